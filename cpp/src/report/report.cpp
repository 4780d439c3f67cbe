// ==============================================================================
// report.cpp - Отчёт сканирования
// ==============================================================================
//
// RapidJSON для JSON-отчёта
//
// ==============================================================================

#include "repoguard/report.hpp"

#include "repoguard/output.hpp"
#include "repoguard/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <utility>

namespace repoguard::report {

// ----------------------------------------------------------------------------
// ScanReport
// ----------------------------------------------------------------------------

void ScanReport::add(check::FileRecord record) {
    records.push_back(std::move(record));
}

void ScanReport::finalize(const config::ScanConfig& cfg) {
    // Порядок прихода от воркеров недетерминирован
    std::sort(records.begin(), records.end(),
              [](const check::FileRecord& a, const check::FileRecord& b) { return a.path < b.path; });

    summary = Summary{};
    summary.scanned = records.size();
    for (const auto& record : records) {
        if (check::is_flagged(record, cfg)) {
            ++summary.flagged;
        }
        if (record.rewrite == check::RewriteStatus::Rewritten) {
            ++summary.rewritten;
        }
        if (!record.readable) {
            ++summary.unreadable;
        }
    }
}

int exit_status(const ScanReport& report) {
    if (report.interrupted) {
        return EXIT_INTERRUPTED;
    }
    return report.summary.flagged == 0 ? EXIT_CLEAN : EXIT_VIOLATIONS;
}

// ----------------------------------------------------------------------------
// Текстовый рендеринг
// ----------------------------------------------------------------------------

namespace {

std::string format_line_number(std::size_t line) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "    Line %03zu: ", line);
    return buf;
}

std::string join_kinds(const std::vector<check::CheckKind>& kinds) {
    std::string result;
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += check::check_kind_to_string(kinds[i]);
    }
    return result;
}

const char* expected_ending(config::LineEndingTarget target) {
    return target == config::LineEndingTarget::Windows ? "CRLF" : "LF";
}

}  // namespace

bool is_listed(const check::FileRecord& record, const config::ScanConfig& cfg) {
    return cfg.list_all || check::is_flagged(record, cfg);
}

std::string render_status(const check::FileRecord& record, const config::ScanConfig& cfg) {
    if (!record.readable) {
        // Не нарушение: файл только учитывается в сводке как unreadable
        if (record.error.has_value()) {
            return "unreadable: " + record.error->message;
        }
        return "unreadable";
    }

    auto kinds = check::violations(record, cfg);
    std::string status = kinds.empty() ? "clean" : join_kinds(kinds);
    if (record.rewrite == check::RewriteStatus::Rewritten) {
        status += std::string(" (rewritten to ") + expected_ending(cfg.line_ending_target) + ")";
    }
    return status;
}

std::string render_entry(const check::FileRecord& record, const config::ScanConfig& cfg) {
    std::string result = "File: \"" + platform::path_to_utf8(record.path) + "\" - " +
                         render_status(record, cfg) + "\n";
    if (!record.readable) {
        return result;
    }

    // Номера строк: табуляции всегда, хвостовые пробелы только с -t
    std::vector<std::size_t> tab_lines = cfg.ignore_tabs ? std::vector<std::size_t>{}
                                                         : record.tab_lines;
    std::vector<std::size_t> trailing_lines =
        cfg.show_trailing ? record.trailing_lines : std::vector<std::size_t>{};

    std::size_t ti = 0;
    std::size_t wi = 0;
    while (ti < tab_lines.size() || wi < trailing_lines.size()) {
        std::size_t line = 0;
        bool tab = false;
        bool trailing = false;
        if (wi >= trailing_lines.size() ||
            (ti < tab_lines.size() && tab_lines[ti] <= trailing_lines[wi])) {
            line = tab_lines[ti];
        } else {
            line = trailing_lines[wi];
        }
        if (ti < tab_lines.size() && tab_lines[ti] == line) {
            tab = true;
            ++ti;
        }
        if (wi < trailing_lines.size() && trailing_lines[wi] == line) {
            trailing = true;
            ++wi;
        }

        result += format_line_number(line);
        if (tab && trailing) {
            result += "tab, trailing whitespace";
        } else if (tab) {
            result += "tab";
        } else {
            result += "trailing whitespace";
        }
        result += "\n";
    }

    for (auto kind : check::violations(record, cfg)) {
        switch (kind) {
        case check::CheckKind::WrongLineEnding:
            result += std::string("    line endings are ") +
                      check::line_ending_kind_to_string(record.line_ending) + ", expected " +
                      expected_ending(cfg.line_ending_target) + "\n";
            break;
        case check::CheckKind::RewriteFailed:
            result += "    rewrite failed: " +
                      (record.error.has_value() ? record.error->message : std::string("unknown error")) +
                      "\n";
            break;
        case check::CheckKind::Tabs:
        case check::CheckKind::TrailingWhitespace:
        case check::CheckKind::MixedLineEndings:
        case check::CheckKind::ExecutableWithoutShebang:
        case check::CheckKind::ShebangWithoutExecutable:
            break;
        }
    }

    return result;
}

std::string render_summary(const Summary& summary) {
    return "Scanned: " + std::to_string(summary.scanned) +
           ", flagged: " + std::to_string(summary.flagged) +
           ", rewritten: " + std::to_string(summary.rewritten) +
           ", unreadable: " + std::to_string(summary.unreadable);
}

std::string render_text(const ScanReport& report, const config::ScanConfig& cfg) {
    std::string result;
    for (const auto& record : report.records) {
        if (is_listed(record, cfg)) {
            result += render_entry(record, cfg);
        }
    }
    result += render_summary(report.summary);
    result += "\n";
    return result;
}

// ----------------------------------------------------------------------------
// JSON рендеринг
// ----------------------------------------------------------------------------

namespace {

rapidjson::Value make_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value make_line_array(const std::vector<std::size_t>& lines,
                                 rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (auto line : lines) {
        arr.PushBack(static_cast<uint64_t>(line), alloc);
    }
    return arr;
}

rapidjson::Value record_to_json(const check::FileRecord& record, const config::ScanConfig& cfg,
                                rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    auto kinds = check::violations(record, cfg);

    obj.AddMember("path", make_string(platform::path_to_utf8(record.path), alloc), alloc);

    const char* status = !record.readable ? "unreadable" : (kinds.empty() ? "clean" : "flagged");
    obj.AddMember("status", rapidjson::StringRef(status), alloc);
    obj.AddMember("line_ending",
                  rapidjson::StringRef(check::line_ending_kind_to_string(record.line_ending)), alloc);

    rapidjson::Value violations(rapidjson::kArrayType);
    for (auto kind : kinds) {
        violations.PushBack(rapidjson::StringRef(check::check_kind_to_id(kind)), alloc);
    }
    obj.AddMember("violations", violations, alloc);

    if (!cfg.ignore_tabs) {
        obj.AddMember("tab_lines", make_line_array(record.tab_lines, alloc), alloc);
    }
    if (cfg.show_trailing) {
        obj.AddMember("trailing_lines", make_line_array(record.trailing_lines, alloc), alloc);
    }
    if (cfg.check_execute) {
        obj.AddMember("executable", record.is_executable, alloc);
        obj.AddMember("shebang", record.has_shebang, alloc);
    }
    obj.AddMember("rewrite", rapidjson::StringRef(check::rewrite_status_to_string(record.rewrite)),
                  alloc);
    if (record.error.has_value()) {
        rapidjson::Value err(rapidjson::kObjectType);
        err.AddMember("kind", rapidjson::StringRef(error_kind_to_string(record.error->kind)), alloc);
        err.AddMember("message", make_string(record.error->message, alloc), alloc);
        obj.AddMember("error", err, alloc);
    }
    return obj;
}

}  // namespace

std::string render_json(const ScanReport& report, const config::ScanConfig& cfg) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("root", make_string(platform::path_to_utf8(report.root), alloc), alloc);

    rapidjson::Value files(rapidjson::kArrayType);
    for (const auto& record : report.records) {
        if (is_listed(record, cfg)) {
            files.PushBack(record_to_json(record, cfg, alloc), alloc);
        }
    }
    doc.AddMember("files", files, alloc);

    rapidjson::Value summary(rapidjson::kObjectType);
    summary.AddMember("scanned", static_cast<uint64_t>(report.summary.scanned), alloc);
    summary.AddMember("flagged", static_cast<uint64_t>(report.summary.flagged), alloc);
    summary.AddMember("rewritten", static_cast<uint64_t>(report.summary.rewritten), alloc);
    summary.AddMember("unreadable", static_cast<uint64_t>(report.summary.unreadable), alloc);
    doc.AddMember("summary", summary, alloc);

    doc.AddMember("interrupted", report.interrupted, alloc);
    doc.AddMember("clean", exit_status(report) == EXIT_CLEAN, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

void print(const ScanReport& report, const config::ScanConfig& cfg, output::Writer& writer,
           bool json) {
    if (json) {
        writer.write_line(output::Stream::Stdout, render_json(report, cfg));
        writer.flush();
        return;
    }

    for (const auto& record : report.records) {
        if (is_listed(record, cfg)) {
            writer.write(output::Stream::Stdout, render_entry(record, cfg));
        }
    }
    output::Color color = report.summary.flagged == 0 ? output::Color::Green : output::Color::Red;
    writer.colored_line(output::Stream::Stdout, render_summary(report.summary), color);
    writer.flush();
}

}  // namespace repoguard::report
