// ==============================================================================
// inspector.cpp - Проверка содержимого и прав файла
// ==============================================================================

#include "repoguard/inspector.hpp"

#include "repoguard/platform.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>

namespace repoguard::check {

// ============================================================================
// Строковые представления
// ============================================================================

const char* line_ending_kind_to_string(LineEndingKind kind) {
    switch (kind) {
    case LineEndingKind::LF:
        return "LF";
    case LineEndingKind::CRLF:
        return "CRLF";
    case LineEndingKind::Mixed:
        return "mixed";
    case LineEndingKind::NoNewlines:
        return "none";
    case LineEndingKind::NotText:
        return "not-text";
    }
    return "none";
}

const char* check_kind_to_string(CheckKind kind) {
    switch (kind) {
    case CheckKind::Tabs:
        return "tabs";
    case CheckKind::TrailingWhitespace:
        return "trailing whitespace";
    case CheckKind::MixedLineEndings:
        return "mixed line endings";
    case CheckKind::WrongLineEnding:
        return "wrong line endings";
    case CheckKind::ExecutableWithoutShebang:
        return "executable without shebang";
    case CheckKind::ShebangWithoutExecutable:
        return "shebang without execute permission";
    case CheckKind::RewriteFailed:
        return "rewrite failed";
    }
    return "unknown";
}

const char* check_kind_to_id(CheckKind kind) {
    switch (kind) {
    case CheckKind::Tabs:
        return "tabs";
    case CheckKind::TrailingWhitespace:
        return "trailing_whitespace";
    case CheckKind::MixedLineEndings:
        return "mixed_line_endings";
    case CheckKind::WrongLineEnding:
        return "wrong_line_endings";
    case CheckKind::ExecutableWithoutShebang:
        return "executable_without_shebang";
    case CheckKind::ShebangWithoutExecutable:
        return "shebang_without_executable";
    case CheckKind::RewriteFailed:
        return "rewrite_failed";
    }
    return "unknown";
}

const char* rewrite_status_to_string(RewriteStatus status) {
    switch (status) {
    case RewriteStatus::NotAttempted:
        return "not_attempted";
    case RewriteStatus::Rewritten:
        return "rewritten";
    case RewriteStatus::Failed:
        return "failed";
    }
    return "not_attempted";
}

// ============================================================================
// Классификация
// ============================================================================

LineEndingKind classify_line_endings(std::string_view bytes) {
    bool seen_crlf = false;
    bool seen_lf = false;

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] != '\n') {
            continue;
        }
        if (i > 0 && bytes[i - 1] == '\r') {
            seen_crlf = true;
        } else {
            seen_lf = true;
        }
        if (seen_crlf && seen_lf) {
            return LineEndingKind::Mixed;
        }
    }

    if (seen_crlf) {
        return LineEndingKind::CRLF;
    }
    if (seen_lf) {
        return LineEndingKind::LF;
    }
    return LineEndingKind::NoNewlines;
}

bool looks_like_text(std::string_view bytes) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t size = bytes.size();

    std::size_t i = 0;
    while (i < size) {
        unsigned char c = data[i];
        if (c == 0x00) {
            return false;
        }
        if (c < 0x80) {
            ++i;
            continue;
        }

        // Длина последовательности и минимальное значение (против overlong)
        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
            min_cp = 0x10000;
        } else {
            return false;
        }

        if (i + len > size) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            unsigned char cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

// ============================================================================
// Проверка
// ============================================================================

FileRecord inspect_content(const std::filesystem::path& path, std::string_view bytes,
                           bool is_executable, const config::ScanConfig& cfg) {
    FileRecord record;
    record.path = path;

    // Шаг 1: бинарные файлы не проверяются на пробелы и окончания строк
    if (!looks_like_text(bytes)) {
        record.line_ending = LineEndingKind::NotText;
        record.readable = false;
        record.error = Error{ErrorKind::Read, "not a valid UTF-8 text file",
                             platform::path_to_utf8(path)};
        return record;
    }

    // Шаг 2
    record.line_ending = classify_line_endings(bytes);

    // Шаги 3-4: построчный проход, терминатор (\n или \r\n) отрезается
    std::size_t line_no = 1;
    std::size_t start = 0;
    while (start < bytes.size()) {
        std::size_t nl = bytes.find('\n', start);
        std::size_t end = (nl == std::string_view::npos) ? bytes.size() : nl;
        std::string_view line = bytes.substr(start, end - start);
        if (nl != std::string_view::npos && !line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!cfg.ignore_tabs && line.find('\t') != std::string_view::npos) {
            record.tab_lines.push_back(line_no);
        }
        if (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
            record.trailing_lines.push_back(line_no);
        }

        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
        ++line_no;
    }
    record.has_tabs = !record.tab_lines.empty();
    record.has_trailing_whitespace = !record.trailing_lines.empty();

    // Шаг 5
    if (cfg.check_execute) {
        record.is_executable = is_executable;
        record.has_shebang = bytes.size() >= 2 && bytes[0] == '#' && bytes[1] == '!';
    }

    return record;
}

std::optional<std::string> read_file_bytes(const std::filesystem::path& path, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = std::string("failed to open file: ") + std::strerror(errno);
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        error = "failed to read file";
        return std::nullopt;
    }
    return ss.str();
}

FileRecord inspect_file(const std::filesystem::path& path, const config::ScanConfig& cfg) {
    std::string error;
    auto bytes = read_file_bytes(path, error);
    if (!bytes.has_value()) {
        FileRecord record;
        record.path = path;
        record.line_ending = LineEndingKind::NotText;
        record.readable = false;
        record.error = Error{ErrorKind::Read, error, platform::path_to_utf8(path)};
        return record;
    }

    bool executable = cfg.check_execute && platform::is_executable(path);
    return inspect_content(path, *bytes, executable, cfg);
}

// ============================================================================
// Вердикт
// ============================================================================

std::vector<CheckKind> violations(const FileRecord& record, const config::ScanConfig& cfg) {
    std::vector<CheckKind> result;

    // NotText: не нарушение, учитывается только как unreadable
    if (!record.readable) {
        return result;
    }

    if (!cfg.ignore_tabs && record.has_tabs) {
        result.push_back(CheckKind::Tabs);
    }
    if (record.has_trailing_whitespace) {
        result.push_back(CheckKind::TrailingWhitespace);
    }

    switch (record.line_ending) {
    case LineEndingKind::Mixed:
        result.push_back(CheckKind::MixedLineEndings);
        break;
    case LineEndingKind::LF:
        if (cfg.line_ending_target == config::LineEndingTarget::Windows) {
            result.push_back(CheckKind::WrongLineEnding);
        }
        break;
    case LineEndingKind::CRLF:
        if (cfg.line_ending_target == config::LineEndingTarget::Unix) {
            result.push_back(CheckKind::WrongLineEnding);
        }
        break;
    case LineEndingKind::NoNewlines:
    case LineEndingKind::NotText:
        break;
    }

    if (cfg.check_execute) {
        if (record.is_executable && !record.has_shebang) {
            result.push_back(CheckKind::ExecutableWithoutShebang);
        } else if (record.has_shebang && !record.is_executable) {
            result.push_back(CheckKind::ShebangWithoutExecutable);
        }
    }

    if (record.rewrite == RewriteStatus::Failed) {
        result.push_back(CheckKind::RewriteFailed);
    }

    return result;
}

bool is_flagged(const FileRecord& record, const config::ScanConfig& cfg) {
    return !violations(record, cfg).empty();
}

}  // namespace repoguard::check
