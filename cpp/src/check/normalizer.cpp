// ==============================================================================
// normalizer.cpp - Нормализация окончаний строк
// ==============================================================================

#include "repoguard/normalizer.hpp"

#include "repoguard/platform.hpp"

#include <exception>

namespace repoguard::check {

std::string normalize_line_endings(std::string_view bytes, config::LineEndingTarget target) {
    std::string result;

    switch (target) {
    case config::LineEndingTarget::None:
        return std::string(bytes);

    case config::LineEndingTarget::Unix:
        result.reserve(bytes.size());
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (bytes[i] != '\r') {
                result += bytes[i];
                continue;
            }
            // Серия '\r' перед '\n' снимается целиком, иначе в выводе остаётся "\r\n"
            std::size_t run_end = i;
            while (run_end < bytes.size() && bytes[run_end] == '\r') {
                ++run_end;
            }
            if (run_end >= bytes.size() || bytes[run_end] != '\n') {
                result.append(bytes.substr(i, run_end - i));
            }
            i = run_end - 1;
        }
        return result;

    case config::LineEndingTarget::Windows:
        result.reserve(bytes.size() + bytes.size() / 16);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (bytes[i] == '\n' && (i == 0 || bytes[i - 1] != '\r')) {
                result += '\r';
            }
            result += bytes[i];
        }
        return result;
    }

    return std::string(bytes);
}

bool needs_rewrite(const FileRecord& record, config::LineEndingTarget target) {
    if (target == config::LineEndingTarget::None || !record.readable) {
        return false;
    }

    switch (record.line_ending) {
    case LineEndingKind::Mixed:
        return true;
    case LineEndingKind::LF:
        return target == config::LineEndingTarget::Windows;
    case LineEndingKind::CRLF:
        return target == config::LineEndingTarget::Unix;
    case LineEndingKind::NoNewlines:
    case LineEndingKind::NotText:
        return false;
    }
    return false;
}

NormalizeResult normalize_file(const FileRecord& record, const config::ScanConfig& cfg) {
    NormalizeResult result;
    if (!needs_rewrite(record, cfg.line_ending_target)) {
        return result;
    }

    const std::string path_str = platform::path_to_utf8(record.path);

    if (!platform::is_writable(record.path)) {
        result.error = Error{ErrorKind::Write, "file is not writable", path_str};
        return result;
    }

    // Содержимое целиком в памяти, затем атомарная замена
    std::string read_error;
    auto bytes = read_file_bytes(record.path, read_error);
    if (!bytes.has_value()) {
        result.error = Error{ErrorKind::Write, "failed to re-read file for rewrite: " + read_error,
                             path_str};
        return result;
    }

    std::string converted = normalize_line_endings(*bytes, cfg.line_ending_target);
    if (converted == *bytes) {
        return result;
    }

    try {
        platform::replace_file_atomic(record.path, converted);
    } catch (const std::exception& e) {
        result.error = Error{ErrorKind::Write, e.what(), path_str};
        return result;
    }

    result.rewritten = true;
    return result;
}

FileRecord apply_normalization(const FileRecord& record, const config::ScanConfig& cfg) {
    if (!cfg.normalizes() || !needs_rewrite(record, cfg.line_ending_target)) {
        return record;
    }

    NormalizeResult result = normalize_file(record, cfg);
    if (!result.ok()) {
        FileRecord failed = record;
        failed.rewrite = RewriteStatus::Failed;
        failed.error = result.error;
        return failed;
    }
    if (!result.rewritten) {
        return record;
    }

    FileRecord fresh = inspect_file(record.path, cfg);
    fresh.rewrite = RewriteStatus::Rewritten;
    return fresh;
}

}  // namespace repoguard::check
