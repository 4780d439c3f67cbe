// ==============================================================================
// config.cpp - Конфигурация сканирования
// ==============================================================================
//
// yaml-cpp для конфиг-файла
//
// ==============================================================================

#include "repoguard/config.hpp"

#include "repoguard/error.hpp"
#include "repoguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace repoguard::config {

// ----------------------------------------------------------------------------
// LineEndingTarget
// ----------------------------------------------------------------------------

const char* line_ending_target_to_string(LineEndingTarget target) {
    switch (target) {
    case LineEndingTarget::None:
        return "none";
    case LineEndingTarget::Windows:
        return "windows";
    case LineEndingTarget::Unix:
        return "unix";
    }
    return "none";
}

std::optional<LineEndingTarget> parse_line_ending_target(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower.empty()) {
        return LineEndingTarget::None;
    }
    if (lower == "windows" || lower == "crlf") {
        return LineEndingTarget::Windows;
    }
    if (lower == "unix" || lower == "lf") {
        return LineEndingTarget::Unix;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// ScanConfig
// ----------------------------------------------------------------------------

bool ScanConfig::matches_extension(const std::filesystem::path& file) const {
    if (all_extensions) {
        return true;
    }
    if (!file.has_extension()) {
        return false;
    }
    // Сравнение case-sensitive, как у файловой системы
    return extensions.count(file.extension().string()) > 0;
}

std::set<std::string> default_extensions() {
    return {".bash", ".c",   ".cc",  ".cfg", ".cmake", ".cpp", ".cxx", ".h",
            ".hh",   ".hpp", ".hxx", ".ini", ".json",  ".m",   ".md",  ".py",
            ".rst",  ".sh",  ".toml", ".txt", ".yaml", ".yml"};
}

ScanConfig default_config() {
    ScanConfig cfg;
    cfg.extensions = default_extensions();
    return cfg;
}

std::string normalize_extension(std::string_view ext) {
    if (ext.empty() || ext == "*") {
        return std::string(ext);
    }
    if (ext.front() == '.') {
        return std::string(ext);
    }
    return "." + std::string(ext);
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> result;
    std::string current;
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current += c;
    }
    if (!current.empty()) {
        result.push_back(std::move(current));
    }
    return result;
}

// ----------------------------------------------------------------------------
// YAML конфиг
// ----------------------------------------------------------------------------

namespace {

// Список строк: последовательность или скаляр с разделителями
std::vector<std::string> read_string_list(const YAML::Node& node, const std::string& key,
                                          const std::string& source) {
    std::vector<std::string> items;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw config_error("'" + key + "' must be a list of strings", source);
            }
            items.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        items = split_list(node.as<std::string>());
    } else if (!node.IsNull()) {
        throw config_error("'" + key + "' must be a string or a list of strings", source);
    }
    return items;
}

bool read_bool(const YAML::Node& node, const std::string& key, const std::string& source) {
    if (!node.IsScalar()) {
        throw config_error("'" + key + "' must be a boolean", source);
    }
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        throw config_error("'" + key + "' must be a boolean, got '" + node.Scalar() + "'", source);
    }
}

void apply_extensions(ScanConfig& cfg, const std::vector<std::string>& raw) {
    if (raw.size() == 1 && raw.front() == "*") {
        cfg.all_extensions = true;
        cfg.extensions.clear();
        return;
    }
    cfg.all_extensions = false;
    cfg.extensions.clear();
    for (const auto& ext : raw) {
        cfg.extensions.insert(normalize_extension(ext));
    }
}

ScanConfig from_yaml(const YAML::Node& root, const std::string& source) {
    ScanConfig cfg = default_config();

    if (root.IsNull()) {
        // Пустой файл - допустим, всё по умолчанию
        return cfg;
    }
    if (!root.IsMap()) {
        throw config_error("configuration must be a mapping", source);
    }

    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;

        if (key == "extensions") {
            apply_extensions(cfg, read_string_list(value, key, source));
        } else if (key == "skip") {
            cfg.skip = read_string_list(value, key, source);
        } else if (key == "ignore_tabs") {
            cfg.ignore_tabs = read_bool(value, key, source);
        } else if (key == "trailing") {
            cfg.show_trailing = read_bool(value, key, source);
        } else if (key == "list_all") {
            cfg.list_all = read_bool(value, key, source);
        } else if (key == "execute") {
            cfg.check_execute = read_bool(value, key, source);
        } else if (key == "recursive") {
            cfg.recursive = read_bool(value, key, source);
        } else if (key == "line_endings") {
            if (!value.IsScalar()) {
                throw config_error("'line_endings' must be one of: unix, windows, none", source);
            }
            auto target = parse_line_ending_target(value.Scalar());
            if (!target.has_value()) {
                throw config_error("invalid value '" + value.Scalar() +
                                       "' for 'line_endings': must be one of: unix, windows, none",
                                   source);
            }
            cfg.line_ending_target = *target;
        } else if (key == "threads") {
            try {
                cfg.num_threads = value.as<unsigned>();
            } catch (const YAML::BadConversion&) {
                throw config_error("'threads' must be a non-negative integer", source);
            }
        } else {
            throw config_error("unknown configuration key '" + key + "'", source);
        }
    }

    return cfg;
}

}  // namespace

ScanConfig parse_config_yaml(std::string_view text, const std::string& source) {
    try {
        YAML::Node root = YAML::Load(std::string(text));
        return from_yaml(root, source);
    } catch (const YAML::Exception& e) {
        throw config_error(std::string("failed to parse configuration: ") + e.what(), source);
    }
}

ScanConfig load_config_file(const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw config_error("failed to open configuration file", source);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    return parse_config_yaml(ss.str(), source);
}

// ----------------------------------------------------------------------------
// resolve
// ----------------------------------------------------------------------------

ScanConfig resolve(const ScanConfig& base, const Overrides& overrides) {
    // Конфликт флагов проверяется до любого I/O
    if (overrides.use_windows && overrides.use_unix) {
        throw config_error("argument -u/--unix: not allowed with argument -w/--windows");
    }

    ScanConfig cfg = base;

    if (!overrides.extensions.empty()) {
        std::vector<std::string> raw;
        for (const auto& item : overrides.extensions) {
            auto parts = split_list(item);
            raw.insert(raw.end(), parts.begin(), parts.end());
        }
        if (raw.empty()) {
            throw config_error("argument -e/--extensions: expected at least one extension");
        }
        apply_extensions(cfg, raw);
    }

    for (const auto& item : overrides.skip) {
        for (auto& part : split_list(item)) {
            cfg.skip.push_back(std::move(part));
        }
    }

    cfg.ignore_tabs = cfg.ignore_tabs || overrides.ignore_tabs;
    cfg.show_trailing = cfg.show_trailing || overrides.show_trailing;
    cfg.list_all = cfg.list_all || overrides.list_all;
    cfg.check_execute = cfg.check_execute || overrides.check_execute;
    cfg.dry_run = cfg.dry_run || overrides.dry_run;

    if (overrides.no_recurse) {
        cfg.recursive = false;
    }
    if (overrides.use_windows) {
        cfg.line_ending_target = LineEndingTarget::Windows;
    } else if (overrides.use_unix) {
        cfg.line_ending_target = LineEndingTarget::Unix;
    }
    if (overrides.num_threads.has_value()) {
        cfg.num_threads = *overrides.num_threads;
    }

    if (cfg.dry_run && cfg.line_ending_target == LineEndingTarget::None) {
        throw config_error("argument -n/--dry-run: requires -w/--windows or -u/--unix");
    }

    return cfg;
}

}  // namespace repoguard::config
