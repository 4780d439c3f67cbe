// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат справки и ошибок в стиле argparse/clap,
// ошибки парсинга завершают процесс с кодом 2.
//
// ==============================================================================

#include "repoguard/cli.hpp"

#include "repoguard/platform.hpp"

#include <cstring>
#include <initializer_list>

namespace repoguard::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

ParseResult usage_error(ParseResult result, const std::string& message,
                        const std::optional<std::string>& command) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, command);
    return result;
}

// Опции enforce со значением: "-e X", "--extensions X", "--extensions=X"
struct ValueOption {
    const char* short_name;
    const char* long_name;
    const char* value_name;
};

constexpr ValueOption OPT_EXTENSIONS{"-e", "--extensions", "<EXTENSIONS>"};
constexpr ValueOption OPT_SKIP{"-s", "--skip", "<SKIP>"};
constexpr ValueOption OPT_CONFIG{"-c", "--config", "<CONFIG>"};
constexpr ValueOption OPT_THREADS{nullptr, "--num-threads", "<NUM_THREADS>"};

enum class Match { No, Yes, MissingValue };

/// Сопоставить argv[i] с опцией; при успехе value заполнен, i сдвинут
Match match_value(const ValueOption& opt, int argc, char** argv, int& i, std::string& value) {
    const char* arg = argv[i];

    bool exact = (opt.short_name != nullptr && str_eq(arg, opt.short_name)) ||
                 str_eq(arg, opt.long_name);
    if (exact) {
        if (i + 1 >= argc) {
            return Match::MissingValue;
        }
        ++i;
        value = argv[i];
        return Match::Yes;
    }

    std::string with_eq = std::string(opt.long_name) + "=";
    if (starts_with(arg, with_eq.c_str())) {
        value = arg + with_eq.size();
        return Match::Yes;
    }
    return Match::No;
}

std::string option_display(const ValueOption& opt) {
    std::string display;
    if (opt.short_name != nullptr) {
        display = std::string(opt.short_name) + ", ";
    }
    return display + opt.long_name + " " + opt.value_name;
}

/// Булев флаг enforce по одной букве; false если буква неизвестна
bool apply_short_flag(char flag, EnforceCommand& cmd, GlobalOptions& global) {
    switch (flag) {
    case 'l':
        cmd.overrides.list_all = true;
        return true;
    case 'i':
        cmd.overrides.ignore_tabs = true;
        return true;
    case 't':
        cmd.overrides.show_trailing = true;
        return true;
    case 'w':
        cmd.overrides.use_windows = true;
        return true;
    case 'u':
        cmd.overrides.use_unix = true;
        return true;
    case 'x':
        cmd.overrides.check_execute = true;
        return true;
    case 'n':
        cmd.overrides.dry_run = true;
        return true;
    case 'j':
        cmd.json = true;
        return true;
    case 'q':
        global.quiet = true;
        return true;
    case 'v':
        global.verbose++;
        return true;
    default:
        return false;
    }
}

bool apply_long_flag(const char* arg, EnforceCommand& cmd) {
    if (str_eq(arg, "--list-all") || str_eq(arg, "--list")) {
        cmd.overrides.list_all = true;
    } else if (str_eq(arg, "--ignore-tabs")) {
        cmd.overrides.ignore_tabs = true;
    } else if (str_eq(arg, "--trailing")) {
        cmd.overrides.show_trailing = true;
    } else if (str_eq(arg, "--windows")) {
        cmd.overrides.use_windows = true;
    } else if (str_eq(arg, "--unix")) {
        cmd.overrides.use_unix = true;
    } else if (str_eq(arg, "--execute")) {
        cmd.overrides.check_execute = true;
    } else if (str_eq(arg, "--no-recurse")) {
        cmd.overrides.no_recurse = true;
    } else if (str_eq(arg, "--dry-run")) {
        cmd.overrides.dry_run = true;
    } else if (str_eq(arg, "--json")) {
        cmd.json = true;
    } else {
        return false;
    }
    return true;
}

std::optional<unsigned> parse_unsigned(const std::string& text) {
    if (text.empty() || text.size() > 6) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

ParseResult parse_enforce(ParseResult result, int argc, char** argv, int start) {
    const std::optional<std::string> command_name = std::string("enforce");
    EnforceCommand cmd;
    bool have_folder = false;
    bool only_positional = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (only_positional || arg[0] != '-' || str_eq(arg, "-")) {
            if (have_folder) {
                return usage_error(std::move(result),
                                   std::string("error: unexpected argument '") + arg + "' found",
                                   command_name);
            }
            cmd.folder = platform::path_from_utf8(arg);
            have_folder = true;
            continue;
        }

        if (str_eq(arg, "--")) {
            only_positional = true;
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"enforce"};
            return result;
        }
        if (str_eq(arg, "--quiet")) {
            result.global.quiet = true;
            continue;
        }
        if (str_eq(arg, "--verbose")) {
            result.global.verbose++;
            continue;
        }

        std::string value;
        bool matched = false;
        for (const ValueOption* opt : {&OPT_EXTENSIONS, &OPT_SKIP, &OPT_CONFIG, &OPT_THREADS}) {
            Match m = match_value(*opt, argc, argv, i, value);
            if (m == Match::No) {
                continue;
            }
            if (m == Match::MissingValue) {
                return usage_error(std::move(result),
                                   "error: a value is required for '" + option_display(*opt) +
                                       "' but none was supplied",
                                   command_name);
            }
            if (opt == &OPT_EXTENSIONS) {
                cmd.overrides.extensions.push_back(value);
            } else if (opt == &OPT_SKIP) {
                cmd.overrides.skip.push_back(value);
            } else if (opt == &OPT_CONFIG) {
                cmd.config_path = platform::path_from_utf8(value);
            } else {
                auto threads = parse_unsigned(value);
                if (!threads.has_value()) {
                    return usage_error(std::move(result),
                                       "error: invalid value '" + value +
                                           "' for '--num-threads <NUM_THREADS>': expected a "
                                           "non-negative integer",
                                       command_name);
                }
                cmd.overrides.num_threads = threads;
            }
            matched = true;
            break;
        }
        if (matched) {
            continue;
        }

        if (apply_long_flag(arg, cmd)) {
            continue;
        }

        // Короткие флаги, в т.ч. сгруппированные: -lt, -vv
        if (arg[1] != '-') {
            bool all_known = true;
            for (const char* p = arg + 1; *p != '\0'; ++p) {
                if (!apply_short_flag(*p, cmd, result.global)) {
                    all_known = false;
                    break;
                }
            }
            if (all_known) {
                continue;
            }
        }

        return usage_error(std::move(result),
                           std::string("error: unexpected argument '") + arg + "' found",
                           command_name);
    }

    if (!have_folder) {
        return usage_error(std::move(result),
                           "error: the following required arguments were not provided:\n"
                           "  <FOLDER>",
                           command_name);
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("repoguard ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: repoguard [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  enforce  Check (and optionally fix) files in a repository\n"
               "  version  Print version\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -q             Suppress informational output\n"
               "  -v...          Print verbose output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Check a repository, listing trailing whitespace lines:\n"
               "        ./repoguard enforce -t src/\n"
               "\n"
               "    Convert all Python and C++ sources to LF line endings:\n"
               "        ./repoguard enforce -u -e py,cpp,hpp .\n";
    }
    if (*command == "enforce") {
        return "Check (and optionally fix) files in a repository\n"
               "\n"
               "Usage: repoguard enforce [OPTIONS] <FOLDER>\n"
               "\n"
               "Arguments:\n"
               "  <FOLDER>  Folder to scan\n"
               "\n"
               "Options:\n"
               "  -e, --extensions <EXTENSIONS>  Extensions to check (comma or space "
               "separated, '*' for all)\n"
               "  -l, --list-all                 List all files, not only flagged ones\n"
               "  -i, --ignore-tabs              Do not report tabs\n"
               "  -t, --trailing                 Show line numbers of trailing whitespace\n"
               "  -s, --skip <SKIP>              Skip paths containing this text\n"
               "  -w, --windows                  Convert line endings to CRLF\n"
               "  -u, --unix                     Convert line endings to LF\n"
               "  -x, --execute                  Check executable bits against shebangs\n"
               "  -c, --config <CONFIG>          Load options from a YAML file\n"
               "      --no-recurse               Only scan files directly in <FOLDER>\n"
               "  -n, --dry-run                  Report wrong line endings instead of "
               "converting\n"
               "  -j, --json                     Output as JSON\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of "
               "CPUs)\n"
               "  -q                             Suppress informational output\n"
               "  -v...                          Print verbose output\n"
               "  -h, --help                     Print help\n";
    }
    if (*command == "version") {
        return "Print version\n"
               "\n"
               "Usage: repoguard version\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: repoguard help [COMMAND]\n";
    }
    // Неизвестная подкоманда для help
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// render_usage_error
// ----------------------------------------------------------------------------

std::string render_usage_error(const std::string& error_msg,
                               const std::optional<std::string>& command) {
    std::string usage = (command.has_value() && *command == "enforce")
                            ? "Usage: repoguard enforce [OPTIONS] <FOLDER>"
                            : "Usage: repoguard [OPTIONS] <COMMAND>";
    return error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found",
                               std::nullopt);
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "enforce")) {
        return parse_enforce(std::move(result), argc, argv, cmd_idx + 1);
    }
    if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
        return result;
    }
    if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
        return result;
    }

    // Неизвестная команда
    return usage_error(std::move(result),
                       std::string("error: unrecognized subcommand '") + cmd + "'", std::nullopt);
}

}  // namespace repoguard::cli
