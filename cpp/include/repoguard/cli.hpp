// ==============================================================================
// repoguard/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диспетчеризация подкоманд (enforce, help, version)
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef REPOGUARD_CLI_HPP
#define REPOGUARD_CLI_HPP

#include "repoguard/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace repoguard::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// enforce - проверка (и нормализация) файлов репозитория
struct EnforceCommand {
    std::filesystem::path folder;
    config::Overrides overrides;
    std::optional<std::filesystem::path> config_path;  // -c, --config
    bool json = false;                                 // -j, --json
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<EnforceCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

/// Сообщение об ошибке парсинга: error + usage + подсказка
std::string render_usage_error(const std::string& error_msg,
                               const std::optional<std::string>& command = std::nullopt);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Enforce consistent line endings, whitespace and permissions";

}  // namespace repoguard::cli

#endif  // REPOGUARD_CLI_HPP
