// ==============================================================================
// repoguard/config.hpp - Конфигурация сканирования
// ==============================================================================
//
// Назначение:
// - ScanConfig: неизменяемая конфигурация одного запуска
// - LineEndingTarget: целевой стиль окончаний строк
// - Загрузка YAML-конфига (yaml-cpp)
// - Слияние конфига с флагами командной строки
//
// ScanConfig строится один раз за запуск и передаётся во все компоненты
// по const-ссылке. Глобального изменяемого состояния нет.
//
// ==============================================================================

#ifndef REPOGUARD_CONFIG_HPP
#define REPOGUARD_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace repoguard::config {

// ----------------------------------------------------------------------------
// LineEndingTarget - целевой стиль окончаний строк
// ----------------------------------------------------------------------------

enum class LineEndingTarget {
    None,     // Только отчёт, без перезаписи
    Windows,  // CRLF
    Unix      // LF
};

/// "none" / "windows" / "unix"
const char* line_ending_target_to_string(LineEndingTarget target);

/// Разобрать значение ключа line_endings (регистр не важен)
/// @return nullopt при неизвестном значении
std::optional<LineEndingTarget> parse_line_ending_target(std::string_view text);

// ----------------------------------------------------------------------------
// ScanConfig
// ----------------------------------------------------------------------------

struct ScanConfig {
    /// Допустимые расширения (С точкой: ".py")
    std::set<std::string> extensions;

    /// true: расширения не фильтруются (-e "*")
    bool all_extensions = false;

    /// Подстроки путей для исключения (файлы и целые поддеревья)
    std::vector<std::string> skip;

    bool ignore_tabs = false;    // -i
    bool show_trailing = false;  // -t
    bool list_all = false;       // -l
    bool check_execute = false;  // -x

    LineEndingTarget line_ending_target = LineEndingTarget::None;

    bool recursive = true;  // --no-recurse выключает
    bool dry_run = false;   // -n: сообщать о несоответствии target, не переписывая

    /// Размер пула воркеров (0 = число CPU)
    unsigned num_threads = 0;

    /// Проверить расширение файла по allow-list
    bool matches_extension(const std::filesystem::path& file) const;

    /// Нужна ли нормализация (target задан и не dry-run)
    bool normalizes() const { return line_ending_target != LineEndingTarget::None && !dry_run; }
};

/// Расширения по умолчанию (распространённые исходники и текст)
std::set<std::string> default_extensions();

/// Конфигурация по умолчанию
ScanConfig default_config();

/// Привести расширение к виду ".ext" ("py" -> ".py", ".py" -> ".py")
std::string normalize_extension(std::string_view ext);

/// Разбить список, разделённый запятыми и/или пробелами
/// Пустые элементы отбрасываются
std::vector<std::string> split_list(std::string_view text);

// ----------------------------------------------------------------------------
// YAML конфиг
// ----------------------------------------------------------------------------
//
// Ключи (все необязательные):
//   extensions: [".py", ".cpp"] | "*" | ".py, .m"
//   skip: ["build", "third_party"]
//   ignore_tabs / trailing / list_all / execute / recursive: bool
//   line_endings: unix | windows | none
//   threads: uint
//
// Неизвестный ключ -> ConfigError.
//

/// Разобрать YAML-текст конфига
/// @param source Имя источника для сообщений об ошибках
/// @throws repoguard::Exception (ErrorKind::Config)
ScanConfig parse_config_yaml(std::string_view text, const std::string& source = "<config>");

/// Загрузить YAML-конфиг из файла
/// @throws repoguard::Exception (ErrorKind::Config), в т.ч. если файл не читается
ScanConfig load_config_file(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Флаги командной строки поверх конфига
// ----------------------------------------------------------------------------

struct Overrides {
    std::vector<std::string> extensions;  // -e (заменяет список)
    std::vector<std::string> skip;        // -s (добавляется)
    bool ignore_tabs = false;             // -i
    bool show_trailing = false;           // -t
    bool list_all = false;                // -l
    bool check_execute = false;           // -x
    bool use_windows = false;             // -w
    bool use_unix = false;                // -u
    bool no_recurse = false;              // --no-recurse
    bool dry_run = false;                 // -n
    std::optional<unsigned> num_threads;  // --num-threads
};

/// Построить итоговый ScanConfig
///
/// Булевы флаги могут только включать опцию. -e заменяет список расширений,
/// -s дополняет список исключений, -w/-u перекрывают line_endings.
///
/// @param base Конфиг из файла или default_config()
/// @throws repoguard::Exception (ErrorKind::Config) при конфликте флагов
ScanConfig resolve(const ScanConfig& base, const Overrides& overrides);

}  // namespace repoguard::config

#endif  // REPOGUARD_CONFIG_HPP
