// ==============================================================================
// repoguard/inspector.hpp - Проверка содержимого и прав файла
// ==============================================================================
//
// Назначение:
// - LineEndingKind: классификация окончаний строк
// - CheckKind: виды нарушений
// - FileRecord: результат проверки одного файла
// - inspect_file / inspect_content: построение FileRecord
// - violations / is_flagged: вердикт с учётом включённых проверок
//
// Алгоритм inspect_content:
// 1. Нулевой байт или невалидный UTF-8 -> NotText, readable=false,
//    шаги 2-5 пропускаются
// 2. Окончания строк: только \r\n -> CRLF, только \n -> LF,
//    оба -> Mixed, ни одного -> NoNewlines
// 3. Табуляции (если не ignore_tabs): номера строк, 1-based
// 4. Хвостовые пробелы: строка без терминатора оканчивается ' ' или '\t'
// 5. Execute-бит (если check_execute): должен совпадать с наличием "#!"
//
// ==============================================================================

#ifndef REPOGUARD_INSPECTOR_HPP
#define REPOGUARD_INSPECTOR_HPP

#include "repoguard/config.hpp"
#include "repoguard/error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repoguard::check {

// ----------------------------------------------------------------------------
// LineEndingKind
// ----------------------------------------------------------------------------

enum class LineEndingKind {
    LF,          // Только \n
    CRLF,        // Только \r\n
    Mixed,       // И то, и другое (всегда нарушение)
    NoNewlines,  // Ни одного терминатора (никогда не нарушение)
    NotText      // Бинарный или нечитаемый файл
};

/// "LF", "CRLF", "mixed", "none", "not-text"
const char* line_ending_kind_to_string(LineEndingKind kind);

// ----------------------------------------------------------------------------
// CheckKind - виды нарушений
// ----------------------------------------------------------------------------

enum class CheckKind {
    Tabs,                      // Табуляции в строках
    TrailingWhitespace,        // Хвостовые пробелы/табуляции
    MixedLineEndings,          // Смешанные окончания строк
    WrongLineEnding,           // Стиль не совпадает с target (dry-run / без перезаписи)
    ExecutableWithoutShebang,  // Есть execute-бит, нет "#!"
    ShebangWithoutExecutable,  // Есть "#!", нет execute-бита
    RewriteFailed              // Нормализация не удалась
};

/// Человекочитаемое имя ("tabs", "trailing whitespace", ...)
const char* check_kind_to_string(CheckKind kind);

/// Машинное имя для JSON ("tabs", "trailing_whitespace", ...)
const char* check_kind_to_id(CheckKind kind);

// ----------------------------------------------------------------------------
// FileRecord
// ----------------------------------------------------------------------------

/// Статус перезаписи файла нормализатором
enum class RewriteStatus {
    NotAttempted,
    Rewritten,
    Failed
};

const char* rewrite_status_to_string(RewriteStatus status);

/// Результат проверки одного файла
///
/// Запись не изменяется после создания: повторная проверка создаёт новую.
struct FileRecord {
    std::filesystem::path path;

    LineEndingKind line_ending = LineEndingKind::NoNewlines;

    bool has_tabs = false;
    std::vector<std::size_t> tab_lines;  // 1-based, по возрастанию

    bool has_trailing_whitespace = false;
    std::vector<std::size_t> trailing_lines;  // 1-based, по возрастанию

    bool is_executable = false;
    bool has_shebang = false;

    /// false: файл не открылся или не является текстом
    bool readable = true;

    RewriteStatus rewrite = RewriteStatus::NotAttempted;

    /// ReadError / WriteError уровня файла
    std::optional<Error> error;
};

// ----------------------------------------------------------------------------
// Проверка
// ----------------------------------------------------------------------------

/// Классифицировать окончания строк по сырым байтам
LineEndingKind classify_line_endings(std::string_view bytes);

/// Валидный UTF-8 без нулевых байтов
bool looks_like_text(std::string_view bytes);

/// Проверить уже прочитанное содержимое
///
/// @param is_executable Execute-бит файла (учитывается при cfg.check_execute)
FileRecord inspect_content(const std::filesystem::path& path, std::string_view bytes,
                           bool is_executable, const config::ScanConfig& cfg);

/// Прочитать файл и проверить его
///
/// Никогда не бросает: ошибка чтения попадает в FileRecord::error,
/// запись получает readable=false и NotText.
FileRecord inspect_file(const std::filesystem::path& path, const config::ScanConfig& cfg);

/// Прочитать файл целиком
/// @return nullopt при ошибке открытия/чтения (причина в error)
std::optional<std::string> read_file_bytes(const std::filesystem::path& path, std::string& error);

// ----------------------------------------------------------------------------
// Вердикт
// ----------------------------------------------------------------------------

/// Нарушения записи с учётом включённых проверок
///
/// Выключенные проверки (ignore_tabs, check_execute=false) не дают нарушений.
/// Нечитаемые файлы (NotText) нарушений не имеют.
std::vector<CheckKind> violations(const FileRecord& record, const config::ScanConfig& cfg);

/// Есть ли у записи хотя бы одно нарушение
bool is_flagged(const FileRecord& record, const config::ScanConfig& cfg);

}  // namespace repoguard::check

#endif  // REPOGUARD_INSPECTOR_HPP
