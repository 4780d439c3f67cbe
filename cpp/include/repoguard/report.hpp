// ==============================================================================
// repoguard/report.hpp - Отчёт сканирования
// ==============================================================================
//
// Назначение:
// - ScanReport: записи по всем файлам + сводка
// - Политика вывода (list_all / show_trailing)
// - Текстовый и JSON (RapidJSON) рендеринг
// - Код возврата процесса
//
// Жизненный цикл: ScanReport наполняется во время сканирования,
// finalize() вызывается один раз после исчерпания Discovery, затем отчёт
// выводится и отбрасывается. Между запусками ничего не сохраняется.
//
// ==============================================================================

#ifndef REPOGUARD_REPORT_HPP
#define REPOGUARD_REPORT_HPP

#include "repoguard/config.hpp"
#include "repoguard/error.hpp"
#include "repoguard/inspector.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace repoguard::output {
class Writer;
}  // namespace repoguard::output

namespace repoguard::report {

// ----------------------------------------------------------------------------
// Коды возврата
// ----------------------------------------------------------------------------

constexpr int EXIT_CLEAN = 0;         // Нарушений не осталось
constexpr int EXIT_VIOLATIONS = 1;    // Есть помеченные файлы
constexpr int EXIT_USAGE = 2;         // Ошибка аргументов / ConfigError
constexpr int EXIT_NOT_FOUND = 3;     // NotFoundError
constexpr int EXIT_INTERRUPTED = 130; // SIGINT

// ----------------------------------------------------------------------------
// ScanReport
// ----------------------------------------------------------------------------

struct Summary {
    std::size_t scanned = 0;
    std::size_t flagged = 0;
    std::size_t rewritten = 0;
    std::size_t unreadable = 0;
};

struct ScanReport {
    std::filesystem::path root;

    /// После finalize() упорядочены по пути
    std::vector<check::FileRecord> records;

    Summary summary;

    /// Сканирование остановлено сигналом
    bool interrupted = false;

    /// Нефатальные ошибки обхода каталогов
    std::vector<Error> warnings;

    /// Добавить запись (до finalize)
    void add(check::FileRecord record);

    /// Отсортировать записи по пути и посчитать сводку
    void finalize(const config::ScanConfig& cfg);
};

/// Код возврата: 0 если нет помеченных файлов
int exit_status(const ScanReport& report);

// ----------------------------------------------------------------------------
// Рендеринг
// ----------------------------------------------------------------------------

/// Статус одной записи: "clean", "unreadable: <причина>" или список нарушений
std::string render_status(const check::FileRecord& record, const config::ScanConfig& cfg);

/// Блок одной записи: строка "File: ..." + строки с деталями
std::string render_entry(const check::FileRecord& record, const config::ScanConfig& cfg);

/// "Scanned: N, flagged: N, rewritten: N, unreadable: N"
std::string render_summary(const Summary& summary);

/// Весь текстовый отчёт: выводимые записи + сводка
std::string render_text(const ScanReport& report, const config::ScanConfig& cfg);

/// JSON-документ отчёта (pretty, отступ 2)
std::string render_json(const ScanReport& report, const config::ScanConfig& cfg);

/// Попадает ли запись в листинг при данной политике
bool is_listed(const check::FileRecord& record, const config::ScanConfig& cfg);

/// Вывести отчёт через Writer (stdout) в текстовом или JSON виде
void print(const ScanReport& report, const config::ScanConfig& cfg, output::Writer& writer,
           bool json);

}  // namespace repoguard::report

#endif  // REPOGUARD_REPORT_HPP
