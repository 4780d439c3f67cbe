// ==============================================================================
// repoguard/scanner.hpp - Конвейер сканирования
// ==============================================================================
//
// Назначение:
// - Discovery -> Inspector -> (Normalizer) -> ScanReport
// - Пул воркеров (std::thread), пути и записи передаются через Channel
// - Каждый файл обрабатывается ровно одним воркером: запись при
//   нормализации не пересекается с чтением того же файла
// - Отмена: флаг проверяется Discovery и воркерами; начатые файлы
//   дорабатываются, ещё не начатые отбрасываются
//
// ==============================================================================

#ifndef REPOGUARD_SCANNER_HPP
#define REPOGUARD_SCANNER_HPP

#include "repoguard/config.hpp"
#include "repoguard/inspector.hpp"
#include "repoguard/report.hpp"

#include <atomic>
#include <filesystem>

namespace repoguard::output {
class Writer;
}  // namespace repoguard::output

namespace repoguard::scan {

/// Полная обработка одного файла: проверка, нормализация, повторная проверка
///
/// Не бросает: непредвиденная ошибка превращается в ReadError записи.
check::FileRecord process_file(const std::filesystem::path& path, const config::ScanConfig& cfg);

/// Число воркеров: cfg.num_threads или hardware_concurrency (минимум 1)
unsigned worker_count(const config::ScanConfig& cfg);

/// Просканировать root и собрать итоговый отчёт (finalize уже вызван)
///
/// @param cancel Флаг отмены (может быть nullptr)
/// @param log Журнал для debug/trace сообщений (может быть nullptr)
/// @throws repoguard::Exception (ErrorKind::NotFound) если root не существует
report::ScanReport run_scan(const std::filesystem::path& root, const config::ScanConfig& cfg,
                            const std::atomic<bool>* cancel = nullptr,
                            output::Writer* log = nullptr);

}  // namespace repoguard::scan

#endif  // REPOGUARD_SCANNER_HPP
