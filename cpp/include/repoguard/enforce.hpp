// ==============================================================================
// repoguard/enforce.hpp - Команда enforce
// ==============================================================================
//
// Назначение:
// - Сборка ScanConfig (YAML + флаги CLI)
// - Запуск сканирования и вывод отчёта
// - Отображение фатальных ошибок в коды возврата
//
// ==============================================================================

#ifndef REPOGUARD_ENFORCE_HPP
#define REPOGUARD_ENFORCE_HPP

#include "repoguard/cli.hpp"
#include "repoguard/error.hpp"
#include "repoguard/output.hpp"

namespace repoguard::app {

/// Код возврата для фатальной ошибки: Config -> 2, NotFound -> 3, прочие -> 1
int exit_code_for(ErrorKind kind);

/// Выполнить enforce
///
/// Фатальные ошибки (repoguard::Exception) печатаются как "[x] <message>"
/// и не выходят наружу.
///
/// @return 0 чисто, 1 нарушения, 2 ошибка конфигурации, 3 корень не найден,
///         130 прерывание
int run_enforce(const cli::EnforceCommand& cmd, output::Writer& writer);

}  // namespace repoguard::app

#endif  // REPOGUARD_ENFORCE_HPP
