// ==============================================================================
// repoguard/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - TTY detection
// - Права доступа (execute / write)
// - Атомарная замена файла
// - Обработка прерывания (SIGINT/SIGTERM)
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef REPOGUARD_PLATFORM_HPP
#define REPOGUARD_PLATFORM_HPP

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>

namespace repoguard::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Права доступа
// ----------------------------------------------------------------------------

/// Установлен ли хотя бы один бит execute (owner/group/others)
/// На Windows всегда false: понятия execute-бита там нет
bool is_executable(const std::filesystem::path& p);

/// Может ли текущий процесс писать в файл
/// Требуются бит owner_write и (POSIX) access(W_OK)
bool is_writable(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Атомарная замена
// ----------------------------------------------------------------------------

/// Атомарно заменить содержимое файла
///
/// Файл, недоступный процессу на запись (is_writable), не заменяется.
/// Содержимое пишется во временный файл рядом с target, получает права и
/// владельца target и переименовывается поверх него. При любой ошибке
/// временный файл удаляется, target остаётся нетронутым.
///
/// @throws std::runtime_error при ошибке записи или переименования
void replace_file_atomic(const std::filesystem::path& target, std::string_view bytes);

// ----------------------------------------------------------------------------
// Прерывание
// ----------------------------------------------------------------------------

/// Установить обработчики SIGINT/SIGTERM, выставляющие interrupt_flag()
void install_interrupt_handler();

/// Флаг прерывания (общий на процесс)
std::atomic<bool>& interrupt_flag();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

}  // namespace repoguard::platform

#endif  // REPOGUARD_PLATFORM_HPP
