// ==============================================================================
// repoguard/error.hpp - Таксономия ошибок
// ==============================================================================
//
// Назначение:
// - ErrorKind: NotFound / Read / Write / Config
// - Error: значение ошибки (вид + сообщение + путь)
// - Exception: исключение для фатальных ошибок (NotFound, Config)
//
// Политика:
// - Фатальные ошибки пробрасываются как Exception до границы app
// - Ошибки уровня файла (Read, Write) сохраняются в FileRecord и не
//   прерывают сканирование
//
// ==============================================================================

#ifndef REPOGUARD_ERROR_HPP
#define REPOGUARD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace repoguard {

// ----------------------------------------------------------------------------
// ErrorKind - вид ошибки
// ----------------------------------------------------------------------------

enum class ErrorKind {
    NotFound,  // Корневая папка не существует (фатально)
    Read,      // Файл не открывается или не является текстом
    Write,     // Не удалось переписать файл при нормализации
    Config     // Конфликтующие флаги, плохой конфиг (фатально)
};

/// Преобразовать ErrorKind в строку ("NotFoundError", ...)
const char* error_kind_to_string(ErrorKind kind);

// ----------------------------------------------------------------------------
// Error - значение ошибки
// ----------------------------------------------------------------------------

struct Error {
    ErrorKind kind = ErrorKind::Read;
    std::string message;
    std::string path;  // UTF-8, может быть пустым

    /// Форматировать ошибку для вывода
    /// Формат: "<message>" или "<message> - <path>"
    std::string format() const;

    /// Фатальна ли ошибка (прерывает весь запуск)
    bool is_fatal() const { return kind == ErrorKind::NotFound || kind == ErrorKind::Config; }
};

// ----------------------------------------------------------------------------
// Exception - исключение для фатальных ошибок
// ----------------------------------------------------------------------------

class Exception : public std::runtime_error {
public:
    explicit Exception(Error error);

    const Error& error() const noexcept { return error_; }
    ErrorKind kind() const noexcept { return error_.kind; }

private:
    Error error_;
};

/// Сконструировать Exception вида Config
Exception config_error(const std::string& message, const std::string& path = {});

/// Сконструировать Exception вида NotFound
Exception not_found_error(const std::string& message, const std::string& path);

}  // namespace repoguard

#endif  // REPOGUARD_ERROR_HPP
