// ==============================================================================
// repoguard/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) при TTY
//
// Только этот модуль пишет в stdout/stderr. Writer не потокобезопасен:
// используется из главного потока.
//
// ==============================================================================

#ifndef REPOGUARD_OUTPUT_HPP
#define REPOGUARD_OUTPUT_HPP

#include <string>
#include <string_view>

namespace repoguard::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки, нарушения
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
    bool color = true;   // false: никогда не выводить ANSI codes
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// Записать строку цветом (цвет только при TTY) + перевод строки
    void colored_line(Stream s, std::string_view message, Color color);

    // Сообщения с префиксами (stderr)
    // -------------------------------------------------------------------------

    /// "[+] <message>", подавляется при quiet
    void info(std::string_view message);

    /// "[!] <message>", подавляется при quiet
    void warn(std::string_view message);

    /// "[x] <message>", выводится всегда
    void error(std::string_view message);

    /// "[*] <message>", только при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>", только при verbose > 1
    void trace(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Префикс (цветной при TTY) + сообщение + newline в stderr
    void prefixed(std::string_view prefix, Color color, std::string_view message);

    bool use_color(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace repoguard::output

#endif  // REPOGUARD_OUTPUT_HPP
