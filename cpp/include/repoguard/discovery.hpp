// ==============================================================================
// repoguard/discovery.hpp - Поиск файлов
// ==============================================================================
//
// Назначение:
// - Ленивый обход дерева каталогов (явный стек вместо рекурсии)
// - Фильтрация по расширениям (ScanConfig::matches_extension)
// - Исключения по skip-шаблонам: совпавший каталог отсекается целиком,
//   без захода внутрь
// - Детерминированный порядок: лексикографический внутри каталога,
//   обход в глубину
// - Остановка по флагу отмены
// - Символьные ссылки не обходятся (ни на файлы, ни на каталоги)
//
// ==============================================================================

#ifndef REPOGUARD_DISCOVERY_HPP
#define REPOGUARD_DISCOVERY_HPP

#include "repoguard/config.hpp"
#include "repoguard/error.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace repoguard::io {

// ----------------------------------------------------------------------------
// Discovery - одноразовая ленивая последовательность путей
// ----------------------------------------------------------------------------

/// Использование:
/// @code
///   io::Discovery discovery(root, cfg, &platform::interrupt_flag());
///   while (auto path = discovery.next()) {
///       // обработка *path
///   }
/// @endcode
///
/// Последовательность не перезапускается: после исчерпания next() всегда
/// возвращает nullopt.
class Discovery {
public:
    /// @param root Корневая папка (или одиночный файл)
    /// @param cfg Конфигурация; должна пережить Discovery
    /// @param cancel Флаг отмены (может быть nullptr)
    /// @throws repoguard::Exception (ErrorKind::NotFound) если root не существует
    Discovery(const std::filesystem::path& root, const config::ScanConfig& cfg,
              const std::atomic<bool>* cancel = nullptr);

    Discovery(const Discovery&) = delete;
    Discovery& operator=(const Discovery&) = delete;

    /// Следующий путь-кандидат или nullopt (исчерпано или отменено)
    std::optional<std::filesystem::path> next();

    /// Каталоги, которые не удалось прочитать (не фатально)
    const std::vector<Error>& warnings() const { return warnings_; }

    /// Сколько путей уже выдано
    std::size_t yielded() const { return yielded_; }

    /// Сколько файлов/каталогов отброшено skip-шаблонами
    std::size_t skipped() const { return skipped_; }

    const std::filesystem::path& root() const { return root_; }

private:
    // Кадр явного стека: отсортированное содержимое одного каталога
    struct Frame {
        std::vector<std::filesystem::path> entries;
        std::size_t index = 0;
    };

    /// Прочитать и отсортировать содержимое каталога
    /// @return false если каталог не читается (ошибка уходит в warnings_)
    bool push_directory(const std::filesystem::path& dir);

    bool cancelled() const;

    std::filesystem::path root_;
    std::filesystem::path root_abs_;
    const config::ScanConfig& cfg_;
    const std::atomic<bool>* cancel_;

    std::vector<Frame> stack_;
    std::optional<std::filesystem::path> single_file_;

    std::vector<Error> warnings_;
    std::size_t yielded_ = 0;
    std::size_t skipped_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Совпадает ли путь с одним из skip-шаблонов
///
/// Относительный шаблон - подстрока относительного пути (с '/' как
/// разделителем). Абсолютный шаблон - сам путь или любой его родитель.
///
/// @param relative Путь относительно корня
/// @param absolute Полный путь
bool is_skipped(const std::filesystem::path& relative, const std::filesystem::path& absolute,
                const std::vector<std::string>& skip);

/// Собрать все пути в вектор (удобно для тестов и небольших деревьев)
/// @throws repoguard::Exception (ErrorKind::NotFound)
std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  const config::ScanConfig& cfg);

}  // namespace repoguard::io

#endif  // REPOGUARD_DISCOVERY_HPP
