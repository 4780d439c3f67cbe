// ==============================================================================
// discovery.cpp - Поиск файлов
// ==============================================================================
//
// Обход в глубину на явном стеке кадров. Каждый кадр - отсортированное
// содержимое одного каталога, поэтому порядок выдачи воспроизводим между
// запусками на неизменном дереве.
//
// ==============================================================================

#include "repoguard/discovery.hpp"

#include "repoguard/platform.hpp"

#include <algorithm>
#include <system_error>

namespace repoguard::io {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

// Является ли prefix (покомпонентно) префиксом path
bool has_path_prefix(const fs::path& path, const fs::path& prefix) {
    auto it = path.begin();
    for (const auto& part : prefix) {
        if (part.empty()) {
            // Хвостовой разделитель "dir/"
            continue;
        }
        if (it == path.end() || *it != part) {
            return false;
        }
        ++it;
    }
    return true;
}

}  // namespace

bool is_skipped(const fs::path& relative, const fs::path& absolute,
                const std::vector<std::string>& skip) {
    if (skip.empty()) {
        return false;
    }

    const std::string rel = relative.generic_string();
    for (const auto& pattern : skip) {
        if (pattern.empty()) {
            continue;
        }
        fs::path pattern_path = platform::path_from_utf8(pattern);
        if (pattern_path.is_absolute()) {
            // Абсолютный шаблон: сам путь или его поддерево
            if (has_path_prefix(absolute.lexically_normal(), pattern_path.lexically_normal())) {
                return true;
            }
            continue;
        }
        // Относительный шаблон: подстрока относительного пути
        if (rel.find(pattern_path.generic_string()) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Discovery
// ----------------------------------------------------------------------------

Discovery::Discovery(const fs::path& root, const config::ScanConfig& cfg,
                     const std::atomic<bool>* cancel)
    : root_(root), cfg_(cfg), cancel_(cancel) {
    std::error_code ec;
    fs::file_status status = fs::status(root_, ec);
    if (ec || !fs::exists(status)) {
        // Фатально: ни один файл ещё не тронут
        throw not_found_error("Specified folder does not exist", platform::path_to_utf8(root_));
    }

    root_abs_ = fs::absolute(root_, ec);
    if (ec) {
        root_abs_ = root_;
    }

    if (fs::is_regular_file(status)) {
        // Корень-файл: относительный путь для шаблонов skip - его имя
        if (is_skipped(root_.filename(), root_abs_, cfg_.skip)) {
            ++skipped_;
            return;
        }
        if (cfg_.matches_extension(root_)) {
            single_file_ = root_;
        }
        return;
    }

    if (!fs::is_directory(status)) {
        throw not_found_error("Specified path is not a folder or regular file",
                              platform::path_to_utf8(root_));
    }

    push_directory(root_);
}

bool Discovery::cancelled() const {
    return cancel_ != nullptr && cancel_->load();
}

bool Discovery::push_directory(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        warnings_.push_back(
            Error{ErrorKind::Read, "failed to read directory: " + ec.message(), platform::path_to_utf8(dir)});
        return false;
    }

    Frame frame;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        frame.entries.push_back(it->path());
    }
    if (ec) {
        warnings_.push_back(Error{ErrorKind::Read, "failed to enter directory: " + ec.message(),
                                  platform::path_to_utf8(dir)});
        return false;
    }

    std::sort(frame.entries.begin(), frame.entries.end());
    stack_.push_back(std::move(frame));
    return true;
}

std::optional<fs::path> Discovery::next() {
    if (single_file_.has_value()) {
        if (cancelled()) {
            single_file_.reset();
            return std::nullopt;
        }
        fs::path result = std::move(*single_file_);
        single_file_.reset();
        ++yielded_;
        return result;
    }

    while (!stack_.empty()) {
        if (cancelled()) {
            // Отмена: больше ничего не выдаём
            stack_.clear();
            return std::nullopt;
        }

        Frame& top = stack_.back();
        if (top.index >= top.entries.size()) {
            stack_.pop_back();
            continue;
        }
        // Копия: push_directory() может инвалидировать ссылку на кадр
        fs::path entry = top.entries[top.index++];

        fs::path relative = entry.lexically_relative(root_);
        if (is_skipped(relative, root_abs_ / relative, cfg_.skip)) {
            // Каталог отсекается вместе со всем поддеревом
            ++skipped_;
            continue;
        }

        std::error_code ec;
        fs::file_status status = fs::symlink_status(entry, ec);
        if (ec) {
            warnings_.push_back(Error{ErrorKind::Read, "failed to get metadata: " + ec.message(),
                                      platform::path_to_utf8(entry)});
            continue;
        }

        if (fs::is_symlink(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            if (cfg_.recursive) {
                push_directory(entry);
            }
            continue;
        }
        if (fs::is_regular_file(status) && cfg_.matches_extension(entry)) {
            ++yielded_;
            return entry;
        }
    }

    return std::nullopt;
}

// ----------------------------------------------------------------------------
// discover_files
// ----------------------------------------------------------------------------

std::vector<fs::path> discover_files(const fs::path& root, const config::ScanConfig& cfg) {
    Discovery discovery(root, cfg);
    std::vector<fs::path> result;
    while (auto path = discovery.next()) {
        result.push_back(std::move(*path));
    }
    return result;
}

}  // namespace repoguard::io
