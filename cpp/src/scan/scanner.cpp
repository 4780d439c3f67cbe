// ==============================================================================
// scanner.cpp - Конвейер сканирования
// ==============================================================================

#include "repoguard/scanner.hpp"

#include "repoguard/channel.hpp"
#include "repoguard/discovery.hpp"
#include "repoguard/normalizer.hpp"
#include "repoguard/output.hpp"
#include "repoguard/platform.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace repoguard::scan {

check::FileRecord process_file(const std::filesystem::path& path, const config::ScanConfig& cfg) {
    try {
        check::FileRecord record = check::inspect_file(path, cfg);
        if (!cfg.normalizes()) {
            return record;
        }
        return check::apply_normalization(record, cfg);
    } catch (const std::exception& e) {
        // Например std::bad_alloc на огромном файле: запись без проверок
        check::FileRecord record;
        record.path = path;
        record.line_ending = check::LineEndingKind::NotText;
        record.readable = false;
        record.error = Error{ErrorKind::Read, e.what(), platform::path_to_utf8(path)};
        return record;
    }
}

unsigned worker_count(const config::ScanConfig& cfg) {
    if (cfg.num_threads > 0) {
        return cfg.num_threads;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

namespace {

bool is_cancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load();
}

// Закрывает канал путей и дожидается воркеров при любом выходе из run_scan
class WorkerGuard {
public:
    WorkerGuard(Channel<std::filesystem::path>& paths, std::vector<std::thread>& workers)
        : paths_(paths), workers_(workers) {}

    ~WorkerGuard() { join(); }

    WorkerGuard(const WorkerGuard&) = delete;
    WorkerGuard& operator=(const WorkerGuard&) = delete;

    void join() {
        paths_.close();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    Channel<std::filesystem::path>& paths_;
    std::vector<std::thread>& workers_;
};

}  // namespace

report::ScanReport run_scan(const std::filesystem::path& root, const config::ScanConfig& cfg,
                            const std::atomic<bool>* cancel, output::Writer* log) {
    // NotFound бросается здесь, до запуска воркеров
    io::Discovery discovery(root, cfg, cancel);

    const unsigned threads = worker_count(cfg);
    if (log != nullptr) {
        log->debug("scanning " + platform::path_to_utf8(root) + " with " +
                   std::to_string(threads) + " worker(s)");
    }

    Channel<std::filesystem::path> paths(static_cast<std::size_t>(threads) * 4);
    Channel<check::FileRecord> records;

    std::vector<std::thread> workers;
    workers.reserve(threads);
    WorkerGuard guard(paths, workers);

    for (unsigned i = 0; i < threads; ++i) {
        workers.emplace_back([&paths, &records, &cfg, cancel] {
            while (auto path = paths.receive()) {
                // Ещё не начатые пути после отмены отбрасываются
                if (is_cancelled(cancel)) {
                    continue;
                }
                if (!records.send(process_file(*path, cfg))) {
                    break;
                }
            }
        });
    }

    while (auto path = discovery.next()) {
        if (log != nullptr) {
            log->trace("candidate " + platform::path_to_utf8(*path));
        }
        if (!paths.send(std::move(*path))) {
            break;
        }
    }

    guard.join();
    records.close();

    report::ScanReport result;
    result.root = root;
    while (auto record = records.receive()) {
        result.add(std::move(*record));
    }
    result.interrupted = is_cancelled(cancel);
    result.warnings = discovery.warnings();
    result.finalize(cfg);

    if (log != nullptr) {
        log->debug("discovered " + std::to_string(discovery.yielded()) + " file(s), skipped " +
                   std::to_string(discovery.skipped()));
    }
    return result;
}

}  // namespace repoguard::scan
