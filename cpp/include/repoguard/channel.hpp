// ==============================================================================
// repoguard/channel.hpp - Канал сообщений между потоками
// ==============================================================================
//
// Назначение:
// - Передача путей от Discovery к воркерам и записей от воркеров обратно
// - Мьютекс защищает только очередь канала, не файловый I/O
// - capacity > 0 ограничивает очередь: send() ждёт свободного места
//
// Протокол: отправитель вызывает close() после последнего send();
// receive() возвращает nullopt, когда канал закрыт и пуст.
//
// ==============================================================================

#ifndef REPOGUARD_CHANNEL_HPP
#define REPOGUARD_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace repoguard {

template <typename T>
class Channel {
public:
    /// @param capacity Максимальная длина очереди (0 = без ограничения)
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Отправить значение; блокируется, пока очередь полна
    /// @return false если канал уже закрыт (значение отброшено)
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || capacity_ == 0 || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Получить значение; блокируется, пока очередь пуста и канал открыт
    /// @return nullopt если канал закрыт и пуст
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    /// Закрыть канал: новые send() отклоняются, очередь дочитывается
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    const std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}  // namespace repoguard

#endif  // REPOGUARD_CHANNEL_HPP
