#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pkgdash {

// Multi-producer, single-consumer channel between units of work and the
// interactive loop
template <typename T>
class MessageQueue {
public:
    MessageQueue() = default;

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    void push(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(message));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    template <typename Rep, typename Period>
    std::optional<T> wait_pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> queue_;
};

} // namespace pkgdash
