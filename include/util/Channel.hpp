#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace reprise::util {

// Unbounded multi-producer queue drained by a single consumer.
// Items come out in the order they were pushed.
template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Blocks until an item arrives, the timeout expires, or stop is requested
    [[nodiscard]] std::optional<T> pop_for(std::chrono::milliseconds timeout, std::stop_token stop_token) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, stop_token, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Drops pending items and rejects further pushes
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool closed_ = false;
};

}  // namespace reprise::util
