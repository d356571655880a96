#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <cstddef>

namespace torrentflow::core {

// Multi-producer queue with a fixed capacity. push() never blocks: when the
// queue is full the oldest element is discarded to make room.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns false if an element had to be dropped.
    bool push(T value) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_count_;
                dropped = true;
            }
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return !dropped;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    // Waits up to `timeout`; returns nullopt on timeout or once closed and drained.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });

        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

    std::size_t dropped_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_count_;
    }

private:
    const std::size_t capacity_;
    std::deque<T> items_;
    std::size_t dropped_count_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}
