#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace showgrab {
namespace core {

// Unbounded multi-producer queue; workers push, the controlling thread pops.
template <typename T>
class EventQueue {
public:
    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    template <typename Rep, typename Period>
    std::optional<T> waitPop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !events_.empty(); });
        return popLocked();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.empty();
    }

private:
    std::optional<T> popLocked() {
        if (events_.empty()) {
            return std::nullopt;
        }
        T event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> events_;
};

} // namespace core
} // namespace showgrab
