#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace easel {

// Hands events from worker threads to one consumer, in arrival order.
template<typename T>
class EventQueue {
public:
    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    // Blocks until an event arrives or the timeout passes.
    template<typename Rep, typename Period>
    std::optional<T> wait_pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !pending_.empty(); });
        return take_front();
    }

    std::deque<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::exchange(pending_, {});
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.empty();
    }

private:
    std::optional<T> take_front() {
        if (pending_.empty()) {
            return std::nullopt;
        }
        std::optional<T> event(std::move(pending_.front()));
        pending_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> pending_;
};

}
