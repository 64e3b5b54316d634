#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace easel {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Cooperative scheduler for the main thread. post() and post_delayed() may be
// called from any thread; work only runs inside poll() on the polling thread.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    explicit EventLoop(std::shared_ptr<Clock> clock);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);
    TimerId post_delayed(std::chrono::milliseconds delay, Task task);
    bool cancel(TimerId id);

    // Pollers run at the start of every poll(), e.g. a transport draining pty output.
    void add_poller(Task poller);

    // Runs pollers, then posted tasks, then every timer that is due. Returns
    // the number of tasks and timers executed.
    size_t poll();

    // Polls until done() is true or the wall-clock timeout expires.
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout,
                   std::chrono::milliseconds interval = std::chrono::milliseconds(10));

    size_t pending_timers() const;
    const Clock& clock() const { return *clock_; }

private:
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
    std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_index_;
    TimerId next_timer_id_ = 1;
    std::vector<Task> pollers_;
};

}
