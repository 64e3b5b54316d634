#include "core/event_loop.h"

#include <thread>

namespace easel {

EventLoop::EventLoop()
    : clock_(std::make_shared<SteadyClock>())
{
}

EventLoop::EventLoop(std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>())
{
}

void EventLoop::post(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

EventLoop::TimerId EventLoop::post_delayed(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_timer_id_++;
    auto due = clock_->now() + delay;
    timers_.emplace(std::make_pair(due, id), std::move(task));
    timer_index_[id] = due;
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_index_.find(id);
    if (it == timer_index_.end()) {
        return false;
    }
    timers_.erase(std::make_pair(it->second, id));
    timer_index_.erase(it);
    return true;
}

void EventLoop::add_poller(Task poller) {
    std::lock_guard<std::mutex> lock(mutex_);
    pollers_.push_back(std::move(poller));
}

size_t EventLoop::poll() {
    std::vector<Task> pollers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pollers = pollers_;
    }
    for (auto& poller : pollers) {
        poller();
    }

    size_t executed = 0;

    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        task();
        ++executed;
    }

    // Timers scheduled by a firing timer with zero delay run on the next poll.
    auto now = clock_->now();
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!timers_.empty() && timers_.begin()->first.first <= now) {
            auto node = timers_.extract(timers_.begin());
            timer_index_.erase(node.key().second);
            due.push_back(std::move(node.mapped()));
        }
    }
    for (auto& task : due) {
        task();
        ++executed;
    }

    return executed;
}

bool EventLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout,
                          std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (poll() == 0) {
            std::this_thread::sleep_for(interval);
        }
    }
    return true;
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

}
