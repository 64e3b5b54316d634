#include <gtest/gtest.h>
#include "core/event_loop.h"
#include "support/fakes.h"

#include <vector>

using namespace easel;
using easel::testing::ManualClock;
using namespace std::chrono_literals;

TEST(EventLoopTest, PostedTasksRunOnPoll) {
    EventLoop loop;
    int runs = 0;
    loop.post([&runs]() { ++runs; });
    loop.post([&runs]() { ++runs; });

    EXPECT_EQ(runs, 0);
    EXPECT_EQ(loop.poll(), 2);
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(loop.poll(), 0);
}

TEST(EventLoopTest, TimersFireWhenDueInOrder) {
    auto clock = std::make_shared<ManualClock>();
    EventLoop loop(clock);
    std::vector<int> order;

    loop.post_delayed(200ms, [&order]() { order.push_back(2); });
    loop.post_delayed(100ms, [&order]() { order.push_back(1); });

    loop.poll();
    EXPECT_TRUE(order.empty());
    EXPECT_EQ(loop.pending_timers(), 2);

    clock->advance(150ms);
    loop.poll();
    ASSERT_EQ(order.size(), 1);
    EXPECT_EQ(order[0], 1);

    clock->advance(100ms);
    loop.poll();
    ASSERT_EQ(order.size(), 2);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(loop.pending_timers(), 0);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    auto clock = std::make_shared<ManualClock>();
    EventLoop loop(clock);
    bool fired = false;

    auto id = loop.post_delayed(10ms, [&fired]() { fired = true; });
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.cancel(id));

    clock->advance(1s);
    loop.poll();
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, ZeroDelayTimerScheduledByTimerRunsNextPoll) {
    auto clock = std::make_shared<ManualClock>();
    EventLoop loop(clock);
    int second = 0;

    loop.post_delayed(0ms, [&]() {
        loop.post_delayed(0ms, [&second]() { ++second; });
    });

    loop.poll();
    EXPECT_EQ(second, 0);
    loop.poll();
    EXPECT_EQ(second, 1);
}

TEST(EventLoopTest, PollersRunEveryPoll) {
    EventLoop loop;
    int polls = 0;
    loop.add_poller([&polls]() { ++polls; });

    loop.poll();
    loop.poll();
    EXPECT_EQ(polls, 2);
}

TEST(EventLoopTest, RunUntilStopsWhenDone) {
    EventLoop loop;
    int count = 0;
    loop.add_poller([&count]() { ++count; });

    EXPECT_TRUE(loop.run_until([&count]() { return count >= 3; }, 5s, 1ms));
    EXPECT_FALSE(loop.run_until([]() { return false; }, 20ms, 1ms));
}
