#include <gtest/gtest.h>
#include "core/event_queue.h"
#include "core/session_events.h"

#include <chrono>
#include <string>
#include <thread>
#include <variant>

using namespace easel;

TEST(EventQueueTest, TryPopOnEmptyQueue) {
    EventQueue<SessionEvent> queue;

    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(EventQueueTest, DrainKeepsTerminalOutputInOrder) {
    EventQueue<SessionEvent> queue;
    queue.push(OutputEvent{"t1", "hello "});
    queue.push(OutputEvent{"t1", "world"});
    queue.push(ExitEvent{"t1", 0});

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 3u);
    EXPECT_EQ(std::get<OutputEvent>(drained[0]).data, "hello ");
    EXPECT_EQ(std::get<OutputEvent>(drained[1]).data, "world");
    EXPECT_EQ(std::get<ExitEvent>(drained[2]).exit_code, 0);
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.drain().empty());
}

TEST(EventQueueTest, WaitPopForTimesOut) {
    EventQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto value = queue.wait_pop_for(std::chrono::milliseconds(20));

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(EventQueueTest, WaitPopForReceivesPushFromAnotherThread) {
    EventQueue<SessionEvent> queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(ExitEvent{"t2", 137});
    });

    auto event = queue.wait_pop_for(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(event.has_value());
    auto* exit = std::get_if<ExitEvent>(&*event);
    ASSERT_NE(exit, nullptr);
    EXPECT_EQ(exit->terminal_id, "t2");
    EXPECT_EQ(exit->exit_code, 137);
}

TEST(EventQueueTest, ConcurrentProducersLoseNothing) {
    EventQueue<int> queue;
    constexpr int PER_PRODUCER = 500;

    auto produce = [&queue](int base) {
        for (int i = 0; i < PER_PRODUCER; ++i) {
            queue.push(base + i);
        }
    };
    std::thread a(produce, 0);
    std::thread b(produce, PER_PRODUCER);

    int received = 0;
    long long sum = 0;
    while (received < 2 * PER_PRODUCER) {
        if (auto value = queue.wait_pop_for(std::chrono::seconds(1))) {
            sum += *value;
            ++received;
        }
    }
    a.join();
    b.join();

    EXPECT_EQ(sum, static_cast<long long>(2 * PER_PRODUCER) * (2 * PER_PRODUCER - 1) / 2);
    EXPECT_TRUE(queue.empty());
}
