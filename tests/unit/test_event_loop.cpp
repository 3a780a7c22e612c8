/**
 * @file test_event_loop.cpp
 * @brief Unit tests for the poll-based EventLoop.
 */

#include "core/event_loop.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <fcntl.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace jobtier;
using namespace std::chrono_literals;

TEST(EventLoopTest, OneShotTimerFiresOnce) {
    EventLoop loop;
    int fired = 0;
    loop.add_timer(10ms, [&] { ++fired; });

    EXPECT_TRUE(loop.run_until([&] { return fired > 0; }, 1000ms));
    loop.run_until([] { return false; }, 50ms);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.pending_timer_count(), 0u);
}

TEST(EventLoopTest, TimersFireInDueOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.add_timer(30ms, [&] { order.push_back(3); });
    loop.add_timer(10ms, [&] { order.push_back(1); });
    loop.add_timer(20ms, [&] { order.push_back(2); });

    loop.run_until([&] { return order.size() == 3; }, 1000ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.add_timer(10ms, [&] { fired = true; });

    EXPECT_TRUE(loop.is_timer_pending(id));
    EXPECT_TRUE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.cancel_timer(kInvalidTimer));

    loop.run_until([] { return false; }, 50ms);
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, PeriodicTimerRepeatsUntilCancelled) {
    EventLoop loop;
    int ticks = 0;
    TimerId id = kInvalidTimer;
    id = loop.add_periodic_timer(5ms, [&] {
        if (++ticks == 3) loop.cancel_timer(id);
    });

    loop.run_until([] { return false; }, 150ms);
    EXPECT_EQ(ticks, 3);
    EXPECT_FALSE(loop.is_timer_pending(id));
}

TEST(EventLoopTest, TimerCallbackMayCancelAnotherDueTimer) {
    EventLoop loop;
    bool second_fired = false;
    TimerId second = kInvalidTimer;
    loop.add_timer(5ms, [&] { loop.cancel_timer(second); });
    second = loop.add_timer(6ms, [&] { second_fired = true; });

    std::this_thread::sleep_for(20ms);      // both due on the next pass
    loop.run_once(0ms);
    EXPECT_FALSE(second_fired);
}

TEST(EventLoopTest, DeferredWorkRunsInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.defer([&] {
        order.push_back(1);
        loop.defer([&] { order.push_back(2); });
    });

    loop.run_once(0ms);
    ASSERT_FALSE(order.empty());
    EXPECT_EQ(order.front(), 1);
    loop.run_until([&] { return order.size() == 2; }, 100ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTest, PostFromAnotherThreadWakesLoop) {
    EventLoop loop;
    std::atomic<bool> ran{false};

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        loop.post([&] {
            ran = true;
            loop.stop();
        });
    });

    auto start = std::chrono::steady_clock::now();
    loop.run();
    producer.join();

    EXPECT_TRUE(ran.load());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(loop.is_running());
}

TEST(EventLoopTest, WatchReadableDescriptor) {
    EventLoop loop;
    int fds[2];
    ASSERT_EQ(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);

    std::string received;
    loop.watch_readable(fds[0], [&] {
        char buf[16];
        auto n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) received.append(buf, static_cast<size_t>(n));
    });
    EXPECT_EQ(loop.watcher_count(), 1u);

    ASSERT_EQ(::write(fds[1], "ping", 4), 4);
    loop.run_until([&] { return received == "ping"; }, 500ms);
    EXPECT_EQ(received, "ping");

    loop.unwatch(fds[0]);
    EXPECT_EQ(loop.watcher_count(), 0u);
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(EventLoopTest, StopEndsRun) {
    EventLoop loop;
    loop.add_timer(10ms, [&] { loop.stop(); });
    loop.run();
    EXPECT_FALSE(loop.is_running());

    // The stop request does not leak into the next run
    int fired = 0;
    loop.add_timer(5ms, [&] { ++fired; });
    EXPECT_TRUE(loop.run_until([&] { return fired == 1; }, 500ms));
}

TEST(EventLoopTest, RunUntilTimesOut) {
    EventLoop loop;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.run_until([] { return false; }, 60ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 60ms);
}
