// SPDX-License-Identifier: MIT

// tests/epoll_event_loop_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"

using namespace seq_pipe;

TEST(EpollEventLoopTest, DeferredCallbacksRunInOrder) {
    EpollEventLoop loop;
    std::vector<int> order;

    loop.Defer([&]() { order.push_back(1); });
    loop.Defer([&]() { order.push_back(2); });
    loop.Defer([&]() { order.push_back(3); });

    loop.Poll(0);

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(loop.HasPendingWork());
}

TEST(EpollEventLoopTest, DeferFromCallbackWaitsForNextBatch) {
    EpollEventLoop loop;
    std::vector<int> order;

    loop.Defer([&]() {
        order.push_back(1);
        loop.Defer([&]() { order.push_back(3); });
    });
    loop.Defer([&]() { order.push_back(2); });

    loop.RunUntilIdle();

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EpollEventLoopTest, PollWithNothingPendingReturns) {
    EpollEventLoop loop;
    loop.Poll(0);
    EXPECT_FALSE(loop.HasPendingWork());
}

TEST(EpollEventLoopTest, IsInEventLoopThreadFalseBeforeFirstRun) {
    EpollEventLoop loop;
    EXPECT_FALSE(loop.IsInEventLoopThread());
}

TEST(EpollEventLoopTest, IsInEventLoopThreadInsideCallbacks) {
    EpollEventLoop loop;
    bool deferred_on_loop = false;
    bool timer_on_loop = false;

    loop.Defer([&]() { deferred_on_loop = loop.IsInEventLoopThread(); });
    loop.Schedule(std::chrono::milliseconds(1),
                  [&]() { timer_on_loop = loop.IsInEventLoopThread(); });
    loop.RunUntilIdle();

    EXPECT_TRUE(deferred_on_loop);
    EXPECT_TRUE(timer_on_loop);
}

TEST(EpollEventLoopTest, IsInEventLoopThreadFalseFromOtherThread) {
    EpollEventLoop loop;
    loop.Poll(0);

    std::atomic<bool> other{true};
    std::thread worker([&]() { other = loop.IsInEventLoopThread(); });
    worker.join();

    EXPECT_TRUE(loop.IsInEventLoopThread());
    EXPECT_FALSE(other.load());
}

TEST(EpollEventLoopTest, TimersFireByDeadline) {
    EpollEventLoop loop;
    std::vector<int> order;

    loop.Schedule(std::chrono::milliseconds(20), [&]() { order.push_back(2); });
    loop.Schedule(std::chrono::milliseconds(1), [&]() { order.push_back(1); });
    EXPECT_EQ(loop.PendingTimers(), 2u);

    loop.RunUntilIdle();

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(EpollEventLoopTest, ZeroDelayTimerStillFires) {
    EpollEventLoop loop;
    int fired = 0;

    loop.Schedule(std::chrono::milliseconds(0), [&]() { ++fired; });
    loop.Schedule(std::chrono::milliseconds(-5), [&]() { ++fired; });
    loop.RunUntilIdle();

    EXPECT_EQ(fired, 2);
}

TEST(EpollEventLoopTest, TimerCanScheduleAnotherTimer) {
    EpollEventLoop loop;
    int fired = 0;

    loop.Schedule(std::chrono::milliseconds(1), [&]() {
        ++fired;
        loop.Schedule(std::chrono::milliseconds(1), [&]() { ++fired; });
    });
    loop.RunUntilIdle();

    EXPECT_EQ(fired, 2);
}

TEST(EpollEventLoopTest, DestroyWithArmedTimersDoesNotFire) {
    bool fired = false;
    {
        EpollEventLoop loop;
        loop.Schedule(std::chrono::milliseconds(1), [&]() { fired = true; });
    }
    EXPECT_FALSE(fired);
}

TEST(EpollEventLoopRunUntilTest, StopsWhenPredicateHolds) {
    EpollEventLoop loop;

    int calls = 0;
    std::function<void()> step = [&]() {
        ++calls;
        loop.Defer(step);  // Never goes idle on its own
    };
    loop.Defer(step);

    loop.RunUntil([&] { return calls >= 3; });

    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(loop.HasPendingWork());
}

TEST(EpollEventLoopRunUntilTest, WaitsForDeferFromAnotherThread) {
    EpollEventLoop loop;
    bool delivered = false;
    loop.Poll(0);

    // The loop has nothing deferred and no timers while the worker sleeps
    std::thread worker([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        loop.Defer([&]() { delivered = true; });
    });

    auto start = std::chrono::steady_clock::now();
    loop.RunUntil([&] { return delivered; });
    auto waited = std::chrono::steady_clock::now() - start;
    worker.join();

    EXPECT_TRUE(delivered);
    EXPECT_GE(waited, std::chrono::milliseconds(10));
}

TEST(EpollEventLoopRunUntilTest, StopFromAnotherThreadEndsWait) {
    EpollEventLoop loop;

    std::thread worker([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        loop.Stop();
    });
    loop.RunUntil([] { return false; });
    worker.join();

    // Stop is sticky
    bool ran = false;
    loop.Defer([&]() { ran = true; });
    loop.RunUntil([] { return false; });
    EXPECT_TRUE(ran);  // The queue drains once before the stop check
}

TEST(EpollEventLoopRunUntilTest, RunUntilIdleWaitsForTimers) {
    EpollEventLoop loop;
    int calls = 0;

    std::function<void()> step = [&]() {
        if (++calls < 5) loop.Schedule(std::chrono::milliseconds(1), step);
    };
    loop.Defer(step);

    loop.RunUntilIdle();

    EXPECT_EQ(calls, 5);
    EXPECT_FALSE(loop.HasPendingWork());
}

TEST(EpollEventLoopRunUntilTest, RunReturnsAfterStop) {
    EpollEventLoop loop;

    int count = 0;
    std::function<void()> step = [&]() {
        if (++count >= 3) {
            loop.Stop();
        } else {
            loop.Defer(step);
        }
    };
    loop.Defer(step);

    loop.Run();

    EXPECT_EQ(count, 3);
}

TEST(EventLoopTest, RunUntilIdleDrainsDeferredWork) {
    EventLoop loop;
    IEventLoop& iface = loop;

    int calls = 0;
    iface.Defer([&]() {
        ++calls;
        iface.Defer([&]() { ++calls; });
    });

    loop.RunUntilIdle();

    EXPECT_EQ(calls, 2);
}

TEST(EventLoopTest, RunUntilStopsEarly) {
    EventLoop loop;
    IEventLoop& iface = loop;

    int calls = 0;
    std::function<void()> step = [&]() {
        ++calls;
        iface.Defer(step);
    };
    iface.Defer(step);

    loop.RunUntil([&] { return calls >= 4; });

    EXPECT_EQ(calls, 4);
}
