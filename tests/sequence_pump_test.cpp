// SPDX-License-Identifier: MIT

// tests/sequence_pump_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/sink.hpp"
#include "src/sequence.hpp"
#include "src/sequence_pump.hpp"

using namespace seq_pipe;

namespace {

// Records every sink callback in arrival order.
struct RecordingSink {
    std::string tag;
    std::vector<std::string>* log = nullptr;
    std::vector<int> items;
    std::optional<Error> error;
    bool completed = false;

    void OnData(int&& x) {
        items.push_back(x);
        if (log) log->push_back(tag + std::to_string(x));
    }
    void OnError(const Error& e) { error = e; }
    void OnComplete() { completed = true; }
};

static_assert(StreamingSink<RecordingSink, int>);

class SequencePumpTest : public ::testing::Test {
protected:
    void RunLoop() { loop_.RunUntilIdle(); }

    std::shared_ptr<RecordingSink> MakeSink(std::string tag = "",
                                            std::vector<std::string>* log = nullptr) {
        auto sink = std::make_shared<RecordingSink>();
        sink->tag = std::move(tag);
        sink->log = log;
        return sink;
    }

    EpollEventLoop loop_;
};

}  // namespace

TEST_F(SequencePumpTest, DeliversAllItemsThenCompletes) {
    auto sink = MakeSink();
    auto pump = Pump(loop_, Iota<int>(1, 6), sink);

    EXPECT_TRUE(sink->items.empty());  // Nothing runs until the loop does
    RunLoop();

    EXPECT_EQ(sink->items, (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(sink->completed);
    EXPECT_FALSE(sink->error.has_value());
    EXPECT_TRUE(pump->IsFinished());
    EXPECT_EQ(pump->ItemsDelivered(), 5u);
}

TEST_F(SequencePumpTest, TwoPumpsInterleave) {
    std::vector<std::string> log;
    auto a = Pump(loop_, Iota<int>(1, 4), MakeSink("a", &log));
    auto b = Pump(loop_, Iota<int>(1, 4), MakeSink("b", &log));

    RunLoop();

    EXPECT_EQ(log, (std::vector<std::string>{"a1", "b1", "a2", "b2", "a3", "b3"}));
}

TEST_F(SequencePumpTest, ItemsPerTurnBatchesPulls) {
    std::vector<std::string> log;
    auto a = Pump(loop_, Iota<int>(1, 5), MakeSink("a", &log), PumpConfig{.items_per_turn = 2});
    auto b = Pump(loop_, Iota<int>(1, 5), MakeSink("b", &log), PumpConfig{.items_per_turn = 2});

    RunLoop();

    EXPECT_EQ(log, (std::vector<std::string>{"a1", "a2", "b1", "b2", "a3", "a4", "b3", "b4"}));
}

TEST_F(SequencePumpTest, OtherTasksRunBetweenPulls) {
    std::vector<std::string> log;
    auto pump = Pump(loop_, Iota<int>(1, 4), MakeSink("p", &log));
    loop_.Defer([&]() {
        log.push_back("task");
    });

    RunLoop();

    EXPECT_EQ(log, (std::vector<std::string>{"p1", "task", "p2", "p3"}));
}

TEST_F(SequencePumpTest, SuspendAndResume) {
    std::vector<int> items;
    bool completed = false;
    std::shared_ptr<SequencePump<int, CallbackSink<int>>> pump;

    auto sink = std::make_shared<CallbackSink<int>>(
        [&](int&& x) {
            items.push_back(x);
            if (x == 3) pump->Suspend();
        },
        [](const Error&) {},
        [&]() { completed = true; });

    pump = SequencePump<int, CallbackSink<int>>::Create(
        loop_, Iota<int>(1, 7), sink, PumpConfig{.items_per_turn = 10});
    pump->Start();
    RunLoop();

    EXPECT_EQ(items, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(pump->IsSuspended());
    EXPECT_FALSE(completed);

    pump->Resume();
    RunLoop();

    EXPECT_EQ(items, (std::vector<int>{1, 2, 3, 4, 5, 6}));
    EXPECT_TRUE(completed);
}

TEST_F(SequencePumpTest, NestedSuspendNeedsMatchingResumes) {
    auto sink = MakeSink();
    auto pump = SequencePump<int, RecordingSink>::Create(loop_, Iota<int>(1, 4), sink);

    pump->Suspend();
    pump->Suspend();
    pump->Start();
    RunLoop();
    EXPECT_TRUE(sink->items.empty());

    pump->Resume();
    RunLoop();
    EXPECT_TRUE(sink->items.empty());

    pump->Resume();
    RunLoop();
    EXPECT_EQ(sink->items, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(sink->completed);
}

TEST_F(SequencePumpTest, CloseStopsWithoutCompletion) {
    std::vector<int> items;
    bool completed = false;
    std::shared_ptr<SequencePump<int, CallbackSink<int>>> pump;

    auto sink = std::make_shared<CallbackSink<int>>(
        [&](int&& x) {
            items.push_back(x);
            if (x == 5) pump->Close();
        },
        [](const Error&) {},
        [&]() { completed = true; });

    pump = SequencePump<int, CallbackSink<int>>::Create(loop_, Iota<int>(1), sink);
    pump->Start();
    RunLoop();

    EXPECT_EQ(items, (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_FALSE(completed);
    EXPECT_TRUE(pump->IsClosed());
    EXPECT_FALSE(pump->IsFinished());
}

TEST_F(SequencePumpTest, ThrowingStageReportsCallbackFailed) {
    auto sink = MakeSink();
    auto pump = Pump(loop_,
                     Iota<int>(1, 10).Map([](int x) {
                         if (x == 3) throw std::runtime_error("stage failed at 3");
                         return x;
                     }),
                     sink);

    RunLoop();

    EXPECT_EQ(sink->items, (std::vector<int>{1, 2}));
    ASSERT_TRUE(sink->error.has_value());
    EXPECT_EQ(sink->error->code, ErrorCode::CallbackFailed);
    EXPECT_EQ(sink->error->message, "stage failed at 3");
    EXPECT_FALSE(sink->completed);
    EXPECT_TRUE(pump->IsFinished());
}

TEST_F(SequencePumpTest, ZeroItemsPerTurnThrows) {
    EXPECT_THROW(Pump(loop_, Iota<int>(1, 3), MakeSink(), PumpConfig{.items_per_turn = 0}),
                 PipeError);
}

TEST_F(SequencePumpTest, DroppedPumpDeliversNothing) {
    auto sink = MakeSink();
    auto pump = Pump(loop_, Iota<int>(1, 4), sink);
    pump.reset();

    RunLoop();

    EXPECT_TRUE(sink->items.empty());
    EXPECT_FALSE(sink->completed);
}
