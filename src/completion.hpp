// SPDX-License-Identifier: MIT

// src/completion.hpp
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace seq_pipe {

/// Shared cancellation flag handed to every task started by one run.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag MakeCancelFlag() {
    return std::make_shared<std::atomic<bool>>(false);
}

// Completion<R> - the handle a user task reports its result through.
//
// Copyable; all copies share one state, and only the first report is
// delivered. Reports made off the event-loop thread are marshalled onto
// the loop with Defer(), so the receiver always runs on the loop thread.
//
// Cancelled() turns true when the run that started the task has already
// failed. The task is not interrupted; a cooperative task can check the
// flag and finish early, and whatever it reports is discarded.
template<typename R>
class Completion {
public:
    using Callback = std::function<void(std::expected<R, Error>)>;

    Completion(IEventLoop& loop, Callback on_done, CancelFlag cancelled = nullptr)
        : state_(std::make_shared<State>(loop, std::move(on_done), std::move(cancelled))) {}

    void Complete(R value) const {
        Report(std::expected<R, Error>(std::move(value)));
    }

    void Fail(Error error) const {
        Report(std::unexpected(std::move(error)));
    }

    void operator()(std::expected<R, Error> result) const {
        Report(std::move(result));
    }

    bool Cancelled() const {
        return state_->cancelled && state_->cancelled->load(std::memory_order_acquire);
    }

    /// @return true once a result has been reported through any copy.
    bool IsReported() const { return state_->reported.load(std::memory_order_acquire); }

private:
    struct State {
        State(IEventLoop& l, Callback cb, CancelFlag c)
            : loop(l), on_done(std::move(cb)), cancelled(std::move(c)) {}

        IEventLoop& loop;
        Callback on_done;
        CancelFlag cancelled;
        std::atomic<bool> reported{false};
    };

    void Report(std::expected<R, Error> result) const {
        if (state_->reported.exchange(true, std::memory_order_acq_rel)) return;
        auto cb = std::move(state_->on_done);
        state_->on_done = nullptr;
        if (!cb) return;
        if (state_->loop.IsInEventLoopThread()) {
            cb(std::move(result));
        } else {
            state_->loop.Defer([cb = std::move(cb), result = std::move(result)]() mutable {
                cb(std::move(result));
            });
        }
    }

    std::shared_ptr<State> state_;
};

}  // namespace seq_pipe
