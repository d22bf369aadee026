// SPDX-License-Identifier: MIT

// src/sequence_pump.hpp
#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <memory>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/sink.hpp"
#include "lib/stream/suspendable.hpp"
#include "src/sequence.hpp"

namespace seq_pipe {

/// Pacing for SequencePump.
struct PumpConfig {
    size_t items_per_turn = 1;   ///< Items pulled per event-loop iteration
};

// SequencePump - drives a deferred pipeline cooperatively on the event loop.
//
// Each loop iteration ("turn") pulls up to items_per_turn items and pushes
// them into the sink, then yields back to the loop with Defer(), so other
// tasks interleave between pulls. Every turn boundary is a suspension point.
//
// State machine:
//   Created -> Running -> Finished (OnComplete or OnError emitted)
//                 |
//                 +-> Closed (Close() called, no further callbacks)
//
// Backpressure uses the Suspendable suspend-count: while suspended no pulls
// happen; the 1-to-0 Resume() transition schedules the next turn. The sink
// may call Suspend() from inside OnData to stop the current turn.
//
// A stage that throws ends the pump with OnError(Error{CallbackFailed}).
//
// Thread safety: Not thread-safe. All methods must be called from the event
// loop thread.
template<typename T, typename Sink>
    requires StreamingSink<Sink, T>
class SequencePump : public Suspendable,
                     public std::enable_shared_from_this<SequencePump<T, Sink>> {
public:
    static std::shared_ptr<SequencePump> Create(
        IEventLoop& loop,
        Sequence<T> sequence,
        std::shared_ptr<Sink> sink,
        PumpConfig config = {}) {
        if (config.items_per_turn == 0) {
            throw PipeError(ErrorCode::InvalidArgument, "items_per_turn must be positive");
        }
        return std::shared_ptr<SequencePump>(
            new SequencePump(loop, std::move(sequence), std::move(sink), config));
    }

    /// Schedule the first turn. Calling Start() again has no effect.
    void Start() {
        if (started_ || closed_) return;
        started_ = true;
        Log()->debug("sequence pump: start ({})", sequence_.Explain());
        ScheduleTurn();
    }

    // =========================================================================
    // Suspendable interface implementation
    // =========================================================================

    void Suspend() override {
        suspend_count_.fetch_add(1, std::memory_order_acq_rel);
    }

    void Resume() override {
        int prev = suspend_count_.fetch_sub(1, std::memory_order_acq_rel);
        assert(prev > 0 && "Resume called more times than Suspend");
        if (prev == 1 && started_) {
            ScheduleTurn();
        }
    }

    void Close() override {
        if (closed_ || finished_) return;
        closed_ = true;
        sequence_.Stop();
    }

    bool IsSuspended() const override {
        return suspend_count_.load(std::memory_order_acquire) > 0;
    }

    bool IsFinished() const { return finished_; }
    bool IsClosed() const { return closed_; }
    size_t ItemsDelivered() const { return delivered_; }
    const std::shared_ptr<Sink>& sink() const { return sink_; }

private:
    SequencePump(IEventLoop& loop, Sequence<T> sequence,
                 std::shared_ptr<Sink> sink, PumpConfig config)
        : loop_(loop),
          sequence_(std::move(sequence)),
          sink_(std::move(sink)),
          config_(config) {}

    void ScheduleTurn() {
        if (turn_scheduled_ || finished_ || closed_) return;
        turn_scheduled_ = true;
        std::weak_ptr<SequencePump> weak_self = this->shared_from_this();
        loop_.Defer([weak_self]() {
            if (auto self = weak_self.lock()) {
                self->RunTurn();
            }
        });
    }

    void RunTurn() {
        turn_scheduled_ = false;
        for (size_t i = 0; i < config_.items_per_turn; ++i) {
            if (finished_ || closed_ || IsSuspended()) return;
            try {
                auto item = sequence_.Next();
                if (!item) {
                    finished_ = true;
                    Log()->debug("sequence pump: complete after {} items", delivered_);
                    sink_->OnComplete();
                    return;
                }
                ++delivered_;
                sink_->OnData(std::move(*item));
            } catch (...) {
                finished_ = true;
                auto error = ErrorFromCurrentException(ErrorCode::CallbackFailed);
                Log()->warn("sequence pump: failed after {} items: {}", delivered_, error.message);
                sink_->OnError(error);
                return;
            }
        }
        if (!IsSuspended()) ScheduleTurn();
    }

    IEventLoop& loop_;
    Sequence<T> sequence_;
    std::shared_ptr<Sink> sink_;
    PumpConfig config_;

    std::atomic<int> suspend_count_{0};
    size_t delivered_ = 0;
    bool started_ = false;
    bool turn_scheduled_ = false;
    bool finished_ = false;
    bool closed_ = false;
};

/// Build and start a pump in one step. Turns hold only a weak reference,
/// so the caller must keep the returned pump alive until it finishes.
template<typename T, typename Sink>
    requires StreamingSink<Sink, T>
std::shared_ptr<SequencePump<T, Sink>> Pump(
    IEventLoop& loop, Sequence<T> sequence, std::shared_ptr<Sink> sink,
    PumpConfig config = {}) {
    auto pump = SequencePump<T, Sink>::Create(loop, std::move(sequence), std::move(sink), config);
    pump->Start();
    return pump;
}

}  // namespace seq_pipe
