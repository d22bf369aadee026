// SPDX-License-Identifier: MIT

// lib/stream/suspendable.hpp
#pragma once

namespace seq_pipe {

/// Interface for event-loop producers that support backpressure.
///
/// Uses suspend-count semantics:
/// - Suspend() increments the count; Resume() decrements it.
/// - IsSuspended() returns true when the count is greater than zero.
/// - Actual pause/resume only happens on 0-to-1 and 1-to-0 transitions,
///   allowing nested suspend calls from multiple downstream consumers.
///
/// Thread safety:
/// - Suspend(), Resume(), Close() must be called from the event-loop thread.
/// - IsSuspended() is thread-safe (atomic load).
class Suspendable {
public:
    virtual ~Suspendable() = default;

    /// Increment the suspend count. When the count goes from 0 to 1,
    /// the producer stops pulling.
    virtual void Suspend() = 0;

    /// Decrement the suspend count. When the count goes from 1 to 0,
    /// the producer schedules its next pull.
    virtual void Resume() = 0;

    /// Stop producing. No further callbacks after Close().
    virtual void Close() = 0;

    /// @return true if the producer is currently suspended (count > 0).
    virtual bool IsSuspended() const = 0;
};

}  // namespace seq_pipe
