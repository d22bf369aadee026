// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace seq_pipe {

/// Single-threaded cooperative event loop.
///
/// Every task the scheduler, pump and async ops start runs as a callback
/// on this loop. "Concurrent" work means interleaved callbacks on one
/// thread, so the state they share needs no locking as long as it is only
/// touched from the loop thread.
///
/// Implement this to run seq-pipe tasks on an existing loop (libuv, asio,
/// etc.). The built-in EventLoop class wraps an epoll implementation
/// behind this interface.
class IEventLoop {
public:
    using TimerCallback = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Queue a callback for the next loop turn. Safe from any thread.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Run a callback once after a delay.
    /// @param delay  Minimum time before callback fires (0 = next turn)
    /// @param fn     Callback to invoke
    virtual void Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

/// Type-erased event loop using epoll internally.
///
/// Provides implicit conversion to IEventLoop& so it can be passed
/// directly to the scheduler and pump factories:
/// @code
/// EventLoop loop;
/// auto scheduler = Parallel<int>(loop, items, handler, {}, on_done);
/// loop.RunUntilIdle();
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Dispatch deferred callbacks and expired timers for one iteration.
    /// @param timeout_ms  Max wait (-1 = infinite)
    void Poll(int timeout_ms = -1);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Block and dispatch until @p done returns true or Stop() is called.
    /// Reports from other threads wake the loop.
    void RunUntil(const std::function<bool()>& done);

    /// Dispatch until no deferred callbacks or armed timers remain.
    void RunUntilIdle();

    /// Signal the event loop to stop after the current iteration.
    void Stop();

    /// Implicit conversion to IEventLoop&.
    operator IEventLoop&();
    /// @copydoc operator IEventLoop&()
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace seq_pipe
