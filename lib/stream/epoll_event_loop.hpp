// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace seq_pipe {

/// Epoll-based event loop for deferred callbacks and timers.
///
/// The epoll set holds one eventfd, written by Wake() so that Defer() and
/// Stop() from other threads interrupt a blocking wait, plus one one-shot
/// timerfd per Schedule() call. Scheduler tasks, pump turns and async-op
/// completions are all Defer()/Schedule() callbacks on this loop.
///
/// Each iteration runs the deferred queue, waits for timer expiry or a
/// wake, fires expired timers, then runs the deferred queue again.
///
/// Thread safety: dispatch happens on whichever thread drives the loop
/// (Poll/Run/RunUntil/RunUntilIdle). Defer(), Schedule(), Stop() and
/// Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create the epoll instance and the wake eventfd.
    /// @throws std::runtime_error if either syscall fails.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    void Defer(std::function<void()> fn) override;

    /// A delay of zero or less fires on the next iteration.
    /// @throws std::runtime_error if the timerfd cannot be created or armed.
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// False until some thread has driven the loop.
    bool IsInEventLoopThread() const override;

    /// One iteration, waiting at most @p timeout_ms (-1 blocks).
    void Poll(int timeout_ms);

    /// Iterate until Stop() is called.
    void Run();

    /// Iterate until @p done returns true or Stop() is called. Blocks in
    /// epoll_wait while nothing is runnable, so work reported from other
    /// threads through Defer() is picked up as soon as it arrives.
    void RunUntil(const std::function<bool()>& done);

    /// Iterate until no deferred callbacks or armed timers remain, or
    /// Stop() is called.
    void RunUntilIdle();

    /// @return True if deferred callbacks or armed timers remain.
    bool HasPendingWork();

    /// Number of armed timers.
    size_t PendingTimers();

    /// Make the current (or next) run call return. Sticky: later run calls
    /// return immediately.
    void Stop();

    /// Interrupt a blocking wait.
    void Wake();

private:
    void BindToCurrentThread();
    bool HasDeferred();
    void RunDeferred();
    void WaitAndDispatch(int timeout_ms);
    void FireTimer(int timer_fd);

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> stopped_{false};
    std::atomic<std::thread::id> loop_thread_id_{};

    std::mutex mutex_;
    std::vector<std::function<void()>> deferred_;
    std::unordered_map<int, TimerCallback> timers_;  // timerfd -> callback

    static constexpr int kMaxEvents = 64;
};

}  // namespace seq_pipe
