// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/log.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace seq_pipe {

namespace {

std::runtime_error SysError(const char* what) {
    return std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

}  // namespace

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw SysError("epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        auto err = SysError("eventfd");
        close(epoll_fd_);
        throw err;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        auto err = SysError("epoll_ctl ADD wake fd");
        close(wake_fd_);
        close(epoll_fd_);
        throw err;
    }
}

EpollEventLoop::~EpollEventLoop() {
    for (auto& [fd, callback] : timers_) {
        close(fd);
    }
    timers_.clear();
    close(wake_fd_);
    close(epoll_fd_);
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.push_back(std::move(fn));
    }
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        throw SysError("timerfd_create");
    }

    // One-shot: it_interval stays zero. An all-zero it_value would disarm
    // the timer, so non-positive delays expire after 1ns instead.
    itimerspec ts{};
    if (delay.count() > 0) {
        ts.it_value.tv_sec = delay.count() / 1000;
        ts.it_value.tv_nsec = (delay.count() % 1000) * 1000000;
    } else {
        ts.it_value.tv_nsec = 1;
    }
    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        auto err = SysError("timerfd_settime");
        close(tfd);
        throw err;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.emplace(tfd, std::move(fn));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = tfd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, tfd, &ev) < 0) {
        auto err = SysError("epoll_ctl ADD timer");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timers_.erase(tfd);
        }
        close(tfd);
        throw err;
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

void EpollEventLoop::Poll(int timeout_ms) {
    BindToCurrentThread();
    RunDeferred();
    WaitAndDispatch(HasDeferred() ? 0 : timeout_ms);
    RunDeferred();
}

void EpollEventLoop::Run() {
    RunUntil([] { return false; });
}

void EpollEventLoop::RunUntil(const std::function<bool()>& done) {
    BindToCurrentThread();
    RunDeferred();
    while (!stopped_.load() && !done()) {
        WaitAndDispatch(HasDeferred() ? 0 : -1);
        RunDeferred();
    }
}

void EpollEventLoop::RunUntilIdle() {
    BindToCurrentThread();
    RunDeferred();
    while (!stopped_.load() && HasPendingWork()) {
        WaitAndDispatch(HasDeferred() ? 0 : -1);
        RunDeferred();
    }
}

bool EpollEventLoop::HasPendingWork() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !deferred_.empty() || !timers_.empty();
}

size_t EpollEventLoop::PendingTimers() {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EpollEventLoop::Stop() {
    stopped_.store(true);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::BindToCurrentThread() {
    loop_thread_id_.store(std::this_thread::get_id());
}

bool EpollEventLoop::HasDeferred() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !deferred_.empty();
}

void EpollEventLoop::RunDeferred() {
    std::vector<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(deferred_);
    }
    // Callbacks deferred while this batch runs wait for the next iteration
    for (auto& fn : batch) {
        if (fn) {
            fn();
        }
    }
}

void EpollEventLoop::WaitAndDispatch(int timeout_ms) {
    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);
    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        Log()->error("epoll_wait failed: {}", std::strerror(errno));
        throw SysError("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
            continue;
        }
        if ((events[i].events & (EPOLLERR | EPOLLHUP)) != 0) {
            Log()->warn("timer fd {} reported events {:#x}", fd, static_cast<uint32_t>(events[i].events));
        }
        FireTimer(fd);
    }
}

void EpollEventLoop::FireTimer(int timer_fd) {
    TimerCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(timer_fd);
        if (it == timers_.end()) {
            return;
        }
        callback = std::move(it->second);
        timers_.erase(it);
    }

    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd, &expirations, sizeof(expirations));
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, timer_fd, nullptr);
    close(timer_fd);

    if (callback) {
        callback();
    }
}

}  // namespace seq_pipe
