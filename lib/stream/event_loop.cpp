// SPDX-License-Identifier: MIT

#include "lib/stream/event_loop.hpp"
#include "lib/stream/epoll_event_loop.hpp"

namespace seq_pipe {

// Pimpl implementation using EpollEventLoop
struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) {
    impl_->Poll(timeout_ms);
}

void EventLoop::Run() {
    impl_->Run();
}

void EventLoop::RunUntil(const std::function<bool()>& done) {
    impl_->RunUntil(done);
}

void EventLoop::RunUntilIdle() {
    impl_->RunUntilIdle();
}

void EventLoop::Stop() {
    impl_->Stop();
}

EventLoop::operator IEventLoop&() {
    return *impl_;
}

EventLoop::operator const IEventLoop&() const {
    return *impl_;
}

}  // namespace seq_pipe
