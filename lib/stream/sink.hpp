// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <expected>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"

namespace seq_pipe {

/// Concept for the minimal sink lifecycle: error and completion.
template<typename S>
concept BasicSink = requires(S& s, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnComplete() } -> std::same_as<void>;
};

/// Concept for a streaming sink that receives items of type T one at a time.
///
/// Refines BasicSink by adding an OnData callback for item delivery.
template<typename S, typename T>
concept StreamingSink = BasicSink<S> && requires(S& s, T&& item) {
    { s.OnData(std::move(item)) } -> std::same_as<void>;
};

/// Concrete streaming sink that dispatches items through user-provided callbacks.
///
/// All callbacks are guarded by an atomic validity flag: once Invalidate()
/// is called, subsequent OnData / OnError / OnComplete calls are silently
/// dropped, so a consumer torn down before its producer is never called back.
template<typename T>
class CallbackSink {
public:
    /// Construct with callbacks for data, error, and completion events.
    /// @param on_data      Invoked for each incoming item.
    /// @param on_error     Invoked when the producer fails.
    /// @param on_complete  Invoked when the producer ends normally.
    CallbackSink(
        std::function<void(T&&)> on_data,
        std::function<void(const Error&)> on_error,
        std::function<void()> on_complete
    ) : on_data_(std::move(on_data)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)) {}

    /// Deliver one item to the downstream consumer.
    void OnData(T&& item) {
        if (valid_.load(std::memory_order_acquire)) on_data_(std::move(item));
    }

    /// Report an error to the downstream consumer.
    void OnError(const Error& e) {
        if (valid_.load(std::memory_order_acquire)) on_error_(e);
    }

    /// Signal normal completion.
    void OnComplete() {
        if (valid_.load(std::memory_order_acquire)) on_complete_();
    }

    /// Atomically disable all future callback dispatches.
    void Invalidate() { valid_.store(false, std::memory_order_release); }

private:
    std::function<void(T&&)> on_data_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    std::atomic<bool> valid_{true};
};

// Single-result sink - receives one result (success or error via expected)
template<typename S>
concept SingleResultSink = BasicSink<S> && requires(S& s) {
    typename S::ResultType;
    { s.OnResult(std::declval<typename S::ResultType>()) } -> std::same_as<void>;
};

// ResultSink - delivers exactly one std::expected to its callback
template<typename Result>
class ResultSink {
public:
    using ResultType = Result;
    using Callback = std::function<void(std::expected<Result, Error>)>;

    explicit ResultSink(Callback on_result)
        : on_result_(std::move(on_result)) {}

    void OnResult(Result&& result) {
        if (!valid_.load(std::memory_order_acquire) || delivered_) return;
        delivered_ = true;
        Deliver(std::move(result));
    }

    void OnError(const Error& e) {
        if (!valid_.load(std::memory_order_acquire) || delivered_) return;
        delivered_ = true;
        Deliver(std::unexpected(e));
    }

    void OnComplete() {
        // No-op for single-result - result already delivered
    }

    void Invalidate() { valid_.store(false, std::memory_order_release); }

    bool IsDelivered() const { return delivered_; }

private:
    void Deliver(std::expected<Result, Error> result) {
        // Release the callback before invoking it so captures die with the call
        auto cb = std::move(on_result_);
        on_result_ = nullptr;
        if (cb) cb(std::move(result));
    }

    Callback on_result_;
    std::atomic<bool> valid_{true};
    bool delivered_ = false;
};

static_assert(StreamingSink<CallbackSink<int>, int>, "CallbackSink must satisfy StreamingSink");
static_assert(SingleResultSink<ResultSink<int>>, "ResultSink must satisfy SingleResultSink");

}  // namespace seq_pipe
