// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace seq_pipe {

/// Error codes for all pipeline, cursor and scheduler operations.
enum class ErrorCode {
    // Configuration
    InvalidArgument,    ///< Non-positive chunk/batch/concurrency size, detected before iteration

    // Callbacks
    CallbackFailed,     ///< User transformation, predicate or handler threw or failed

    // Scheduler
    SchedulerFailure,   ///< A handler invocation failed inside the chunk scheduler

    // Sequence
    SequenceConsumed,   ///< Terminal consumer called on an already-driven sequence

    // Stream
    StreamAborted,      ///< Push source closed before completing

    // State
    InvalidState,       ///< Method called in wrong lifecycle state
};

/// Error payload delivered to OnError callbacks and std::expected results.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "config", "callback").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
            return "config";
        case ErrorCode::CallbackFailed:
            return "callback";
        case ErrorCode::SchedulerFailure:
            return "scheduler";
        case ErrorCode::SequenceConsumed:
            return "sequence";
        case ErrorCode::StreamAborted:
            return "stream";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

/// Exception carrying an Error, thrown on the synchronous paths
/// (configuration checks and reuse of a consumed sequence).
class PipeError : public std::runtime_error {
public:
    explicit PipeError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    PipeError(ErrorCode code, std::string message)
        : PipeError(Error{code, std::move(message)}) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

/// Classify the in-flight exception as an Error with the given code.
///
/// Must be called from inside a catch block. Used on the asynchronous
/// paths, where a throwing user callback is reported through OnError or
/// std::expected instead of unwinding into the event loop.
inline Error ErrorFromCurrentException(ErrorCode code) {
    try {
        throw;
    } catch (const PipeError& e) {
        return e.error();
    } catch (const std::exception& e) {
        return Error{code, e.what()};
    } catch (...) {
        return Error{code, "unknown exception"};
    }
}

}  // namespace seq_pipe
