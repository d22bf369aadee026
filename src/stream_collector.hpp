// SPDX-License-Identifier: MIT

// src/stream_collector.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/sink.hpp"
#include "src/collection.hpp"
#include "src/sequence.hpp"
#include "src/sequence_pump.hpp"

namespace seq_pipe {

// StreamCollector<T> - drains a push-based source into a realized collection.
//
// Satisfies StreamingSink<T>: every OnData appends, OnComplete delivers the
// accumulated Collection<T>, OnError delivers the error. The callback fires
// exactly once; anything pushed after that is ignored.
template<typename T>
class StreamCollector {
public:
    using Callback = std::function<void(std::expected<Collection<T>, Error>)>;

    explicit StreamCollector(Callback on_result) : sink_(std::move(on_result)) {}

    void OnData(T&& item) {
        if (sink_.IsDelivered()) return;
        items_.push_back(std::move(item));
    }

    void OnError(const Error& e) {
        items_.clear();
        sink_.OnError(e);
    }

    void OnComplete() {
        sink_.OnResult(Collection<T>(std::move(items_)));
    }

    /// The producer went away without completing.
    void Abort(const std::string& reason) {
        OnError(Error{ErrorCode::StreamAborted, reason});
    }

    void Invalidate() { sink_.Invalidate(); }

    size_t BufferedCount() const { return items_.size(); }
    bool IsDelivered() const { return sink_.IsDelivered(); }

private:
    ResultSink<Collection<T>> sink_;
    std::vector<T> items_;
};

static_assert(StreamingSink<StreamCollector<int>, int>,
              "StreamCollector must satisfy StreamingSink");

/// Pump @p sequence through the event loop into a StreamCollector.
///
/// The returned pump must be kept alive until on_result fires. Closing the
/// pump emits nothing; report the abandoned drain with pump->sink()->Abort().
template<typename T>
std::shared_ptr<SequencePump<T, StreamCollector<T>>> Drain(
    IEventLoop& loop,
    Sequence<T> sequence,
    typename StreamCollector<T>::Callback on_result,
    PumpConfig config = {}) {
    auto collector = std::make_shared<StreamCollector<T>>(std::move(on_result));
    return Pump(loop, std::move(sequence), std::move(collector), config);
}

}  // namespace seq_pipe
