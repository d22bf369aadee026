// SPDX-License-Identifier: MIT

// src/async_ops.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/sink.hpp"
#include "src/collection.hpp"
#include "src/completion.hpp"

namespace seq_pipe {

// Asynchronous whole-collection operators on the event loop.
//
// MapAsync, FilterAsync, EveryAsync and SomeAsync start one task per item
// at once (no concurrency cap; use ChunkScheduler for bounded execution).
// Per-item results are gathered in input order. ReduceAsync runs its steps
// one after another.
//
// The first failure is delivered immediately; tasks still running see
// Completion::Cancelled() and whatever they report is ignored.

namespace detail {

template<typename U>
struct MapAsyncState {
    MapAsyncState(size_t n, typename ResultSink<std::vector<U>>::Callback cb)
        : slots(n), remaining(n), sink(std::move(cb)) {}

    std::vector<std::optional<U>> slots;
    size_t remaining;
    ResultSink<std::vector<U>> sink;
    CancelFlag cancelled = MakeCancelFlag();

    void Fail(const Error& e) {
        cancelled->store(true, std::memory_order_release);
        sink.OnError(e);
    }

    void Finish() {
        std::vector<U> out;
        out.reserve(slots.size());
        for (auto& slot : slots) out.push_back(std::move(*slot));
        sink.OnResult(std::move(out));
    }
};

}  // namespace detail

template<typename T, typename U>
void MapAsync(IEventLoop& loop,
              const Collection<T>& items,
              std::type_identity_t<std::function<void(const T&, Completion<U>)>> fn,
              std::function<void(std::expected<std::vector<U>, Error>)> on_complete) {
    auto snapshot = items.snapshot();
    auto state = std::make_shared<detail::MapAsyncState<U>>(snapshot->size(),
                                                            std::move(on_complete));
    if (snapshot->empty()) {
        state->Finish();
        return;
    }
    for (size_t i = 0; i < snapshot->size(); ++i) {
        if (state->sink.IsDelivered()) return;
        Completion<U> done(
            loop,
            // snapshot keeps the item alive for tasks that report later
            [state, snapshot, i](std::expected<U, Error> result) {
                if (state->sink.IsDelivered()) return;
                if (!result) {
                    state->Fail(result.error());
                    return;
                }
                state->slots[i] = std::move(*result);
                if (--state->remaining == 0) state->Finish();
            },
            state->cancelled);
        try {
            fn((*snapshot)[i], done);
        } catch (...) {
            done.Fail(ErrorFromCurrentException(ErrorCode::CallbackFailed));
        }
    }
}

template<typename T>
void FilterAsync(IEventLoop& loop,
                 const Collection<T>& items,
                 std::type_identity_t<std::function<void(const T&, Completion<bool>)>> pred,
                 std::type_identity_t<std::function<void(std::expected<Collection<T>, Error>)>> on_complete) {
    MapAsync<T, bool>(
        loop, items, std::move(pred),
        [items, on_complete = std::move(on_complete)](
            std::expected<std::vector<bool>, Error> keep) {
            if (!keep) {
                on_complete(std::unexpected(keep.error()));
                return;
            }
            std::vector<T> out;
            for (size_t i = 0; i < items.size(); ++i) {
                if ((*keep)[i]) out.push_back(items[i]);
            }
            on_complete(Collection<T>(std::move(out)));
        });
}

/// True when every item passes. Every predicate runs (no short-circuit);
/// an empty collection passes.
template<typename T>
void EveryAsync(IEventLoop& loop,
                const Collection<T>& items,
                std::type_identity_t<std::function<void(const T&, Completion<bool>)>> pred,
                std::type_identity_t<std::function<void(std::expected<bool, Error>)>> on_complete) {
    MapAsync<T, bool>(
        loop, items, std::move(pred),
        [on_complete = std::move(on_complete)](std::expected<std::vector<bool>, Error> passed) {
            if (!passed) {
                on_complete(std::unexpected(passed.error()));
                return;
            }
            on_complete(std::all_of(passed->begin(), passed->end(), [](bool b) { return b; }));
        });
}

/// True when at least one item passes. Every predicate runs (no
/// short-circuit); an empty collection fails.
template<typename T>
void SomeAsync(IEventLoop& loop,
               const Collection<T>& items,
               std::type_identity_t<std::function<void(const T&, Completion<bool>)>> pred,
               std::type_identity_t<std::function<void(std::expected<bool, Error>)>> on_complete) {
    MapAsync<T, bool>(
        loop, items, std::move(pred),
        [on_complete = std::move(on_complete)](std::expected<std::vector<bool>, Error> passed) {
            if (!passed) {
                on_complete(std::unexpected(passed.error()));
                return;
            }
            on_complete(std::any_of(passed->begin(), passed->end(), [](bool b) { return b; }));
        });
}

namespace detail {

template<typename T, typename Acc>
struct ReduceAsyncState : std::enable_shared_from_this<ReduceAsyncState<T, Acc>> {
    using Step = std::function<void(Acc, const T&, Completion<Acc>)>;

    ReduceAsyncState(IEventLoop& l, std::shared_ptr<const std::vector<T>> s,
                     Acc init, Step f,
                     typename ResultSink<Acc>::Callback cb)
        : loop(l), snapshot(std::move(s)), acc(std::move(init)),
          step(std::move(f)), sink(std::move(cb)) {}

    IEventLoop& loop;
    std::shared_ptr<const std::vector<T>> snapshot;
    Acc acc;
    Step step;
    ResultSink<Acc> sink;
    size_t index = 0;

    // Each step starts on a fresh loop turn so long chains of synchronous
    // completions do not grow the stack.
    void RunNext() {
        if (index == snapshot->size()) {
            sink.OnResult(std::move(acc));
            return;
        }
        auto self = this->shared_from_this();
        Completion<Acc> done(loop, [self](std::expected<Acc, Error> result) {
            if (!result) {
                self->sink.OnError(result.error());
                return;
            }
            self->acc = std::move(*result);
            ++self->index;
            self->loop.Defer([self] { self->RunNext(); });
        });
        try {
            step(std::move(acc), (*snapshot)[index], done);
        } catch (...) {
            done.Fail(ErrorFromCurrentException(ErrorCode::CallbackFailed));
        }
    }
};

}  // namespace detail

/// Sequential asynchronous fold: step i+1 starts after step i reports.
template<typename T, typename Acc>
void ReduceAsync(IEventLoop& loop,
                 const Collection<T>& items,
                 Acc init,
                 std::type_identity_t<std::function<void(Acc, const T&, Completion<Acc>)>> step,
                 std::type_identity_t<std::function<void(std::expected<Acc, Error>)>> on_complete) {
    auto state = std::make_shared<detail::ReduceAsyncState<T, Acc>>(
        loop, items.snapshot(), std::move(init), std::move(step), std::move(on_complete));
    state->RunNext();
}

}  // namespace seq_pipe
