// SPDX-License-Identifier: MIT

// src/sequence.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/producer.hpp"
#include "src/stages.hpp"

namespace seq_pipe {

template<typename T>
class Sequence;

template<typename F, typename T>
using MapResult = std::decay_t<std::invoke_result_t<F&, T&&>>;

template<typename F, typename T>
concept SequencePredicate = std::predicate<F&, const T&>;

// Sequence<T> - a deferred pipeline handle.
//
// Owns the last stage of a chain of producers. Operators consume the
// sequence (&&-qualified) and return a new one whose stage owns the old
// chain; nothing is evaluated until a terminal consumer pulls.
//
// Single pass: terminal consumers take the chain and destroy it when they
// return. Calling another operator or terminal on a sequence that has been
// consumed (or moved from) throws PipeError{SequenceConsumed}.
//
// Usage:
//   auto firsts = Iota<int>(1)
//       .Filter([](int x) { return x % 2 == 0; })
//       .Map([](int x) { return x * 2; })
//       .Take(5)
//       .ToVector();  // {4, 8, 12, 16, 20}
template<typename T>
class Sequence {
public:
    using value_type = T;

    explicit Sequence(ProducerPtr<T> producer) : producer_(std::move(producer)) {}

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;
    Sequence(Sequence&&) noexcept = default;
    Sequence& operator=(Sequence&&) noexcept = default;

    // =========================================================================
    // Stages
    // =========================================================================

    template<typename F>
        requires std::invocable<F&, T&&>
    Sequence<MapResult<F, T>> Map(F fn) && {
        using U = MapResult<F, T>;
        return Sequence<U>(std::make_unique<MapStage<T, U, F>>(Release(), std::move(fn)));
    }

    template<SequencePredicate<T> Pred>
    Sequence<T> Filter(Pred pred) && {
        return Sequence<T>(std::make_unique<FilterStage<T, Pred>>(Release(), std::move(pred)));
    }

    /// fn must return a finite container (anything satisfying std::ranges::range).
    template<typename F>
        requires std::ranges::range<MapResult<F, T>>
    Sequence<std::ranges::range_value_t<MapResult<F, T>>> FlatMap(F fn) && {
        using C = MapResult<F, T>;
        using U = std::ranges::range_value_t<C>;
        return Sequence<U>(std::make_unique<FlatMapStage<T, C, F>>(Release(), std::move(fn)));
    }

    Sequence<T> Take(size_t count) && {
        return Sequence<T>(std::make_unique<TakeStage<T>>(Release(), count));
    }

    Sequence<T> Skip(size_t count) && {
        return Sequence<T>(std::make_unique<SkipStage<T>>(Release(), count));
    }

    template<SequencePredicate<T> Pred>
    Sequence<T> TakeWhile(Pred pred) && {
        return Sequence<T>(std::make_unique<TakeWhileStage<T, Pred>>(Release(), std::move(pred)));
    }

    template<SequencePredicate<T> Pred>
    Sequence<T> SkipWhile(Pred pred) && {
        return Sequence<T>(std::make_unique<SkipWhileStage<T, Pred>>(Release(), std::move(pred)));
    }

    /// @throws PipeError{InvalidArgument} if size is 0; the sequence is left intact.
    Sequence<std::vector<T>> Chunk(size_t size) && {
        if (size == 0) {
            throw PipeError(ErrorCode::InvalidArgument, "chunk size must be positive");
        }
        return Sequence<std::vector<T>>(std::make_unique<ChunkStage<T>>(Release(), size));
    }

    // =========================================================================
    // Terminal consumers
    // =========================================================================

    /// Materialize every item in order. A throwing stage leaves no partial result.
    std::vector<T> ToVector() && {
        auto producer = Release();
        std::vector<T> out;
        while (auto item = producer->Next()) {
            out.push_back(std::move(*item));
        }
        return out;
    }

    template<typename Acc, typename Op>
        requires std::invocable<Op&, Acc&&, T&&>
    Acc Reduce(Acc init, Op op) && {
        auto producer = Release();
        Acc acc = std::move(init);
        while (auto item = producer->Next()) {
            acc = op(std::move(acc), std::move(*item));
        }
        return acc;
    }

    /// Pull exactly one item, then stop the chain.
    std::optional<T> First() && {
        auto producer = Release();
        auto item = producer->Next();
        producer->Stop();
        return item;
    }

    /// Pull until pred passes, then stop the chain. Nothing past the match is pulled.
    template<SequencePredicate<T> Pred>
    std::optional<T> First(Pred pred) && {
        auto producer = Release();
        while (auto item = producer->Next()) {
            if (pred(std::as_const(*item))) {
                producer->Stop();
                return item;
            }
        }
        return std::nullopt;
    }

    /// Invoke fn per item. Items delivered before a failure are not retracted.
    template<typename F>
        requires std::invocable<F&, T&&>
    void ForEach(F fn) && {
        auto producer = Release();
        while (auto item = producer->Next()) {
            fn(std::move(*item));
        }
    }

    template<SequencePredicate<T> Pred>
    bool Some(Pred pred) && {
        return std::move(*this).First(std::move(pred)).has_value();
    }

    template<SequencePredicate<T> Pred>
    bool Every(Pred pred) && {
        auto producer = Release();
        while (auto item = producer->Next()) {
            if (!pred(std::as_const(*item))) {
                producer->Stop();
                return false;
            }
        }
        return true;
    }

    size_t Count() && {
        auto producer = Release();
        size_t count = 0;
        while (producer->Next()) ++count;
        return count;
    }

    // Numeric aggregates

    T Sum() && requires std::is_arithmetic_v<T> {
        return std::move(*this).Reduce(T{}, [](T acc, T x) { return acc + x; });
    }

    std::optional<double> Average() && requires std::is_arithmetic_v<T> {
        auto producer = Release();
        double total = 0;
        size_t count = 0;
        while (auto item = producer->Next()) {
            total += static_cast<double>(*item);
            ++count;
        }
        if (count == 0) return std::nullopt;
        return total / static_cast<double>(count);
    }

    std::optional<T> Min() && requires std::totally_ordered<T> {
        return std::move(*this).Extremum(std::less<>{});
    }

    std::optional<T> Max() && requires std::totally_ordered<T> {
        return std::move(*this).Extremum(std::greater<>{});
    }

    // =========================================================================
    // Pull-based iteration contract
    // =========================================================================

    /// Pull the next item; std::nullopt once the chain is done.
    /// @throws PipeError{SequenceConsumed} if a terminal already took the chain.
    std::optional<T> Next() {
        return Chain().Next();
    }

    /// Stop the chain; subsequent Next() calls report done.
    void Stop() {
        if (producer_) producer_->Stop();
    }

    bool IsConsumed() const { return producer_ == nullptr; }

    /// Numbered stage list from source to the last stage, e.g.
    /// "1. source\n2. filter\n3. map". Empty once consumed.
    std::string Explain() const {
        std::vector<StageKind> kinds;
        for (const ProducerBase* p = producer_.get(); p != nullptr; p = p->Upstream()) {
            kinds.push_back(p->Kind());
        }
        std::string out;
        size_t step = 1;
        for (auto it = kinds.rbegin(); it != kinds.rend(); ++it, ++step) {
            if (!out.empty()) out += '\n';
            out += fmt::format("{}. {}", step, stage_name(*it));
        }
        return out;
    }

private:
    template<typename Cmp>
    std::optional<T> Extremum(Cmp better) && {
        auto producer = Release();
        std::optional<T> best;
        while (auto item = producer->Next()) {
            if (!best || better(*item, *best)) best = std::move(item);
        }
        return best;
    }

    Producer<T>& Chain() {
        if (!producer_) {
            throw PipeError(ErrorCode::SequenceConsumed, "sequence already consumed");
        }
        return *producer_;
    }

    ProducerPtr<T> Release() {
        Chain();
        return std::move(producer_);
    }

    ProducerPtr<T> producer_;
};

// =============================================================================
// Source factories
// =============================================================================

/// Deferred sequence over a shared, immutable snapshot.
template<typename T>
Sequence<T> Lazy(std::shared_ptr<const std::vector<T>> items) {
    return Sequence<T>(std::make_unique<VectorSource<T>>(std::move(items)));
}

/// Deferred sequence over a snapshot of @p items.
template<typename T>
Sequence<T> Lazy(std::vector<T> items) {
    return Lazy(std::make_shared<const std::vector<T>>(std::move(items)));
}

/// Unbounded sequence fn(0), fn(1), ...; bound it with Take/TakeWhile/First.
template<typename F>
    requires std::invocable<F&, size_t>
Sequence<MapResult<F, size_t>> Generate(F fn) {
    using T = MapResult<F, size_t>;
    return Sequence<T>(std::make_unique<GenerateSource<T>>(std::move(fn)));
}

/// Unbounded progression start, start+1, ...
template<typename T>
    requires std::is_arithmetic_v<T>
Sequence<T> Iota(T start) {
    return Sequence<T>(std::make_unique<IotaSource<T>>(start, std::nullopt, T{1}));
}

/// Progression [start, end) with the given step.
/// @throws PipeError{InvalidArgument} if step is 0.
template<typename T>
    requires std::is_arithmetic_v<T>
Sequence<T> Iota(T start, T end, T step = T{1}) {
    if (step == T{0}) {
        throw PipeError(ErrorCode::InvalidArgument, "iota step must be non-zero");
    }
    return Sequence<T>(std::make_unique<IotaSource<T>>(start, end, step));
}

}  // namespace seq_pipe
