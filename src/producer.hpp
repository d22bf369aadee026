// SPDX-License-Identifier: MIT

// src/producer.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace seq_pipe {

/// Operator kind of one link in a deferred pipeline.
enum class StageKind {
    Source,
    Map,
    Filter,
    FlatMap,
    Take,
    Skip,
    TakeWhile,
    SkipWhile,
    Chunk,
};

constexpr std::string_view stage_name(StageKind kind) {
    switch (kind) {
        case StageKind::Source:    return "source";
        case StageKind::Map:       return "map";
        case StageKind::Filter:    return "filter";
        case StageKind::FlatMap:   return "flatMap";
        case StageKind::Take:      return "take";
        case StageKind::Skip:      return "skip";
        case StageKind::TakeWhile: return "takeWhile";
        case StageKind::SkipWhile: return "skipWhile";
        case StageKind::Chunk:     return "chunk";
    }
    return "unknown";
}

/// Type-independent part of a producer: identity and cancellation.
///
/// Stages form a singly linked chain through Upstream(); walking it from
/// the last stage reaches the source.
class ProducerBase {
public:
    virtual ~ProducerBase() = default;

    virtual StageKind Kind() const = 0;

    /// @return The producer this one pulls from, nullptr for sources.
    virtual const ProducerBase* Upstream() const { return nullptr; }

    /// Stop producing. After Stop() every Next() reports done and the
    /// producer never pulls its upstream again. Propagates upstream.
    /// Idempotent.
    virtual void Stop() = 0;
};

/// Pull-based producer of T.
///
/// Next() is the single "pull next" operation: an engaged optional is an
/// item plus continue, std::nullopt is completion. A producer that has
/// reported completion keeps reporting it; it is never rewound.
///
/// Exceptions thrown by user callbacks inside Next() propagate to the
/// caller unchanged. Items already pulled upstream stay pulled.
template<typename T>
class Producer : public ProducerBase {
public:
    using value_type = T;

    virtual std::optional<T> Next() = 0;
};

template<typename T>
using ProducerPtr = std::unique_ptr<Producer<T>>;

/// Base for sources that own their position and end state.
template<typename T>
class SourceProducer : public Producer<T> {
public:
    StageKind Kind() const override { return StageKind::Source; }

    void Stop() override { stopped_ = true; }

    bool IsStopped() const { return stopped_; }

protected:
    bool stopped_ = false;
};

/// Yields the items of a realized, immutable vector strictly in order.
///
/// Holds only a read position into the shared snapshot; runs no user code.
template<typename T>
class VectorSource final : public SourceProducer<T> {
public:
    explicit VectorSource(std::shared_ptr<const std::vector<T>> items)
        : items_(std::move(items)) {}

    std::optional<T> Next() override {
        if (this->stopped_ || index_ >= items_->size()) return std::nullopt;
        return (*items_)[index_++];
    }

    size_t position() const { return index_; }

private:
    std::shared_ptr<const std::vector<T>> items_;
    size_t index_ = 0;
};

/// Unbounded source: yields fn(0), fn(1), ... until stopped.
template<typename T>
class GenerateSource final : public SourceProducer<T> {
public:
    explicit GenerateSource(std::function<T(size_t)> fn) : fn_(std::move(fn)) {}

    std::optional<T> Next() override {
        if (this->stopped_) return std::nullopt;
        return fn_(index_++);
    }

private:
    std::function<T(size_t)> fn_;
    size_t index_ = 0;
};

/// Arithmetic progression start, start+step, ... up to (excluding) end.
/// Without an end the progression is unbounded.
template<typename T>
class IotaSource final : public SourceProducer<T> {
public:
    IotaSource(T start, std::optional<T> end, T step)
        : current_(start), end_(end), step_(step) {}

    std::optional<T> Next() override {
        if (this->stopped_) return std::nullopt;
        if (end_ && (step_ > T{0} ? current_ >= *end_ : current_ <= *end_)) {
            return std::nullopt;
        }
        T value = current_;
        current_ += step_;
        return value;
    }

private:
    T current_;
    std::optional<T> end_;
    T step_;
};

}  // namespace seq_pipe
