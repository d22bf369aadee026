// SPDX-License-Identifier: MIT

// src/stages.hpp
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include "src/producer.hpp"

namespace seq_pipe {

// Stage<In, Out> - a producer of Out that owns and pulls a producer of In.
//
// All pulls go through Pull(), which refuses to touch upstream once the
// stage is stopped. Stop() marks the stage and forwards to upstream so
// cancellation reaches the source.
template<typename In, typename Out>
class Stage : public Producer<Out> {
public:
    const ProducerBase* Upstream() const override { return upstream_.get(); }

    void Stop() override {
        if (stopped_) return;
        stopped_ = true;
        upstream_->Stop();
    }

protected:
    explicit Stage(ProducerPtr<In> upstream) : upstream_(std::move(upstream)) {}

    std::optional<In> Pull() {
        if (stopped_) return std::nullopt;
        return upstream_->Next();
    }

    bool stopped_ = false;

private:
    ProducerPtr<In> upstream_;
};

template<typename In, typename Out, typename F>
class MapStage final : public Stage<In, Out> {
public:
    MapStage(ProducerPtr<In> upstream, F fn)
        : Stage<In, Out>(std::move(upstream)), fn_(std::move(fn)) {}

    StageKind Kind() const override { return StageKind::Map; }

    std::optional<Out> Next() override {
        auto item = this->Pull();
        if (!item) return std::nullopt;
        return fn_(std::move(*item));
    }

private:
    F fn_;
};

template<typename T, typename Pred>
class FilterStage final : public Stage<T, T> {
public:
    FilterStage(ProducerPtr<T> upstream, Pred pred)
        : Stage<T, T>(std::move(upstream)), pred_(std::move(pred)) {}

    StageKind Kind() const override { return StageKind::Filter; }

    std::optional<T> Next() override {
        while (auto item = this->Pull()) {
            if (pred_(std::as_const(*item))) return item;
        }
        return std::nullopt;
    }

private:
    Pred pred_;
};

// Expands each upstream item into a finite container and yields its
// elements before pulling the next upstream item.
template<typename In, typename Container, typename F>
class FlatMapStage final : public Stage<In, std::ranges::range_value_t<Container>> {
public:
    using Out = std::ranges::range_value_t<Container>;

    FlatMapStage(ProducerPtr<In> upstream, F fn)
        : Stage<In, Out>(std::move(upstream)), fn_(std::move(fn)) {}

    StageKind Kind() const override { return StageKind::FlatMap; }

    std::optional<Out> Next() override {
        while (true) {
            if (current_ && it_ != std::ranges::end(*current_)) {
                Out value = std::move(*it_);
                ++it_;
                return value;
            }
            current_.reset();
            auto item = this->Pull();
            if (!item) return std::nullopt;
            // emplace keeps the container in place so it_ stays valid
            current_.emplace(fn_(std::move(*item)));
            it_ = std::ranges::begin(*current_);
        }
    }

    void Stop() override {
        current_.reset();
        Stage<In, Out>::Stop();
    }

private:
    F fn_;
    std::optional<Container> current_;
    std::ranges::iterator_t<Container> it_{};
};

// Yields at most n items. Stops upstream as soon as the n-th item has been
// pulled, so an (n+1)-th item is never requested.
template<typename T>
class TakeStage final : public Stage<T, T> {
public:
    TakeStage(ProducerPtr<T> upstream, size_t count)
        : Stage<T, T>(std::move(upstream)), remaining_(count) {}

    StageKind Kind() const override { return StageKind::Take; }

    std::optional<T> Next() override {
        if (remaining_ == 0) {
            this->Stop();
            return std::nullopt;
        }
        auto item = this->Pull();
        if (!item) return std::nullopt;
        if (--remaining_ == 0) this->Stop();
        return item;
    }

private:
    size_t remaining_;
};

template<typename T>
class SkipStage final : public Stage<T, T> {
public:
    SkipStage(ProducerPtr<T> upstream, size_t count)
        : Stage<T, T>(std::move(upstream)), to_skip_(count) {}

    StageKind Kind() const override { return StageKind::Skip; }

    std::optional<T> Next() override {
        while (to_skip_ > 0) {
            if (!this->Pull()) return std::nullopt;
            --to_skip_;
        }
        return this->Pull();
    }

private:
    size_t to_skip_;
};

// The first item failing pred ends the stage: it is dropped, not re-queued.
template<typename T, typename Pred>
class TakeWhileStage final : public Stage<T, T> {
public:
    TakeWhileStage(ProducerPtr<T> upstream, Pred pred)
        : Stage<T, T>(std::move(upstream)), pred_(std::move(pred)) {}

    StageKind Kind() const override { return StageKind::TakeWhile; }

    std::optional<T> Next() override {
        auto item = this->Pull();
        if (!item) return std::nullopt;
        if (!pred_(std::as_const(*item))) {
            this->Stop();
            return std::nullopt;
        }
        return item;
    }

private:
    Pred pred_;
};

// Drops items while pred holds. Once an item fails, pred is never called again.
template<typename T, typename Pred>
class SkipWhileStage final : public Stage<T, T> {
public:
    SkipWhileStage(ProducerPtr<T> upstream, Pred pred)
        : Stage<T, T>(std::move(upstream)), pred_(std::move(pred)) {}

    StageKind Kind() const override { return StageKind::SkipWhile; }

    std::optional<T> Next() override {
        while (auto item = this->Pull()) {
            if (skipping_ && pred_(std::as_const(*item))) continue;
            skipping_ = false;
            return item;
        }
        return std::nullopt;
    }

private:
    Pred pred_;
    bool skipping_ = true;
};

// Groups upstream items into vectors of `size`; the final group may be shorter.
template<typename T>
class ChunkStage final : public Stage<T, std::vector<T>> {
public:
    ChunkStage(ProducerPtr<T> upstream, size_t size)
        : Stage<T, std::vector<T>>(std::move(upstream)), size_(size) {}

    StageKind Kind() const override { return StageKind::Chunk; }

    std::optional<std::vector<T>> Next() override {
        std::vector<T> group;
        while (group.size() < size_) {
            auto item = this->Pull();
            if (!item) break;
            group.push_back(std::move(*item));
        }
        if (group.empty()) return std::nullopt;
        return group;
    }

private:
    size_t size_;
};

}  // namespace seq_pipe
