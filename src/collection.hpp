// SPDX-License-Identifier: MIT

// src/collection.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/cursor.hpp"
#include "src/sequence.hpp"

namespace seq_pipe {

template<typename T, typename K>
class IndexedCollection;

// Collection<T> - realized, ordered, immutable items.
//
// The eager operators return new collections. Lazy(), Cursor(), Batches()
// and Parallel() (src/chunk_scheduler.hpp) share the same snapshot without
// copying; since a collection never changes after construction, every
// deferred consumer sees the items as they were when it was created.
template<typename T>
class Collection {
public:
    using value_type = T;

    Collection() : items_(std::make_shared<const std::vector<T>>()) {}

    explicit Collection(std::vector<T> items)
        : items_(std::make_shared<const std::vector<T>>(std::move(items))) {}

    Collection(std::initializer_list<T> items)
        : Collection(std::vector<T>(items)) {}

    const std::vector<T>& items() const { return *items_; }
    size_t size() const { return items_->size(); }
    bool empty() const { return items_->empty(); }
    const T& operator[](size_t i) const { return (*items_)[i]; }
    auto begin() const { return items_->begin(); }
    auto end() const { return items_->end(); }

    /// Shared snapshot handed to deferred consumers.
    std::shared_ptr<const std::vector<T>> snapshot() const { return items_; }

    // =========================================================================
    // Eager operators
    // =========================================================================

    template<typename F>
        requires std::invocable<F&, const T&>
    auto Map(F fn) const {
        using U = std::decay_t<std::invoke_result_t<F&, const T&>>;
        std::vector<U> out;
        out.reserve(size());
        for (const auto& item : *items_) out.push_back(fn(item));
        return Collection<U>(std::move(out));
    }

    template<std::predicate<const T&> Pred>
    Collection Filter(Pred pred) const {
        std::vector<T> out;
        for (const auto& item : *items_) {
            if (pred(item)) out.push_back(item);
        }
        return Collection(std::move(out));
    }

    template<typename F>
        requires std::ranges::range<std::invoke_result_t<F&, const T&>>
    auto FlatMap(F fn) const {
        using C = std::decay_t<std::invoke_result_t<F&, const T&>>;
        using U = std::ranges::range_value_t<C>;
        std::vector<U> out;
        for (const auto& item : *items_) {
            auto expanded = fn(item);
            for (auto& value : expanded) out.push_back(std::move(value));
        }
        return Collection<U>(std::move(out));
    }

    /// @throws PipeError{InvalidArgument} if size is 0.
    Collection<std::vector<T>> Chunk(size_t size) const {
        if (size == 0) {
            throw PipeError(ErrorCode::InvalidArgument, "chunk size must be positive");
        }
        std::vector<std::vector<T>> out;
        for (size_t i = 0; i < items_->size(); i += size) {
            auto first = items_->begin() + static_cast<std::ptrdiff_t>(i);
            auto last = items_->begin() +
                static_cast<std::ptrdiff_t>(std::min(i + size, items_->size()));
            out.emplace_back(first, last);
        }
        return Collection<std::vector<T>>(std::move(out));
    }

    /// Build a key -> positions side table. The collection itself is not
    /// touched; the index lives in the returned decorator.
    template<typename KeyFn>
        requires std::invocable<KeyFn&, const T&>
    auto Index(KeyFn key_fn) const {
        using K = std::decay_t<std::invoke_result_t<KeyFn&, const T&>>;
        return IndexedCollection<T, K>(*this, key_fn);
    }

    // =========================================================================
    // Entry points into the deferred core
    // =========================================================================

    Sequence<T> Lazy() const { return seq_pipe::Lazy(items_); }

    /// @throws PipeError{InvalidArgument} if batch_size is 0.
    BatchCursor<T> Cursor(size_t batch_size) const {
        return BatchCursor<T>(items_, batch_size);
    }

    /// @throws PipeError{InvalidArgument} if batch_size is 0.
    Sequence<std::vector<T>> Batches(size_t batch_size) const {
        return Cursor(batch_size).AsSequence();
    }

private:
    std::shared_ptr<const std::vector<T>> items_;
};

// IndexedCollection<T, K> - a collection plus a key -> item positions table.
template<typename T, typename K>
class IndexedCollection {
public:
    template<typename KeyFn>
    IndexedCollection(Collection<T> base, KeyFn key_fn) : base_(std::move(base)) {
        for (size_t i = 0; i < base_.size(); ++i) {
            index_[key_fn(base_[i])].push_back(i);
        }
    }

    const Collection<T>& base() const { return base_; }

    bool Contains(const K& key) const { return index_.contains(key); }

    /// Items whose key equals @p key, in collection order.
    Collection<T> Lookup(const K& key) const {
        std::vector<T> out;
        if (auto it = index_.find(key); it != index_.end()) {
            out.reserve(it->second.size());
            for (size_t pos : it->second) out.push_back(base_[pos]);
        }
        return Collection<T>(std::move(out));
    }

    size_t KeyCount() const { return index_.size(); }

private:
    Collection<T> base_;
    std::unordered_map<K, std::vector<size_t>> index_;
};

/// Inclusive range start, start+step, ..., up to end.
/// @throws PipeError{InvalidArgument} if step is not positive.
template<typename T>
    requires std::is_arithmetic_v<T>
Collection<T> Range(T start, T end, T step = T{1}) {
    if (!(step > T{0})) {
        throw PipeError(ErrorCode::InvalidArgument, "range step must be positive");
    }
    std::vector<T> out;
    for (T value = start; value <= end; value += step) out.push_back(value);
    return Collection<T>(std::move(out));
}

/// Collection of fn(0) ... fn(n-1).
template<typename F>
    requires std::invocable<F&, size_t>
auto Times(size_t n, F fn) {
    using T = std::decay_t<std::invoke_result_t<F&, size_t>>;
    std::vector<T> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back(fn(i));
    return Collection<T>(std::move(out));
}

}  // namespace seq_pipe
