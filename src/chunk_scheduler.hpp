// SPDX-License-Identifier: MIT

// src/chunk_scheduler.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/sink.hpp"
#include "src/collection.hpp"
#include "src/completion.hpp"

namespace seq_pipe {

/// Partitioning and concurrency limits for ChunkScheduler.
struct SchedulerConfig {
    size_t chunks = DefaultChunks();             ///< Number of slices to partition into
    std::optional<size_t> max_concurrency = {};  ///< Outstanding task cap (unset = chunks)

    /// Available-parallelism hint, or 4 when the platform reports none.
    static size_t DefaultChunks() {
        unsigned hint = std::thread::hardware_concurrency();
        return hint == 0 ? 4 : hint;
    }

    size_t EffectiveConcurrency() const {
        return max_concurrency.value_or(chunks);
    }

    std::expected<void, Error> Validate() const {
        if (chunks == 0) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                                         "chunks must be positive"});
        }
        if (max_concurrency && *max_concurrency == 0) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                                         "max_concurrency must be positive"});
        }
        return {};
    }
};

/// One contiguous partition of the scheduler's input.
template<typename T>
struct Slice {
    size_t index;                ///< Position in partition order
    std::span<const T> items;    ///< View into the scheduler's snapshot

    size_t size() const { return items.size(); }
    auto begin() const { return items.begin(); }
    auto end() const { return items.end(); }
};

/// Counters for monitoring a scheduler run.
struct SchedulerStats {
    size_t slices_total = 0;       ///< Slices produced by partitioning
    size_t slices_submitted = 0;   ///< Handler invocations started
    size_t slices_completed = 0;   ///< Successful completions accepted
    size_t peak_in_flight = 0;     ///< Largest ledger size observed
};

// ChunkScheduler - bounded-concurrency execution over partitions of a
// realized sequence.
//
// Algorithm:
//   1. Partition the input into slices of ceil(L / chunks) items (last may
//      be shorter; L == 0 gives no slices).
//   2. Admit slices in partition order while the ledger of outstanding
//      tasks holds fewer than max_concurrency handles.
//   3. Each completion removes its handle exactly once, appends its result
//      and admits the next slice. First to finish frees the slot.
//   4. When every slice has completed, deliver the results as a Collection.
//
// Results are in completion order, not partition order.
//
// Failure: the first failed (or throwing) handler ends the run with
// Error{SchedulerFailure}. No further slices are admitted; tasks already in
// flight are not interrupted, their Completion::Cancelled() turns true and
// their results are discarded.
//
// Lifetime: every admitted task holds a reference to the scheduler, so a
// run stays alive until its last outstanding task reports.
//
// Thread safety: Not thread-safe. Start() and the ledger are confined to the
// event-loop thread; Completion marshals off-thread reports onto it.
template<typename T, typename R>
class ChunkScheduler : public std::enable_shared_from_this<ChunkScheduler<T, R>> {
public:
    using Handler = std::function<void(Slice<T>, Completion<R>)>;
    using Callback = std::function<void(std::expected<Collection<R>, Error>)>;

    /// Validate the configuration and build a scheduler. Nothing runs until Start().
    static std::expected<std::shared_ptr<ChunkScheduler>, Error> Create(
        IEventLoop& loop,
        std::shared_ptr<const std::vector<T>> items,
        Handler handler,
        SchedulerConfig config,
        Callback on_complete) {
        if (auto valid = config.Validate(); !valid) {
            return std::unexpected(valid.error());
        }
        if (!handler) {
            return std::unexpected(Error{ErrorCode::InvalidArgument, "handler is empty"});
        }
        return std::shared_ptr<ChunkScheduler>(new ChunkScheduler(
            loop, std::move(items), std::move(handler), config, std::move(on_complete)));
    }

    /// Begin admitting slices. Calling Start() again has no effect.
    void Start() {
        if (started_) return;
        started_ = true;
        Log()->debug("chunk scheduler: {} items, {} slices of {}, max_concurrency={}",
                     items_->size(), slice_count_, slice_size_, max_concurrency_);
        if (slice_count_ == 0) {
            Finish();
            return;
        }
        Pump();
    }

    /// Number of outstanding handles in the ledger.
    size_t InFlight() const { return ledger_.size(); }

    size_t SliceSize() const { return slice_size_; }
    size_t SliceCount() const { return slice_count_; }

    bool IsComplete() const { return finished_; }

    SchedulerStats stats() const { return stats_; }

private:
    ChunkScheduler(IEventLoop& loop,
                   std::shared_ptr<const std::vector<T>> items,
                   Handler handler,
                   SchedulerConfig config,
                   Callback on_complete)
        : loop_(loop),
          items_(std::move(items)),
          handler_(std::move(handler)),
          max_concurrency_(config.EffectiveConcurrency()),
          sink_(std::move(on_complete)),
          cancelled_(MakeCancelFlag()) {
        // ceil(L / chunks) without forming L + chunks - 1, which wraps for
        // very large chunk counts
        size_t length = items_->size();
        slice_size_ = length / config.chunks + (length % config.chunks != 0);
        slice_count_ = length == 0 ? 0 : length / slice_size_ + (length % slice_size_ != 0);
        stats_.slices_total = slice_count_;
    }

    // Admit slices until the ledger is full or partitions run out. Guarded
    // against reentry from handlers that complete synchronously.
    void Pump() {
        if (pumping_) return;
        pumping_ = true;
        while (!finished_ && next_slice_ < slice_count_ &&
               ledger_.size() < max_concurrency_) {
            Admit(next_slice_++);
        }
        pumping_ = false;

        if (!finished_ && next_slice_ == slice_count_ && ledger_.empty()) {
            Finish();
        }
    }

    void Admit(size_t index) {
        ledger_.insert(index);
        ++stats_.slices_submitted;
        stats_.peak_in_flight = std::max(stats_.peak_in_flight, ledger_.size());

        size_t begin = index * slice_size_;
        size_t len = std::min(slice_size_, items_->size() - begin);
        Slice<T> slice{index, std::span<const T>(items_->data() + begin, len)};

        Log()->debug("chunk scheduler: admit slice {} ({} items, in_flight={})",
                     index, len, ledger_.size());

        auto self = this->shared_from_this();
        Completion<R> done(
            loop_,
            [self, index](std::expected<R, Error> result) {
                self->OnTaskDone(index, std::move(result));
            },
            cancelled_);

        try {
            handler_(slice, done);
        } catch (...) {
            done.Fail(ErrorFromCurrentException(ErrorCode::CallbackFailed));
        }
    }

    void OnTaskDone(size_t index, std::expected<R, Error> result) {
        // Each handle leaves the ledger exactly once, even after a failure
        if (ledger_.erase(index) == 0) return;
        if (finished_) {
            Log()->debug("chunk scheduler: discarding slice {} after failure", index);
            return;
        }

        if (!result) {
            Fail(index, result.error());
            return;
        }

        results_.push_back(std::move(*result));
        ++stats_.slices_completed;
        Pump();
    }

    void Fail(size_t index, const Error& cause) {
        finished_ = true;
        cancelled_->store(true, std::memory_order_release);
        Log()->warn("chunk scheduler: slice {} failed ({}): {}; {} task(s) still in flight",
                    index, error_category(cause.code), cause.message, ledger_.size());
        sink_.OnError(Error{ErrorCode::SchedulerFailure,
                            fmt::format("slice {} failed: {}", index, cause.message)});
    }

    void Finish() {
        finished_ = true;
        Log()->debug("chunk scheduler: {} slices complete", stats_.slices_completed);
        sink_.OnResult(Collection<R>(std::move(results_)));
    }

    IEventLoop& loop_;
    std::shared_ptr<const std::vector<T>> items_;
    Handler handler_;
    size_t max_concurrency_;
    size_t slice_size_ = 0;
    size_t slice_count_ = 0;

    ResultSink<Collection<R>> sink_;
    CancelFlag cancelled_;

    std::unordered_set<size_t> ledger_;  // Outstanding slice indices
    std::vector<R> results_;             // Completion order
    size_t next_slice_ = 0;

    bool started_ = false;
    bool pumping_ = false;
    bool finished_ = false;

    SchedulerStats stats_;
};

/// Run handler over `config.chunks` slices of @p items with at most
/// `config.max_concurrency` outstanding. Results arrive in completion order.
///
/// @return The started scheduler (for stats), or the configuration error.
///         on_complete is not called when configuration fails.
template<typename R, typename T>
std::expected<std::shared_ptr<ChunkScheduler<T, R>>, Error> Parallel(
    IEventLoop& loop,
    const Collection<T>& items,
    std::type_identity_t<typename ChunkScheduler<T, R>::Handler> handler,
    SchedulerConfig config,
    std::type_identity_t<typename ChunkScheduler<T, R>::Callback> on_complete) {
    auto scheduler = ChunkScheduler<T, R>::Create(
        loop, items.snapshot(), std::move(handler), config, std::move(on_complete));
    if (scheduler) (*scheduler)->Start();
    return scheduler;
}

}  // namespace seq_pipe
