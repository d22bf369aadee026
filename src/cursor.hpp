// SPDX-License-Identifier: MIT

// src/cursor.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/producer.hpp"
#include "src/sequence.hpp"

namespace seq_pipe {

// BatchCursor - fixed-size contiguous slices of a realized sequence, one per pull.
//
// State machine:
//   offset = 0
//   Next(): offset < length  -> yield [offset, min(offset + size, length)), offset = end
//           offset >= length -> done (terminal)
//
// No look-ahead: each slice is computed only when requested. Slices are
// views into the shared snapshot and are valid while the cursor (or any
// other holder of the snapshot) is alive.
template<typename T>
class BatchCursor {
public:
    /// @throws PipeError{InvalidArgument} if batch_size is 0.
    BatchCursor(std::shared_ptr<const std::vector<T>> items, size_t batch_size)
        : items_(std::move(items)), batch_size_(batch_size) {
        if (batch_size_ == 0) {
            throw PipeError(ErrorCode::InvalidArgument, "batch size must be positive");
        }
    }

    std::optional<std::span<const T>> Next() {
        if (Done()) return std::nullopt;
        size_t len = std::min(batch_size_, items_->size() - offset_);
        std::span<const T> slice(items_->data() + offset_, len);
        offset_ += len;
        return slice;
    }

    /// End iteration early; Next() reports done from now on.
    void Stop() { offset_ = std::max(offset_, items_->size()); }

    bool Done() const { return offset_ >= items_->size(); }

    size_t offset() const { return offset_; }
    size_t batch_size() const { return batch_size_; }

    /// Number of slices left to yield.
    size_t Remaining() const {
        if (Done()) return 0;
        size_t rest = items_->size() - offset_;
        return rest / batch_size_ + (rest % batch_size_ != 0);
    }

    /// Re-expose this cursor as a deferred sequence of owned slices so
    /// batches can feed a pipeline.
    Sequence<std::vector<T>> AsSequence() &&;

private:
    std::shared_ptr<const std::vector<T>> items_;
    size_t batch_size_;
    size_t offset_ = 0;
};

// Source stage that pulls from a BatchCursor, copying each slice out of the
// snapshot so the yielded batch is independent of the cursor's lifetime.
template<typename T>
class CursorSource final : public SourceProducer<std::vector<T>> {
public:
    explicit CursorSource(BatchCursor<T> cursor) : cursor_(std::move(cursor)) {}

    std::optional<std::vector<T>> Next() override {
        if (this->stopped_) return std::nullopt;
        auto slice = cursor_.Next();
        if (!slice) return std::nullopt;
        return std::vector<T>(slice->begin(), slice->end());
    }

    void Stop() override {
        SourceProducer<std::vector<T>>::Stop();
        cursor_.Stop();
    }

private:
    BatchCursor<T> cursor_;
};

template<typename T>
Sequence<std::vector<T>> BatchCursor<T>::AsSequence() && {
    return Sequence<std::vector<T>>(std::make_unique<CursorSource<T>>(std::move(*this)));
}

}  // namespace seq_pipe
