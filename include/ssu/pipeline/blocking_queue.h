// =============================================================================
// sendstream-upgrade - Blocking Queues
// =============================================================================
// Bounded FIFO queue with the shared halt lifecycle.
//
// enqueue() blocks while the queue is full, dequeue() while it is empty.
// After a planned halt producers are rejected and consumers drain what is
// left, then receive std::nullopt. After an unplanned halt every caller
// returns kCancelled immediately.
// =============================================================================

#ifndef SSU_PIPELINE_BLOCKING_QUEUE_H
#define SSU_PIPELINE_BLOCKING_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "ssu/common/error.h"
#include "ssu/common/sync_primitive.h"
#include "ssu/common/types.h"

namespace ssu::pipeline {

/// @brief Bounded multi-producer multi-consumer FIFO.
///
/// Connects a stage to the next when the consumer does not care about
/// arrival order. Capacity bounds the memory held between two stages.
template <std::movable T>
class BlockingQueue final : public SyncPrimitive {
public:
    /// @brief Construct an empty running queue.
    /// @param name Name used in error messages and logs
    /// @param capacity Maximum queued items, clamped to at least 1
    BlockingQueue(std::string name, std::size_t capacity)
        : name_(std::move(name)), capacity_(capacity == 0 ? 1 : capacity) {}

    ~BlockingQueue() override = default;

    // Non-copyable, non-movable
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;
    BlockingQueue(BlockingQueue&&) = delete;
    BlockingQueue& operator=(BlockingQueue&&) = delete;

    /// @brief Append an item, waiting for room.
    /// @param item Item to queue
    /// @return kCancelled if aborted, kInvalidState after a planned halt.
    [[nodiscard]] VoidResult enqueue(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notFull_.wait(lock, [this] {
                return state_ != PrimitiveState::kRunning || items_.size() < capacity_;
            });
            if (auto result = checkWritable(); !result) {
                return result;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return makeVoidSuccess();
    }

    /// @brief Remove the oldest item, waiting for one.
    /// @return std::nullopt once halted and drained, kCancelled if aborted.
    [[nodiscard]] Result<std::optional<T>> dequeue() {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notEmpty_.wait(lock, [this] {
                return state_ != PrimitiveState::kRunning || !items_.empty();
            });
            if (state_ == PrimitiveState::kAborted) {
                return makeError<std::optional<T>>(abortedError(name_));
            }
            if (items_.empty()) {
                return makeSuccess<std::optional<T>>(std::nullopt);
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        notFull_.notify_one();
        return makeSuccess(std::move(item));
    }

    /// @brief Stop the queue and wake every waiting producer and consumer.
    /// @param unplanned true to abort, false to let consumers drain
    /// @return kCancelled for a planned halt after an abort, success otherwise
    VoidResult halt(bool unplanned) override {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result = applyHalt(state_, unplanned, name_);
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
        return result;
    }

    /// @brief Get the current lifecycle state
    [[nodiscard]] PrimitiveState state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    /// @brief Get the queue name
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    /// @brief Get number of queued items
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /// @brief Get maximum number of queued items
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    /// @brief Reject producers once halted. Caller holds mutex_.
    [[nodiscard]] VoidResult checkWritable() const {
        if (state_ == PrimitiveState::kAborted) {
            return std::unexpected(abortedError(name_));
        }
        if (state_ == PrimitiveState::kDone) {
            return makeVoidError(ErrorCode::kInvalidState, name_ + " received an item after it was halted");
        }
        return makeVoidSuccess();
    }

    const std::string name_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    PrimitiveState state_ = PrimitiveState::kRunning;
};

/// @brief Queue feeding a scalable stage, where arrival order does not matter.
template <UnorderedElement T>
using UnorderedElementQueue = BlockingQueue<T>;

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_BLOCKING_QUEUE_H
