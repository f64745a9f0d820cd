// =============================================================================
// sendstream-upgrade - Ordered Reassembly Queue
// =============================================================================
// Merges units finished out of order by parallel workers back into command
// id order.
//
// Units are keyed by firstId(). The unit released after one ending at
// lastId() starts at lastId() + 1, or at lastId() itself when the last
// command is shared with the next unit. A unit with a shared last id is held
// until its successor has arrived.
//
// The queue is bounded, but the unit the consumer is waiting for (and the
// successor a held unit needs) is always admitted, so a full queue can never
// block the unit that would drain it.
// =============================================================================

#ifndef SSU_PIPELINE_ORDERED_ELEMENT_QUEUE_H
#define SSU_PIPELINE_ORDERED_ELEMENT_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ssu/common/error.h"
#include "ssu/common/sync_primitive.h"
#include "ssu/common/types.h"

namespace ssu::pipeline {

/// @brief Bounded reassembly queue releasing units in id order.
///
/// Sits behind every scalable stage whose successor needs the original
/// command order. Works on any unit that reports its first and last command
/// id, so the same queue carries constructed batches, batched output and
/// compressed output.
///
/// @note Many producers, one consumer.
template <OrderedElement T>
class OrderedElementQueue final : public SyncPrimitive {
public:
    /// @brief Construct an empty running queue.
    /// @param name Name used in error messages and logs
    /// @param capacity Maximum pending units, clamped to at least 1
    /// @param firstExpectedId Id of the first unit to release.
    OrderedElementQueue(std::string name, std::size_t capacity, CommandId firstExpectedId = 0)
        : name_(std::move(name)), capacity_(capacity == 0 ? 1 : capacity), nextId_(firstExpectedId) {}

    ~OrderedElementQueue() override = default;

    // Non-copyable, non-movable
    OrderedElementQueue(const OrderedElementQueue&) = delete;
    OrderedElementQueue& operator=(const OrderedElementQueue&) = delete;
    OrderedElementQueue(OrderedElementQueue&&) = delete;
    OrderedElementQueue& operator=(OrderedElementQueue&&) = delete;

    /// @brief Insert a unit, waiting for room unless it is needed next.
    /// @param item Unit keyed by its firstId()
    /// @return kCancelled if aborted. kInvalidState after a planned halt and
    ///         for duplicate, stale or malformed units (a shared last id must
    ///         lie after the first id).
    [[nodiscard]] VoidResult enqueue(T item) {
        const CommandId key = item.firstId();
        if (item.lastId() < key || (item.isLastIdShared() && item.lastId() == key)) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 fmt::format("{} received malformed unit [{}, {}]", name_, key,
                                             item.lastId()));
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            notFull_.wait(lock, [this, key] {
                return state_ != PrimitiveState::kRunning || pending_.size() < capacity_ ||
                       isAwaited(key);
            });

            if (state_ == PrimitiveState::kAborted) {
                return std::unexpected(abortedError(name_));
            }
            if (state_ == PrimitiveState::kDone) {
                return makeVoidError(ErrorCode::kInvalidState,
                                     name_ + " received a unit after it was halted");
            }
            if (key < nextId_ || pending_.contains(key)) {
                return makeVoidError(ErrorCode::kInvalidState,
                                     fmt::format("{} received unit {} twice", name_, key));
            }
            pending_.emplace(key, std::move(item));
        }
        ready_.notify_all();
        return makeVoidSuccess();
    }

    /// @brief Release the next unit in order, waiting for it.
    /// @return std::nullopt once halted with nothing releasable left,
    ///         kCancelled if aborted.
    [[nodiscard]] Result<std::optional<T>> dequeue() {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] {
                return state_ != PrimitiveState::kRunning || isReleasable();
            });
            if (state_ == PrimitiveState::kAborted) {
                return makeError<std::optional<T>>(abortedError(name_));
            }
            if (!isHeadPresent()) {
                return makeSuccess<std::optional<T>>(std::nullopt);
            }
            item.emplace(releaseHead());
        }
        notFull_.notify_all();
        return makeSuccess(std::move(item));
    }

    /// @brief Release the maximal contiguous run available, waiting for at
    ///        least one unit.
    /// @return An empty vector once halted and drained, kCancelled if aborted.
    [[nodiscard]] Result<std::vector<T>> dequeueRun() {
        std::vector<T> run;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] {
                return state_ != PrimitiveState::kRunning || isReleasable();
            });
            if (state_ == PrimitiveState::kAborted) {
                return makeError<std::vector<T>>(abortedError(name_));
            }
            while (isReleasable() || (state_ == PrimitiveState::kDone && isHeadPresent())) {
                run.push_back(releaseHead());
            }
        }
        notFull_.notify_all();
        return makeSuccess(std::move(run));
    }

    /// @brief Stop the queue and wake every waiting producer and the consumer.
    ///
    /// After a planned halt the consumer still receives the units that
    /// continue the id sequence, including a held unit whose successor
    /// never arrived.
    /// @param unplanned true to abort, false to let the consumer drain
    /// @return kCancelled for a planned halt after an abort, success otherwise
    VoidResult halt(bool unplanned) override {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result = applyHalt(state_, unplanned, name_);
        }
        ready_.notify_all();
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

    /// @brief Id of the next unit to release.
    [[nodiscard]] CommandId nextId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nextId_;
    }

    /// @brief Get number of units waiting for release
    [[nodiscard]] std::size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    [[nodiscard]] bool isHeadPresent() const { return pending_.contains(nextId_); }

    /// @brief Head is present and, if its last id is shared, so is its successor.
    [[nodiscard]] bool isReleasable() const {
        const auto head = pending_.find(nextId_);
        if (head == pending_.end()) {
            return false;
        }
        const T& unit = head->second;
        return !unit.isLastIdShared() || pending_.contains(unit.lastId());
    }

    /// @brief Units that must be admitted even when the queue is full.
    [[nodiscard]] bool isAwaited(CommandId key) const {
        if (key == nextId_) {
            return true;
        }
        const auto head = pending_.find(nextId_);
        return head != pending_.end() && head->second.isLastIdShared() &&
               head->second.lastId() == key;
    }

    /// @brief Remove the head and advance nextId_. Caller holds mutex_.
    T releaseHead() {
        auto node = pending_.extract(nextId_);
        T item = std::move(node.mapped());
        nextId_ = item.lastId() + (item.isLastIdShared() ? 0 : 1);
        return item;
    }

    const std::string name_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::condition_variable notFull_;
    std::map<CommandId, T> pending_;
    CommandId nextId_;
    PrimitiveState state_ = PrimitiveState::kRunning;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_ORDERED_ELEMENT_QUEUE_H
