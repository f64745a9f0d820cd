// =============================================================================
// sendstream-upgrade - Read-Once Buffer Cache Implementation
// =============================================================================

#include "ssu/io/buffer_cache.h"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>

#include "ssu/common/logger.h"

namespace ssu::io {

ReadOnceBufferCache::ReadOnceBufferCache(StreamOffset cacheStart, std::size_t bufferSize,
                                         std::size_t maxBuffers)
    : cacheStart_(cacheStart),
      bufferSize_(bufferSize),
      maxBuffers_(maxBuffers),
      nextKey_(bufferSize == 0 ? 0 : cacheStart / bufferSize) {
    if (bufferSize_ == 0 || maxBuffers_ == 0) {
        throw ConfigurationError("Buffer cache needs a non-zero buffer size and count");
    }
}

// =============================================================================
// Prefetcher side
// =============================================================================

Result<std::optional<ReadBuffer>> ReadOnceBufferCache::reserveBuffer() {
    std::unique_lock<std::mutex> lock(mutex_);
    spaceAvailable_.wait(lock, [this] {
        return state_ != PrimitiveState::kRunning || buffers_.size() + reserved_ < maxBuffers_;
    });

    if (state_ == PrimitiveState::kAborted) {
        return makeError<std::optional<ReadBuffer>>(abortedError(name()));
    }
    if (state_ == PrimitiveState::kDone) {
        return makeSuccess<std::optional<ReadBuffer>>(std::nullopt);
    }

    const std::uint64_t key = nextKey_++;
    const StreamOffset start = std::max<StreamOffset>(key * bufferSize_, cacheStart_);
    const StreamOffset end = (key + 1) * bufferSize_;
    ++reserved_;
    return makeSuccess<std::optional<ReadBuffer>>(
        ReadBuffer(key, start, static_cast<std::size_t>(end - start)));
}

VoidResult ReadOnceBufferCache::publishBuffer(ReadBuffer buffer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reserved_ == 0) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 "Published a buffer that was never reserved");
        }
        --reserved_;

        if (state_ != PrimitiveState::kRunning) {
            return makeVoidSuccess();
        }

        const bool endReached = buffer.size() < buffer.capacity();
        if (endReached) {
            endOfStream_ = buffer.endOffset();
            state_ = PrimitiveState::kDone;
            SSU_LOG_DEBUG("Source ended at offset {}", *endOfStream_);
        }
        if (!buffer.isEmpty()) {
            const std::uint64_t key = buffer.key();
            const std::size_t size = buffer.size();
            buffers_.emplace(key, Entry{std::make_shared<const ReadBuffer>(std::move(buffer)), size});
        }
    }
    bufferReady_.notify_all();
    spaceAvailable_.notify_all();
    return makeVoidSuccess();
}

// =============================================================================
// Reader side
// =============================================================================

void ReadOnceBufferCache::readExact(std::span<std::uint8_t> dst, StreamOffset offset,
                                    UpgradeStats& stats) {
    if (offset < cacheStart_) {
        throw SSUException(ErrorCode::kInvalidState,
                           fmt::format("Offset {} precedes the cached range", offset));
    }

    std::size_t copied = 0;
    while (copied < dst.size()) {
        const StreamOffset position = offset + copied;
        const std::uint64_t key = keyFor(position);

        std::shared_ptr<const ReadBuffer> buffer;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const auto waitStart = std::chrono::steady_clock::now();
            bufferReady_.wait(lock, [this, key] {
                return state_ != PrimitiveState::kRunning || buffers_.contains(key);
            });
            stats.bufferWaitTime += std::chrono::steady_clock::now() - waitStart;

            if (state_ == PrimitiveState::kAborted) {
                throw abortedError(name()).toException();
            }

            const auto it = buffers_.find(key);
            if (it == buffers_.end()) {
                if (endOfStream_ && position >= *endOfStream_) {
                    throw UnexpectedEofError(
                        fmt::format("Source ended at offset {}", *endOfStream_),
                        ErrorContext().withOffset(position));
                }
                throw SSUException(ErrorCode::kInvalidState,
                                   fmt::format("Offset {} is no longer cached", position));
            }
            buffer = it->second.buffer;
        }

        // Published windows are immutable, so the copy runs unlocked.
        const std::size_t count = buffer->read(position, dst.subspan(copied));
        if (count == 0) {
            throw UnexpectedEofError(fmt::format("Source ended at offset {}", buffer->endOffset()),
                                     ErrorContext().withOffset(position));
        }
        consume(key, count, position);
        copied += count;
    }
}

void ReadOnceBufferCache::consume(std::uint64_t key, std::size_t count, StreamOffset offset) {
    bool evicted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = buffers_.find(key);
        if (it == buffers_.end() || count > it->second.remaining) {
            throw SSUException(ErrorCode::kInvalidState,
                               fmt::format("Bytes at offset {} were read more than once", offset));
        }
        it->second.remaining -= count;
        if (it->second.remaining == 0) {
            buffers_.erase(it);
            evicted = true;
        }
    }
    if (evicted) {
        spaceAvailable_.notify_all();
    }
}

// =============================================================================
// SyncPrimitive
// =============================================================================

VoidResult ReadOnceBufferCache::halt(bool unplanned) {
    VoidResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = applyHalt(state_, unplanned, name());
    }
    bufferReady_.notify_all();
    spaceAvailable_.notify_all();
    return result;
}

PrimitiveState ReadOnceBufferCache::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<StreamOffset> ReadOnceBufferCache::endOfStream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endOfStream_;
}

std::size_t ReadOnceBufferCache::residentBuffers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.size();
}

}  // namespace ssu::io
