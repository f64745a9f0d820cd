// =============================================================================
// sendstream-upgrade - Read-Once Buffer Cache
// =============================================================================
// Bounded prefetch cache between the prefetch worker and the readers.
//
// The source is split into windows keyed by (offset / bufferSize); the first
// window starts at the cache start offset (the end of the stream header). A
// window is evicted as soon as every one of its bytes has been read once, so
// each source byte must be read exactly once through the cache. The
// prefetcher blocks while maxBuffers windows are resident or reserved.
//
// Usage:
// @code
// // prefetch worker
// while (auto buffer = unwrapOrThrow(cache.reserveBuffer())) {
//     buffer->fill(context);
//     unwrapOrThrow(cache.publishBuffer(std::move(*buffer)));
// }
//
// // any reader
// cache.readExact(bytes, offset, stats);
// @endcode
// =============================================================================

#ifndef SSU_IO_BUFFER_CACHE_H
#define SSU_IO_BUFFER_CACHE_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>

#include "ssu/common/error.h"
#include "ssu/common/sync_primitive.h"
#include "ssu/common/types.h"
#include "ssu/io/read_buffer.h"
#include "ssu/io/upgrade_stats.h"

namespace ssu::io {

/// @brief Prefetch cache whose windows are discarded after a single read.
/// @note Thread-safe. One prefetcher, any number of readers.
class ReadOnceBufferCache final : public SyncPrimitive {
public:
    /// @param cacheStart Absolute offset of the first cached byte.
    /// @param bufferSize Window size in bytes (> 0).
    /// @param maxBuffers Resident plus reserved windows allowed at once (> 0).
    ReadOnceBufferCache(StreamOffset cacheStart, std::size_t bufferSize, std::size_t maxBuffers);

    ~ReadOnceBufferCache() override = default;

    // Non-copyable, non-movable
    ReadOnceBufferCache(const ReadOnceBufferCache&) = delete;
    ReadOnceBufferCache& operator=(const ReadOnceBufferCache&) = delete;
    ReadOnceBufferCache(ReadOnceBufferCache&&) = delete;
    ReadOnceBufferCache& operator=(ReadOnceBufferCache&&) = delete;

    // -------------------------------------------------------------------------
    // Prefetcher side
    // -------------------------------------------------------------------------

    /// @brief Wait for room and hand out the next window to fill.
    /// @return std::nullopt once the cache is Done, kCancelled once Aborted.
    [[nodiscard]] Result<std::optional<ReadBuffer>> reserveBuffer();

    /// @brief Make a filled window readable.
    /// @note A window shorter than its capacity marks end of stream and moves
    ///       the cache to Done. Windows published after a halt are dropped.
    [[nodiscard]] VoidResult publishBuffer(ReadBuffer buffer);

    // -------------------------------------------------------------------------
    // Reader side
    // -------------------------------------------------------------------------

    /// @brief Copy dst.size() bytes starting at offset, waiting for windows.
    /// @throws UnexpectedEofError if the stream ends first,
    ///         SSUException (kCancelled) if the cache is aborted,
    ///         SSUException (kInvalidState) if a byte is read twice.
    void readExact(std::span<std::uint8_t> dst, StreamOffset offset, UpgradeStats& stats);

    // -------------------------------------------------------------------------
    // SyncPrimitive
    // -------------------------------------------------------------------------

    VoidResult halt(bool unplanned) override;

    [[nodiscard]] PrimitiveState state() const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "buffer cache"; }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    /// @brief Absolute offset where the source ended, once known.
    [[nodiscard]] std::optional<StreamOffset> endOfStream() const;

    /// @brief Windows currently resident.
    [[nodiscard]] std::size_t residentBuffers() const;

    [[nodiscard]] StreamOffset startOffset() const noexcept { return cacheStart_; }
    [[nodiscard]] std::size_t bufferSize() const noexcept { return bufferSize_; }
    [[nodiscard]] std::size_t maxBuffers() const noexcept { return maxBuffers_; }

private:
    struct Entry {
        std::shared_ptr<const ReadBuffer> buffer;

        /// @brief Bytes of the window not read yet.
        std::size_t remaining = 0;
    };

    [[nodiscard]] std::uint64_t keyFor(StreamOffset offset) const noexcept {
        return offset / bufferSize_;
    }

    /// @brief Record that count bytes of a window were consumed.
    void consume(std::uint64_t key, std::size_t count, StreamOffset offset);

    const StreamOffset cacheStart_;
    const std::size_t bufferSize_;
    const std::size_t maxBuffers_;

    mutable std::mutex mutex_;
    std::condition_variable bufferReady_;
    std::condition_variable spaceAvailable_;

    std::map<std::uint64_t, Entry> buffers_;
    std::size_t reserved_ = 0;
    std::uint64_t nextKey_;
    std::optional<StreamOffset> endOfStream_;
    PrimitiveState state_ = PrimitiveState::kRunning;
};

}  // namespace ssu::io

#endif  // SSU_IO_BUFFER_CACHE_H
