// =============================================================================
// sendstream-upgrade - Prefetch Read Buffer
// =============================================================================
// One fixed window of the source stream, filled once by the prefetcher and
// read concurrently (it is immutable once published).
// =============================================================================

#ifndef SSU_IO_READ_BUFFER_H
#define SSU_IO_READ_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "ssu/common/types.h"

namespace ssu::io {

class StreamContext;

/// @brief Window [startOffset, startOffset + size) of the source stream.
class ReadBuffer {
public:
    /// @param key Cache key (absolute offset divided by the buffer size).
    /// @param startOffset Absolute source offset of the first byte.
    /// @param capacity Bytes to request when filling.
    ReadBuffer(std::uint64_t key, StreamOffset startOffset, std::size_t capacity);

    /// @brief Fill from the context's source handle.
    /// @return Bytes actually read; fewer than capacity means end of stream.
    std::size_t fill(StreamContext& context);

    /// @brief Copy the overlap of [offset, offset + dst.size()) into dst.
    /// @return Bytes copied (0 if offset lies outside the filled window).
    [[nodiscard]] std::size_t read(StreamOffset offset, std::span<std::uint8_t> dst) const noexcept;

    [[nodiscard]] std::uint64_t key() const noexcept { return key_; }
    [[nodiscard]] StreamOffset startOffset() const noexcept { return startOffset_; }
    [[nodiscard]] StreamOffset endOffset() const noexcept { return startOffset_ + data_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool isEmpty() const noexcept { return data_.empty(); }

private:
    std::uint64_t key_;
    StreamOffset startOffset_;
    std::size_t capacity_;
    ByteBuffer data_;
};

}  // namespace ssu::io

#endif  // SSU_IO_READ_BUFFER_H
