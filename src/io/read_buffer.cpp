// =============================================================================
// sendstream-upgrade - Prefetch Read Buffer Implementation
// =============================================================================

#include "ssu/io/read_buffer.h"

#include <algorithm>
#include <cstring>

#include "ssu/io/stream_context.h"

namespace ssu::io {

ReadBuffer::ReadBuffer(std::uint64_t key, StreamOffset startOffset, std::size_t capacity)
    : key_(key), startOffset_(startOffset), capacity_(capacity) {}

std::size_t ReadBuffer::fill(StreamContext& context) {
    data_.resize(capacity_);
    const std::size_t filled = context.read(data_);
    data_.resize(filled);
    data_.shrink_to_fit();
    return filled;
}

std::size_t ReadBuffer::read(StreamOffset offset, std::span<std::uint8_t> dst) const noexcept {
    if (offset < startOffset_ || offset >= endOffset()) {
        return 0;
    }
    const std::size_t position = static_cast<std::size_t>(offset - startOffset_);
    const std::size_t count = std::min(dst.size(), data_.size() - position);
    std::memcpy(dst.data(), data_.data() + position, count);
    return count;
}

}  // namespace ssu::io
