// =============================================================================
// sendstream-upgrade - Zstandard Payload Codec
// =============================================================================
// zstd compression of WRITE payloads for ENCODED_WRITE commands.
//
// Frames use a fixed window log so the receiving kernel can decode them.
// One ZstdCompressor per compression worker; the context is not thread-safe.
// =============================================================================

#ifndef SSU_FORMAT_ZSTD_CODEC_H
#define SSU_FORMAT_ZSTD_CODEC_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "ssu/common/types.h"

namespace ssu::format {

inline constexpr int kMinCompressionLevel = 1;
inline constexpr int kMaxCompressionLevel = 19;
inline constexpr int kDefaultCompressionLevel = 3;

class ZstdCompressorImpl;

/// @brief Reusable zstd compression context.
class ZstdCompressor {
public:
    /// @brief Create a compressor for a level in [1, 19].
    /// @throws SSUException (kInvalidArgument) for out-of-range levels.
    explicit ZstdCompressor(int level);

    ~ZstdCompressor();

    // Non-copyable, movable
    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;
    ZstdCompressor(ZstdCompressor&&) noexcept;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept;

    /// @brief Compress one payload into a single frame.
    /// @throws SSUException (kCompressionFailed) on library errors.
    [[nodiscard]] ByteBuffer compress(std::span<const std::uint8_t> input);

    [[nodiscard]] int level() const noexcept;

private:
    std::unique_ptr<ZstdCompressorImpl> impl_;
};

/// @brief Decompress a single frame of known decompressed size.
/// @throws SSUException (kProtocolError) if the frame is corrupt or its size
///         differs from expectedSize.
[[nodiscard]] ByteBuffer zstdDecompress(std::span<const std::uint8_t> frame, std::size_t expectedSize);

}  // namespace ssu::format

#endif  // SSU_FORMAT_ZSTD_CODEC_H
