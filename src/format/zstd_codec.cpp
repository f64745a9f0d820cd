// =============================================================================
// sendstream-upgrade - Zstandard Payload Codec Implementation
// =============================================================================

#include "ssu/format/zstd_codec.h"

#include <string>

#include <fmt/format.h>
#include <zstd.h>

#include "ssu/common/error.h"
#include "ssu/format/send_format.h"

namespace ssu::format {

namespace {

void checkZstd(std::size_t code, const char* what) {
    if (ZSTD_isError(code)) {
        throw SSUException(ErrorCode::kCompressionFailed,
                           fmt::format("{}: {}", what, ZSTD_getErrorName(code)));
    }
}

}  // namespace

// =============================================================================
// ZstdCompressorImpl
// =============================================================================

class ZstdCompressorImpl {
public:
    explicit ZstdCompressorImpl(int level) : level_(level), cctx_(ZSTD_createCCtx()) {
        if (cctx_ == nullptr) {
            throw SSUException(ErrorCode::kCompressionFailed, "Failed to allocate zstd context");
        }
    }

    ~ZstdCompressorImpl() { ZSTD_freeCCtx(cctx_); }

    ZstdCompressorImpl(const ZstdCompressorImpl&) = delete;
    ZstdCompressorImpl& operator=(const ZstdCompressorImpl&) = delete;

    ByteBuffer compress(std::span<const std::uint8_t> input) {
        checkZstd(ZSTD_CCtx_reset(cctx_, ZSTD_reset_session_and_parameters), "zstd reset");
        checkZstd(ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level_),
                  "zstd compression level");
        checkZstd(ZSTD_CCtx_setParameter(cctx_, ZSTD_c_windowLog, kZstdWindowLog),
                  "zstd window log");

        ByteBuffer output(ZSTD_compressBound(input.size()));
        const std::size_t size =
            ZSTD_compress2(cctx_, output.data(), output.size(), input.data(), input.size());
        checkZstd(size, "Zstd compression failed");
        output.resize(size);
        return output;
    }

    [[nodiscard]] int level() const noexcept { return level_; }

private:
    int level_;
    ZSTD_CCtx* cctx_;
};

// =============================================================================
// ZstdCompressor
// =============================================================================

ZstdCompressor::ZstdCompressor(int level) {
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        throw SSUException(ErrorCode::kInvalidArgument,
                           fmt::format("Compression level {} outside [{}, {}]", level,
                                       kMinCompressionLevel, kMaxCompressionLevel));
    }
    impl_ = std::make_unique<ZstdCompressorImpl>(level);
}

ZstdCompressor::~ZstdCompressor() = default;

ZstdCompressor::ZstdCompressor(ZstdCompressor&&) noexcept = default;
ZstdCompressor& ZstdCompressor::operator=(ZstdCompressor&&) noexcept = default;

ByteBuffer ZstdCompressor::compress(std::span<const std::uint8_t> input) {
    return impl_->compress(input);
}

int ZstdCompressor::level() const noexcept {
    return impl_->level();
}

// =============================================================================
// Decompression
// =============================================================================

ByteBuffer zstdDecompress(std::span<const std::uint8_t> frame, std::size_t expectedSize) {
    ByteBuffer output(expectedSize);
    const std::size_t size = ZSTD_decompress(output.data(), output.size(), frame.data(), frame.size());
    if (ZSTD_isError(size)) {
        throw ProtocolError(
            fmt::format("Zstd decompression failed: {}", ZSTD_getErrorName(size)));
    }
    if (size != expectedSize) {
        throw ProtocolError(fmt::format("Zstd frame decoded to {} bytes, expected {}", size,
                                        expectedSize));
    }
    return output;
}

}  // namespace ssu::format
