// =============================================================================
// sendstream-upgrade - CRC32C Tests
// =============================================================================
// Known-answer vectors (RFC 3720) and incremental updates.
// =============================================================================

#include "ssu/common/crc32c.h"

#include <gtest/gtest.h>

#include <numeric>
#include <string_view>
#include <vector>

namespace ssu {
namespace {

std::vector<std::uint8_t> bytesOf(std::string_view text) {
    return {text.begin(), text.end()};
}

TEST(Crc32cTest, EmptyInput) {
    EXPECT_EQ(Crc32c::compute({}), 0u);
}

TEST(Crc32cTest, CheckString) {
    EXPECT_EQ(Crc32c::compute(bytesOf("123456789")), 0xE3069283u);
}

TEST(Crc32cTest, Rfc3720Vectors) {
    std::vector<std::uint8_t> zeros(32, 0x00);
    EXPECT_EQ(Crc32c::compute(zeros), 0x8A9136AAu);

    std::vector<std::uint8_t> ones(32, 0xFF);
    EXPECT_EQ(Crc32c::compute(ones), 0x62A8AB43u);

    std::vector<std::uint8_t> ascending(32);
    std::iota(ascending.begin(), ascending.end(), std::uint8_t{0});
    EXPECT_EQ(Crc32c::compute(ascending), 0x46DD794Eu);
}

TEST(Crc32cTest, IncrementalUpdateMatchesOneShot) {
    const auto data = bytesOf("The quick brown fox jumps over the lazy dog");
    const std::span<const std::uint8_t> all(data);

    for (std::size_t split = 0; split <= data.size(); split += 7) {
        const std::uint32_t partial = Crc32c::update(0, all.first(split));
        EXPECT_EQ(Crc32c::update(partial, all.subspan(split)), Crc32c::compute(all))
            << "split at " << split;
    }
}

TEST(Crc32cTest, SendStreamChecksumSkipsFinalInversion) {
    const auto data = bytesOf("123456789");
    EXPECT_EQ(sendStreamChecksum(data), ~Crc32c::update(~std::uint32_t{0}, data));
    EXPECT_NE(sendStreamChecksum(data), Crc32c::compute(data));
    EXPECT_EQ(sendStreamChecksum({}), 0u);
}

}  // namespace
}  // namespace ssu
