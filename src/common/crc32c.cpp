// =============================================================================
// sendstream-upgrade - CRC32C Checksum Implementation
// =============================================================================

#include "ssu/common/crc32c.h"

#include <array>

namespace ssu {

namespace {

constexpr std::uint32_t kCastagnoliReflected = 0x82F63B78U;

/// @brief Slicing-by-4 lookup tables, built at compile time.
constexpr std::array<std::array<std::uint32_t, 256>, 4> makeTables() {
    std::array<std::array<std::uint32_t, 256>, 4> tables{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int bit = 0; bit < 8; ++bit) {
            c = (c & 1U) != 0 ? (c >> 1) ^ kCastagnoliReflected : c >> 1;
        }
        tables[0][i] = c;
    }
    for (std::uint32_t i = 0; i < 256; ++i) {
        for (std::size_t t = 1; t < 4; ++t) {
            const std::uint32_t prev = tables[t - 1][i];
            tables[t][i] = (prev >> 8) ^ tables[0][prev & 0xFFU];
        }
    }
    return tables;
}

constexpr auto kTables = makeTables();

}  // namespace

std::uint32_t Crc32c::update(std::uint32_t crc, std::span<const std::uint8_t> data) noexcept {
    std::uint32_t c = ~crc;
    const std::uint8_t* p = data.data();
    std::size_t remaining = data.size();

    while (remaining >= 4) {
        c ^= static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
             (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
        c = kTables[3][c & 0xFFU] ^ kTables[2][(c >> 8) & 0xFFU] ^
            kTables[1][(c >> 16) & 0xFFU] ^ kTables[0][c >> 24];
        p += 4;
        remaining -= 4;
    }
    while (remaining-- > 0) {
        c = (c >> 8) ^ kTables[0][(c ^ *p++) & 0xFFU];
    }
    return ~c;
}

}  // namespace ssu
