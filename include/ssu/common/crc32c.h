// =============================================================================
// sendstream-upgrade - CRC32C Checksum
// =============================================================================
// Table-driven CRC32C (Castagnoli, reflected polynomial 0x82F63B78).
//
// Crc32c::update follows the common convention: the running value is inverted
// on entry and exit, so update(0, data) is the standard CRC32C of data.
// sendStreamChecksum() applies the send-stream rule on top of it: an inverted
// seed and an inverted result, which equals the raw register update from 0.
// =============================================================================

#ifndef SSU_COMMON_CRC32C_H
#define SSU_COMMON_CRC32C_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace ssu {

/// @brief CRC32C accumulator.
class Crc32c {
public:
    /// @brief Continue a CRC32C computation over more bytes.
    /// @param crc Result of a previous update (0 to start).
    /// @param data Bytes to fold in.
    [[nodiscard]] static std::uint32_t update(std::uint32_t crc,
                                              std::span<const std::uint8_t> data) noexcept;

    /// @brief Standard CRC32C of a buffer.
    [[nodiscard]] static std::uint32_t compute(std::span<const std::uint8_t> data) noexcept {
        return update(0, data);
    }
};

/// @brief Checksum stored in a send-stream command header.
/// @note The caller zeroes the checksum field before hashing the command.
[[nodiscard]] inline std::uint32_t sendStreamChecksum(std::span<const std::uint8_t> data) noexcept {
    return ~Crc32c::update(~std::uint32_t{0}, data);
}

}  // namespace ssu

#endif  // SSU_COMMON_CRC32C_H
