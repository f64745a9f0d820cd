// =============================================================================
// sendstream-upgrade - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codec, I/O and pipeline layers.
//
// This module defines:
// - CommandId, StreamOffset, ByteBuffer: type aliases
// - Little-endian load/store helpers for wire fields
// - C++20 concepts for queue element contracts
// =============================================================================

#ifndef SSU_COMMON_TYPES_H
#define SSU_COMMON_TYPES_H

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>
#include <vector>

namespace ssu {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Sequence id of a command, assigned in source-read order.
/// @note Ids start at 0 for the first command after the stream header and are
///       never reused within a run.
using CommandId = std::uint64_t;

/// @brief Byte offset within the source or destination stream.
using StreamOffset = std::uint64_t;

/// @brief Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

inline constexpr CommandId kInvalidCommandId = std::numeric_limits<CommandId>::max();

// =============================================================================
// Little-Endian Helpers
// =============================================================================

namespace detail {

template <typename T>
[[nodiscard]] constexpr T byteSwapIfBigEndian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            return static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            return static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            return static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }
    return value;
}

}  // namespace detail

/// @brief Decode a little-endian integer from raw bytes.
template <std::unsigned_integral T>
[[nodiscard]] inline T loadLE(const std::uint8_t* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(T));
    return detail::byteSwapIfBigEndian(value);
}

/// @brief Encode an integer as little-endian into raw bytes.
template <std::unsigned_integral T>
inline void storeLE(std::uint8_t* dst, T value) noexcept {
    value = detail::byteSwapIfBigEndian(value);
    std::memcpy(dst, &value, sizeof(T));
}

/// @brief Append a little-endian integer to a byte buffer.
template <std::unsigned_integral T>
inline void appendLE(ByteBuffer& buffer, T value) {
    const std::size_t offset = buffer.size();
    buffer.resize(offset + sizeof(T));
    storeLE(buffer.data() + offset, value);
}

// =============================================================================
// Queue Element Concepts
// =============================================================================

/// @brief Unit of work accepted by the ordered reassembly queue.
/// @note A unit covers the command ids [firstId, lastId]. When lastIdShared()
///       is true the last command was only partially covered and the next
///       unit starts at the same id.
template <typename T>
concept OrderedElement = std::movable<T> && requires(const T& element) {
    { element.firstId() } -> std::convertible_to<CommandId>;
    { element.lastId() } -> std::convertible_to<CommandId>;
    { element.isLastIdShared() } -> std::convertible_to<bool>;
};

/// @brief Element of a plain blocking queue; carries no ordering obligation.
template <typename T>
concept UnorderedElement = std::movable<T> && std::is_nothrow_move_constructible_v<T>;

}  // namespace ssu

#endif  // SSU_COMMON_TYPES_H
