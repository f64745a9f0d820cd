// =============================================================================
// sendstream-upgrade - Send-Stream Attributes
// =============================================================================
// Tag-length-value attribute codec.
//
// Attributes are decoded as views into the command payload that owns them;
// a view must not outlive that buffer. Encoding appends to a ByteBuffer.
// =============================================================================

#ifndef SSU_FORMAT_SEND_ATTRIBUTE_H
#define SSU_FORMAT_SEND_ATTRIBUTE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ssu/common/types.h"
#include "ssu/format/send_format.h"

namespace ssu::format {

/// @brief Decoded attribute referencing bytes of its command payload.
struct AttributeView {
    AttributeType type = AttributeType::kUnspec;

    /// @brief Position of the attribute header within the command payload.
    std::size_t offset = 0;

    /// @brief Size of the attribute header (4, or 2 for unsized DATA).
    std::size_t headerSize = kAttributeHeaderSize;

    std::span<const std::uint8_t> payload;

    [[nodiscard]] std::size_t encodedSize() const noexcept { return headerSize + payload.size(); }

    /// @brief Interpret the payload as a little-endian u64.
    /// @throws ProtocolError if the payload is not 8 bytes.
    [[nodiscard]] std::uint64_t asU64() const;

    /// @brief Interpret the payload as a little-endian u32.
    /// @throws ProtocolError if the payload is not 4 bytes.
    [[nodiscard]] std::uint32_t asU32() const;

    [[nodiscard]] std::string_view asString() const noexcept {
        return {reinterpret_cast<const char*>(payload.data()), payload.size()};
    }
};

/// @brief Parse the TLV sequence of a command payload.
/// @param payload Command payload (everything after the command header).
/// @param version Stream version the payload is encoded in.
/// @param id Command id used in error context.
/// @throws ProtocolError for unknown types, overruns, or a DATA attribute that
///         is not the last one.
[[nodiscard]] std::vector<AttributeView> decodeAttributes(std::span<const std::uint8_t> payload,
                                                          StreamVersion version,
                                                          CommandId id = kInvalidCommandId);

/// @brief Append a length-prefixed attribute.
/// @throws ProtocolError if the payload exceeds the u16 length field.
void encodeAttribute(ByteBuffer& out, AttributeType type, std::span<const std::uint8_t> payload);

void encodeU64Attribute(ByteBuffer& out, AttributeType type, std::uint64_t value);

void encodeU32Attribute(ByteBuffer& out, AttributeType type, std::uint32_t value);

void encodeStringAttribute(ByteBuffer& out, AttributeType type, std::string_view value);

/// @brief Size of the DATA attribute header in a given version.
[[nodiscard]] constexpr std::size_t dataAttributeHeaderSize(StreamVersion version) noexcept {
    return hasSizedDataAttribute(version) ? kAttributeHeaderSize : kUnsizedDataHeaderSize;
}

/// @brief Append a DATA attribute header framed for the given version.
/// @throws ProtocolError if a sized header cannot describe the length.
void encodeDataAttributeHeader(ByteBuffer& out, std::size_t payloadSize, StreamVersion version);

}  // namespace ssu::format

#endif  // SSU_FORMAT_SEND_ATTRIBUTE_H
