// =============================================================================
// sendstream-upgrade - Send-Stream Commands
// =============================================================================
// Command header framing and the in-memory command model.
//
// A SendCommand keeps its non-DATA attributes as already-encoded TLV bytes in
// wire order, and the DATA payload (if any) separately. Attribute framing is
// identical across versions except for DATA, so changing the version of a
// command only changes how its DATA header is emitted at serialization time.
// Coalescing and truncation edit the DATA payload and patch FILE_OFFSET in
// place.
// =============================================================================

#ifndef SSU_FORMAT_SEND_COMMAND_H
#define SSU_FORMAT_SEND_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ssu/common/types.h"
#include "ssu/format/send_attribute.h"
#include "ssu/format/send_format.h"

namespace ssu::format {

class ZstdCompressor;

// =============================================================================
// Command Header
// =============================================================================

/// @brief Fixed 10-byte command header.
struct CommandHeader {
    /// @brief Payload length (attributes only, header excluded).
    std::uint32_t length = 0;

    /// @brief Raw command type code.
    std::uint16_t rawType = 0;

    /// @brief Stored CRC32C of the whole command with this field zeroed.
    std::uint32_t crc32c = 0;

    [[nodiscard]] static CommandHeader decode(std::span<const std::uint8_t, kCommandHeaderSize> bytes) noexcept;

    void encodeTo(std::span<std::uint8_t, kCommandHeaderSize> bytes) const noexcept;

    [[nodiscard]] std::size_t totalSize() const noexcept { return kCommandHeaderSize + length; }

    [[nodiscard]] bool isEnd() const noexcept {
        return rawType == static_cast<std::uint16_t>(CommandType::kEnd);
    }
};

/// @brief Compute the checksum of a serialized command.
/// @param command Header plus payload; the header's crc field is treated as zero.
[[nodiscard]] std::uint32_t computeCommandChecksum(std::span<const std::uint8_t> command) noexcept;

// =============================================================================
// Command Info
// =============================================================================

/// @brief A command as read off the source, before attribute decoding.
/// @note When read through the shared buffer cache the payload stays in the
///       cache until a construction worker loads it from payloadOffset.
struct CommandInfo {
    CommandId id = kInvalidCommandId;
    CommandHeader header;

    /// @brief Source stream offset of the first payload byte.
    StreamOffset payloadOffset = 0;

    /// @brief Payload bytes once materialized.
    ByteBuffer payload;

    bool payloadLoaded = false;

    [[nodiscard]] bool isEnd() const noexcept { return header.isEnd(); }
};

/// @brief Parse the attributes of a loaded command.
/// @throws ProtocolError on malformed TLVs, SSUException (kInvalidState) if the
///         payload has not been loaded.
[[nodiscard]] std::vector<AttributeView> decodeAttributes(const CommandInfo& info,
                                                          StreamVersion version);

// =============================================================================
// Send Command
// =============================================================================

/// @brief Decoded command, re-encodable in any version that can express it.
class SendCommand {
public:
    /// @brief Decode a loaded command.
    /// @param info Command with its payload loaded.
    /// @param version Version the command was read in.
    /// @param verifyChecksum Validate the stored CRC32C first.
    /// @throws ChecksumError, ProtocolError
    [[nodiscard]] static SendCommand decode(const CommandInfo& info, StreamVersion version,
                                            bool verifyChecksum);

    /// @brief Decode a fully serialized command (header plus payload).
    [[nodiscard]] static SendCommand fromBytes(std::span<const std::uint8_t> bytes,
                                               StreamVersion version, bool verifyChecksum,
                                               CommandId id = kInvalidCommandId);

    /// @brief UPDATE_EXTENT command serializing to exactly totalSize bytes.
    /// @throws ProtocolError if totalSize is below kMinPadCommandSize.
    [[nodiscard]] static SendCommand makePadding(std::size_t totalSize, StreamVersion version);

    /// @brief Smallest UPDATE_EXTENT padding command (empty path).
    static constexpr std::size_t kMinPadCommandSize =
        kCommandHeaderSize + kAttributeHeaderSize + 2 * (kAttributeHeaderSize + sizeof(std::uint64_t));

    // -------------------------------------------------------------------------
    // Transcoding
    // -------------------------------------------------------------------------

    /// @brief Re-target the command at another stream version.
    /// @throws UnsupportedVersionError if the command or one of its attributes
    ///         does not exist in the destination, ProtocolError if the DATA
    ///         payload cannot be framed there.
    void transcode(StreamVersion destination, CommandId id = kInvalidCommandId);

    /// @brief Build the ENCODED_WRITE form of a WRITE command.
    /// @return std::nullopt when the command is not compressible or the result
    ///         does not shrink by at least the added metadata.
    [[nodiscard]] std::optional<SendCommand> compress(ZstdCompressor& compressor) const;

    // -------------------------------------------------------------------------
    // Coalescing
    // -------------------------------------------------------------------------

    /// @brief WRITE in an unsized-DATA version with path, offset and data.
    [[nodiscard]] bool isAppendable() const noexcept;

    /// @brief Whether next continues this command's extent in the same file.
    [[nodiscard]] bool canAppend(const SendCommand& next) const noexcept;

    /// @brief Move up to maxDataSize - dataSize() bytes from the front of next.
    /// @return Number of bytes moved.
    std::size_t append(SendCommand& next, std::size_t maxDataSize);

    /// @brief Drop bytes from the front of DATA and advance FILE_OFFSET.
    void truncateDataAtStart(std::size_t bytes);

    [[nodiscard]] bool isFull(std::size_t maxDataSize) const noexcept {
        return data_.has_value() && data_->size() >= maxDataSize;
    }

    /// @brief A command whose DATA payload has been fully moved elsewhere.
    [[nodiscard]] bool isEmpty() const noexcept { return data_.has_value() && data_->empty(); }

    // -------------------------------------------------------------------------
    // Padding
    // -------------------------------------------------------------------------

    /// @brief Unencoded WRITE whose offset and length are block aligned.
    [[nodiscard]] bool isPaddable() const noexcept;

    /// @brief Size of the padding command needed before this command.
    /// @param writeOffset Destination offset the command would start at.
    /// @return 0 if the DATA payload would already start block aligned.
    [[nodiscard]] std::size_t paddingBefore(StreamOffset writeOffset) const noexcept;

    // -------------------------------------------------------------------------
    // Serialization
    // -------------------------------------------------------------------------

    /// @brief Append the wire form (header with fresh CRC32C) to out.
    void serializeTo(ByteBuffer& out) const;

    [[nodiscard]] ByteBuffer serialize() const;

    [[nodiscard]] std::size_t serializedSize() const noexcept;

    /// @brief Offset of the first DATA payload byte within the wire form.
    [[nodiscard]] std::size_t dataPayloadOffset() const noexcept;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] CommandType type() const noexcept { return type_; }
    [[nodiscard]] StreamVersion version() const noexcept { return version_; }
    [[nodiscard]] bool isEnd() const noexcept { return type_ == CommandType::kEnd; }
    [[nodiscard]] bool hasData() const noexcept { return data_.has_value(); }
    [[nodiscard]] std::size_t dataSize() const noexcept { return data_ ? data_->size() : 0; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
        return data_ ? std::span<const std::uint8_t>(*data_) : std::span<const std::uint8_t>{};
    }
    [[nodiscard]] const std::optional<std::string>& path() const noexcept { return path_; }
    [[nodiscard]] std::optional<std::uint64_t> fileOffset() const noexcept { return fileOffset_; }

    /// @brief Encoded non-DATA attributes in wire order.
    [[nodiscard]] std::span<const std::uint8_t> encodedAttributes() const noexcept {
        return attributes_;
    }

    /// @brief Wire size of the command before compression.
    [[nodiscard]] std::uint64_t logicalSize() const noexcept {
        return uncompressedSize_.value_or(serializedSize());
    }

    /// @brief Equal wire form (statistics are not compared).
    [[nodiscard]] bool operator==(const SendCommand& other) const noexcept {
        return version_ == other.version_ && type_ == other.type_ &&
               attributes_ == other.attributes_ && data_ == other.data_;
    }

private:
    SendCommand() = default;

    [[nodiscard]] static SendCommand decodeFrom(const CommandHeader& header,
                                                std::span<const std::uint8_t> payload,
                                                StreamVersion version, bool verifyChecksum,
                                                CommandId id);

    void adoptAttribute(const AttributeView& attribute, CommandId id);

    StreamVersion version_ = kNewestStreamVersion;
    CommandType type_ = CommandType::kUnspec;
    ByteBuffer attributes_;
    std::optional<ByteBuffer> data_;
    std::optional<std::string> path_;
    std::optional<std::uint64_t> fileOffset_;

    /// @brief Position of the FILE_OFFSET value inside attributes_.
    std::optional<std::size_t> fileOffsetPosition_;

    /// @brief Wire size of the WRITE an ENCODED_WRITE was built from.
    std::optional<std::uint64_t> uncompressedSize_;
};

/// @brief Human-readable one-line summary for logs and error messages.
[[nodiscard]] std::string describeCommand(const SendCommand& command);

}  // namespace ssu::format

#endif  // SSU_FORMAT_SEND_COMMAND_H
