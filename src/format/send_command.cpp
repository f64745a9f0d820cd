// =============================================================================
// sendstream-upgrade - Send-Stream Commands Implementation
// =============================================================================

#include "ssu/format/send_command.h"

#include <algorithm>
#include <array>

#include <fmt/format.h>

#include "ssu/common/crc32c.h"
#include "ssu/common/error.h"
#include "ssu/format/zstd_codec.h"

namespace ssu::format {

namespace {

/// @brief UNENCODED_FILE_LEN, UNENCODED_LEN, UNENCODED_OFFSET and COMPRESSION.
constexpr std::size_t kEncodedMetadataSize =
    3 * (kAttributeHeaderSize + sizeof(std::uint64_t)) + kAttributeHeaderSize + sizeof(std::uint32_t);

ErrorContext commandContext(CommandId id) {
    ErrorContext ctx;
    if (id != kInvalidCommandId) {
        ctx.withCommand(id);
    }
    return ctx;
}

std::uint32_t checksumOf(const CommandHeader& header, std::span<const std::uint8_t> payload) noexcept {
    CommandHeader zeroed = header;
    zeroed.crc32c = 0;
    std::array<std::uint8_t, kCommandHeaderSize> headerBytes{};
    zeroed.encodeTo(headerBytes);
    const std::uint32_t partial = Crc32c::update(~std::uint32_t{0}, headerBytes);
    return ~Crc32c::update(partial, payload);
}

}  // namespace

// =============================================================================
// CommandHeader
// =============================================================================

CommandHeader CommandHeader::decode(std::span<const std::uint8_t, kCommandHeaderSize> bytes) noexcept {
    CommandHeader header;
    header.length = loadLE<std::uint32_t>(bytes.data() + kCommandLengthOffset);
    header.rawType = loadLE<std::uint16_t>(bytes.data() + kCommandTypeOffset);
    header.crc32c = loadLE<std::uint32_t>(bytes.data() + kCommandCrcOffset);
    return header;
}

void CommandHeader::encodeTo(std::span<std::uint8_t, kCommandHeaderSize> bytes) const noexcept {
    storeLE(bytes.data() + kCommandLengthOffset, length);
    storeLE(bytes.data() + kCommandTypeOffset, rawType);
    storeLE(bytes.data() + kCommandCrcOffset, crc32c);
}

std::uint32_t computeCommandChecksum(std::span<const std::uint8_t> command) noexcept {
    if (command.size() < kCommandHeaderSize) {
        return sendStreamChecksum(command);
    }
    const auto header =
        CommandHeader::decode(std::span<const std::uint8_t, kCommandHeaderSize>(command.data(), kCommandHeaderSize));
    return checksumOf(header, command.subspan(kCommandHeaderSize));
}

std::vector<AttributeView> decodeAttributes(const CommandInfo& info, StreamVersion version) {
    if (!info.payloadLoaded) {
        throw SSUException(ErrorCode::kInvalidState,
                           "Decoding attributes of a command whose payload is not loaded",
                           commandContext(info.id));
    }
    return decodeAttributes(info.payload, version, info.id);
}

// =============================================================================
// SendCommand - Decoding
// =============================================================================

SendCommand SendCommand::decode(const CommandInfo& info, StreamVersion version, bool verifyChecksum) {
    if (!info.payloadLoaded) {
        throw SSUException(ErrorCode::kInvalidState,
                           "Decoding a command whose payload is not loaded",
                           commandContext(info.id).withOffset(info.payloadOffset));
    }
    if (info.payload.size() != info.header.length) {
        throw ProtocolError(fmt::format("Command payload holds {} bytes, header announces {}",
                                        info.payload.size(), info.header.length),
                            commandContext(info.id).withOffset(info.payloadOffset));
    }
    return decodeFrom(info.header, info.payload, version, verifyChecksum, info.id);
}

SendCommand SendCommand::fromBytes(std::span<const std::uint8_t> bytes, StreamVersion version,
                                   bool verifyChecksum, CommandId id) {
    if (bytes.size() < kCommandHeaderSize) {
        throw ProtocolError(fmt::format("Command of {} bytes is shorter than its header", bytes.size()),
                            commandContext(id));
    }
    const auto header =
        CommandHeader::decode(std::span<const std::uint8_t, kCommandHeaderSize>(bytes.data(), kCommandHeaderSize));
    if (header.totalSize() != bytes.size()) {
        throw ProtocolError(fmt::format("Command header announces {} payload bytes, buffer holds {}",
                                        header.length, bytes.size() - kCommandHeaderSize),
                            commandContext(id));
    }
    return decodeFrom(header, bytes.subspan(kCommandHeaderSize), version, verifyChecksum, id);
}

SendCommand SendCommand::decodeFrom(const CommandHeader& header,
                                    std::span<const std::uint8_t> payload, StreamVersion version,
                                    bool verifyChecksum, CommandId id) {
    if (verifyChecksum) {
        const std::uint32_t computed = checksumOf(header, payload);
        if (computed != header.crc32c) {
            throw ChecksumError(header.crc32c, computed, commandContext(id));
        }
    }

    const auto type = commandTypeFor(header.rawType, version);
    if (!type) {
        throw ProtocolError(fmt::format("Unknown command type {} for stream {}", header.rawType,
                                        streamVersionToString(version)),
                            commandContext(id));
    }

    SendCommand command;
    command.version_ = version;
    command.type_ = *type;
    for (const auto& attribute : decodeAttributes(payload, version, id)) {
        command.adoptAttribute(attribute, id);
    }
    return command;
}

void SendCommand::adoptAttribute(const AttributeView& attribute, CommandId id) {
    if (attribute.type == AttributeType::kData) {
        data_.emplace(attribute.payload.begin(), attribute.payload.end());
        return;
    }

    switch (attribute.type) {
        case AttributeType::kPath:
            path_ = std::string(attribute.asString());
            break;
        case AttributeType::kFileOffset:
            try {
                fileOffset_ = attribute.asU64();
            } catch (const ProtocolError& e) {
                throw ProtocolError(e.message(), commandContext(id));
            }
            fileOffsetPosition_ = attributes_.size() + kAttributeHeaderSize;
            break;
        default:
            break;
    }
    encodeAttribute(attributes_, attribute.type, attribute.payload);
}

SendCommand SendCommand::makePadding(std::size_t totalSize, StreamVersion version) {
    if (totalSize < kMinPadCommandSize) {
        throw ProtocolError(fmt::format("Padding command of {} bytes is below the minimum of {}",
                                        totalSize, kMinPadCommandSize));
    }
    SendCommand command;
    command.version_ = version;
    command.type_ = CommandType::kUpdateExtent;
    encodeStringAttribute(command.attributes_, AttributeType::kPath,
                          std::string(totalSize - kMinPadCommandSize, 'a'));
    encodeU64Attribute(command.attributes_, AttributeType::kFileOffset, 0);
    encodeU64Attribute(command.attributes_, AttributeType::kSize, 0);
    return command;
}

// =============================================================================
// SendCommand - Transcoding
// =============================================================================

void SendCommand::transcode(StreamVersion destination, CommandId id) {
    if (destination == version_) {
        return;
    }
    if (!isSupportedVersionPair(version_, destination)) {
        throw UnsupportedVersionError(
            fmt::format("Cannot transcode {} command from {} to {} in one pass",
                        commandTypeToString(type_), streamVersionToString(version_),
                        streamVersionToString(destination)),
            commandContext(id));
    }
    if (!commandTypeFor(static_cast<std::uint16_t>(type_), destination)) {
        throw UnsupportedVersionError(
            fmt::format("{} commands do not exist in {} streams", commandTypeToString(type_),
                        streamVersionToString(destination)),
            commandContext(id));
    }

    // Non-DATA attributes are framed identically in every version; only check
    // that their types exist in the destination.
    std::size_t offset = 0;
    while (offset + kAttributeHeaderSize <= attributes_.size()) {
        const auto rawType = loadLE<std::uint16_t>(attributes_.data() + offset);
        const auto length = loadLE<std::uint16_t>(attributes_.data() + offset + sizeof(std::uint16_t));
        if (!attributeTypeFor(rawType, destination)) {
            throw UnsupportedVersionError(
                fmt::format("{} command carries attribute {} which {} streams lack",
                            commandTypeToString(type_),
                            attributeTypeToString(static_cast<AttributeType>(rawType)),
                            streamVersionToString(destination)),
                commandContext(id));
        }
        offset += kAttributeHeaderSize + length;
    }

    if (data_ && hasSizedDataAttribute(destination) && data_->size() > kMaxSizedAttributeLength) {
        throw ProtocolError(fmt::format("DATA payload of {} bytes cannot be framed in a {} stream",
                                        data_->size(), streamVersionToString(destination)),
                            commandContext(id));
    }

    version_ = destination;
}

std::optional<SendCommand> SendCommand::compress(ZstdCompressor& compressor) const {
    if (type_ != CommandType::kWrite || !data_ || data_->empty() ||
        hasSizedDataAttribute(version_)) {
        return std::nullopt;
    }

    ByteBuffer compressed = compressor.compress(*data_);
    if (compressed.size() + kEncodedMetadataSize >= data_->size()) {
        return std::nullopt;
    }

    SendCommand encoded = *this;
    encoded.type_ = CommandType::kEncodedWrite;
    const auto unencodedSize = static_cast<std::uint64_t>(data_->size());
    encodeU64Attribute(encoded.attributes_, AttributeType::kUnencodedFileLen, unencodedSize);
    encodeU64Attribute(encoded.attributes_, AttributeType::kUnencodedLen, unencodedSize);
    encodeU64Attribute(encoded.attributes_, AttributeType::kUnencodedOffset, 0);
    encodeU32Attribute(encoded.attributes_, AttributeType::kCompression, kEncodedIoCompressionZstd);
    encoded.uncompressedSize_ = serializedSize();
    encoded.data_ = std::move(compressed);
    return encoded;
}

// =============================================================================
// SendCommand - Coalescing
// =============================================================================

bool SendCommand::isAppendable() const noexcept {
    return type_ == CommandType::kWrite && !hasSizedDataAttribute(version_) && data_.has_value() &&
           path_.has_value() && fileOffsetPosition_.has_value();
}

bool SendCommand::canAppend(const SendCommand& next) const noexcept {
    return isAppendable() && next.isAppendable() && version_ == next.version_ &&
           *path_ == *next.path_ && *fileOffset_ + data_->size() == *next.fileOffset_;
}

std::size_t SendCommand::append(SendCommand& next, std::size_t maxDataSize) {
    if (!canAppend(next)) {
        throw SSUException(ErrorCode::kInvalidState,
                           fmt::format("Cannot append {} to {}", describeCommand(next),
                                       describeCommand(*this)));
    }
    const std::size_t room = maxDataSize > data_->size() ? maxDataSize - data_->size() : 0;
    const std::size_t moved = std::min(room, next.data_->size());
    if (moved == 0) {
        return 0;
    }
    data_->insert(data_->end(), next.data_->begin(),
                  next.data_->begin() + static_cast<std::ptrdiff_t>(moved));
    next.truncateDataAtStart(moved);
    return moved;
}

void SendCommand::truncateDataAtStart(std::size_t bytes) {
    if (!data_ || !fileOffsetPosition_ || bytes > data_->size()) {
        throw SSUException(ErrorCode::kInvalidState,
                           fmt::format("Cannot truncate {} bytes from {}", bytes,
                                       describeCommand(*this)));
    }
    data_->erase(data_->begin(), data_->begin() + static_cast<std::ptrdiff_t>(bytes));
    *fileOffset_ += bytes;
    storeLE(attributes_.data() + *fileOffsetPosition_, *fileOffset_);
}

// =============================================================================
// SendCommand - Padding
// =============================================================================

bool SendCommand::isPaddable() const noexcept {
    return type_ == CommandType::kWrite && data_.has_value() && fileOffset_.has_value() &&
           *fileOffset_ % kPadAlignment == 0 && data_->size() % kPadAlignment == 0;
}

std::size_t SendCommand::paddingBefore(StreamOffset writeOffset) const noexcept {
    const std::size_t misalignment = (writeOffset + dataPayloadOffset()) % kPadAlignment;
    if (misalignment == 0) {
        return 0;
    }
    std::size_t pad = kPadAlignment - misalignment;
    if (pad < kMinPadCommandSize) {
        pad += kPadAlignment;
    }
    return pad;
}

// =============================================================================
// SendCommand - Serialization
// =============================================================================

std::size_t SendCommand::dataPayloadOffset() const noexcept {
    return kCommandHeaderSize + attributes_.size() +
           (data_ ? dataAttributeHeaderSize(version_) : 0);
}

std::size_t SendCommand::serializedSize() const noexcept {
    return dataPayloadOffset() + dataSize();
}

void SendCommand::serializeTo(ByteBuffer& out) const {
    const std::size_t start = out.size();
    out.resize(start + kCommandHeaderSize);
    out.insert(out.end(), attributes_.begin(), attributes_.end());
    if (data_) {
        encodeDataAttributeHeader(out, data_->size(), version_);
        out.insert(out.end(), data_->begin(), data_->end());
    }

    CommandHeader header;
    header.length = static_cast<std::uint32_t>(out.size() - start - kCommandHeaderSize);
    header.rawType = static_cast<std::uint16_t>(type_);
    header.crc32c = 0;
    const std::span<std::uint8_t, kCommandHeaderSize> headerBytes(out.data() + start, kCommandHeaderSize);
    header.encodeTo(headerBytes);
    header.crc32c = sendStreamChecksum(std::span<const std::uint8_t>(out).subspan(start));
    header.encodeTo(headerBytes);
}

ByteBuffer SendCommand::serialize() const {
    ByteBuffer out;
    out.reserve(serializedSize());
    serializeTo(out);
    return out;
}

std::string describeCommand(const SendCommand& command) {
    return fmt::format("<{} {} attrs={}B data={} path={} offset={}>",
                       commandTypeToString(command.type()),
                       streamVersionToString(command.version()), command.encodedAttributes().size(),
                       command.hasData() ? fmt::format("{}B", command.dataSize()) : "none",
                       command.path() ? *command.path() : "-",
                       command.fileOffset() ? fmt::format("{}", *command.fileOffset()) : "-");
}

}  // namespace ssu::format
