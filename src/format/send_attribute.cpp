// =============================================================================
// sendstream-upgrade - Send-Stream Attributes Implementation
// =============================================================================

#include "ssu/format/send_attribute.h"

#include <fmt/format.h>

#include "ssu/common/error.h"

namespace ssu::format {

namespace {

ErrorContext attributeContext(CommandId id, std::size_t offset) {
    ErrorContext ctx;
    if (id != kInvalidCommandId) {
        ctx.withCommand(id);
    }
    ctx.withOffset(offset);
    return ctx;
}

}  // namespace

std::uint64_t AttributeView::asU64() const {
    if (payload.size() != sizeof(std::uint64_t)) {
        throw ProtocolError(fmt::format("{} attribute holds {} bytes, expected 8",
                                        attributeTypeToString(type), payload.size()));
    }
    return loadLE<std::uint64_t>(payload.data());
}

std::uint32_t AttributeView::asU32() const {
    if (payload.size() != sizeof(std::uint32_t)) {
        throw ProtocolError(fmt::format("{} attribute holds {} bytes, expected 4",
                                        attributeTypeToString(type), payload.size()));
    }
    return loadLE<std::uint32_t>(payload.data());
}

std::vector<AttributeView> decodeAttributes(std::span<const std::uint8_t> payload,
                                            StreamVersion version, CommandId id) {
    std::vector<AttributeView> attributes;
    std::size_t offset = 0;

    while (offset < payload.size()) {
        const std::size_t remaining = payload.size() - offset;
        if (remaining < sizeof(std::uint16_t)) {
            throw ProtocolError(fmt::format("Truncated attribute header ({} bytes left)", remaining),
                                attributeContext(id, offset));
        }

        const auto rawType = loadLE<std::uint16_t>(payload.data() + offset);
        const auto type = attributeTypeFor(rawType, version);
        if (!type) {
            throw ProtocolError(fmt::format("Unknown attribute type {} for stream {}", rawType,
                                            streamVersionToString(version)),
                                attributeContext(id, offset));
        }

        AttributeView view;
        view.type = *type;
        view.offset = offset;

        if (*type == AttributeType::kData && !hasSizedDataAttribute(version)) {
            view.headerSize = kUnsizedDataHeaderSize;
            view.payload = payload.subspan(offset + kUnsizedDataHeaderSize);
            attributes.push_back(view);
            break;
        }

        if (remaining < kAttributeHeaderSize) {
            throw ProtocolError(fmt::format("Truncated {} attribute header", attributeTypeToString(*type)),
                                attributeContext(id, offset));
        }
        const auto length = loadLE<std::uint16_t>(payload.data() + offset + sizeof(std::uint16_t));
        if (length > remaining - kAttributeHeaderSize) {
            throw ProtocolError(
                fmt::format("{} attribute of {} bytes overruns the command ({} bytes left)",
                            attributeTypeToString(*type), length, remaining - kAttributeHeaderSize),
                attributeContext(id, offset));
        }

        if (!attributes.empty() && attributes.back().type == AttributeType::kData) {
            throw ProtocolError("Data attribute must be the last attribute of a command",
                                attributeContext(id, offset));
        }

        view.headerSize = kAttributeHeaderSize;
        view.payload = payload.subspan(offset + kAttributeHeaderSize, length);
        attributes.push_back(view);
        offset += kAttributeHeaderSize + length;
    }

    return attributes;
}

void encodeAttribute(ByteBuffer& out, AttributeType type, std::span<const std::uint8_t> payload) {
    if (payload.size() > kMaxSizedAttributeLength) {
        throw ProtocolError(fmt::format("{} attribute of {} bytes exceeds the u16 length field",
                                        attributeTypeToString(type), payload.size()));
    }
    appendLE(out, static_cast<std::uint16_t>(type));
    appendLE(out, static_cast<std::uint16_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
}

void encodeU64Attribute(ByteBuffer& out, AttributeType type, std::uint64_t value) {
    std::uint8_t bytes[sizeof(std::uint64_t)];
    storeLE(bytes, value);
    encodeAttribute(out, type, bytes);
}

void encodeU32Attribute(ByteBuffer& out, AttributeType type, std::uint32_t value) {
    std::uint8_t bytes[sizeof(std::uint32_t)];
    storeLE(bytes, value);
    encodeAttribute(out, type, bytes);
}

void encodeStringAttribute(ByteBuffer& out, AttributeType type, std::string_view value) {
    encodeAttribute(out, type,
                    std::span<const std::uint8_t>(
                        reinterpret_cast<const std::uint8_t*>(value.data()), value.size()));
}

void encodeDataAttributeHeader(ByteBuffer& out, std::size_t payloadSize, StreamVersion version) {
    appendLE(out, static_cast<std::uint16_t>(AttributeType::kData));
    if (!hasSizedDataAttribute(version)) {
        return;
    }
    if (payloadSize > kMaxSizedAttributeLength) {
        throw ProtocolError(fmt::format(
            "DATA attribute of {} bytes cannot be represented in a {} stream", payloadSize,
            streamVersionToString(version)));
    }
    appendLE(out, static_cast<std::uint16_t>(payloadSize));
}

}  // namespace ssu::format
