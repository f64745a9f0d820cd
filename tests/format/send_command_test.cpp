// =============================================================================
// sendstream-upgrade - Send Command Tests
// =============================================================================
// Decoding, transcoding, coalescing, compression and padding of commands.
// =============================================================================

#include "ssu/format/send_command.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "ssu/common/error.h"
#include "ssu/format/send_attribute.h"
#include "ssu/format/zstd_codec.h"
#include "support/stream_builder.h"

namespace ssu::format {
namespace {

using test::buildCommand;
using test::patternData;
using test::randomData;

ByteBuffer writeAttributes(std::string_view path, std::uint64_t offset) {
    ByteBuffer attributes;
    encodeStringAttribute(attributes, AttributeType::kPath, path);
    encodeU64Attribute(attributes, AttributeType::kFileOffset, offset);
    return attributes;
}

SendCommand makeWrite(std::string_view path, std::uint64_t offset, const ByteBuffer& data,
                      StreamVersion version) {
    const ByteBuffer bytes = buildCommand(CommandType::kWrite, writeAttributes(path, offset),
                                          std::span<const std::uint8_t>(data), version);
    return SendCommand::fromBytes(bytes, version, true);
}

// =============================================================================
// Decoding
// =============================================================================

TEST(SendCommandTest, DecodesWriteAttributes) {
    const ByteBuffer data = patternData(1000);
    const SendCommand command = makeWrite("a/b", 8192, data, StreamVersion::kV1);

    EXPECT_EQ(command.type(), CommandType::kWrite);
    EXPECT_EQ(command.version(), StreamVersion::kV1);
    ASSERT_TRUE(command.path().has_value());
    EXPECT_EQ(*command.path(), "a/b");
    EXPECT_EQ(command.fileOffset(), 8192u);
    ASSERT_EQ(command.dataSize(), data.size());
    EXPECT_TRUE(std::equal(data.begin(), data.end(), command.data().begin()));
}

TEST(SendCommandTest, RejectsChecksumMismatch) {
    ByteBuffer bytes = buildCommand(CommandType::kWrite, writeAttributes("f", 0),
                                    std::span<const std::uint8_t>(patternData(64)),
                                    StreamVersion::kV1);
    bytes.back() ^= 0x01;

    EXPECT_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV1, true)),
                 ChecksumError);
    EXPECT_NO_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV1, false)));
}

TEST(SendCommandTest, RejectsUnknownCommandType) {
    const ByteBuffer bytes =
        buildCommand(static_cast<CommandType>(99), ByteBuffer{}, std::nullopt, StreamVersion::kV2);
    EXPECT_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV2, true)),
                 ProtocolError);
}

TEST(SendCommandTest, RejectsVersionTwoCommandInVersionOneStream) {
    const ByteBuffer bytes =
        buildCommand(CommandType::kFallocate, ByteBuffer{}, std::nullopt, StreamVersion::kV1);
    EXPECT_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV1, true)),
                 ProtocolError);
}

TEST(SendCommandTest, RejectsAttributeOverrun) {
    ByteBuffer attributes;
    appendLE(attributes, static_cast<std::uint16_t>(AttributeType::kPath));
    appendLE(attributes, std::uint16_t{200});
    attributes.push_back('x');

    const ByteBuffer bytes =
        buildCommand(CommandType::kUnlink, attributes, std::nullopt, StreamVersion::kV1);
    EXPECT_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV1, true)),
                 ProtocolError);
}

TEST(SendCommandTest, RejectsLengthMismatch) {
    ByteBuffer bytes =
        buildCommand(CommandType::kEnd, ByteBuffer{}, std::nullopt, StreamVersion::kV1);
    bytes.push_back(0);
    EXPECT_THROW(static_cast<void>(SendCommand::fromBytes(bytes, StreamVersion::kV1, false)),
                 ProtocolError);
}

// =============================================================================
// Transcoding
// =============================================================================

TEST(SendCommandTest, TranscodeDropsDataLength) {
    const ByteBuffer data = patternData(4096);
    SendCommand command = makeWrite("f", 0, data, StreamVersion::kV1);
    const std::size_t v1Size = command.serializedSize();

    command.transcode(StreamVersion::kV2);

    EXPECT_EQ(command.version(), StreamVersion::kV2);
    EXPECT_EQ(command.serializedSize(), v1Size - sizeof(std::uint16_t));

    const ByteBuffer v2Bytes = command.serialize();
    const SendCommand reparsed = SendCommand::fromBytes(v2Bytes, StreamVersion::kV2, true);
    EXPECT_EQ(reparsed, command);
}

TEST(SendCommandTest, TranscodeRoundTripRestoresOriginalBytes) {
    const ByteBuffer original =
        buildCommand(CommandType::kWrite, writeAttributes("dir/file", 123),
                     std::span<const std::uint8_t>(patternData(777)), StreamVersion::kV1);

    SendCommand command = SendCommand::fromBytes(original, StreamVersion::kV1, true);
    command.transcode(StreamVersion::kV2);
    command.transcode(StreamVersion::kV1);

    EXPECT_EQ(command.serialize(), original);
}

TEST(SendCommandTest, NonDataCommandsTranscodeUnchangedInSize) {
    ByteBuffer attributes;
    encodeStringAttribute(attributes, AttributeType::kPath, "dir");
    encodeU64Attribute(attributes, AttributeType::kMode, 0755);
    const ByteBuffer bytes =
        buildCommand(CommandType::kChmod, attributes, std::nullopt, StreamVersion::kV1);

    SendCommand command = SendCommand::fromBytes(bytes, StreamVersion::kV1, true);
    command.transcode(StreamVersion::kV2);
    EXPECT_EQ(command.serializedSize(), bytes.size());
}

TEST(SendCommandTest, DowngradeRejectsOversizedData) {
    SendCommand command = makeWrite("f", 0, patternData(70000), StreamVersion::kV2);
    EXPECT_THROW(command.transcode(StreamVersion::kV1), ProtocolError);
}

TEST(SendCommandTest, DowngradeRejectsVersionTwoCommands) {
    ByteBuffer attributes;
    encodeStringAttribute(attributes, AttributeType::kPath, "f");
    encodeU64Attribute(attributes, AttributeType::kSetflagsFlags, 1);
    const ByteBuffer bytes =
        buildCommand(CommandType::kSetflags, attributes, std::nullopt, StreamVersion::kV2);

    SendCommand command = SendCommand::fromBytes(bytes, StreamVersion::kV2, true);
    EXPECT_THROW(command.transcode(StreamVersion::kV1), UnsupportedVersionError);
}

// =============================================================================
// Coalescing
// =============================================================================

TEST(SendCommandTest, AppendsContiguousWrites) {
    const ByteBuffer first = patternData(1000, 1);
    const ByteBuffer second = patternData(500, 2);
    SendCommand head = makeWrite("f", 0, first, StreamVersion::kV2);
    SendCommand next = makeWrite("f", 1000, second, StreamVersion::kV2);

    ASSERT_TRUE(head.canAppend(next));
    EXPECT_EQ(head.append(next, 1 << 20), 500u);
    EXPECT_EQ(head.dataSize(), 1500u);
    EXPECT_TRUE(next.isEmpty());
    EXPECT_TRUE(std::equal(second.begin(), second.end(), head.data().begin() + 1000));
}

TEST(SendCommandTest, PartialAppendAdvancesRemainder) {
    SendCommand head = makeWrite("f", 0, patternData(1000, 1), StreamVersion::kV2);
    const ByteBuffer second = patternData(1000, 2);
    SendCommand next = makeWrite("f", 1000, second, StreamVersion::kV2);

    EXPECT_EQ(head.append(next, 1200), 200u);
    EXPECT_TRUE(head.isFull(1200));
    EXPECT_EQ(next.fileOffset(), 1200u);
    EXPECT_EQ(next.dataSize(), 800u);
    EXPECT_TRUE(std::equal(second.begin() + 200, second.end(), next.data().begin()));

    // The patched FILE_OFFSET survives serialization.
    const SendCommand reparsed =
        SendCommand::fromBytes(next.serialize(), StreamVersion::kV2, true);
    EXPECT_EQ(reparsed.fileOffset(), 1200u);
}

TEST(SendCommandTest, DoesNotAppendAcrossFilesOrGaps) {
    const SendCommand head = makeWrite("f", 0, patternData(100), StreamVersion::kV2);
    EXPECT_FALSE(head.canAppend(makeWrite("g", 100, patternData(100), StreamVersion::kV2)));
    EXPECT_FALSE(head.canAppend(makeWrite("f", 101, patternData(100), StreamVersion::kV2)));

    // Sized DATA cannot grow in place.
    const SendCommand v1 = makeWrite("f", 0, patternData(100), StreamVersion::kV1);
    EXPECT_FALSE(v1.isAppendable());
}

// =============================================================================
// Compression
// =============================================================================

TEST(SendCommandTest, CompressesCompressibleWrites) {
    const ByteBuffer data = patternData(64 * 1024);
    const SendCommand write = makeWrite("f", 4096, data, StreamVersion::kV2);
    ZstdCompressor compressor(kDefaultCompressionLevel);

    const auto encoded = write.compress(compressor);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->type(), CommandType::kEncodedWrite);
    EXPECT_LT(encoded->serializedSize(), write.serializedSize());
    EXPECT_EQ(encoded->logicalSize(), write.serializedSize());
    EXPECT_EQ(encoded->fileOffset(), 4096u);

    EXPECT_EQ(zstdDecompress(encoded->data(), data.size()), data);

    // The encoded form is a valid v2 command carrying the unencoded length.
    const ByteBuffer bytes = encoded->serialize();
    CommandInfo info;
    info.header = CommandHeader::decode(
        std::span<const std::uint8_t, kCommandHeaderSize>(bytes.data(), kCommandHeaderSize));
    info.payload.assign(bytes.begin() + kCommandHeaderSize, bytes.end());
    info.payloadLoaded = true;
    bool sawUnencodedLength = false;
    for (const auto& attribute : decodeAttributes(info, StreamVersion::kV2)) {
        if (attribute.type == AttributeType::kUnencodedLen) {
            EXPECT_EQ(attribute.asU64(), data.size());
            sawUnencodedLength = true;
        }
    }
    EXPECT_TRUE(sawUnencodedLength);
}

TEST(SendCommandTest, LeavesIncompressibleWritesAlone) {
    const SendCommand write = makeWrite("f", 0, randomData(16 * 1024), StreamVersion::kV2);
    ZstdCompressor compressor(kDefaultCompressionLevel);
    EXPECT_FALSE(write.compress(compressor).has_value());
}

TEST(SendCommandTest, OnlyVersionTwoWritesCompress) {
    ZstdCompressor compressor(kDefaultCompressionLevel);
    const SendCommand v1 = makeWrite("f", 0, patternData(16 * 1024), StreamVersion::kV1);
    EXPECT_FALSE(v1.compress(compressor).has_value());
}

// =============================================================================
// Padding
// =============================================================================

TEST(SendCommandTest, PaddingCommandHasRequestedSize) {
    for (std::size_t size : {SendCommand::kMinPadCommandSize, std::size_t{100}, std::size_t{4096}}) {
        const SendCommand pad = SendCommand::makePadding(size, StreamVersion::kV2);
        EXPECT_EQ(pad.type(), CommandType::kUpdateExtent);
        EXPECT_EQ(pad.serialize().size(), size);
    }
    EXPECT_THROW(static_cast<void>(
                     SendCommand::makePadding(SendCommand::kMinPadCommandSize - 1, StreamVersion::kV2)),
                 ProtocolError);
}

TEST(SendCommandTest, PaddingAlignsDataPayload) {
    const SendCommand write = makeWrite("f", 8192, patternData(4096), StreamVersion::kV2);
    ASSERT_TRUE(write.isPaddable());

    for (StreamOffset offset : {StreamOffset{17}, StreamOffset{4000}, StreamOffset{4096 * 3 + 5}}) {
        const std::size_t pad = write.paddingBefore(offset);
        EXPECT_EQ((offset + pad + write.dataPayloadOffset()) % kPadAlignment, 0u);
        EXPECT_TRUE(pad == 0 || pad >= SendCommand::kMinPadCommandSize);
    }

    const StreamOffset aligned = kPadAlignment * 2 - write.dataPayloadOffset();
    EXPECT_EQ(write.paddingBefore(aligned), 0u);
}

TEST(SendCommandTest, UnalignedWritesAreNotPaddable) {
    EXPECT_FALSE(makeWrite("f", 100, patternData(4096), StreamVersion::kV2).isPaddable());
    EXPECT_FALSE(makeWrite("f", 0, patternData(4000), StreamVersion::kV2).isPaddable());
}

TEST(SendCommandTest, EncodedWritesAreNotPaddable) {
    const SendCommand write = makeWrite("f", 0, patternData(4 * kPadAlignment), StreamVersion::kV2);
    ASSERT_TRUE(write.isPaddable());

    ZstdCompressor compressor(kDefaultCompressionLevel);
    const auto encoded = write.compress(compressor);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->type(), CommandType::kEncodedWrite);
    EXPECT_FALSE(encoded->isPaddable());
}

}  // namespace
}  // namespace ssu::format
