// =============================================================================
// sendstream-upgrade - Stream Codec Tests
// =============================================================================
// Header and command framing through a directly held source.
// =============================================================================

#include "ssu/format/stream_codec.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

#include "ssu/common/error.h"
#include "ssu/io/stream_context.h"
#include "ssu/pipeline/upgrade_options.h"
#include "support/stream_builder.h"

namespace ssu::format {
namespace {

using test::memorySink;
using test::memorySource;
using test::patternData;
using test::StreamBuilder;

io::StreamContext readerFor(const ByteBuffer& bytes, pipeline::UpgradeOptions options = {}) {
    return io::StreamContext(std::make_shared<const pipeline::UpgradeOptions>(std::move(options)),
                             memorySource(bytes), std::nullopt);
}

// =============================================================================
// Header
// =============================================================================

TEST(StreamCodecTest, ReadsVersionOneHeader) {
    auto context = readerFor(StreamBuilder(StreamVersion::kV1).end().bytes());
    EXPECT_EQ(readHeader(context).version, StreamVersion::kV1);
    EXPECT_EQ(context.readOffset(), kStreamHeaderSize);
}

TEST(StreamCodecTest, RejectsBadMagic) {
    ByteBuffer bytes = StreamBuilder().end().bytes();
    bytes[0] = 'x';
    auto context = readerFor(bytes);
    EXPECT_THROW(static_cast<void>(readHeader(context)), ProtocolError);
}

TEST(StreamCodecTest, RejectsUnknownVersion) {
    ByteBuffer bytes = StreamBuilder().end().bytes();
    storeLE(bytes.data() + kStreamMagic.size(), std::uint32_t{3});
    auto context = readerFor(bytes);
    EXPECT_THROW(static_cast<void>(readHeader(context)), UnsupportedVersionError);
}

TEST(StreamCodecTest, RejectsShortHeader) {
    ByteBuffer bytes(kStreamMagic.begin(), kStreamMagic.end());
    auto context = readerFor(bytes);
    EXPECT_THROW(static_cast<void>(readHeader(context)), ProtocolError);
}

TEST(StreamCodecTest, WritesHeader) {
    std::ostringstream out;
    io::StreamContext context(std::make_shared<const pipeline::UpgradeOptions>(), std::nullopt,
                              memorySink(out));
    writeHeader(context, StreamVersion::kV2);
    context.flush();

    const ByteBuffer expected = StreamBuilder(StreamVersion::kV2).bytes();
    EXPECT_EQ(test::toBytes(out), expected);
    EXPECT_EQ(context.writeOffset(), kStreamHeaderSize);
}

// =============================================================================
// Commands
// =============================================================================

TEST(StreamCodecTest, ReadsCommandsWithPayloads) {
    StreamBuilder builder;
    builder.mkfile("f").write("f", 0, patternData(300)).end();
    auto context = readerFor(builder.bytes());
    static_cast<void>(readHeader(context));

    const CommandInfo mkfile = readCommand(context, 0);
    EXPECT_EQ(mkfile.header.rawType, static_cast<std::uint16_t>(CommandType::kMkfile));
    EXPECT_TRUE(mkfile.payloadLoaded);
    EXPECT_EQ(mkfile.payloadOffset, builder.commandOffsets()[0] + kCommandHeaderSize);

    const CommandInfo write = readCommand(context, 1);
    EXPECT_EQ(write.payload.size(), write.header.length);

    const CommandInfo end = readCommand(context, 2);
    EXPECT_TRUE(end.isEnd());
    EXPECT_EQ(context.readOffset(), builder.bytes().size());
    EXPECT_EQ(context.stats().commandsRead, 3u);
}

TEST(StreamCodecTest, ReportsTruncationInsidePayload) {
    StreamBuilder builder;
    builder.mkfile("f").mkfile("g").write("f", 0, patternData(1000)).end();
    ByteBuffer bytes = builder.bytes();
    bytes.resize(builder.commandOffsets()[2] + kCommandHeaderSize + 10);

    auto context = readerFor(bytes);
    static_cast<void>(readHeader(context));
    static_cast<void>(readCommand(context, 0));
    static_cast<void>(readCommand(context, 1));

    try {
        static_cast<void>(readCommand(context, 2));
        FAIL() << "expected truncation";
    } catch (const UnexpectedEofError& e) {
        EXPECT_NE(e.message().find("Source truncated inside command 2"), std::string::npos);
        EXPECT_NE(e.message().find("last complete command 1"), std::string::npos);
    }
}

TEST(StreamCodecTest, ReportsTruncationInsideFirstHeader) {
    ByteBuffer bytes = StreamBuilder().mkfile("f").end().bytes();
    bytes.resize(kStreamHeaderSize + 4);

    auto context = readerFor(bytes);
    static_cast<void>(readHeader(context));
    try {
        static_cast<void>(readCommand(context, 0));
        FAIL() << "expected truncation";
    } catch (const UnexpectedEofError& e) {
        EXPECT_NE(e.message().find("no complete command"), std::string::npos);
    }
}

TEST(StreamCodecTest, RejectsOversizedPayloadLength) {
    ByteBuffer bytes = StreamBuilder().bytes();
    ByteBuffer header(kCommandHeaderSize);
    storeLE(header.data() + kCommandLengthOffset,
            static_cast<std::uint32_t>(pipeline::kMaxCommandPayloadSize + 1));
    storeLE(header.data() + kCommandTypeOffset, static_cast<std::uint16_t>(CommandType::kWrite));
    bytes.insert(bytes.end(), header.begin(), header.end());

    auto context = readerFor(bytes);
    static_cast<void>(readHeader(context));
    EXPECT_THROW(static_cast<void>(readCommand(context, 0)), ProtocolError);
}

TEST(StreamCodecTest, ConstructDetectsCorruption) {
    StreamBuilder builder;
    builder.write("f", 0, patternData(100)).end();
    ByteBuffer bytes = builder.bytes();
    bytes[builder.commandOffsets()[1] - 1] ^= 0xFF;  // last DATA byte

    {
        auto context = readerFor(bytes);
        const auto header = readHeader(context);
        context.setVersions(header.version, StreamVersion::kV2);
        CommandInfo info = readCommand(context, 0);
        EXPECT_THROW(static_cast<void>(constructCommand(context, info)), ChecksumError);
    }

    {
        pipeline::UpgradeOptions options;
        options.skipInputChecksums = true;
        auto context = readerFor(bytes, options);
        const auto header = readHeader(context);
        context.setVersions(header.version, StreamVersion::kV2);
        CommandInfo info = readCommand(context, 0);
        const SendCommand command = constructCommand(context, info);
        EXPECT_EQ(command.version(), StreamVersion::kV2);
        EXPECT_FALSE(info.payloadLoaded);
        EXPECT_EQ(context.stats().checksumsVerified, 0u);
    }
}

TEST(StreamCodecTest, WriteCommandPadsAlignedWrites) {
    pipeline::UpgradeOptions options;
    options.padWithDummyCommands = true;
    options.verifyCommands = true;

    std::ostringstream out;
    io::StreamContext context(std::make_shared<const pipeline::UpgradeOptions>(options),
                              std::nullopt, memorySink(out));
    context.setVersions(StreamVersion::kV1, StreamVersion::kV2);
    writeHeader(context, StreamVersion::kV2);

    const ByteBuffer data = patternData(2 * kPadAlignment);
    SendCommand write = SendCommand::fromBytes(
        test::buildCommand(CommandType::kWrite,
                           [] {
                               ByteBuffer attributes;
                               encodeStringAttribute(attributes, AttributeType::kPath, "f");
                               encodeU64Attribute(attributes, AttributeType::kFileOffset, 0);
                               return attributes;
                           }(),
                           std::span<const std::uint8_t>(data), StreamVersion::kV2),
        StreamVersion::kV2, true);

    writeCommand(context, write, 0);
    context.flush();

    const ByteBuffer written = test::toBytes(out);
    EXPECT_EQ(context.stats().paddingCommands, 1u);
    EXPECT_EQ(context.stats().commandsWritten, 1u);
    ASSERT_EQ(written.size(), context.writeOffset());

    // The DATA payload ends the stream and starts on an aligned offset.
    const std::size_t dataStart = written.size() - data.size();
    EXPECT_EQ(dataStart % kPadAlignment, 0u);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), written.begin() + dataStart));

    // The padding is a valid UPDATE_EXTENT right after the header.
    const auto padHeader = CommandHeader::decode(
        std::span<const std::uint8_t, kCommandHeaderSize>(written.data() + kStreamHeaderSize,
                                                          kCommandHeaderSize));
    EXPECT_EQ(padHeader.rawType, static_cast<std::uint16_t>(CommandType::kUpdateExtent));
    EXPECT_NO_THROW(static_cast<void>(SendCommand::fromBytes(
        std::span<const std::uint8_t>(written).subspan(kStreamHeaderSize, padHeader.totalSize()),
        StreamVersion::kV2, true)));
}

TEST(StreamCodecTest, WriteCommandWithoutPaddingWritesOnlyTheCommand) {
    std::ostringstream out;
    io::StreamContext context(std::make_shared<const pipeline::UpgradeOptions>(), std::nullopt,
                              memorySink(out));
    context.setVersions(StreamVersion::kV1, StreamVersion::kV2);

    const SendCommand end = SendCommand::fromBytes(
        test::buildCommand(CommandType::kEnd, ByteBuffer{}, std::nullopt, StreamVersion::kV2),
        StreamVersion::kV2, true);
    writeCommand(context, end, 5);
    context.flush();

    EXPECT_EQ(test::toBytes(out), end.serialize());
    EXPECT_EQ(context.stats().paddingCommands, 0u);
}

}  // namespace
}  // namespace ssu::format
