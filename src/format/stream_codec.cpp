// =============================================================================
// sendstream-upgrade - Stream Codec Implementation
// =============================================================================

#include "ssu/format/stream_codec.h"

#include <algorithm>
#include <array>
#include <chrono>

#include <fmt/format.h>

#include "ssu/common/logger.h"
#include "ssu/io/stream_context.h"

namespace ssu::format {

namespace {

/// @brief Largest payload a command may announce in this context.
std::size_t payloadLimit(const io::StreamContext& context) {
    if (context.hasSource()) {
        return pipeline::kMaxCommandPayloadSize;
    }
    const std::size_t window = context.options().maxCommandSize();
    return window > kCommandHeaderSize ? window - kCommandHeaderSize : 0;
}

}  // namespace

// =============================================================================
// Header
// =============================================================================

StreamHeader readHeader(io::StreamContext& context) {
    std::array<std::uint8_t, kStreamHeaderSize> bytes{};
    try {
        context.readExact(bytes);
    } catch (const UnexpectedEofError& e) {
        throw ProtocolError(fmt::format("Stream too short for a header: {}", e.message()));
    }

    if (!std::equal(kStreamMagic.begin(), kStreamMagic.end(), bytes.begin())) {
        throw ProtocolError("Bad stream magic", ErrorContext().withOffset(0));
    }

    const auto rawVersion = loadLE<std::uint32_t>(bytes.data() + kStreamMagic.size());
    const auto version = versionFromNumber(rawVersion);
    if (!version) {
        throw UnsupportedVersionError(rawVersion, ErrorContext().withOffset(kStreamMagic.size()));
    }
    return StreamHeader{*version};
}

void writeHeader(io::StreamContext& context, StreamVersion version) {
    context.write(kStreamMagic);
    context.write32(versionNumber(version));
}

// =============================================================================
// Commands
// =============================================================================

void throwTruncated(const UnexpectedEofError& cause, CommandId id,
                    std::optional<CommandId> lastComplete) {
    ErrorContext ctx;
    ctx.withCommand(id);
    if (cause.context() && cause.context()->byteOffset) {
        ctx.withOffset(*cause.context()->byteOffset);
    }
    const std::string last =
        lastComplete ? fmt::format("last complete command {}", *lastComplete) : "no complete command";
    throw UnexpectedEofError(
        fmt::format("Source truncated inside command {} ({}): {}", id, last, cause.message()),
        std::move(ctx));
}

CommandInfo readCommand(io::StreamContext& context, CommandId id) {
    const std::optional<CommandId> previous =
        id == 0 ? std::nullopt : std::optional<CommandId>(id - 1);

    CommandInfo info;
    info.id = id;

    std::array<std::uint8_t, kCommandHeaderSize> headerBytes{};
    const StreamOffset headerOffset = context.readOffset();
    try {
        context.readExact(headerBytes);
    } catch (const UnexpectedEofError& e) {
        if (context.hasSource()) {
            throwTruncated(e, id, previous);
        }
        throw;
    }
    info.header = CommandHeader::decode(headerBytes);
    info.payloadOffset = context.readOffset();

    if (info.header.length > payloadLimit(context)) {
        throw ProtocolError(fmt::format("Command payload of {} bytes exceeds the {}-byte limit",
                                        info.header.length, payloadLimit(context)),
                            ErrorContext().withCommand(id).withOffset(headerOffset));
    }

    if (context.hasSource()) {
        info.payload.resize(info.header.length);
        try {
            context.readExact(info.payload);
        } catch (const UnexpectedEofError& e) {
            throwTruncated(e, id, previous);
        }
        info.payloadLoaded = true;
    } else {
        context.skip(info.header.length);
    }

    ++context.stats().commandsRead;
    return info;
}

void loadPayload(io::StreamContext& context, CommandInfo& info) {
    if (info.payloadLoaded) {
        return;
    }
    info.payload.resize(info.header.length);
    try {
        context.readCachedAt(info.payloadOffset, info.payload);
    } catch (const UnexpectedEofError& e) {
        throwTruncated(e, info.id,
                       info.id == 0 ? std::nullopt : std::optional<CommandId>(info.id - 1));
    }
    info.payloadLoaded = true;
}

SendCommand constructCommand(io::StreamContext& context, CommandInfo& info) {
    loadPayload(context, info);

    const auto start = std::chrono::steady_clock::now();
    const bool verify = !context.options().skipInputChecksums;
    SendCommand command = SendCommand::decode(info, context.sourceVersion(), verify);
    if (verify) {
        ++context.stats().checksumsVerified;
        context.stats().checksumBytes += info.header.totalSize();
    }
    command.transcode(context.destinationVersion(), info.id);
    context.stats().decodeTime += std::chrono::steady_clock::now() - start;

    // The payload is no longer needed once decoded.
    info.payload = ByteBuffer{};
    info.payloadLoaded = false;
    return command;
}

void writeCommand(io::StreamContext& context, const SendCommand& command, CommandId id) {
    const auto& options = context.options();

    if (options.padWithDummyCommands && command.isPaddable()) {
        const std::size_t padding = command.paddingBefore(context.writeOffset());
        if (padding > 0) {
            const ByteBuffer bytes =
                SendCommand::makePadding(padding, context.destinationVersion()).serialize();
            context.write(bytes);
            ++context.stats().paddingCommands;
            context.stats().paddingBytes += bytes.size();
        }
    }

    const ByteBuffer bytes = command.serialize();
    if (options.verifyCommands) {
        const SendCommand reparsed = SendCommand::fromBytes(bytes, command.version(), true, id);
        if (!(reparsed == command)) {
            throw WorkerFault(fmt::format("Serialized command does not decode to itself: {} vs {}",
                                          describeCommand(command), describeCommand(reparsed)),
                              ErrorContext().withCommand(id).withOffset(context.writeOffset()));
        }
    }

    context.write(bytes, command.logicalSize());
    ++context.stats().commandsWritten;
    SSU_LOG_TRACE("Wrote command {} {}", id, describeCommand(command));
}

}  // namespace ssu::format
