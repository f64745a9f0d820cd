// =============================================================================
// sendstream-upgrade - Stream Codec
// =============================================================================
// Reads and writes stream headers and commands through a StreamContext.
//
// The same routines serve the single-threaded path (context holds the source
// and destination) and the pipeline workers (payloads come from the shared
// buffer cache), so both produce identical bytes.
// =============================================================================

#ifndef SSU_FORMAT_STREAM_CODEC_H
#define SSU_FORMAT_STREAM_CODEC_H

#include <optional>

#include "ssu/common/error.h"
#include "ssu/common/types.h"
#include "ssu/format/send_command.h"
#include "ssu/format/send_format.h"

namespace ssu::io {
class StreamContext;
}  // namespace ssu::io

namespace ssu::format {

/// @brief Decoded stream header.
struct StreamHeader {
    StreamVersion version = kNewestStreamVersion;
};

/// @brief Read and validate the magic and version.
/// @throws ProtocolError (bad magic), UnsupportedVersionError, UnexpectedEofError
[[nodiscard]] StreamHeader readHeader(io::StreamContext& context);

/// @brief Write the magic and version.
void writeHeader(io::StreamContext& context, StreamVersion version);

/// @brief Read the next command header at the context's read offset.
///
/// With a directly held source the payload is read as well. Through the
/// buffer cache the payload offset is recorded and skipped; a construction
/// worker loads it later with loadPayload().
///
/// @throws UnexpectedEofError naming the last complete command when the
///         source ends inside the header (or directly read payload),
///         ProtocolError if the payload length exceeds what can be buffered.
[[nodiscard]] CommandInfo readCommand(io::StreamContext& context, CommandId id);

/// @brief Materialize a cached payload (no-op if already loaded).
/// @throws UnexpectedEofError if the source ends inside the payload.
void loadPayload(io::StreamContext& context, CommandInfo& info);

/// @brief Load, checksum, decode and transcode one command for the
///        destination version.
[[nodiscard]] SendCommand constructCommand(io::StreamContext& context, CommandInfo& info);

/// @brief Write one command, preceded by a padding command when alignment
///        padding is enabled. Verifies the serialized form when enabled.
/// @throws WorkerFault if verification finds a mismatch, IOError on writes.
void writeCommand(io::StreamContext& context, const SendCommand& command, CommandId id);

/// @brief Report a truncated source.
/// @param lastComplete Last command whose bytes were all present, if any.
[[noreturn]] void throwTruncated(const UnexpectedEofError& cause, CommandId id,
                                 std::optional<CommandId> lastComplete);

}  // namespace ssu::format

#endif  // SSU_FORMAT_STREAM_CODEC_H
