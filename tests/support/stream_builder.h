// =============================================================================
// sendstream-upgrade - Test Stream Builder
// =============================================================================
// Builds well-formed send-streams in memory for tests, plus helpers that wrap
// byte buffers as sources and sinks.
// =============================================================================

#ifndef SSU_TESTS_SUPPORT_STREAM_BUILDER_H
#define SSU_TESTS_SUPPORT_STREAM_BUILDER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include "ssu/common/types.h"
#include "ssu/format/send_format.h"
#include "ssu/io/byte_stream.h"

namespace ssu::test {

/// @brief Deterministic, mildly compressible payload.
[[nodiscard]] ByteBuffer patternData(std::size_t size, std::uint32_t seed = 1);

/// @brief Incompressible payload.
[[nodiscard]] ByteBuffer randomData(std::size_t size, std::uint32_t seed = 1);

/// @brief Serialize one command with a valid checksum.
/// @param attributes Encoded non-DATA attributes.
/// @param data DATA payload, framed for the version when present.
[[nodiscard]] ByteBuffer buildCommand(format::CommandType type, const ByteBuffer& attributes,
                                      std::optional<std::span<const std::uint8_t>> data,
                                      format::StreamVersion version);

/// @brief Fluent builder for whole streams.
class StreamBuilder {
public:
    explicit StreamBuilder(format::StreamVersion version = format::StreamVersion::kV1);

    StreamBuilder& subvol(std::string_view path);
    StreamBuilder& mkfile(std::string_view path);
    StreamBuilder& mkdir(std::string_view path);
    StreamBuilder& write(std::string_view path, std::uint64_t offset,
                         std::span<const std::uint8_t> data);
    StreamBuilder& truncate(std::string_view path, std::uint64_t size);
    StreamBuilder& chmod(std::string_view path, std::uint64_t mode);
    StreamBuilder& end();

    /// @brief Append an already serialized command.
    StreamBuilder& raw(const ByteBuffer& command);

    [[nodiscard]] const ByteBuffer& bytes() const noexcept { return bytes_; }

    [[nodiscard]] std::size_t commandCount() const noexcept { return commandOffsets_.size(); }

    /// @brief Stream offset at which each command starts.
    [[nodiscard]] const std::vector<std::size_t>& commandOffsets() const noexcept {
        return commandOffsets_;
    }

    [[nodiscard]] format::StreamVersion version() const noexcept { return version_; }

private:
    StreamBuilder& add(format::CommandType type, const ByteBuffer& attributes,
                       std::optional<std::span<const std::uint8_t>> data = std::nullopt);

    format::StreamVersion version_;
    ByteBuffer bytes_;
    std::vector<std::size_t> commandOffsets_;
};

/// @brief Typical incremental-send stream: directories, files, contiguous
///        writes split into v1-sized chunks, metadata updates and END.
[[nodiscard]] ByteBuffer sampleStream(std::size_t files, std::size_t bytesPerFile,
                                      std::uint32_t seed = 1);

/// @brief Source reading from a copy of the buffer.
[[nodiscard]] io::ByteSource memorySource(const ByteBuffer& bytes);

/// @brief Sink appending to a caller-owned string stream.
[[nodiscard]] io::ByteSink memorySink(std::ostringstream& out);

[[nodiscard]] ByteBuffer toBytes(const std::ostringstream& out);

/// @brief Stream buffer that serves a prefix and then fails every read.
class FailingStreamBuf : public std::streambuf {
public:
    explicit FailingStreamBuf(ByteBuffer prefix);

protected:
    int_type underflow() override;

private:
    std::string prefix_;
    bool served_ = false;
};

/// @brief Write bytes to a fresh file under the temp directory.
[[nodiscard]] std::string writeTempFile(std::string_view name, const ByteBuffer& bytes);

}  // namespace ssu::test

#endif  // SSU_TESTS_SUPPORT_STREAM_BUILDER_H
