// =============================================================================
// sendstream-upgrade - Stream Context
// =============================================================================
// Per-thread view of a run: the I/O handles this thread is allowed to touch,
// its read and write offsets, its local statistics and a handle on the run's
// shared queues and buffer cache.
//
// Handle ownership:
// - The primary context is created with the source and destination handles.
// - cloneForWorker() moves a handle into the child when asked to preserve it,
//   so at most one live context holds each handle.
// - A context without a source reads through the shared buffer cache.
// =============================================================================

#ifndef SSU_IO_STREAM_CONTEXT_H
#define SSU_IO_STREAM_CONTEXT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "ssu/common/error.h"
#include "ssu/common/types.h"
#include "ssu/format/send_format.h"
#include "ssu/io/byte_stream.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/upgrade_options.h"

namespace ssu::pipeline {
struct SyncContainer;
}  // namespace ssu::pipeline

namespace ssu::io {

/// @brief Offsets, handles and statistics of one thread's view of the stream.
class StreamContext {
public:
    /// @brief Create the primary context of a run.
    StreamContext(std::shared_ptr<const pipeline::UpgradeOptions> options,
                  std::optional<ByteSource> source, std::optional<ByteSink> destination);

    ~StreamContext();

    // Non-copyable, movable
    StreamContext(const StreamContext&) = delete;
    StreamContext& operator=(const StreamContext&) = delete;
    StreamContext(StreamContext&&) noexcept;
    StreamContext& operator=(StreamContext&&) noexcept;

    // -------------------------------------------------------------------------
    // Worker contexts
    // -------------------------------------------------------------------------

    /// @brief Derive a worker context sharing options, versions and sync state.
    /// @param preserveSource Move the source handle into the child.
    /// @param preserveDestination Move the destination handle into the child.
    /// @return kConfigurationError if a requested handle is not held here.
    [[nodiscard]] Result<StreamContext> cloneForWorker(bool preserveSource,
                                                       bool preserveDestination);

    /// @brief Attach the run's queues and buffer cache.
    void attachSync(std::shared_ptr<const pipeline::SyncContainer> sync) noexcept;

    /// @brief Merge the local statistics into the run totals and reset them.
    void rolloverStats(SharedStats& into) noexcept;

    // -------------------------------------------------------------------------
    // Reading
    // -------------------------------------------------------------------------

    /// @brief Read up to dst.size() bytes at the read offset.
    /// @return Bytes read; short only at end of a directly held source.
    /// @note Without a source handle the read goes through the buffer cache
    ///       and is exact.
    std::size_t read(std::span<std::uint8_t> dst);

    /// @brief Read exactly dst.size() bytes.
    /// @throws UnexpectedEofError if the stream ends first.
    void readExact(std::span<std::uint8_t> dst);

    /// @brief Read a range of the cached source without moving the read offset.
    /// @throws SSUException (kInvalidState) if no buffer cache is attached.
    void readCachedAt(StreamOffset offset, std::span<std::uint8_t> dst);

    [[nodiscard]] std::uint32_t read32();

    /// @brief Advance the read offset without consuming the bytes.
    /// @note Cached payloads are consumed later through readCachedAt().
    void skip(std::size_t bytes) noexcept { readOffset_ += bytes; }

    // -------------------------------------------------------------------------
    // Writing
    // -------------------------------------------------------------------------

    /// @brief Write bytes to the destination handle.
    /// @param logicalBytes Size the bytes stand for before compression.
    void write(std::span<const std::uint8_t> bytes, std::size_t logicalBytes);

    void write(std::span<const std::uint8_t> bytes) { write(bytes, bytes.size()); }

    void write32(std::uint32_t value);

    void flush();

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    void setVersions(format::StreamVersion source, format::StreamVersion destination) noexcept;

    /// @throws SSUException (kInvalidState) before setVersions().
    [[nodiscard]] format::StreamVersion sourceVersion() const;

    /// @throws SSUException (kInvalidState) before setVersions().
    [[nodiscard]] format::StreamVersion destinationVersion() const;

    [[nodiscard]] const pipeline::UpgradeOptions& options() const noexcept { return *options_; }

    /// @throws SSUException (kInvalidState) if no sync container is attached.
    [[nodiscard]] const pipeline::SyncContainer& sync() const;

    [[nodiscard]] bool hasSync() const noexcept { return sync_ != nullptr; }
    [[nodiscard]] bool hasSource() const noexcept { return source_.has_value(); }
    [[nodiscard]] bool hasDestination() const noexcept { return destination_.has_value(); }

    [[nodiscard]] StreamOffset readOffset() const noexcept { return readOffset_; }
    [[nodiscard]] StreamOffset writeOffset() const noexcept { return writeOffset_; }

    [[nodiscard]] UpgradeStats& stats() noexcept { return stats_; }
    [[nodiscard]] const UpgradeStats& stats() const noexcept { return stats_; }

private:
    StreamContext(std::shared_ptr<const pipeline::UpgradeOptions> options,
                  std::shared_ptr<const pipeline::SyncContainer> sync);

    std::shared_ptr<const pipeline::UpgradeOptions> options_;
    std::shared_ptr<const pipeline::SyncContainer> sync_;
    std::optional<ByteSource> source_;
    std::optional<ByteSink> destination_;
    std::optional<format::StreamVersion> sourceVersion_;
    std::optional<format::StreamVersion> destinationVersion_;
    StreamOffset readOffset_ = 0;
    StreamOffset writeOffset_ = 0;
    UpgradeStats stats_;
};

}  // namespace ssu::io

#endif  // SSU_IO_STREAM_CONTEXT_H
