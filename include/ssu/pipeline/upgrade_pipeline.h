// =============================================================================
// sendstream-upgrade - Upgrade Pipeline
// =============================================================================
// Entry point of one upgrade run.
//
// The stream header is read and validated and the destination header written
// on the calling thread, before any worker exists. A thread budget of 1 then
// transcodes inline; any other budget hands the primary context to the
// Coordinator. Both paths use the same codec and batching routines and
// produce identical output.
//
// Usage:
// @code
// UpgradeOptions options;
// options.inputPath = "old.stream";
// options.outputPath = "new.stream";
// UpgradePipeline pipeline(options);
// if (auto result = pipeline.run(); !result) {
//     // result.error().code(), result.error().message()
// }
// @endcode
// =============================================================================

#ifndef SSU_PIPELINE_UPGRADE_PIPELINE_H
#define SSU_PIPELINE_UPGRADE_PIPELINE_H

#include <memory>
#include <optional>

#include "ssu/common/error.h"
#include "ssu/format/send_format.h"
#include "ssu/io/byte_stream.h"
#include "ssu/io/stream_context.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/thread_counts.h"
#include "ssu/pipeline/upgrade_options.h"

namespace ssu::pipeline {

/// @brief One transcode of a send-stream.
///
/// A pipeline object can be run more than once; each run resets the
/// statistics and the recorded versions.
class UpgradePipeline {
public:
    /// @brief Construct with options
    /// @param options Run options, validated at the start of every run
    explicit UpgradePipeline(UpgradeOptions options);

    /// @brief Open the configured input and output and run.
    /// @return kConfigurationError for invalid options, kFileNotFound or
    ///         kIOError when a handle cannot be opened, otherwise the first
    ///         error of the transcode itself
    [[nodiscard]] VoidResult run();

    /// @brief Run between explicit handles (paths in the options are ignored).
    /// @param source Stream positioned at the send-stream magic
    /// @param destination Sink receiving the transcoded stream
    /// @return Success once the END command has been written and flushed
    /// @note On failure the destination holds a partial, invalid stream.
    [[nodiscard]] VoidResult run(io::ByteSource source, io::ByteSink destination);

    /// @brief Get the run options
    [[nodiscard]] const UpgradeOptions& options() const noexcept { return *options_; }

    /// @brief Statistics of the last run, including a failed one.
    [[nodiscard]] const io::UpgradeStats& stats() const noexcept { return stats_; }

    /// @brief Thread allocation of the last run (unset for single-threaded runs).
    [[nodiscard]] const std::optional<ThreadCounts>& threadCounts() const noexcept {
        return threadCounts_;
    }

    /// @brief Version read from the source header (unset if it was never read)
    [[nodiscard]] std::optional<format::StreamVersion> sourceVersion() const noexcept {
        return sourceVersion_;
    }

    /// @brief Version written to the destination header (unset if none was written)
    [[nodiscard]] std::optional<format::StreamVersion> destinationVersion() const noexcept {
        return destinationVersion_;
    }

private:
    /// @brief Build the primary context and process both headers.
    [[nodiscard]] io::StreamContext prepare(io::ByteSource source, io::ByteSink destination);

    /// @brief Transcode every command on the calling thread.
    static void runSingleThreaded(io::StreamContext& context);

    std::shared_ptr<const UpgradeOptions> options_;
    io::UpgradeStats stats_;
    std::optional<ThreadCounts> threadCounts_;
    std::optional<format::StreamVersion> sourceVersion_;
    std::optional<format::StreamVersion> destinationVersion_;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_UPGRADE_PIPELINE_H
