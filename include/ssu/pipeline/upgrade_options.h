// =============================================================================
// sendstream-upgrade - Upgrade Options
// =============================================================================
// Run configuration shared read-only by every stream context of a run.
// =============================================================================

#ifndef SSU_PIPELINE_UPGRADE_OPTIONS_H
#define SSU_PIPELINE_UPGRADE_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "ssu/common/error.h"
#include "ssu/format/send_format.h"
#include "ssu/format/zstd_codec.h"
#include "ssu/pipeline/thread_counts.h"

namespace ssu::pipeline {

// =============================================================================
// Defaults
// =============================================================================

inline constexpr std::size_t kDefaultPrefetchBufferSize = 1024 * 1024;  // 1MB
inline constexpr std::size_t kDefaultPrefetchBufferCount = 16;
inline constexpr std::size_t kDefaultQueueCapacity = 64;
inline constexpr std::size_t kDefaultReadBatchBytes = 256 * 1024;
inline constexpr std::size_t kDefaultWriteBatchBytes = 512 * 1024;
inline constexpr std::size_t kDefaultMaxBatchedExtentSize = 128 * 1024;

/// @brief Minimum command size the prefetch window must be able to hold.
inline constexpr std::size_t kMinCommandWindow = 192 * 1024;

/// @brief Upper bound on a single command's payload length read off the wire.
/// @note Well above anything the kernel emits; protects the allocator from
///       corrupt length fields.
inline constexpr std::size_t kMaxCommandPayloadSize = 64 * 1024 * 1024;

// =============================================================================
// UpgradeOptions
// =============================================================================

/// @brief Options of one upgrade run.
struct UpgradeOptions {
    /// @brief Source stream; empty or "-" reads standard input.
    std::filesystem::path inputPath;

    /// @brief Destination stream; empty or "-" writes standard output.
    std::filesystem::path outputPath;

    bool forceOverwrite = false;

    /// @brief Destination version (newest supported when unset).
    std::optional<format::StreamVersion> destinationVersion;

    /// @brief Total thread budget: 0 automatic, 1 single-threaded.
    std::uint32_t threadCount = 0;

    /// @brief Explicit construction thread count (0 = computed).
    std::uint32_t constructorThreads = 0;

    /// @brief Explicit compression thread count (0 = computed).
    std::uint32_t compressorThreads = 0;

    /// @brief zstd level for ENCODED_WRITE conversion, 0 disables compression.
    int compressionLevel = format::kDefaultCompressionLevel;

    /// @brief Largest DATA payload coalescing may build, 0 disables coalescing.
    std::size_t maxBatchedExtentSize = kDefaultMaxBatchedExtentSize;

    bool padWithDummyCommands = false;
    bool verifyCommands = false;
    bool skipInputChecksums = false;

    std::size_t prefetchBufferSize = kDefaultPrefetchBufferSize;
    std::size_t prefetchBufferCount = kDefaultPrefetchBufferCount;
    std::size_t queueCapacity = kDefaultQueueCapacity;

    /// @brief Payload bytes grouped into one read batch.
    std::size_t readBatchBytes = kDefaultReadBatchBytes;

    /// @brief Output bytes grouped into one write batch.
    std::size_t writeBatchBytes = kDefaultWriteBatchBytes;

    ThreadTunables tunables;

    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool readsStandardInput() const noexcept {
        return inputPath.empty() || inputPath == "-";
    }

    [[nodiscard]] bool writesStandardOutput() const noexcept {
        return outputPath.empty() || outputPath == "-";
    }

    [[nodiscard]] bool isSingleThreaded() const noexcept { return threadCount == 1; }

    /// @brief Largest command (header plus payload) the prefetch window can
    ///        hold without starving the reader.
    [[nodiscard]] std::size_t maxCommandSize() const noexcept;

    /// @brief Construction and compression thread counts for this machine.
    [[nodiscard]] ThreadCounts resolveThreadCounts(std::uint32_t availableCpus) const noexcept;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_UPGRADE_OPTIONS_H
