// =============================================================================
// sendstream-upgrade - Upgrade Statistics
// =============================================================================
// Per-context counters and timings, merged into a lock-free shared aggregate
// when a worker finishes.
// =============================================================================

#ifndef SSU_IO_UPGRADE_STATS_H
#define SSU_IO_UPGRADE_STATS_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace ssu::io {

/// @brief Counters and timings gathered by one context.
struct UpgradeStats {
    // Source
    std::uint64_t bytesRead = 0;
    std::uint64_t readsIssued = 0;
    std::uint64_t commandsRead = 0;

    // Destination
    std::uint64_t bytesWritten = 0;
    std::uint64_t writesIssued = 0;
    std::uint64_t commandsWritten = 0;

    /// @brief Destination bytes the commands would take without compression.
    std::uint64_t logicalBytesWritten = 0;

    std::uint64_t paddingCommands = 0;
    std::uint64_t paddingBytes = 0;

    // Transformations
    std::uint64_t checksumsVerified = 0;
    std::uint64_t checksumBytes = 0;
    std::uint64_t bytesCoalesced = 0;
    std::uint64_t commandsCoalesced = 0;
    std::uint64_t compressionPassed = 0;
    std::uint64_t compressionRejected = 0;
    std::uint64_t bytesBeforeCompression = 0;
    std::uint64_t bytesAfterCompression = 0;

    // Timings
    std::chrono::nanoseconds storageReadTime{0};
    std::chrono::nanoseconds storageWriteTime{0};
    std::chrono::nanoseconds bufferWaitTime{0};
    std::chrono::nanoseconds compressTime{0};

    /// @brief Checksum validation, decoding and transcoding of source commands.
    std::chrono::nanoseconds decodeTime{0};

    /// @brief Add every counter and timer of other.
    UpgradeStats& operator+=(const UpgradeStats& other) noexcept;

    /// @brief Compressed over uncompressed size of the compressed extents.
    [[nodiscard]] double compressionRatio() const noexcept;

    /// @brief Multi-line report printed after a run.
    [[nodiscard]] std::string summary(std::chrono::nanoseconds elapsed) const;

    [[nodiscard]] bool operator==(const UpgradeStats&) const = default;
};

/// @brief Aggregate shared by all workers of one run.
///
/// Each field is a relaxed atomic, so workers add their totals without a
/// lock. A snapshot taken while workers still run may mix fields from
/// different moments.
class SharedStats {
public:
    /// @brief Construct with every field zero
    SharedStats() noexcept;

    // Non-copyable, non-movable
    SharedStats(const SharedStats&) = delete;
    SharedStats& operator=(const SharedStats&) = delete;
    SharedStats(SharedStats&&) = delete;
    SharedStats& operator=(SharedStats&&) = delete;

    /// @brief Add one worker's totals
    /// @param stats Totals of a finished worker context
    void add(const UpgradeStats& stats) noexcept;

    /// @brief Copy the current totals
    [[nodiscard]] UpgradeStats snapshot() const noexcept;

private:
    static constexpr std::size_t kCounterCount = 17;
    static constexpr std::size_t kTimerCount = 5;

    std::array<std::atomic<std::uint64_t>, kCounterCount> counters_;
    std::array<std::atomic<std::int64_t>, kTimerCount> timersNs_;
};

}  // namespace ssu::io

#endif  // SSU_IO_UPGRADE_STATS_H
