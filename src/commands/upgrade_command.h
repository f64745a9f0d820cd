// =============================================================================
// sendstream-upgrade - Upgrade Command
// =============================================================================
// Command handler for transcoding a send-stream to a newer version.
//
// This module provides:
// - UpgradeCommand: runs one UpgradePipeline and reports its statistics
// - UpgradeCommandOptions: pipeline options plus reporting flags
// =============================================================================

#ifndef SSU_COMMANDS_UPGRADE_COMMAND_H
#define SSU_COMMANDS_UPGRADE_COMMAND_H

#include <chrono>
#include <optional>

#include "ssu/common/error.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/thread_counts.h"
#include "ssu/pipeline/upgrade_options.h"

namespace ssu::commands {

// =============================================================================
// Upgrade Options
// =============================================================================

/// @brief Configuration options for the upgrade command.
struct UpgradeCommandOptions {
    /// @brief Options handed to the pipeline.
    pipeline::UpgradeOptions upgrade;

    /// @brief Print the statistics summary after a successful run.
    bool showSummary = true;

    /// @brief Also print failures to stderr (console logging is off when the
    ///        stream is written to stdout).
    bool errorsToStderr = false;
};

// =============================================================================
// UpgradeCommand Class
// =============================================================================

/// @brief Command handler for send-stream upgrades.
class UpgradeCommand {
public:
    explicit UpgradeCommand(UpgradeCommandOptions options);

    ~UpgradeCommand();

    // Non-copyable, movable
    UpgradeCommand(const UpgradeCommand&) = delete;
    UpgradeCommand& operator=(const UpgradeCommand&) = delete;
    UpgradeCommand(UpgradeCommand&&) noexcept;
    UpgradeCommand& operator=(UpgradeCommand&&) noexcept;

    /// @brief Execute the upgrade.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Statistics of the last run.
    [[nodiscard]] const io::UpgradeStats& stats() const noexcept { return stats_; }

    [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept { return elapsed_; }

    [[nodiscard]] const UpgradeCommandOptions& options() const noexcept { return options_; }

private:
    /// @brief Print summary statistics to stderr.
    void printSummary() const;

    UpgradeCommandOptions options_;
    io::UpgradeStats stats_;
    std::optional<pipeline::ThreadCounts> threadCounts_;
    std::chrono::nanoseconds elapsed_{0};
};

}  // namespace ssu::commands

#endif  // SSU_COMMANDS_UPGRADE_COMMAND_H
