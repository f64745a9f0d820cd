// =============================================================================
// sendstream-upgrade - Pipeline Coordinator
// =============================================================================
// Spawns and supervises the worker set of a multi-threaded run.
//
// Workers are spawned in dependency order with the writer last. The
// coordinator polls them on an interval; the first error that is not a
// cancellation aborts every shared primitive so blocked workers wake up,
// the remaining workers are joined and that error is returned. Errors
// reported afterwards are consequences of the abort and only logged.
// =============================================================================

#ifndef SSU_PIPELINE_COORDINATOR_H
#define SSU_PIPELINE_COORDINATOR_H

#include <chrono>
#include <optional>
#include <vector>

#include "ssu/common/error.h"
#include "ssu/io/stream_context.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/thread_counts.h"
#include "ssu/pipeline/worker.h"

namespace ssu::pipeline {

struct SyncContainer;

/// Interval between worker status polls
inline constexpr std::chrono::milliseconds kDefaultPollInterval{10};

/// @brief Supervisor of one multi-threaded run.
///
/// Sizes the worker set with computeThreadCounts(), builds the SyncContainer,
/// spawns prefetch, read, construct, batch, compress and write workers, and
/// folds every worker's statistics into one total when the run ends.
class Coordinator {
public:
    /// @brief Construct a coordinator
    /// @param pollInterval Sleep between polls of unfinished workers
    explicit Coordinator(std::chrono::milliseconds pollInterval = kDefaultPollInterval) noexcept;

    /// @brief Run the pipeline from the primary context.
    /// @param primary Context holding both handles, positioned after the
    ///        stream header with its versions set. The handles are moved into
    ///        the prefetch and write workers.
    /// @return The first non-cancellation error of any worker. A cancellation
    ///         is returned only when nothing else failed.
    [[nodiscard]] VoidResult run(io::StreamContext& primary);

    /// @brief Thread allocation used by the last run.
    [[nodiscard]] const ThreadCounts& threadCounts() const noexcept { return counts_; }

    /// @brief Run-wide statistics of the last run.
    [[nodiscard]] const io::UpgradeStats& stats() const noexcept { return stats_; }

private:
    /// @brief Keep the first real error and abort the run on it.
    void recordFailure(Error error, const SyncContainer& sync);

    /// @brief Poll until every worker has finished, then join them all.
    void supervise(std::vector<Worker>& workers, const SyncContainer& sync);

    std::chrono::milliseconds pollInterval_;
    ThreadCounts counts_;
    io::UpgradeStats stats_;
    std::optional<Error> failure_;
    std::optional<Error> cancellation_;
    bool aborted_ = false;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_COORDINATOR_H
