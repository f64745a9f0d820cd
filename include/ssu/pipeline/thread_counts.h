// =============================================================================
// sendstream-upgrade - Worker Thread Allocation
// =============================================================================
// Splits a thread budget between the scalable roles (construction and
// compression). Prefetch, read, batching and write always get one thread each.
// =============================================================================

#ifndef SSU_PIPELINE_THREAD_COUNTS_H
#define SSU_PIPELINE_THREAD_COUNTS_H

#include <cstdint>
#include <string>

#include "ssu/common/error.h"

namespace ssu::pipeline {

/// @brief Sizing constants, exposed so runs can be tuned without rebuilding.
struct ThreadTunables {
    /// @brief Roles that always run exactly one thread.
    std::uint32_t nonScalableRoles = 4;

    /// @brief Upper bound on construction workers.
    std::uint32_t maxConstructors = 4;

    /// @brief Scalable threads handed to compression per construction thread.
    std::uint32_t compressorWeight = 3;

    /// @brief Compressors guaranteed per constructor in every allocation.
    double minCompressorRatio = 1.0;

    /// @brief Smallest budget that runs the full multi-threaded pipeline.
    [[nodiscard]] std::uint32_t minimumViablePipeline() const noexcept {
        return nonScalableRoles + 2;
    }

    /// @brief Check the tunables can satisfy the ratio guarantee.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Threads allotted to the scalable roles.
struct ThreadCounts {
    std::uint32_t constructors = 1;
    std::uint32_t compressors = 1;

    [[nodiscard]] std::uint32_t total(const ThreadTunables& tunables) const noexcept {
        return tunables.nonScalableRoles + constructors + compressors;
    }

    [[nodiscard]] bool operator==(const ThreadCounts&) const = default;
};

/// @brief Allocate construction and compression threads.
///
/// The budget is capped at half the available CPUs (requested 0 means "use
/// that cap"). Budgets below the minimum viable pipeline fall back to one
/// thread of each role. Otherwise the scalable threads are split by weight,
/// clamped to [1, maxConstructors] constructors.
///
/// @param requested Requested total thread budget, 0 for automatic.
/// @param availableCpus Logical CPUs on this machine.
[[nodiscard]] ThreadCounts computeThreadCounts(std::uint32_t requested,
                                               std::uint32_t availableCpus,
                                               const ThreadTunables& tunables = {}) noexcept;

/// @brief Logical CPUs reported by the runtime (at least 1).
[[nodiscard]] std::uint32_t availableCpuCount() noexcept;

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_THREAD_COUNTS_H
