// =============================================================================
// sendstream-upgrade - Worker Thread Allocation Implementation
// =============================================================================

#include "ssu/pipeline/thread_counts.h"

#include <algorithm>
#include <thread>

namespace ssu::pipeline {

VoidResult ThreadTunables::validate() const {
    if (nonScalableRoles == 0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "Non-scalable role count must be at least 1");
    }
    if (maxConstructors == 0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "Maximum constructor count must be at least 1");
    }
    if (compressorWeight == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "Compressor weight must be at least 1");
    }
    // The fallback allocation is one thread of each role, so no ratio above 1
    // can be guaranteed for every budget.
    if (!(minCompressorRatio > 0.0) || minCompressorRatio > 1.0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "Minimum compressor ratio must be in (0, 1]");
    }
    if (static_cast<double>(compressorWeight) < minCompressorRatio) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "Compressor weight is below the minimum compressor ratio");
    }
    return makeVoidSuccess();
}

ThreadCounts computeThreadCounts(std::uint32_t requested, std::uint32_t availableCpus,
                                 const ThreadTunables& tunables) noexcept {
    const std::uint32_t cap = std::max<std::uint32_t>(availableCpus / 2, 1);
    const std::uint32_t budget = requested == 0 ? cap : std::min(requested, cap);

    ThreadCounts counts;
    if (budget < tunables.minimumViablePipeline()) {
        return counts;
    }

    const std::uint32_t scalable = budget - tunables.nonScalableRoles;
    counts.constructors = std::clamp<std::uint32_t>(scalable / (1 + tunables.compressorWeight), 1,
                                                    std::max<std::uint32_t>(tunables.maxConstructors, 1));
    counts.compressors = scalable - counts.constructors;
    return counts;
}

std::uint32_t availableCpuCount() noexcept {
    return std::max(std::thread::hardware_concurrency(), 1U);
}

}  // namespace ssu::pipeline
