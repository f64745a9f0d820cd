// =============================================================================
// sendstream-upgrade - Upgrade Options Implementation
// =============================================================================

#include "ssu/pipeline/upgrade_options.h"

#include <fmt/format.h>

namespace ssu::pipeline {

std::size_t UpgradeOptions::maxCommandSize() const noexcept {
    // A read batch still waiting to be handed to constructors pins its
    // payload buffers, plus one partially consumed buffer at either end and
    // the buffer the reader is waiting for.
    if (prefetchBufferCount < 4) {
        return 0;
    }
    const std::size_t window = (prefetchBufferCount - 3) * prefetchBufferSize;
    return window > readBatchBytes ? window - readBatchBytes : 0;
}

ThreadCounts UpgradeOptions::resolveThreadCounts(std::uint32_t availableCpus) const noexcept {
    ThreadCounts counts = computeThreadCounts(threadCount, availableCpus, tunables);
    if (constructorThreads != 0) {
        counts.constructors = constructorThreads;
    }
    if (compressorThreads != 0) {
        counts.compressors = compressorThreads;
    }
    return counts;
}

VoidResult UpgradeOptions::validate() const {
    if (compressionLevel != 0 &&
        (compressionLevel < format::kMinCompressionLevel ||
         compressionLevel > format::kMaxCompressionLevel)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Compression level must be 0 or in [{}, {}], got {}",
                                         format::kMinCompressionLevel,
                                         format::kMaxCompressionLevel, compressionLevel));
    }

    if (!readsStandardInput() && !writesStandardOutput() && inputPath == outputPath) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "Input and output must be different files");
    }

    if (prefetchBufferSize == 0 || prefetchBufferCount < 4) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "Prefetch needs at least 4 buffers of non-zero size");
    }
    if (queueCapacity == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "Queue capacity must be at least 1");
    }
    if (readBatchBytes == 0 || writeBatchBytes == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "Batch sizes must be non-zero");
    }
    if (maxCommandSize() < kMinCommandWindow) {
        return makeVoidError(
            ErrorCode::kConfigurationError,
            fmt::format("Prefetch window of {} x {} bytes with {}-byte read batches holds commands "
                        "of at most {} bytes, need at least {}",
                        prefetchBufferCount, prefetchBufferSize, readBatchBytes, maxCommandSize(),
                        kMinCommandWindow));
    }

    if (auto result = tunables.validate(); !result) {
        return result;
    }
    return makeVoidSuccess();
}

}  // namespace ssu::pipeline
