// =============================================================================
// sendstream-upgrade - Pipeline Stages
// =============================================================================
// Loop bodies of the worker roles. Each runs on its own worker context until
// its input ends, and throws on failure; the owning Worker turns exceptions
// into an error status.
// =============================================================================

#ifndef SSU_PIPELINE_STAGES_H
#define SSU_PIPELINE_STAGES_H

namespace ssu::io {
class StreamContext;
}  // namespace ssu::io

namespace ssu::pipeline {

/// @brief Fill the buffer cache from the source until end of stream.
/// @note Requires the source handle.
void runPrefetchStage(io::StreamContext& context);

/// @brief Read command headers through the cache and hand out read batches.
/// @note Halts the read queue and the buffer cache after END.
void runReadStage(io::StreamContext& context);

/// @brief Decode and transcode read batches.
void runConstructStage(io::StreamContext& context);

/// @brief Coalesce constructed commands in id order into output batches.
/// @note Halts the compression queue after END.
void runBatchStage(io::StreamContext& context);

/// @brief Convert WRITEs of output batches into ENCODED_WRITEs.
void runCompressStage(io::StreamContext& context);

/// @brief Write output batches in id order, with padding and verification.
/// @note Requires the destination handle.
void runWriteStage(io::StreamContext& context);

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_STAGES_H
