// =============================================================================
// sendstream-upgrade - Pipeline Synchronization Container
// =============================================================================
// The shared state of a multi-threaded run: the buffer cache, the queues
// between stages and the run-wide statistics.
//
// Built once before any worker starts and shared read-only; every mutation
// goes through the primitives themselves.
//
// Data flow:
//   Prefetch -> [buffer cache] -> Read -> readQueue -> Construct(N)
//     -> constructedQueue -> Batch -> compressionQueue -> Compress(M)
//     -> writeQueue -> Write
// Without compression the batching stage feeds writeQueue directly.
// =============================================================================

#ifndef SSU_PIPELINE_SYNC_CONTAINER_H
#define SSU_PIPELINE_SYNC_CONTAINER_H

#include <memory>
#include <vector>

#include "ssu/common/sync_primitive.h"
#include "ssu/common/types.h"
#include "ssu/io/buffer_cache.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/blocking_queue.h"
#include "ssu/pipeline/command_batch.h"
#include "ssu/pipeline/ordered_element_queue.h"
#include "ssu/pipeline/upgrade_options.h"

namespace ssu::pipeline {

/// @brief Queues, cache and statistics shared by all workers of a run.
struct SyncContainer {
    /// @brief Prefetch -> Read, and payload loads by Construct
    std::unique_ptr<io::ReadOnceBufferCache> bufferCache;

    /// @brief Read -> Construct
    std::unique_ptr<UnorderedElementQueue<CommandBatchInfo>> readQueue;

    /// @brief Construct -> Batch, back in id order
    std::unique_ptr<OrderedElementQueue<ConstructedBatch>> constructedQueue;

    /// @brief Batch -> Compress (null when compression is off)
    std::unique_ptr<UnorderedElementQueue<OutputBatch>> compressionQueue;

    /// @brief Batch or Compress -> Write, back in id order
    std::unique_ptr<OrderedElementQueue<OutputBatch>> writeQueue;

    /// @brief Totals rolled over by workers as they finish
    std::unique_ptr<io::SharedStats> stats;

    /// @brief Build the container for a run.
    /// @param options Queue capacity and prefetch window sizes
    /// @param cacheStart Source offset right after the stream header.
    /// @param compression Whether a compression stage runs.
    [[nodiscard]] static std::shared_ptr<const SyncContainer> create(const UpgradeOptions& options,
                                                                     StreamOffset cacheStart,
                                                                     bool compression);

    /// @brief Every haltable primitive, in pipeline order.
    [[nodiscard]] std::vector<SyncPrimitive*> primitives() const;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_SYNC_CONTAINER_H
