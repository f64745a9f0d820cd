// =============================================================================
// sendstream-upgrade - Pipeline Synchronization Container Implementation
// =============================================================================

#include "ssu/pipeline/sync_container.h"

namespace ssu::pipeline {

std::shared_ptr<const SyncContainer> SyncContainer::create(const UpgradeOptions& options,
                                                           StreamOffset cacheStart,
                                                           bool compression) {
    auto container = std::make_shared<SyncContainer>();
    container->bufferCache = std::make_unique<io::ReadOnceBufferCache>(
        cacheStart, options.prefetchBufferSize, options.prefetchBufferCount);
    container->readQueue = std::make_unique<UnorderedElementQueue<CommandBatchInfo>>(
        "read queue", options.queueCapacity);
    container->constructedQueue = std::make_unique<OrderedElementQueue<ConstructedBatch>>(
        "constructed queue", options.queueCapacity);
    if (compression) {
        container->compressionQueue = std::make_unique<UnorderedElementQueue<OutputBatch>>(
            "compression queue", options.queueCapacity);
    }
    container->writeQueue = std::make_unique<OrderedElementQueue<OutputBatch>>(
        "write queue", options.queueCapacity);
    container->stats = std::make_unique<io::SharedStats>();
    return container;
}

std::vector<SyncPrimitive*> SyncContainer::primitives() const {
    std::vector<SyncPrimitive*> result;
    result.push_back(bufferCache.get());
    result.push_back(readQueue.get());
    result.push_back(constructedQueue.get());
    if (compressionQueue) {
        result.push_back(compressionQueue.get());
    }
    result.push_back(writeQueue.get());
    return result;
}

}  // namespace ssu::pipeline
