// =============================================================================
// sendstream-upgrade - Input Stages
// =============================================================================
// Prefetch, read and construction.
// =============================================================================

#include <optional>

#include "ssu/common/logger.h"
#include "ssu/format/stream_codec.h"
#include "ssu/io/buffer_cache.h"
#include "ssu/io/stream_context.h"
#include "ssu/pipeline/stages.h"
#include "ssu/pipeline/sync_container.h"

namespace ssu::pipeline {

void runPrefetchStage(io::StreamContext& context) {
    auto& cache = *context.sync().bufferCache;
    while (auto buffer = unwrapOrThrow(cache.reserveBuffer())) {
        buffer->fill(context);
        unwrapOrThrow(cache.publishBuffer(std::move(*buffer)));
    }
    SSU_LOG_DEBUG("Prefetch finished after {} bytes", context.stats().bytesRead);
}

void runReadStage(io::StreamContext& context) {
    const auto& sync = context.sync();
    const auto& options = context.options();

    CommandBatchInfo batch;
    CommandId id = 0;
    StreamOffset previousEnd = context.readOffset();

    while (true) {
        format::CommandInfo info;
        try {
            info = format::readCommand(context, id);
        } catch (const UnexpectedEofError& e) {
            // Payloads were skipped, so a source ending before previousEnd
            // truncated the previous command rather than this header.
            const auto endOfStream = sync.bufferCache->endOfStream();
            if (id > 0 && endOfStream && *endOfStream < previousEnd) {
                const CommandId truncated = id - 1;
                format::throwTruncated(e, truncated,
                                       truncated == 0 ? std::nullopt
                                                      : std::optional<CommandId>(truncated - 1));
            }
            format::throwTruncated(e, id,
                                   id == 0 ? std::nullopt : std::optional<CommandId>(id - 1));
        }
        previousEnd = context.readOffset();

        const bool end = info.isEnd();
        if (batch.empty()) {
            batch.first = id;
        }
        batch.last = id;
        batch.byteSize += info.header.totalSize();
        batch.containsEnd = end;
        batch.items.push_back(std::move(info));

        if (end || batch.byteSize >= options.readBatchBytes) {
            unwrapOrThrow(sync.readQueue->enqueue(std::move(batch)));
            batch = CommandBatchInfo{};
        }
        if (end) {
            break;
        }
        ++id;
    }

    SSU_LOG_DEBUG("Read {} commands", id + 1);
    unwrapOrThrow(sync.readQueue->halt(false));
    unwrapOrThrow(sync.bufferCache->halt(false));
}

void runConstructStage(io::StreamContext& context) {
    const auto& sync = context.sync();

    while (auto batch = unwrapOrThrow(sync.readQueue->dequeue())) {
        ConstructedBatch constructed;
        constructed.first = batch->first;
        constructed.last = batch->last;
        constructed.containsEnd = batch->containsEnd;
        constructed.items.reserve(batch->items.size());

        for (auto& info : batch->items) {
            constructed.items.push_back(format::constructCommand(context, info));
            constructed.byteSize += constructed.items.back().serializedSize();
        }
        unwrapOrThrow(sync.constructedQueue->enqueue(std::move(constructed)));
    }
}

}  // namespace ssu::pipeline
