// =============================================================================
// sendstream-upgrade - Output Stages
// =============================================================================
// Batching, compression and writing.
// =============================================================================

#include <vector>

#include <fmt/format.h>

#include "ssu/common/logger.h"
#include "ssu/format/stream_codec.h"
#include "ssu/format/zstd_codec.h"
#include "ssu/io/stream_context.h"
#include "ssu/pipeline/command_batcher.h"
#include "ssu/pipeline/stages.h"
#include "ssu/pipeline/sync_container.h"

namespace ssu::pipeline {

void runBatchStage(io::StreamContext& context) {
    const auto& sync = context.sync();
    const auto& options = context.options();
    const auto capabilities = format::capabilitiesFor(
        context.sourceVersion(), context.destinationVersion(), options.compressionLevel);

    CommandBatcher batcher(options.maxBatchedExtentSize, capabilities.coalescing);
    std::vector<OutputCommand> ready;
    OutputBatch batch;

    auto send = [&] {
        if (batch.empty()) {
            return;
        }
        if (sync.compressionQueue) {
            unwrapOrThrow(sync.compressionQueue->enqueue(std::move(batch)));
        } else {
            unwrapOrThrow(sync.writeQueue->enqueue(std::move(batch)));
        }
        batch = OutputBatch{};
    };

    bool ended = false;
    while (!ended) {
        auto constructed = unwrapOrThrow(sync.constructedQueue->dequeue());
        if (!constructed) {
            throw WorkerFault("Constructed commands ended before the END command");
        }

        CommandId id = constructed->first;
        for (auto& command : constructed->items) {
            batcher.push(id++, std::move(command), ready, context.stats());
        }
        ended = constructed->containsEnd;
        if (ended) {
            batcher.flush(ready);
        }

        for (auto& output : ready) {
            if (batch.empty()) {
                batch.first = output.firstId;
            }
            batch.last = output.lastId;
            batch.lastShared = output.lastIdShared;
            batch.containsEnd = output.command.isEnd();
            batch.byteSize += output.command.serializedSize();
            batch.items.push_back(std::move(output));

            if (batch.byteSize >= options.writeBatchBytes) {
                send();
            }
        }
        ready.clear();
    }
    send();

    if (sync.compressionQueue) {
        unwrapOrThrow(sync.compressionQueue->halt(false));
    }
}

void runCompressStage(io::StreamContext& context) {
    const auto& sync = context.sync();
    format::ZstdCompressor compressor(context.options().compressionLevel);

    while (auto batch = unwrapOrThrow(sync.compressionQueue->dequeue())) {
        for (auto& output : batch->items) {
            compressCommand(output.command, compressor, context.stats());
        }
        unwrapOrThrow(sync.writeQueue->enqueue(std::move(*batch)));
    }
}

void runWriteStage(io::StreamContext& context) {
    const auto& sync = context.sync();
    CommandId expected = 0;
    bool ended = false;

    while (!ended) {
        auto run = unwrapOrThrow(sync.writeQueue->dequeueRun());
        if (run.empty()) {
            throw WorkerFault("Output ended before the END command");
        }

        for (auto& batch : run) {
            for (const auto& output : batch.items) {
                if (ended) {
                    throw WorkerFault(fmt::format("Command {} follows the END command", output.firstId));
                }
                if (output.firstId != expected) {
                    throw WorkerFault(fmt::format("Output command starts at id {}, expected {}",
                                                  output.firstId, expected));
                }
                format::writeCommand(context, output.command, output.firstId);
                expected = output.lastId + (output.lastIdShared ? 0 : 1);
                ended = output.command.isEnd();
            }
        }
    }

    context.flush();
    SSU_LOG_DEBUG("Wrote {} bytes", context.writeOffset());
}

}  // namespace ssu::pipeline
