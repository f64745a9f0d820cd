// =============================================================================
// sendstream-upgrade - Pipeline Coordinator Implementation
// =============================================================================

#include "ssu/pipeline/coordinator.h"

#include <algorithm>
#include <thread>

#include "ssu/common/logger.h"
#include "ssu/pipeline/sync_container.h"

namespace ssu::pipeline {

Coordinator::Coordinator(std::chrono::milliseconds pollInterval) noexcept
    : pollInterval_(pollInterval) {}

VoidResult Coordinator::run(io::StreamContext& primary) {
    failure_.reset();
    cancellation_.reset();
    aborted_ = false;
    stats_ = io::UpgradeStats{};

    const auto& options = primary.options();
    const auto capabilities = format::capabilitiesFor(
        primary.sourceVersion(), primary.destinationVersion(), options.compressionLevel);

    counts_ = options.resolveThreadCounts(availableCpuCount());
    const std::uint32_t compressors = capabilities.compression ? counts_.compressors : 0;
    SSU_LOG_INFO("Pipeline: {} construction, {} compression worker(s)", counts_.constructors,
                 compressors);

    auto sync = SyncContainer::create(options, primary.readOffset(), capabilities.compression);
    primary.attachSync(sync);

    std::vector<Worker> workers;
    auto spawnRole = [&](WorkerRole role, std::uint32_t count) {
        for (std::uint32_t i = 0; i < count && !aborted_; ++i) {
            auto worker = Worker::spawn(role, i, primary);
            if (!worker) {
                recordFailure(worker.error(), *sync);
                return;
            }
            workers.push_back(std::move(*worker));
        }
    };

    spawnRole(WorkerRole::kPrefetch, 1);
    spawnRole(WorkerRole::kRead, 1);
    spawnRole(WorkerRole::kConstruct, counts_.constructors);
    spawnRole(WorkerRole::kBatch, 1);
    spawnRole(WorkerRole::kCompress, compressors);
    spawnRole(WorkerRole::kWrite, 1);

    supervise(workers, *sync);

    stats_ = sync->stats->snapshot();
    stats_ += primary.stats();
    primary.attachSync(nullptr);

    if (failure_) {
        return std::unexpected(*failure_);
    }
    if (cancellation_) {
        return std::unexpected(*cancellation_);
    }
    SSU_LOG_INFO("Pipeline finished: {} commands in, {} out", stats_.commandsRead,
                 stats_.commandsWritten);
    return makeVoidSuccess();
}

void Coordinator::supervise(std::vector<Worker>& workers, const SyncContainer& sync) {
    auto isJoined = [](const Worker& worker) { return worker.isJoined(); };

    while (!std::all_of(workers.begin(), workers.end(), isJoined)) {
        for (auto& worker : workers) {
            if (worker.isJoined()) {
                continue;
            }
            auto status = worker.pollStatus();
            if (!status) {
                recordFailure(std::move(status.error()), sync);
            }
        }
        if (!std::all_of(workers.begin(), workers.end(), isJoined)) {
            std::this_thread::sleep_for(pollInterval_);
        }
    }
}

void Coordinator::recordFailure(Error error, const SyncContainer& sync) {
    if (failure_) {
        SSU_LOG_DEBUG("Suppressed follow-up error: {}", error.message());
        return;
    }

    if (error.isCancellation()) {
        // Only the coordinator aborts primitives, so a cancellation is a
        // consequence of an earlier failure, or at worst a stand-in for one.
        SSU_LOG_DEBUG("Worker cancelled: {}", error.message());
        if (!cancellation_) {
            cancellation_ = std::move(error);
        }
    } else {
        SSU_LOG_DEBUG("First failure: {}", error.message());
        failure_ = std::move(error);
    }

    if (!aborted_) {
        aborted_ = true;
        for (SyncPrimitive* primitive : sync.primitives()) {
            if (auto result = primitive->halt(true); !result) {
                SSU_LOG_DEBUG("Halting {}: {}", primitive->name(), result.error().message());
            }
        }
    }
}

}  // namespace ssu::pipeline
