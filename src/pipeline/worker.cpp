// =============================================================================
// sendstream-upgrade - Pipeline Workers Implementation
// =============================================================================

#include "ssu/pipeline/worker.h"

#include <chrono>
#include <system_error>

#include <fmt/format.h>

#include "ssu/common/logger.h"
#include "ssu/pipeline/stages.h"
#include "ssu/pipeline/sync_container.h"

namespace ssu::pipeline {

void runStage(WorkerRole role, io::StreamContext& context) {
    switch (role) {
        case WorkerRole::kPrefetch:
            runPrefetchStage(context);
            return;
        case WorkerRole::kRead:
            runReadStage(context);
            return;
        case WorkerRole::kConstruct:
            runConstructStage(context);
            return;
        case WorkerRole::kBatch:
            runBatchStage(context);
            return;
        case WorkerRole::kCompress:
            runCompressStage(context);
            return;
        case WorkerRole::kWrite:
            runWriteStage(context);
            return;
    }
    throw WorkerFault(fmt::format("Unknown worker role {}", static_cast<int>(role)));
}

// =============================================================================
// Worker
// =============================================================================

Worker::Worker(WorkerRole role, std::string name, std::future<void> done, std::thread thread)
    : role_(role), name_(std::move(name)), done_(std::move(done)), thread_(std::move(thread)) {}

Worker::~Worker() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

Worker::Worker(Worker&&) noexcept = default;

Worker& Worker::operator=(Worker&& other) noexcept {
    if (this != &other) {
        if (thread_.joinable()) {
            thread_.join();
        }
        role_ = other.role_;
        name_ = std::move(other.name_);
        done_ = std::move(other.done_);
        thread_ = std::move(other.thread_);
        joined_ = other.joined_;
    }
    return *this;
}

Result<Worker> Worker::spawn(WorkerRole role, std::uint32_t index, io::StreamContext& parent) {
    auto child = parent.cloneForWorker(roleOwnsSource(role), roleOwnsDestination(role));
    if (!child) {
        return makeError<Worker>(child.error());
    }

    std::string name = isScalableRole(role)
                           ? fmt::format("{}-{}", workerRoleToString(role), index)
                           : std::string(workerRoleToString(role));

    std::packaged_task<void()> task([role, context = std::move(*child)]() mutable {
        runStage(role, context);
        context.rolloverStats(*context.sync().stats);
    });
    std::future<void> done = task.get_future();
    std::thread thread;
    try {
        thread = std::thread(std::move(task));
    } catch (const std::system_error& e) {
        return makeError<Worker>(ErrorCode::kWorkerFault,
                                 fmt::format("Failed to start worker {}: {}", name, e.what()));
    }

    SSU_LOG_DEBUG("Spawned worker {}", name);
    return Worker(role, std::move(name), std::move(done), std::move(thread));
}

Result<WorkerStatus> Worker::pollStatus() {
    if (joined_) {
        return makeError<WorkerStatus>(ErrorCode::kInvalidState,
                                       fmt::format("Worker {} was already joined", name_));
    }
    if (done_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return WorkerStatus::kRunning;
    }
    return collect();
}

Result<WorkerStatus> Worker::join() {
    if (joined_) {
        return makeError<WorkerStatus>(ErrorCode::kInvalidState,
                                       fmt::format("Worker {} was already joined", name_));
    }
    done_.wait();
    return collect();
}

Result<WorkerStatus> Worker::collect() {
    thread_.join();
    joined_ = true;

    try {
        done_.get();
    } catch (const SSUException& e) {
        SSU_LOG_DEBUG("Worker {} failed: {}", name_, e.what());
        return makeError<WorkerStatus>(e.code(), fmt::format("{}: {}", name_, e.what()));
    } catch (const std::exception& e) {
        SSU_LOG_DEBUG("Worker {} faulted: {}", name_, e.what());
        return makeError<WorkerStatus>(ErrorCode::kWorkerFault, fmt::format("{}: {}", name_, e.what()));
    } catch (...) {
        return makeError<WorkerStatus>(ErrorCode::kWorkerFault,
                                       fmt::format("{}: non-standard exception", name_));
    }

    SSU_LOG_DEBUG("Worker {} finished", name_);
    return WorkerStatus::kFinished;
}

}  // namespace ssu::pipeline
