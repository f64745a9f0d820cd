// =============================================================================
// sendstream-upgrade - Pipeline Workers
// =============================================================================
// A Worker is one supervised thread running a stage loop on its own context.
//
// Lifecycle:
//   spawn() -> pollStatus() == kRunning ... -> kFinished or error (once)
// The thread is joined by the poll that first observes completion; an
// exception escaping the stage is captured by the thread's future and
// reported by that poll as an error, never rethrown on the polling thread.
// =============================================================================

#ifndef SSU_PIPELINE_WORKER_H
#define SSU_PIPELINE_WORKER_H

#include <cstdint>
#include <future>
#include <string>
#include <string_view>
#include <thread>

#include "ssu/common/error.h"
#include "ssu/io/stream_context.h"

namespace ssu::pipeline {

// =============================================================================
// Worker Roles
// =============================================================================

/// @brief Closed set of pipeline roles, in spawn order.
enum class WorkerRole : std::uint8_t {
    kPrefetch = 0,
    kRead = 1,
    kConstruct = 2,
    kBatch = 3,
    kCompress = 4,
    kWrite = 5
};

/// @brief Convert role to its name, used as the worker name prefix
[[nodiscard]] constexpr std::string_view workerRoleToString(WorkerRole role) noexcept {
    switch (role) {
        case WorkerRole::kPrefetch:
            return "prefetch";
        case WorkerRole::kRead:
            return "read";
        case WorkerRole::kConstruct:
            return "construct";
        case WorkerRole::kBatch:
            return "batch";
        case WorkerRole::kCompress:
            return "compress";
        case WorkerRole::kWrite:
            return "write";
    }
    return "unknown";
}

/// @brief The only role allowed to read the source handle.
[[nodiscard]] constexpr bool roleOwnsSource(WorkerRole role) noexcept {
    return role == WorkerRole::kPrefetch;
}

/// @brief The only role allowed to write the destination handle.
[[nodiscard]] constexpr bool roleOwnsDestination(WorkerRole role) noexcept {
    return role == WorkerRole::kWrite;
}

/// @brief Roles that may run more than one thread.
[[nodiscard]] constexpr bool isScalableRole(WorkerRole role) noexcept {
    return role == WorkerRole::kConstruct || role == WorkerRole::kCompress;
}

/// @brief Run the stage loop of a role on the calling thread.
/// @param role Stage to run
/// @param context Worker context derived for that role
/// @throws SSUException on any stage failure
void runStage(WorkerRole role, io::StreamContext& context);

// =============================================================================
// Worker
// =============================================================================

/// @brief Outcome of a successful status poll
enum class WorkerStatus : std::uint8_t {
    kRunning = 0,
    kFinished = 1
};

/// @brief Supervised stage thread.
///
/// The stage runs inside a packaged task, so an exception thrown by the loop
/// is carried to pollStatus() instead of terminating the process. The
/// worker's statistics are rolled over into the shared totals when its loop
/// returns normally.
class Worker {
public:
    /// @brief Derive the worker's context from parent and start its thread.
    /// @param role Stage to run
    /// @param index Instance number within the role, used in the name.
    /// @param parent Context the worker context is cloned from; source or
    ///        destination handles move out of it for the roles that own them
    /// @return kConfigurationError if parent lacks a handle the role needs,
    ///         kWorkerFault if the thread cannot be started.
    [[nodiscard]] static Result<Worker> spawn(WorkerRole role, std::uint32_t index,
                                              io::StreamContext& parent);

    /// @brief Joins the thread if still running.
    ~Worker();

    // Non-copyable, movable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) noexcept;
    Worker& operator=(Worker&&) noexcept;

    /// @brief Non-blocking status check.
    /// @return kRunning while the stage runs; on the first poll after it
    ///         returns, kFinished or the stage's error (prefixed with the
    ///         worker name); kInvalidState on any later poll.
    [[nodiscard]] Result<WorkerStatus> pollStatus();

    /// @brief Block until the thread ends, then poll.
    /// @return Same as pollStatus() on a finished worker
    [[nodiscard]] Result<WorkerStatus> join();

    /// @brief Get worker name, e.g. "construct-2"
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Get worker role
    [[nodiscard]] WorkerRole role() const noexcept { return role_; }

    /// @brief Check if the outcome has already been collected
    [[nodiscard]] bool isJoined() const noexcept { return joined_; }

private:
    Worker(WorkerRole role, std::string name, std::future<void> done, std::thread thread);

    /// @brief Join the finished thread and convert its outcome.
    [[nodiscard]] Result<WorkerStatus> collect();

    WorkerRole role_;
    std::string name_;
    std::future<void> done_;
    std::thread thread_;
    bool joined_ = false;
};

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_WORKER_H
