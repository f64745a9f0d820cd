// =============================================================================
// sendstream-upgrade - Shared Synchronization Primitive Lifecycle
// =============================================================================
// Lifecycle shared by every blocking object the pipeline workers meet: the
// buffer cache and the element queues.
//
// State machine:
//   Running --halt(false)--> Done     graceful drain to completion
//   Running --halt(true)---> Aborted  error-driven shutdown, blocked callers
//                                     wake and return immediately
//   Done    --halt(true)---> Aborted
// =============================================================================

#ifndef SSU_COMMON_SYNC_PRIMITIVE_H
#define SSU_COMMON_SYNC_PRIMITIVE_H

#include <cstdint>
#include <string>
#include <string_view>

#include "ssu/common/error.h"

namespace ssu {

/// @brief Lifecycle state of a blocking primitive.
enum class PrimitiveState : std::uint8_t {
    kRunning = 0,
    kDone = 1,
    kAborted = 2
};

[[nodiscard]] constexpr std::string_view primitiveStateToString(PrimitiveState state) noexcept {
    switch (state) {
        case PrimitiveState::kRunning:
            return "running";
        case PrimitiveState::kDone:
            return "done";
        case PrimitiveState::kAborted:
            return "aborted";
    }
    return "unknown";
}

/// @brief Error returned to callers of an aborted primitive.
[[nodiscard]] inline Error abortedError(std::string_view primitiveName) {
    return Error{ErrorCode::kCancelled, std::string(primitiveName) + " was aborted"};
}

/// @brief Apply halt() to a state.
/// @note Callers hold the primitive's lock. Repeating a halt is a no-op; a
///       planned halt of an aborted primitive reports the cancellation.
[[nodiscard]] inline VoidResult applyHalt(PrimitiveState& state, bool unplanned,
                                          std::string_view primitiveName) {
    if (state == PrimitiveState::kAborted) {
        if (unplanned) {
            return makeVoidSuccess();
        }
        return std::unexpected(abortedError(primitiveName));
    }
    if (!unplanned && state == PrimitiveState::kDone) {
        return makeVoidSuccess();
    }
    state = unplanned ? PrimitiveState::kAborted : PrimitiveState::kDone;
    return makeVoidSuccess();
}

/// @brief Object the coordinator can halt without knowing its element type.
class SyncPrimitive {
public:
    virtual ~SyncPrimitive() = default;

    /// @brief Leave the Running state and wake every blocked caller.
    /// @param unplanned true for error-driven shutdown.
    virtual VoidResult halt(bool unplanned) = 0;

    [[nodiscard]] virtual PrimitiveState state() const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace ssu

#endif  // SSU_COMMON_SYNC_PRIMITIVE_H
