/**
 * @file ArgumentBatch.hpp
 * @brief Argument batch and coordinator state types.
 *
 * An argument batch is the unit forwarded from a secondary process to the
 * primary one, and the unit delivered to application code.
 */

#pragma once

#include <string>
#include <vector>

namespace relaunch::core {

/**
 * @brief Ordered startup arguments forwarded as a single message.
 *
 * Order is preserved end-to-end. An empty batch is a valid value meaning
 * "nothing to forward".
 */
using ArgumentBatch = std::vector<std::string>;

/**
 * @brief Role a coordinator currently plays.
 */
enum class CoordinatorState {
    Uninitialized,       ///< No role decided yet, or primary expected to start next
    ActingAsClient,      ///< Another instance exists and is being contacted
    RecoveringStaleLock, ///< Forwarding failed, stale instances are being terminated
    ActingAsPrimary,     ///< Serving forwarded arguments
    Disposed             ///< Released, no further operations allowed
};

/**
 * @brief Converts a CoordinatorState to its display name.
 * @param state The state to convert.
 * @return Human-readable name of the state.
 */
[[nodiscard]] inline const char* coordinatorStateToString(CoordinatorState state) {
    switch (state) {
    case CoordinatorState::Uninitialized:
        return "Uninitialized";
    case CoordinatorState::ActingAsClient:
        return "ActingAsClient";
    case CoordinatorState::RecoveringStaleLock:
        return "RecoveringStaleLock";
    case CoordinatorState::ActingAsPrimary:
        return "ActingAsPrimary";
    case CoordinatorState::Disposed:
        return "Disposed";
    }
    return "Unknown";
}

} // namespace relaunch::core
