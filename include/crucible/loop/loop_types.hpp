/**
 * @file loop_types.hpp
 * @brief State, history and event types of the generate-execute-repair loop
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/errors.hpp"
#include "crucible/core/execution_types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace loop {

/**
 * @enum LoopPhase
 * @brief States of the loop state machine
 *
 * ```
 * GENERATING -> EXECUTING -> EVALUATING -> SUCCEEDED
 *     ^                          |-------> EXHAUSTED
 *     |                          v
 *     +------------------ REQUESTING_REPAIR
 *
 * any non-terminal state ----> CANCELLED
 * ```
 */
enum class LoopPhase {
    GENERATING,
    EXECUTING,
    EVALUATING,
    REQUESTING_REPAIR,
    SUCCEEDED,
    EXHAUSTED,
    CANCELLED
};

/**
 * @enum LoopStatus
 * @brief Externally visible status; anything but RUNNING is terminal
 */
enum class LoopStatus {
    RUNNING,
    SUCCEEDED,
    FAILED,     ///< Reserved for archived states that never ran
    EXHAUSTED,
    CANCELLED
};

/**
 * @struct IterationRecord
 * @brief One completed generate/execute/evaluate round
 */
struct IterationRecord {
    std::size_t index{0};
    core::ExecutionRequest request;
    core::ExecutionResult result;
    std::chrono::system_clock::time_point generated_at;
    std::string code_digest;    ///< SHA-256 fingerprint of request.code
};

/**
 * @struct LoopState
 * @brief Everything known about one loop run
 */
struct LoopState {
    std::string session_id;
    std::vector<IterationRecord> iterations;
    std::size_t max_iterations{0};
    LoopStatus status{LoopStatus::RUNNING};

    std::optional<core::ErrorKind> cancellation_reason;
    std::string error_message;
    std::optional<core::ExecutionResult> last_result;   ///< Includes unrecorded attempts
    std::string final_code;                             ///< Set on success

    bool IsTerminal() const { return status != LoopStatus::RUNNING; }
};

/**
 * @struct LoopEvent
 * @brief Emitted on every state transition
 */
struct LoopEvent {
    std::string session_id;
    LoopPhase phase{LoopPhase::GENERATING};
    std::size_t iteration{0};
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::optional<core::FailureKind> failure_kind;
    std::optional<core::ErrorKind> cancellation_reason;
};

std::string ToString(LoopPhase phase);
std::string ToString(LoopStatus status);

} // namespace loop
} // namespace crucible
