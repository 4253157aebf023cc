/**
 * @file loop_types.cpp
 * @brief Names of loop phases and statuses
 *
 * @date 2025
 */

#include "crucible/loop/loop_types.hpp"

namespace crucible {
namespace loop {

std::string ToString(LoopPhase phase) {
    switch (phase) {
        case LoopPhase::GENERATING:        return "generating";
        case LoopPhase::EXECUTING:         return "executing";
        case LoopPhase::EVALUATING:        return "evaluating";
        case LoopPhase::REQUESTING_REPAIR: return "requesting_repair";
        case LoopPhase::SUCCEEDED:         return "succeeded";
        case LoopPhase::EXHAUSTED:         return "exhausted";
        case LoopPhase::CANCELLED:         return "cancelled";
    }
    return "unknown";
}

std::string ToString(LoopStatus status) {
    switch (status) {
        case LoopStatus::RUNNING:   return "Running";
        case LoopStatus::SUCCEEDED: return "Succeeded";
        case LoopStatus::FAILED:    return "Failed";
        case LoopStatus::EXHAUSTED: return "Exhausted";
        case LoopStatus::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

} // namespace loop
} // namespace crucible
