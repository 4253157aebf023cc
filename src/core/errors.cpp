/**
 * @file errors.cpp
 * @brief Failure classification and error kind names
 *
 * @date 2025
 */

#include "crucible/core/errors.hpp"

namespace crucible {
namespace core {

std::optional<FailureKind> ClassifyFailure(bool timed_out, bool resource_killed, int exit_code) {
    if (timed_out) {
        return FailureKind::TIMEOUT;
    }
    if (resource_killed) {
        return FailureKind::RESOURCE_EXCEEDED;
    }
    if (exit_code != 0) {
        return FailureKind::NON_ZERO_EXIT;
    }
    return std::nullopt;
}

ErrorKind ToErrorKind(FailureKind kind) {
    switch (kind) {
        case FailureKind::TIMEOUT:             return ErrorKind::TIMEOUT;
        case FailureKind::RESOURCE_EXCEEDED:   return ErrorKind::RESOURCE_EXCEEDED;
        case FailureKind::RUNTIME_UNAVAILABLE: return ErrorKind::RUNTIME_UNAVAILABLE;
        case FailureKind::NON_ZERO_EXIT:       return ErrorKind::NON_ZERO_EXIT;
        case FailureKind::INTERNAL_ERROR:      return ErrorKind::INTERNAL_ERROR;
    }
    return ErrorKind::INTERNAL_ERROR;
}

std::string ToString(FailureKind kind) {
    return ToString(ToErrorKind(kind));
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT:             return "Timeout";
        case ErrorKind::RESOURCE_EXCEEDED:   return "ResourceExceeded";
        case ErrorKind::RUNTIME_UNAVAILABLE: return "RuntimeUnavailable";
        case ErrorKind::NON_ZERO_EXIT:       return "NonZeroExit";
        case ErrorKind::INTERNAL_ERROR:      return "InternalError";
        case ErrorKind::GENERATION_ERROR:    return "GenerationError";
        case ErrorKind::VALIDATION_ERROR:    return "ValidationError";
        case ErrorKind::USER_ABORT:          return "UserAbort";
    }
    return "Unknown";
}

} // namespace core
} // namespace crucible
