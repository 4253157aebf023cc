/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the execution engine and the repair loop
 *
 * Expected execution outcomes travel as values inside ExecutionResult.
 * Exceptions are reserved for contract violations: malformed requests,
 * invalid configuration, and failures of the code generator.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace crucible {
namespace core {

/**
 * @enum FailureKind
 * @brief Why a single execution did not succeed
 *
 * Carried by ExecutionResult. When several apply, the most severe wins:
 * TIMEOUT > RESOURCE_EXCEEDED > NON_ZERO_EXIT.
 */
enum class FailureKind {
    TIMEOUT,              ///< Wall-clock deadline fired and the runtime was killed
    RESOURCE_EXCEEDED,    ///< Killed by the memory / CPU enforcement layer
    RUNTIME_UNAVAILABLE,  ///< Isolation backend unreachable
    NON_ZERO_EXIT,        ///< Payload exited with a non-zero code
    INTERNAL_ERROR        ///< Backend or engine fault unrelated to the payload
};

/**
 * @enum ErrorKind
 * @brief Complete error taxonomy, including loop-level reasons
 */
enum class ErrorKind {
    TIMEOUT,
    RESOURCE_EXCEEDED,
    RUNTIME_UNAVAILABLE,
    NON_ZERO_EXIT,
    INTERNAL_ERROR,
    GENERATION_ERROR,   ///< Code generator failed to produce code
    VALIDATION_ERROR,   ///< Request rejected before any runtime was created
    USER_ABORT          ///< Caller cancelled the operation
};

/**
 * @brief Thrown when an execution request or limit set is malformed
 */
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by code generators that cannot produce code
 */
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown when configuration sources contain invalid values
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Pick the failure kind for a finished execution
 * @param timed_out Watchdog deadline fired
 * @param resource_killed Enforcement layer killed the payload
 * @param exit_code Process exit code
 * @return Failure kind, or nullopt for a clean exit
 */
std::optional<FailureKind> ClassifyFailure(bool timed_out, bool resource_killed, int exit_code);

ErrorKind ToErrorKind(FailureKind kind);

std::string ToString(FailureKind kind);
std::string ToString(ErrorKind kind);

} // namespace core
} // namespace crucible
