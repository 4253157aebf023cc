/**
 * @file execution_types.hpp
 * @brief Request and result types exchanged with the sandbox
 *
 * An ExecutionRequest is built once per attempt and is never modified after
 * submission. Exactly one ExecutionResult is produced for every request.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/errors.hpp"
#include "crucible/core/resource_limits.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @enum PayloadKind
 * @brief How the submitted code is staged and invoked
 */
enum class PayloadKind {
    SCRIPT,         ///< Python source run by the interpreter
    SHELL_COMMAND,  ///< Passed to `sh -c`
    TEST_SUITE      ///< Python test file; success also needs a pass marker
};

constexpr const char* kDefaultWorkingDirectory = "/workspace";

/**
 * @struct ExecutionRequest
 * @brief Everything needed to run one payload
 */
struct ExecutionRequest {
    PayloadKind payload_kind{PayloadKind::SCRIPT};
    std::string code;
    std::map<std::string, std::string> auxiliary_files;  ///< Relative path -> content
    std::vector<std::string> dependencies;               ///< Installed in order before the payload
    std::string working_directory{kDefaultWorkingDirectory};
    ResourceLimits limits;
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one execution
 *
 * `success` is true only when `failure_kind` is empty and no other check
 * (cancellation, test markers) rejected the run.
 */
struct ExecutionResult {
    bool success{false};
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{-1};
    std::chrono::milliseconds elapsed{0};
    std::optional<FailureKind> failure_kind;

    std::string diagnostic;           ///< Human-readable explanation of a failure
    bool cancelled{false};            ///< Stopped by the caller's cancellation token
    bool output_truncated{false};     ///< Output exceeded the capture limit
    std::string runtime_id;           ///< Runtime instance that served the request
};

/**
 * @brief Result for a request that never reached a payload
 */
ExecutionResult MakeFailureResult(FailureKind kind, const std::string& diagnostic);

std::string ToString(PayloadKind kind);

/**
 * @brief Parse "script", "shell" / "shell_command", "test" / "test_suite"
 */
std::optional<PayloadKind> ParsePayloadKind(const std::string& name);

} // namespace core
} // namespace crucible
