/**
 * @file execution_types.cpp
 * @brief Helpers for execution requests and results
 *
 * @date 2025
 */

#include "crucible/core/execution_types.hpp"
#include "crucible/utils/string_utils.hpp"

namespace crucible {
namespace core {

ExecutionResult MakeFailureResult(FailureKind kind, const std::string& diagnostic) {
    ExecutionResult result;
    result.success = false;
    result.failure_kind = kind;
    result.diagnostic = diagnostic;
    return result;
}

std::string ToString(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::SCRIPT:        return "Script";
        case PayloadKind::SHELL_COMMAND: return "ShellCommand";
        case PayloadKind::TEST_SUITE:    return "TestSuite";
    }
    return "Unknown";
}

std::optional<PayloadKind> ParsePayloadKind(const std::string& name) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lowered == "script") {
        return PayloadKind::SCRIPT;
    }
    if (lowered == "shell" || lowered == "shell_command" || lowered == "shellcommand") {
        return PayloadKind::SHELL_COMMAND;
    }
    if (lowered == "test" || lowered == "test_suite" || lowered == "testsuite") {
        return PayloadKind::TEST_SUITE;
    }
    return std::nullopt;
}

} // namespace core
} // namespace crucible
