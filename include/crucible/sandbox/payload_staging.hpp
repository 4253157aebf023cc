/**
 * @file payload_staging.hpp
 * @brief Translate an ExecutionRequest into files and commands
 *
 * | Payload       | Staged file    | Command                       |
 * |---------------|----------------|-------------------------------|
 * | SCRIPT        | main.py        | <python> main.py              |
 * | TEST_SUITE    | test_main.py   | <python> test_main.py         |
 * | SHELL_COMMAND | (none)         | sh -c <code>                  |
 *
 * A TEST_SUITE that lists pytest among its dependencies runs as
 * `<python> -m pytest -q test_main.py` instead.
 *
 * Dependencies are installed into `<workdir>/.crucible_deps` by a separate
 * pip command that runs before the payload; the payload then sees them
 * through PYTHONPATH. No step goes through a shell except SHELL_COMMAND.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/execution_types.hpp"
#include "crucible/sandbox/isolated_runtime.hpp"

#include <map>
#include <optional>
#include <string>

namespace crucible {
namespace sandbox {

constexpr const char* kScriptFileName = "main.py";
constexpr const char* kTestSuiteFileName = "test_main.py";
constexpr const char* kDependencyDirectory = ".crucible_deps";

/**
 * @struct StagedPayload
 * @brief Everything a runtime needs to execute one request
 */
struct StagedPayload {
    std::map<std::string, std::string> files;   ///< Auxiliary files plus the script
    std::optional<RuntimeCommand> install;      ///< Dependency installation, if any
    RuntimeCommand command;                     ///< The payload itself
};

/**
 * @brief File the payload code is written to, or nullopt for shell commands
 */
std::optional<std::string> StagedFileName(core::PayloadKind kind);

/**
 * @param request Validated request
 * @param working_directory Working directory as seen inside the runtime
 * @param python_binary Interpreter used for scripts, tests and pip
 */
StagedPayload StagePayload(const core::ExecutionRequest& request,
                           const std::string& working_directory,
                           const std::string& python_binary);

} // namespace sandbox
} // namespace crucible
