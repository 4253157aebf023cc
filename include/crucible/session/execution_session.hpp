/**
 * @file execution_session.hpp
 * @brief Builds, validates and runs single execution requests
 *
 * The session is the boundary where caller input becomes an immutable
 * ExecutionRequest. Malformed input is rejected with ValidationError
 * before any runtime exists. For test suites it also decides whether the
 * run actually passed.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/cancellation.hpp"
#include "crucible/core/execution_types.hpp"
#include "crucible/sandbox/sandbox_manager.hpp"

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace crucible {
namespace session {

/**
 * @struct SessionOptions
 */
struct SessionOptions {
    std::string working_directory{core::kDefaultWorkingDirectory};

    /**
     * @brief Regular expressions matched against stdout lines
     *
     * A test suite passes only if some stdout line matches one of these and
     * the same line does not report failures or errors. Empty selects the
     * defaults from DefaultTestMarkers().
     */
    std::vector<std::string> test_markers;
};

/**
 * @brief "ALL TESTS PASSED" and pytest-style "N passed" summaries
 */
std::vector<std::string> DefaultTestMarkers();

/**
 * @class ExecutionSession
 * @brief Front door to the sandbox for one caller
 *
 * **Usage**:
 * @code
 * ExecutionSession session(manager);
 * auto result = session.Run(PayloadKind::SCRIPT, "print(42)", {}, {}, limits);
 * @endcode
 */
class ExecutionSession {
public:
    /**
     * @throws core::ValidationError if a test marker is not a valid regex
     */
    explicit ExecutionSession(sandbox::SandboxManager& manager, SessionOptions options = {});

    /**
     * @brief Build, validate and execute one request
     * @throws core::ValidationError for malformed input
     */
    core::ExecutionResult Run(core::PayloadKind payload_kind,
                              const std::string& code,
                              const std::map<std::string, std::string>& files,
                              const std::vector<std::string>& dependencies,
                              const core::ResourceLimits& limits,
                              const core::CancellationToken& token = core::CancellationToken());

    /**
     * @brief Validate and execute an already built request
     * @throws core::ValidationError for malformed input
     */
    core::ExecutionResult Execute(const core::ExecutionRequest& request,
                                  const core::CancellationToken& token = core::CancellationToken());

    core::ExecutionRequest BuildRequest(core::PayloadKind payload_kind,
                                        const std::string& code,
                                        const std::map<std::string, std::string>& files,
                                        const std::vector<std::string>& dependencies,
                                        const core::ResourceLimits& limits) const;

    /**
     * @throws core::ValidationError describing the first problem found
     */
    static void ValidateRequest(const core::ExecutionRequest& request);

    /**
     * @brief True if stdout contains a recognized all-passed marker
     */
    bool HasPassMarker(const std::string& stdout_output) const;

    bool IsBackendAvailable();

private:
    sandbox::SandboxManager& manager_;
    SessionOptions options_;
    std::vector<std::regex> markers_;
};

} // namespace session
} // namespace crucible
