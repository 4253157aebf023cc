/**
 * @file execution_session.cpp
 * @brief Request validation and test-suite evaluation
 *
 * **Validation rules**:
 * - code must not be empty or whitespace only
 * - auxiliary file paths must be relative, without `..`, NUL or `\`
 * - auxiliary files must not overwrite the staged script
 * - dependency names must look like pip requirement specifiers and must
 *   not start with `-` (no option injection into pip)
 * - the working directory must be absolute and free of `..`
 *
 * @date 2025
 */

#include "crucible/session/execution_session.hpp"
#include "crucible/sandbox/payload_staging.hpp"
#include "crucible/utils/file_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace crucible {
namespace session {

namespace {

const std::regex kDependencyPattern(R"([A-Za-z0-9._\-\[\]<>=!~,]+)");
const std::regex kFailureSummary(R"(\b\d+ (failed|errors?)\b)");

} // anonymous namespace

std::vector<std::string> DefaultTestMarkers() {
    return {
        R"(ALL TESTS PASSED)",
        R"(\b\d+ passed\b)"
    };
}

ExecutionSession::ExecutionSession(sandbox::SandboxManager& manager, SessionOptions options)
    : manager_(manager)
    , options_(std::move(options)) {

    if (options_.test_markers.empty()) {
        options_.test_markers = DefaultTestMarkers();
    }
    for (const auto& marker : options_.test_markers) {
        try {
            markers_.emplace_back(marker);
        } catch (const std::regex_error& e) {
            throw core::ValidationError("invalid test marker '" + marker + "': " + e.what());
        }
    }
}

// ============================================================================
// REQUEST CONSTRUCTION
// ============================================================================

core::ExecutionRequest ExecutionSession::BuildRequest(core::PayloadKind payload_kind,
                                                      const std::string& code,
                                                      const std::map<std::string, std::string>& files,
                                                      const std::vector<std::string>& dependencies,
                                                      const core::ResourceLimits& limits) const {
    core::ExecutionRequest request;
    request.payload_kind = payload_kind;
    request.code = code;
    request.auxiliary_files = files;
    request.dependencies = dependencies;
    request.working_directory = options_.working_directory;
    request.limits = limits;
    return request;
}

void ExecutionSession::ValidateRequest(const core::ExecutionRequest& request) {
    if (utils::StringUtils::Trim(request.code).empty()) {
        throw core::ValidationError("code must not be empty");
    }

    auto staged_name = sandbox::StagedFileName(request.payload_kind);
    for (const auto& entry : request.auxiliary_files) {
        const std::string& path = entry.first;
        if (!utils::IsSafeRelativePath(path)) {
            throw core::ValidationError("unsafe auxiliary file path: '" + path + "'");
        }
        std::filesystem::path normalized = std::filesystem::path(path).lexically_normal();
        if (staged_name && normalized.string() == *staged_name) {
            throw core::ValidationError("auxiliary file '" + path + "' collides with the staged payload");
        }
        if (*normalized.begin() == sandbox::kDependencyDirectory) {
            throw core::ValidationError("auxiliary file '" + path + "' is inside the dependency directory");
        }
    }

    for (const auto& dependency : request.dependencies) {
        if (dependency.empty()) {
            throw core::ValidationError("dependency names must not be empty");
        }
        if (dependency.front() == '-') {
            throw core::ValidationError("dependency '" + dependency + "' looks like an option");
        }
        if (!std::regex_match(dependency, kDependencyPattern)) {
            throw core::ValidationError("invalid dependency specifier: '" + dependency + "'");
        }
    }

    std::filesystem::path workdir(request.working_directory);
    if (!workdir.is_absolute()) {
        throw core::ValidationError("working directory must be absolute: '" +
                                    request.working_directory + "'");
    }
    for (const auto& part : workdir) {
        if (part == "..") {
            throw core::ValidationError("working directory must not contain '..'");
        }
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

core::ExecutionResult ExecutionSession::Run(core::PayloadKind payload_kind,
                                            const std::string& code,
                                            const std::map<std::string, std::string>& files,
                                            const std::vector<std::string>& dependencies,
                                            const core::ResourceLimits& limits,
                                            const core::CancellationToken& token) {
    return Execute(BuildRequest(payload_kind, code, files, dependencies, limits), token);
}

core::ExecutionResult ExecutionSession::Execute(const core::ExecutionRequest& request,
                                                const core::CancellationToken& token) {
    ValidateRequest(request);

    auto result = manager_.Submit(request, token);

    if (request.payload_kind == core::PayloadKind::TEST_SUITE && result.success &&
        !HasPassMarker(result.stdout_output)) {
        spdlog::info("Test suite exited cleanly but reported no pass marker");
        result.success = false;
        result.diagnostic = "test suite finished without an all-passed marker in stdout";
    }
    return result;
}

bool ExecutionSession::HasPassMarker(const std::string& stdout_output) const {
    for (const auto& line : utils::StringUtils::SplitLines(stdout_output)) {
        if (std::regex_search(line, kFailureSummary)) {
            continue;
        }
        for (const auto& marker : markers_) {
            if (std::regex_search(line, marker)) {
                return true;
            }
        }
    }
    return false;
}

bool ExecutionSession::IsBackendAvailable() {
    return manager_.IsAvailable();
}

} // namespace session
} // namespace crucible
