/**
 * @file payload_staging.cpp
 * @brief Payload staging per PayloadKind
 *
 * @date 2025
 */

#include "crucible/sandbox/payload_staging.hpp"

#include "crucible/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace crucible {
namespace sandbox {

namespace {

/// "pytest", "pytest==8.0", "PyTest>=7" all count
bool RequestsPytest(const std::vector<std::string>& dependencies) {
    return std::any_of(dependencies.begin(), dependencies.end(), [](const std::string& dep) {
        std::string name;
        for (char c : dep) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                break;
            }
            name += c;
        }
        return utils::StringUtils::ToLower(name) == "pytest";
    });
}

} // anonymous namespace

std::optional<std::string> StagedFileName(core::PayloadKind kind) {
    switch (kind) {
        case core::PayloadKind::SCRIPT:        return std::string(kScriptFileName);
        case core::PayloadKind::TEST_SUITE:    return std::string(kTestSuiteFileName);
        case core::PayloadKind::SHELL_COMMAND: return std::nullopt;
    }
    return std::nullopt;
}

StagedPayload StagePayload(const core::ExecutionRequest& request,
                           const std::string& working_directory,
                           const std::string& python_binary) {
    StagedPayload staged;
    staged.files = request.auxiliary_files;

    const std::string deps_path = working_directory + "/" + kDependencyDirectory;

    if (!request.dependencies.empty()) {
        RuntimeCommand install;
        install.argv = {
            python_binary, "-m", "pip", "install",
            "--quiet", "--disable-pip-version-check", "--no-input",
            "--target", deps_path
        };
        install.argv.insert(install.argv.end(),
                            request.dependencies.begin(), request.dependencies.end());
        install.environment["PIP_NO_CACHE_DIR"] = "1";
        staged.install = std::move(install);
        staged.command.environment["PYTHONPATH"] = deps_path;
    }

    switch (request.payload_kind) {
        case core::PayloadKind::SCRIPT:
            staged.files[kScriptFileName] = request.code;
            staged.command.argv = {python_binary, kScriptFileName};
            break;
        case core::PayloadKind::TEST_SUITE:
            staged.files[kTestSuiteFileName] = request.code;
            if (RequestsPytest(request.dependencies)) {
                staged.command.argv = {python_binary, "-m", "pytest", "-q", kTestSuiteFileName};
            } else {
                staged.command.argv = {python_binary, kTestSuiteFileName};
            }
            break;
        case core::PayloadKind::SHELL_COMMAND:
            staged.command.argv = {"sh", "-c", request.code};
            break;
    }

    return staged;
}

} // namespace sandbox
} // namespace crucible
