/**
 * @file external_generator.cpp
 * @brief Host command code generator
 *
 * @date 2025
 */

#include "crucible/loop/external_generator.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/utils/string_utils.hpp"
#include "crucible/utils/subprocess.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crucible {
namespace loop {

using json = nlohmann::json;

namespace {

constexpr std::size_t kStderrExcerpt = 500;

} // anonymous namespace

ExternalCommandGenerator::ExternalCommandGenerator(ExternalGeneratorOptions options)
    : options_(std::move(options)) {

    if (options_.argv.empty()) {
        throw std::invalid_argument("generator command must not be empty");
    }
}

ExternalGeneratorOptions ExternalCommandGenerator::FromCommandLine(const std::string& command_line) {
    ExternalGeneratorOptions options;
    options.argv = {"sh", "-c", command_line};
    return options;
}

// ============================================================================
// PROTOCOL
// ============================================================================

std::string ExternalCommandGenerator::EncodeRequest(const GenerationRequest& request) {
    json j;
    j["session_id"] = request.session_id;
    j["iteration"] = request.iteration;
    j["task"] = request.task;
    j["hints"] = request.hints ? json(*request.hints) : json(nullptr);
    j["context"] = request.feedback;
    j["prompt"] = request.prompt;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ExternalCommandGenerator::DecodeResponse(const std::string& output) {
    std::string trimmed = utils::StringUtils::Trim(output);
    if (trimmed.empty()) {
        throw core::GenerationError("generator produced no output");
    }

    if (trimmed.front() != '{') {
        return output;
    }

    json j;
    try {
        j = json::parse(trimmed);
    } catch (const json::parse_error&) {
        // Not JSON after all (e.g. a Python dict literal); treat as code
        return output;
    }

    if (j.contains("error") && !j["error"].is_null()) {
        std::string message = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
        throw core::GenerationError("generator reported an error: " + message);
    }
    if (j.contains("code") && j["code"].is_string()) {
        return j["code"].get<std::string>();
    }
    throw core::GenerationError("generator response has neither 'code' nor 'error'");
}

// ============================================================================
// GENERATION
// ============================================================================

std::string ExternalCommandGenerator::Generate(const GenerationRequest& request,
                                               const core::CancellationToken& token) {
    utils::SubprocessOptions proc_options;
    proc_options.argv = options_.argv;
    proc_options.environment = options_.environment;
    proc_options.stdin_data = EncodeRequest(request);
    proc_options.max_output_bytes = options_.max_output_bytes;
    proc_options.limits.no_new_privileges = false;

    spdlog::debug("Requesting code from generator (iteration {})", request.iteration + 1);

    utils::Subprocess proc(proc_options);
    if (!proc.Start()) {
        throw core::GenerationError("failed to start generator: " + proc.GetError());
    }

    auto subscription = token.OnCancel([&proc] { proc.Kill(); });
    auto result = proc.Wait(options_.timeout);
    subscription.Reset();

    if (result.killed && token.IsCancelled()) {
        throw core::GenerationError("generation cancelled");
    }
    if (result.timed_out) {
        throw core::GenerationError("generator timed out after " +
                                    std::to_string(options_.timeout.count()) + "ms");
    }
    if (result.exit_code != 0) {
        std::string excerpt = utils::StringUtils::TruncateKeepTail(
            utils::StringUtils::Trim(result.stderr_output), kStderrExcerpt);
        throw core::GenerationError("generator exited with code " +
                                    std::to_string(result.exit_code) +
                                    (excerpt.empty() ? "" : ": " + excerpt));
    }
    if (result.output_truncated) {
        throw core::GenerationError("generator output exceeded " +
                                    std::to_string(options_.max_output_bytes) + " bytes");
    }

    return DecodeResponse(result.stdout_output);
}

} // namespace loop
} // namespace crucible
