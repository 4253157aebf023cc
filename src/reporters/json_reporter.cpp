/**
 * @file json_reporter.cpp
 * @brief JSON rendering implementation
 *
 * **Execution result layout**:
 * ```json
 * {
 *   "success": false,
 *   "exit_code": 1,
 *   "elapsed_ms": 143,
 *   "failure_kind": "NonZeroExit",
 *   "diagnostic": "process exited with code 1",
 *   "cancelled": false,
 *   "output_truncated": false,
 *   "runtime_id": "crucible_1735000000_0a1b2c",
 *   "stdout": "",
 *   "stderr": "Traceback (most recent call last): ..."
 * }
 * ```
 *
 * @date 2025
 */

#include "crucible/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace crucible {
namespace reporters {

using json = nlohmann::json;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {}

// ============================================================================
// EXECUTION
// ============================================================================

json JsonReporter::ToJson(const core::ExecutionResult& result) const {
    json j;
    j["success"] = result.success;
    j["exit_code"] = result.exit_code;
    j["elapsed_ms"] = result.elapsed.count();
    j["failure_kind"] = result.failure_kind
        ? json(core::ToString(*result.failure_kind))
        : json(nullptr);
    j["diagnostic"] = result.diagnostic;
    j["cancelled"] = result.cancelled;
    j["output_truncated"] = result.output_truncated;
    j["runtime_id"] = result.runtime_id;

    if (config_.include_output) {
        j["stdout"] = result.stdout_output;
        j["stderr"] = result.stderr_output;
    }
    return j;
}

json JsonReporter::ToJson(const sandbox::SandboxStats& stats) const {
    return {
        {"active_runtimes", stats.active_runtimes},
        {"total_executed", stats.total_executed},
        {"pooled_runtimes", stats.pooled_runtimes},
        {"total_timeouts", stats.total_timeouts},
        {"total_failures", stats.total_failures}
    };
}

// ============================================================================
// LOOP
// ============================================================================

json JsonReporter::ToJson(const loop::IterationRecord& record) const {
    const auto& request = record.request;

    json j;
    j["index"] = record.index;
    j["generated_at"] = FormatTimestamp(record.generated_at);
    j["code_digest"] = record.code_digest;
    j["payload_kind"] = core::ToString(request.payload_kind);
    j["limits"] = request.limits.ToString();
    j["dependencies"] = request.dependencies;

    json files = json::array();
    for (const auto& entry : request.auxiliary_files) {
        files.push_back(entry.first);
    }
    j["auxiliary_files"] = files;

    if (config_.include_code) {
        j["code"] = request.code;
    }
    j["result"] = ToJson(record.result);
    return j;
}

json JsonReporter::ToJson(const loop::LoopState& state) const {
    json j;
    j["session_id"] = state.session_id;
    j["status"] = loop::ToString(state.status);
    j["max_iterations"] = state.max_iterations;
    j["cancellation_reason"] = state.cancellation_reason
        ? json(core::ToString(*state.cancellation_reason))
        : json(nullptr);
    j["error_message"] = state.error_message;

    json iterations = json::array();
    for (const auto& record : state.iterations) {
        iterations.push_back(ToJson(record));
    }
    j["iterations"] = iterations;

    j["last_result"] = state.last_result ? ToJson(*state.last_result) : json(nullptr);
    j["final_code"] = state.final_code.empty() ? json(nullptr) : json(state.final_code);
    return j;
}

json JsonReporter::ToJson(const loop::LoopEvent& event) const {
    json j;
    j["timestamp"] = FormatTimestamp(event.timestamp);
    j["session_id"] = event.session_id;
    j["phase"] = loop::ToString(event.phase);
    j["iteration"] = event.iteration;
    j["message"] = event.message;
    if (event.failure_kind) {
        j["failure_kind"] = core::ToString(*event.failure_kind);
    }
    if (event.cancellation_reason) {
        j["cancellation_reason"] = core::ToString(*event.cancellation_reason);
    }
    return j;
}

// ============================================================================
// OUTPUT
// ============================================================================

std::string JsonReporter::Dump(const json& j) const {
    // Replace invalid UTF-8 from process output instead of throwing
    return config_.pretty_print
        ? j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JsonReporter::DumpLine(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::WriteReport(const loop::LoopState& state,
                               const std::filesystem::path& output_path) const {
    std::ofstream file(output_path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }

    file << Dump(ToJson(state)) << "\n";
    file.close();
    if (!file) {
        spdlog::error("Failed to write report: {}", output_path.string());
        return false;
    }

    spdlog::info("✓ Loop report written to {}", output_path.string());
    return true;
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace reporters
} // namespace crucible
