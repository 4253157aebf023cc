/**
 * @file json_reporter.hpp
 * @brief JSON rendering of execution results, loop states and events
 *
 * Used by the CLI for its output, by JsonLinesEventSink for event streams
 * and for loop report files.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/execution_types.hpp"
#include "crucible/loop/loop_types.hpp"
#include "crucible/sandbox/sandbox_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace crucible {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON rendering
 */
struct JsonReporterConfig {
    bool pretty_print{true};      ///< Pretty print JSON
    int indent_size{2};           ///< Indentation spaces
    bool include_code{true};      ///< Include submitted code in iteration records
    bool include_output{true};    ///< Include stdout/stderr of results
};

/**
 * @class JsonReporter
 * @brief Stateless JSON renderer
 *
 * **Loop report layout**:
 * ```json
 * {
 *   "session_id": "loop_1735000000_a1b2c3",
 *   "status": "Succeeded",
 *   "max_iterations": 5,
 *   "iterations": [ { "index": 0, "code_digest": "...", "result": {...} } ],
 *   "final_code": "print(4)\n"
 * }
 * ```
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    nlohmann::json ToJson(const core::ExecutionResult& result) const;
    nlohmann::json ToJson(const loop::IterationRecord& record) const;
    nlohmann::json ToJson(const loop::LoopState& state) const;
    nlohmann::json ToJson(const loop::LoopEvent& event) const;
    nlohmann::json ToJson(const sandbox::SandboxStats& stats) const;

    /**
     * @brief Serialize according to the pretty-print settings
     */
    std::string Dump(const nlohmann::json& j) const;

    /**
     * @brief Single-line serialization, regardless of settings
     */
    static std::string DumpLine(const nlohmann::json& j);

    /**
     * @brief Write a loop report file
     * @return false if the file could not be written
     */
    bool WriteReport(const loop::LoopState& state, const std::filesystem::path& output_path) const;

    /**
     * @brief ISO-8601 UTC timestamp with milliseconds
     */
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace crucible
