/**
 * @file external_generator.hpp
 * @brief CodeGenerator backed by a host command (LLM wrapper script, etc.)
 *
 * **Protocol**:
 * - stdin: one JSON object
 *   `{"session_id", "iteration", "task", "hints", "context", "prompt"}`
 * - stdout: `{"code": "..."}`, `{"error": "..."}` or raw code text
 * - a non-zero exit status is a generation failure
 *
 * The command runs on the host, not in the sandbox; it is trusted
 * configuration, not generated input.
 *
 * @date 2025
 */

#pragma once

#include "crucible/loop/interfaces.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace crucible {
namespace loop {

/**
 * @struct ExternalGeneratorOptions
 */
struct ExternalGeneratorOptions {
    std::vector<std::string> argv;                      ///< Command and arguments
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    std::map<std::string, std::string> environment;     ///< Added to the inherited environment
    std::size_t max_output_bytes{4 * 1024 * 1024};
};

/**
 * @class ExternalCommandGenerator
 * @brief Runs one child process per Generate() call
 */
class ExternalCommandGenerator : public CodeGenerator {
public:
    /**
     * @throws std::invalid_argument if argv is empty
     */
    explicit ExternalCommandGenerator(ExternalGeneratorOptions options);

    /**
     * @brief Convenience: run `sh -c <command_line>`
     */
    static ExternalGeneratorOptions FromCommandLine(const std::string& command_line);

    std::string Generate(const GenerationRequest& request,
                         const core::CancellationToken& token) override;

    /**
     * @brief JSON document written to the command's stdin
     */
    static std::string EncodeRequest(const GenerationRequest& request);

    /**
     * @brief Extract code from the command's stdout
     * @throws core::GenerationError on an error response or empty output
     */
    static std::string DecodeResponse(const std::string& output);

private:
    ExternalGeneratorOptions options_;
};

} // namespace loop
} // namespace crucible
