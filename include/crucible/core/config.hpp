/**
 * @file config.hpp
 * @brief Engine configuration layered from defaults, file and environment
 *
 * Precedence, lowest first: compiled defaults, JSON config file,
 * environment variables, command-line flags (applied by the caller).
 *
 * **Recognized environment variables**:
 * - SANDBOX_TIMEOUT            execution timeout in seconds
 * - SANDBOX_MEMORY_LIMIT       docker-style size, e.g. "512m"
 * - SANDBOX_CPU_LIMIT          CPU share, e.g. "1.0"
 * - SANDBOX_NETWORK_DISABLED   true/false
 * - MAX_ITERATIONS             repair loop budget
 * - CRUCIBLE_BACKEND           "docker" or "process"
 * - CRUCIBLE_DOCKER_IMAGE      base image for docker runtimes
 * - CRUCIBLE_POOL_SIZE         pre-warmed runtimes to keep
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/resource_limits.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @struct EngineConfig
 * @brief All tunables of the execution engine and the repair loop
 */
struct EngineConfig {
    // Resource limits
    int execution_timeout_seconds{30};
    std::string memory_limit{"512m"};
    double cpu_limit{1.0};
    bool network_disabled{true};

    // Repair loop
    int max_iterations{5};
    std::size_t feedback_window{3};              ///< Attempts kept in repair context
    std::size_t feedback_max_output_chars{2000}; ///< Per-stream cap in repair context

    // Backend
    std::string backend{"docker"};               ///< "docker" or "process"
    std::string docker_binary{"docker"};
    std::string docker_image{"python:3.11-slim"};
    std::string python_binary{"python3"};
    int pool_size{0};
    int max_processes{64};                       ///< Docker --pids-limit
    std::size_t max_output_bytes{1024 * 1024};   ///< Per-stream capture limit

    // Test suites
    std::vector<std::string> test_markers;       ///< Empty selects the built-in markers

    std::string log_level{"info"};

    /**
     * @brief Defaults <- optional JSON file <- environment
     * @throws ConfigError on unreadable files or invalid values
     */
    static EngineConfig Load(const std::optional<std::filesystem::path>& config_file);

    /**
     * @brief Overlay keys found in a JSON document
     * @throws ConfigError on parse errors or mistyped values
     */
    void MergeJson(const std::string& json_text);
    void MergeJsonFile(const std::filesystem::path& path);

    /**
     * @brief Overlay recognized environment variables
     */
    void MergeEnvironment();

    /**
     * @throws ConfigError if a value is out of range
     */
    void Validate() const;

    ResourceLimits ToResourceLimits() const;

    std::string ToJson(int indent = 2) const;
};

} // namespace core
} // namespace crucible
