/**
 * @file isolated_runtime.hpp
 * @brief Abstraction over isolation backends
 *
 * An IsolatedRuntime is one ephemeral execution environment: it is created,
 * receives files, runs commands, and is destroyed. It is never shared
 * between requests. A RuntimeBackend knows how to probe the isolation
 * technology and manufacture runtimes.
 *
 * **Lifecycle**:
 * ```
 * CreateRuntime(spec) -> Create() -> [ApplyLimits()] -> InjectFiles()
 *                     -> Run() ... -> Destroy()
 * ```
 * Terminate() may be called from any thread at any point; it forcibly
 * stops the running command and makes later Run() calls fail fast.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/resource_limits.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace crucible {
namespace sandbox {

/**
 * @struct RuntimeSpec
 * @brief Parameters a runtime is created with
 */
struct RuntimeSpec {
    std::string image;                          ///< Base image (pool key)
    core::ResourceLimits limits;
    std::string working_directory{"/workspace"};
};

/**
 * @struct RuntimeCommand
 * @brief Command executed inside a runtime
 */
struct RuntimeCommand {
    std::vector<std::string> argv;
    std::map<std::string, std::string> environment;
};

/**
 * @struct RuntimeOutput
 * @brief Raw outcome of one RuntimeCommand
 */
struct RuntimeOutput {
    int exit_code{-1};
    std::string stdout_output;
    std::string stderr_output;
    bool terminated{false};         ///< Stopped by Terminate()
    bool resource_killed{false};    ///< Stopped by the limit enforcement layer (kill or refused allocation)
    bool output_truncated{false};
    std::chrono::milliseconds elapsed{0};
    std::string error;              ///< Set when the command could not be launched
};

/**
 * @class IsolatedRuntime
 * @brief One ephemeral execution environment
 */
class IsolatedRuntime {
public:
    virtual ~IsolatedRuntime() = default;

    virtual const std::string& GetId() const = 0;
    virtual const std::string& GetBaseImage() const = 0;

    /**
     * @brief Absolute working directory as seen by commands in the runtime
     */
    virtual std::string GetWorkingDirectory() const = 0;

    /**
     * @brief Materialize the environment
     * @return false on failure (see GetLastError())
     */
    virtual bool Create() = 0;

    /**
     * @brief Re-apply CPU and memory limits to an existing runtime
     *
     * Network policy is fixed at creation time.
     */
    virtual bool ApplyLimits(const core::ResourceLimits& limits) = 0;

    /**
     * @brief Write files relative to the working directory
     */
    virtual bool InjectFiles(const std::map<std::string, std::string>& files) = 0;

    /**
     * @brief Run a command to completion (or until Terminate())
     */
    virtual RuntimeOutput Run(const RuntimeCommand& command) = 0;

    /**
     * @brief Forcibly stop whatever is running (thread-safe)
     */
    virtual void Terminate() = 0;

    /**
     * @brief Release every resource held by the runtime (idempotent)
     */
    virtual void Destroy() = 0;

    virtual std::string GetLastError() const = 0;
};

/**
 * @class RuntimeBackend
 * @brief Factory and liveness probe for one isolation technology
 */
class RuntimeBackend {
public:
    virtual ~RuntimeBackend() = default;

    virtual std::string GetName() const = 0;

    /**
     * @brief Lightweight liveness probe
     */
    virtual bool Ping() = 0;

    /**
     * @brief Construct a runtime object; the caller must still call Create()
     */
    virtual std::unique_ptr<IsolatedRuntime> CreateRuntime(const RuntimeSpec& spec) = 0;
};

/**
 * @brief Unique runtime name: <prefix>_<timestamp>_<random>
 */
std::string GenerateRuntimeName(const std::string& prefix);

constexpr std::size_t kShortRuntimeIdLength = 12;

/**
 * @brief Runtime id as it appears in log lines (first 12 characters)
 */
std::string ShortRuntimeId(const std::string& id);

} // namespace sandbox
} // namespace crucible
