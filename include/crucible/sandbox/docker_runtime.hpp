/**
 * @file docker_runtime.hpp
 * @brief Container-backed runtimes driven through the docker CLI
 *
 * Each runtime is one container created from the base image with a
 * long-running idle process. Payloads run through `docker exec`, files are
 * copied in with `docker cp`, and the container is force-removed on
 * Destroy().
 *
 * **Hardening applied at creation**:
 * - `--network none` unless the limits enable networking
 * - `--memory` / `--memory-swap` (no swap beyond the limit)
 * - `--cpus`, `--pids-limit`
 * - `--cap-drop ALL`, `--security-opt no-new-privileges`
 * - `--label crucible.managed=true` for stale-container cleanup
 *
 * @date 2025
 */

#pragma once

#include "crucible/sandbox/isolated_runtime.hpp"
#include "crucible/utils/subprocess.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace crucible {
namespace sandbox {

constexpr const char* kManagedLabel = "crucible.managed=true";

/**
 * @struct DockerBackendOptions
 * @brief docker CLI settings shared by all runtimes of a backend
 */
struct DockerBackendOptions {
    std::string docker_binary{"docker"};
    int pids_limit{64};
    std::size_t max_output_bytes{1024 * 1024};
    std::chrono::seconds command_timeout{60};   ///< For create / cp / rm, not for payloads
};

/**
 * @class DockerRuntime
 * @brief One container
 */
class DockerRuntime : public IsolatedRuntime {
public:
    DockerRuntime(DockerBackendOptions options, RuntimeSpec spec);
    ~DockerRuntime() override;

    const std::string& GetId() const override { return name_; }
    const std::string& GetBaseImage() const override { return spec_.image; }
    std::string GetWorkingDirectory() const override { return spec_.working_directory; }

    bool Create() override;
    bool ApplyLimits(const core::ResourceLimits& limits) override;
    bool InjectFiles(const std::map<std::string, std::string>& files) override;
    RuntimeOutput Run(const RuntimeCommand& command) override;
    void Terminate() override;
    void Destroy() override;

    std::string GetLastError() const override;

    /**
     * @brief `docker create` arguments for this runtime (without the binary)
     */
    std::vector<std::string> BuildCreateArgs() const;

    /**
     * @brief `docker exec` arguments for a command (without the binary)
     */
    std::vector<std::string> BuildExecArgs(const RuntimeCommand& command) const;

private:
    std::vector<std::string> GetResourceLimitArgs(const core::ResourceLimits& limits) const;
    utils::SubprocessResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    utils::SubprocessResult ExecuteInterruptibleCommand(const std::vector<std::string>& args);
    void SetLastError(const std::string& message);

    DockerBackendOptions options_;
    RuntimeSpec spec_;
    std::string name_;

    mutable std::mutex mutex_;
    utils::Subprocess* active_{nullptr};   ///< Client process of the running create, start or exec
    std::string last_error_;
    bool created_{false};
    bool destroyed_{false};
    std::atomic<bool> terminated_{false};
};

/**
 * @class DockerBackend
 * @brief Creates DockerRuntime instances and probes the daemon
 */
class DockerBackend : public RuntimeBackend {
public:
    explicit DockerBackend(DockerBackendOptions options = {});

    std::string GetName() const override { return "docker"; }

    /**
     * @brief `docker version` against the daemon
     */
    bool Ping() override;

    std::unique_ptr<IsolatedRuntime> CreateRuntime(const RuntimeSpec& spec) override;

    /**
     * @brief Force-remove containers left behind by crashed processes
     * @return Number of containers removed
     */
    int RemoveStaleRuntimes();

    /**
     * @brief Daemon version reported by the last successful Ping()
     */
    std::string GetServerVersion() const;

private:
    DockerBackendOptions options_;
    mutable std::mutex mutex_;
    std::string server_version_;
};

} // namespace sandbox
} // namespace crucible
