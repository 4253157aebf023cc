/**
 * @file process_runtime.hpp
 * @brief Local process-jail runtimes for hosts without a container daemon
 *
 * Each runtime owns a private scratch directory that stands in for the
 * working directory. Commands run as direct children with POSIX rlimits
 * and, when the kernel allows it, in a private network namespace.
 *
 * This backend bounds resources and confines file writes by convention
 * only; it does not provide filesystem isolation. Prefer DockerBackend for
 * untrusted code.
 *
 * @date 2025
 */

#pragma once

#include "crucible/sandbox/isolated_runtime.hpp"
#include "crucible/utils/subprocess.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace crucible {
namespace sandbox {

/**
 * @struct ProcessBackendOptions
 */
struct ProcessBackendOptions {
    std::size_t max_output_bytes{1024 * 1024};
    std::int64_t max_file_size_bytes{1024LL * 1024 * 1024};
    int max_open_files{256};
    std::string interpreter{"python3"};   ///< Checked by Ping()
};

/**
 * @class ProcessRuntime
 * @brief One scratch directory plus the children running in it
 */
class ProcessRuntime : public IsolatedRuntime {
public:
    ProcessRuntime(ProcessBackendOptions options, RuntimeSpec spec, bool network_isolation_available);
    ~ProcessRuntime() override;

    const std::string& GetId() const override { return id_; }
    const std::string& GetBaseImage() const override { return spec_.image; }

    /**
     * @brief The scratch directory (empty before Create())
     */
    std::string GetWorkingDirectory() const override;

    bool Create() override;
    bool ApplyLimits(const core::ResourceLimits& limits) override;
    bool InjectFiles(const std::map<std::string, std::string>& files) override;
    RuntimeOutput Run(const RuntimeCommand& command) override;
    void Terminate() override;
    void Destroy() override;

    std::string GetLastError() const override;

    /**
     * @brief rlimits derived from the current resource limits
     */
    utils::ProcessLimits BuildProcessLimits() const;

private:
    void SetLastError(const std::string& message);

    ProcessBackendOptions options_;
    RuntimeSpec spec_;
    bool network_isolation_available_;
    std::string id_;

    mutable std::mutex mutex_;
    std::optional<std::filesystem::path> scratch_;
    utils::Subprocess* active_{nullptr};
    std::string last_error_;
    bool destroyed_{false};
    std::atomic<bool> terminated_{false};
};

/**
 * @class ProcessBackend
 * @brief Creates ProcessRuntime instances
 */
class ProcessBackend : public RuntimeBackend {
public:
    explicit ProcessBackend(ProcessBackendOptions options = {});

    std::string GetName() const override { return "process"; }

    /**
     * @brief Checks that the interpreter can be started
     */
    bool Ping() override;

    std::unique_ptr<IsolatedRuntime> CreateRuntime(const RuntimeSpec& spec) override;

    bool HasNetworkIsolation() const { return network_isolation_available_; }

private:
    ProcessBackendOptions options_;
    bool network_isolation_available_;
};

} // namespace sandbox
} // namespace crucible
