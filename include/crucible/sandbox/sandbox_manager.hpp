/**
 * @file sandbox_manager.hpp
 * @brief Runtime acquisition, limit enforcement and guaranteed teardown
 *
 * The SandboxManager is the single entry point for executing untrusted
 * code. Every Submit() gets its own runtime, bounded by the request's
 * limits and destroyed before Submit() returns, whatever the outcome.
 *
 * **Submit() pipeline**:
 * ```
 * availability check ──✗──> RUNTIME_UNAVAILABLE
 *        │
 * acquire runtime (pool or fresh) ──✗──> RUNTIME_UNAVAILABLE / INTERNAL_ERROR
 *        │
 * arm watchdog (deadline = now + timeout)
 *        │
 * inject files ─> install dependencies ─> run payload
 *        │
 * classify: TIMEOUT > RESOURCE_EXCEEDED > NON_ZERO_EXIT
 *        │
 * destroy runtime (always)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/cancellation.hpp"
#include "crucible/core/execution_types.hpp"
#include "crucible/sandbox/isolated_runtime.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace crucible {
namespace sandbox {

/**
 * @struct SandboxStats
 * @brief Snapshot of manager counters
 */
struct SandboxStats {
    std::size_t active_runtimes{0};     ///< Runtimes leased to in-flight requests
    std::uint64_t total_executed{0};    ///< Requests that reached a runtime
    std::size_t pooled_runtimes{0};     ///< Pre-warmed runtimes waiting in the pool
    std::uint64_t total_timeouts{0};
    std::uint64_t total_failures{0};
};

/**
 * @struct SandboxManagerOptions
 */
struct SandboxManagerOptions {
    std::string image{"python:3.11-slim"};
    std::string python_binary{"python3"};
    std::size_t pool_size{0};                           ///< 0 disables pre-warming
    core::ResourceLimits pool_limits;                   ///< Limits pooled runtimes are created with
    std::string pool_working_directory{core::kDefaultWorkingDirectory};
};

/**
 * @class SandboxManager
 * @brief Thread-safe executor of ExecutionRequests
 *
 * **Usage**:
 * @code
 * auto backend = std::make_shared<DockerBackend>();
 * SandboxManager manager(backend, SandboxManagerOptions{});
 *
 * ExecutionRequest request;
 * request.code = "print('hello')";
 * auto result = manager.Submit(request);
 * @endcode
 */
class SandboxManager {
public:
    SandboxManager(std::shared_ptr<RuntimeBackend> backend, SandboxManagerOptions options);
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Execute one request in a fresh (or pre-warmed, single-use) runtime
     *
     * Never throws; every failure is reported through the result.
     */
    core::ExecutionResult Submit(const core::ExecutionRequest& request,
                                 const core::CancellationToken& token = core::CancellationToken());

    /**
     * @brief Liveness probe of the isolation backend
     */
    bool IsAvailable();

    SandboxStats GetStats() const;

    /**
     * @brief Fill the pool up to its configured size
     * @return Number of runtimes created
     */
    std::size_t WarmUp();

    /**
     * @brief Destroy pooled runtimes and refuse further submissions
     */
    void Shutdown();

    const std::string& GetBackendName() const { return backend_name_; }

private:
    class RuntimeLease;

    std::unique_ptr<IsolatedRuntime> AcquireRuntime(const core::ExecutionRequest& request,
                                                    const core::CancellationToken& token,
                                                    std::string* error);
    std::unique_ptr<IsolatedRuntime> TakePooledRuntime(const core::ExecutionRequest& request);
    std::unique_ptr<IsolatedRuntime> CreatePooledRuntime();

    core::ExecutionResult Execute(IsolatedRuntime& runtime,
                                  const core::ExecutionRequest& request,
                                  const core::CancellationToken& token);

    void RecordOutcome(const core::ExecutionResult& result);
    void RefillLoop();

    std::shared_ptr<RuntimeBackend> backend_;
    SandboxManagerOptions options_;
    std::string backend_name_;

    mutable std::mutex mutex_;
    std::condition_variable refill_cv_;
    std::deque<std::unique_ptr<IsolatedRuntime>> pool_;
    std::size_t active_runtimes_{0};
    std::uint64_t total_executed_{0};
    std::uint64_t total_timeouts_{0};
    std::uint64_t total_failures_{0};
    bool shut_down_{false};
    bool refill_requested_{false};

    std::thread refill_thread_;
};

} // namespace sandbox
} // namespace crucible
