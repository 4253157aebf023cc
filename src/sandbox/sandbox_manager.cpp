/**
 * @file sandbox_manager.cpp
 * @brief Implementation of the sandbox execution pipeline
 *
 * **Runtime ownership**:
 * A runtime handed out by AcquireRuntime() is immediately wrapped in a
 * RuntimeLease. The lease destroys the runtime and releases the active
 * count in its destructor, so teardown happens on normal return, on early
 * return and during exception unwinding alike.
 *
 * **Pooling**:
 * Pooled runtimes are created ahead of time with networking disabled and
 * the default working directory. They are still single-use: a pooled
 * runtime is removed from the pool when leased and destroyed afterwards.
 * A background thread refills the pool after each lease. Requests that
 * enable networking or use another working directory bypass the pool.
 *
 * **Cancellation**:
 * The request's token is observed from the moment a runtime is created:
 * AcquireRuntime() terminates a runtime whose creation is still in flight,
 * and the ExecutionWatchdog takes over once it exists.
 *
 * **Locking**:
 * One mutex guards the pool and the counters. It is never held across a
 * backend call.
 *
 * @date 2025
 */

#include "crucible/sandbox/sandbox_manager.hpp"
#include "crucible/sandbox/execution_watchdog.hpp"
#include "crucible/sandbox/payload_staging.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crucible {
namespace sandbox {

// ============================================================================
// RuntimeLease
// ============================================================================

class SandboxManager::RuntimeLease {
public:
    RuntimeLease(SandboxManager& manager, std::unique_ptr<IsolatedRuntime> runtime)
        : manager_(manager)
        , runtime_(std::move(runtime)) {
        std::lock_guard<std::mutex> lock(manager_.mutex_);
        ++manager_.active_runtimes_;
    }

    ~RuntimeLease() {
        try {
            runtime_->Destroy();
        } catch (const std::exception& e) {
            spdlog::error("Failed to destroy runtime {}: {}", runtime_->GetId(), e.what());
        }
        runtime_.reset();

        std::lock_guard<std::mutex> lock(manager_.mutex_);
        --manager_.active_runtimes_;
    }

    RuntimeLease(const RuntimeLease&) = delete;
    RuntimeLease& operator=(const RuntimeLease&) = delete;

    IsolatedRuntime& Get() { return *runtime_; }

private:
    SandboxManager& manager_;
    std::unique_ptr<IsolatedRuntime> runtime_;
};

// ============================================================================
// Construction
// ============================================================================

SandboxManager::SandboxManager(std::shared_ptr<RuntimeBackend> backend, SandboxManagerOptions options)
    : backend_(std::move(backend))
    , options_(std::move(options)) {

    if (!backend_) {
        throw std::invalid_argument("SandboxManager requires a runtime backend");
    }
    backend_name_ = backend_->GetName();

    if (options_.pool_size > 0) {
        refill_thread_ = std::thread(&SandboxManager::RefillLoop, this);
    }

    spdlog::info("Sandbox manager initialized (backend: {}, image: {}, pool: {})",
                 backend_name_, options_.image, options_.pool_size);
}

SandboxManager::~SandboxManager() {
    Shutdown();
}

// ============================================================================
// Submission
// ============================================================================

core::ExecutionResult SandboxManager::Submit(const core::ExecutionRequest& request,
                                             const core::CancellationToken& token) {
    auto started = std::chrono::steady_clock::now();
    core::ExecutionResult result;
    bool executed = false;

    bool shut_down = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down = shut_down_;
    }

    if (shut_down) {
        result = core::MakeFailureResult(core::FailureKind::RUNTIME_UNAVAILABLE,
                                         "sandbox manager has been shut down");
    } else if (token.IsCancelled()) {
        result.cancelled = true;
        result.diagnostic = "execution cancelled before start";
    } else if (!backend_->Ping()) {
        spdlog::error("{} backend is not available", backend_name_);
        result = core::MakeFailureResult(core::FailureKind::RUNTIME_UNAVAILABLE,
                                         backend_name_ + " backend is not available");
    } else {
        try {
            std::string error;
            auto runtime = AcquireRuntime(request, token, &error);
            if (!runtime && token.IsCancelled()) {
                spdlog::info("Runtime creation cancelled");
                result.cancelled = true;
                result.diagnostic = "execution cancelled during runtime creation";
            } else if (!runtime) {
                bool alive = backend_->Ping();
                spdlog::error("Failed to create runtime: {}", error);
                result = core::MakeFailureResult(
                    alive ? core::FailureKind::INTERNAL_ERROR : core::FailureKind::RUNTIME_UNAVAILABLE,
                    "failed to create runtime: " + error);
            } else {
                RuntimeLease lease(*this, std::move(runtime));
                if (token.IsCancelled()) {
                    result.cancelled = true;
                    result.diagnostic = "execution cancelled during runtime creation";
                } else {
                    executed = true;
                    result = Execute(lease.Get(), request, token);
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Sandbox execution failed: {}", e.what());
            result = core::MakeFailureResult(core::FailureKind::INTERNAL_ERROR,
                                             std::string("internal error: ") + e.what());
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (executed) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_executed_;
    }
    RecordOutcome(result);

    if (result.success) {
        spdlog::info("✓ Execution succeeded in {}ms", result.elapsed.count());
    } else if (result.failure_kind) {
        spdlog::info("✗ Execution failed: {} ({})", core::ToString(*result.failure_kind), result.diagnostic);
    } else {
        spdlog::info("✗ Execution unsuccessful: {}", result.diagnostic);
    }
    return result;
}

core::ExecutionResult SandboxManager::Execute(IsolatedRuntime& runtime,
                                              const core::ExecutionRequest& request,
                                              const core::CancellationToken& token) {
    core::ExecutionResult result;
    result.runtime_id = runtime.GetId();

    spdlog::info("Executing {} payload in {} ({})",
                 core::ToString(request.payload_kind), runtime.GetId(), request.limits.ToString());

    // The clock starts once the runtime exists; staging, installation and
    // the payload share one budget
    auto deadline = std::chrono::steady_clock::now() + request.limits.GetWallClockTimeout();
    ExecutionWatchdog watchdog(runtime, deadline, token);

    StagedPayload staged = StagePayload(request, runtime.GetWorkingDirectory(), options_.python_binary);

    RuntimeOutput output;
    bool injected = runtime.InjectFiles(staged.files);
    if (!injected && !watchdog.HasFired()) {
        watchdog.Disarm();
        result.failure_kind = core::FailureKind::INTERNAL_ERROR;
        result.diagnostic = "failed to stage files: " + runtime.GetLastError();
        return result;
    }

    if (injected && staged.install && !watchdog.HasFired()) {
        spdlog::debug("Installing {} dependencies", request.dependencies.size());
        output = runtime.Run(*staged.install);

        if (!watchdog.HasFired() && (!output.error.empty() || output.exit_code != 0)) {
            watchdog.Disarm();
            if (!output.error.empty()) {
                result.failure_kind = core::FailureKind::INTERNAL_ERROR;
                result.diagnostic = "failed to launch dependency installation: " + output.error;
                return result;
            }
            result.stdout_output = std::move(output.stdout_output);
            result.stderr_output = std::move(output.stderr_output);
            result.exit_code = output.exit_code;
            result.output_truncated = output.output_truncated;
            result.failure_kind = core::ClassifyFailure(false, output.resource_killed, output.exit_code);
            result.diagnostic = "dependency installation failed with exit code " +
                                std::to_string(output.exit_code);
            return result;
        }
    }

    if (injected && !watchdog.HasFired()) {
        output = runtime.Run(staged.command);
    }

    watchdog.Disarm();
    auto outcome = watchdog.GetOutcome();

    if (outcome == ExecutionWatchdog::Outcome::NONE && !output.error.empty()) {
        result.failure_kind = core::FailureKind::INTERNAL_ERROR;
        result.diagnostic = "failed to launch payload: " + output.error;
        return result;
    }

    // Partial output captured before a kill is kept
    result.stdout_output = std::move(output.stdout_output);
    result.stderr_output = std::move(output.stderr_output);
    result.exit_code = output.exit_code;
    result.output_truncated = output.output_truncated;

    if (outcome == ExecutionWatchdog::Outcome::CANCELLED) {
        result.cancelled = true;
        result.diagnostic = "execution cancelled";
        return result;
    }

    result.failure_kind = core::ClassifyFailure(outcome == ExecutionWatchdog::Outcome::DEADLINE,
                                                output.resource_killed, output.exit_code);
    result.success = !result.failure_kind.has_value();

    if (result.failure_kind) {
        switch (*result.failure_kind) {
            case core::FailureKind::TIMEOUT:
                result.diagnostic = "execution exceeded the wall-clock limit of " +
                                    std::to_string(request.limits.GetWallClockTimeout().count()) + "ms";
                break;
            case core::FailureKind::RESOURCE_EXCEEDED:
                result.diagnostic = "process was killed after exceeding its resource limits";
                break;
            case core::FailureKind::NON_ZERO_EXIT:
                result.diagnostic = "process exited with code " + std::to_string(output.exit_code);
                break;
            case core::FailureKind::RUNTIME_UNAVAILABLE:
            case core::FailureKind::INTERNAL_ERROR:
                break;
        }
    }
    return result;
}

void SandboxManager::RecordOutcome(const core::ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.failure_kind == core::FailureKind::TIMEOUT) {
        ++total_timeouts_;
    }
    if (!result.success) {
        ++total_failures_;
    }
}

// ============================================================================
// Runtime acquisition
// ============================================================================

std::unique_ptr<IsolatedRuntime> SandboxManager::AcquireRuntime(const core::ExecutionRequest& request,
                                                                const core::CancellationToken& token,
                                                                std::string* error) {
    if (auto pooled = TakePooledRuntime(request)) {
        return pooled;
    }

    RuntimeSpec spec;
    spec.image = options_.image;
    spec.limits = request.limits;
    spec.working_directory = request.working_directory;

    auto runtime = backend_->CreateRuntime(spec);
    if (!runtime) {
        *error = "backend returned no runtime";
        return nullptr;
    }

    // Creation may pull an image; a cancellation must not wait for it
    bool created = false;
    {
        auto subscription = token.OnCancel([&runtime]() { runtime->Terminate(); });
        created = runtime->Create();
    }
    if (!created) {
        *error = runtime->GetLastError();
        runtime->Destroy();
        return nullptr;
    }
    return runtime;
}

std::unique_ptr<IsolatedRuntime> SandboxManager::TakePooledRuntime(const core::ExecutionRequest& request) {
    if (options_.pool_size == 0 ||
        request.limits.IsNetworkEnabled() ||
        request.working_directory != options_.pool_working_directory) {
        return nullptr;
    }

    std::unique_ptr<IsolatedRuntime> runtime;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pool_.empty()) {
            return nullptr;
        }
        runtime = std::move(pool_.front());
        pool_.pop_front();
        refill_requested_ = true;
    }
    refill_cv_.notify_all();

    if (!runtime->ApplyLimits(request.limits)) {
        spdlog::warn("Discarding pooled runtime {}: {}", runtime->GetId(), runtime->GetLastError());
        runtime->Destroy();
        return nullptr;
    }

    spdlog::debug("Using pre-warmed runtime {}", runtime->GetId());
    return runtime;
}

std::unique_ptr<IsolatedRuntime> SandboxManager::CreatePooledRuntime() {
    RuntimeSpec spec;
    spec.image = options_.image;
    spec.limits = options_.pool_limits.WithNetwork(false);
    spec.working_directory = options_.pool_working_directory;

    auto runtime = backend_->CreateRuntime(spec);
    if (!runtime) {
        return nullptr;
    }
    if (!runtime->Create()) {
        spdlog::warn("Failed to pre-warm runtime: {}", runtime->GetLastError());
        runtime->Destroy();
        return nullptr;
    }
    return runtime;
}

std::size_t SandboxManager::WarmUp() {
    std::size_t created = 0;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_ || pool_.size() >= options_.pool_size) {
                break;
            }
        }

        auto runtime = CreatePooledRuntime();
        if (!runtime) {
            break;
        }

        std::unique_ptr<IsolatedRuntime> surplus;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_ || pool_.size() >= options_.pool_size) {
                surplus = std::move(runtime);
            } else {
                pool_.push_back(std::move(runtime));
                ++created;
            }
        }
        if (surplus) {
            surplus->Destroy();
            break;
        }
    }

    if (created > 0) {
        spdlog::debug("Pre-warmed {} runtime(s)", created);
    }
    return created;
}

void SandboxManager::RefillLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        refill_cv_.wait(lock, [this]() { return shut_down_ || refill_requested_; });
        if (shut_down_) {
            return;
        }
        refill_requested_ = false;

        lock.unlock();
        WarmUp();
        lock.lock();
    }
}

// ============================================================================
// Status
// ============================================================================

bool SandboxManager::IsAvailable() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return false;
        }
    }
    return backend_->Ping();
}

SandboxStats SandboxManager::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SandboxStats stats;
    stats.active_runtimes = active_runtimes_;
    stats.total_executed = total_executed_;
    stats.pooled_runtimes = pool_.size();
    stats.total_timeouts = total_timeouts_;
    stats.total_failures = total_failures_;
    return stats;
}

void SandboxManager::Shutdown() {
    std::deque<std::unique_ptr<IsolatedRuntime>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        drained.swap(pool_);
    }
    refill_cv_.notify_all();

    if (refill_thread_.joinable()) {
        refill_thread_.join();
    }

    for (auto& runtime : drained) {
        runtime->Destroy();
    }
    if (!drained.empty()) {
        spdlog::info("Released {} pooled runtime(s)", drained.size());
    }
}

} // namespace sandbox
} // namespace crucible
