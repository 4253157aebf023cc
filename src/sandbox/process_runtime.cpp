/**
 * @file process_runtime.cpp
 * @brief Local process-jail backend
 *
 * **Limit mapping**:
 * - memory      -> RLIMIT_AS
 * - cpu         -> RLIMIT_CPU = ceil(timeout) * max(1, ceil(share)) + grace seconds
 * - network off -> private network namespace (loopback only)
 * - file writes -> RLIMIT_FSIZE, RLIMIT_NOFILE
 *
 * The CPU share is not enforced as a rate by this backend. RLIMIT_CPU sits
 * above the wall-clock budget and only stops runaway processes that escape
 * the watchdog, so a busy payload ends as a timeout.
 *
 * A child that dies from SIGKILL, SIGXCPU or SIGXFSZ without the watchdog
 * having fired was stopped by one of these limits. RLIMIT_AS refuses
 * allocations instead of killing, so a non-zero exit whose stderr reports a
 * failed allocation is classified the same way.
 *
 * @date 2025
 */

#include "crucible/sandbox/process_runtime.hpp"
#include "crucible/utils/file_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <csignal>

namespace crucible {
namespace sandbox {

namespace {

constexpr std::chrono::seconds kPingTimeout{5};
constexpr std::int64_t kCpuGraceSeconds = 2;

// Messages printed by common runtimes when an allocation is refused
constexpr const char* kAllocationFailureMarkers[] = {
    "MemoryError",
    "Cannot allocate memory",
    "std::bad_alloc",
    "out of memory",
};

bool IsLimitSignal(int sig) {
    return sig == SIGKILL || sig == SIGXCPU || sig == SIGXFSZ;
}

bool ReportsAllocationFailure(const std::string& stderr_output) {
    for (const char* marker : kAllocationFailureMarkers) {
        if (utils::StringUtils::Contains(stderr_output, marker)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// ProcessRuntime
// ============================================================================

ProcessRuntime::ProcessRuntime(ProcessBackendOptions options, RuntimeSpec spec,
                               bool network_isolation_available)
    : options_(std::move(options))
    , spec_(std::move(spec))
    , network_isolation_available_(network_isolation_available)
    , id_(GenerateRuntimeName("local")) {
}

ProcessRuntime::~ProcessRuntime() {
    Destroy();
}

std::string ProcessRuntime::GetWorkingDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scratch_ ? scratch_->string() : std::string();
}

utils::ProcessLimits ProcessRuntime::BuildProcessLimits() const {
    utils::ProcessLimits limits;
    double timeout_seconds = static_cast<double>(spec_.limits.GetWallClockTimeout().count()) / 1000.0;
    auto cores = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::ceil(spec_.limits.GetCpuShare())));
    limits.cpu_seconds = static_cast<std::int64_t>(std::ceil(timeout_seconds)) * cores + kCpuGraceSeconds;
    limits.address_space_bytes = spec_.limits.GetMemoryBytes();
    limits.file_size_bytes = options_.max_file_size_bytes;
    limits.open_files = options_.max_open_files;
    limits.no_new_privileges = true;
    return limits;
}

bool ProcessRuntime::Create() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scratch_ || destroyed_) {
        last_error_ = "runtime already created";
        return false;
    }

    scratch_ = utils::CreateTempDirectory("crucible_" + id_ + "_");
    if (!scratch_) {
        last_error_ = "cannot create scratch directory";
        spdlog::error("[{}] {}", id_, last_error_);
        return false;
    }

    spdlog::debug("Runtime {} using {} ({})", id_, scratch_->string(), spec_.limits.ToString());
    return true;
}

bool ProcessRuntime::ApplyLimits(const core::ResourceLimits& limits) {
    if (limits.IsNetworkEnabled() != spec_.limits.IsNetworkEnabled()) {
        SetLastError("network policy cannot change after creation");
        return false;
    }
    spec_.limits = limits;
    return true;
}

bool ProcessRuntime::InjectFiles(const std::map<std::string, std::string>& files) {
    auto root = GetWorkingDirectory();
    if (root.empty()) {
        SetLastError("runtime not created");
        return false;
    }

    std::string error;
    if (!utils::WriteFileTree(root, files, &error)) {
        SetLastError(error);
        return false;
    }
    return true;
}

RuntimeOutput ProcessRuntime::Run(const RuntimeCommand& command) {
    RuntimeOutput output;

    auto root = GetWorkingDirectory();
    if (root.empty()) {
        output.error = "runtime not created";
        return output;
    }

    utils::SubprocessOptions options;
    options.argv = command.argv;
    options.working_directory = root;
    options.environment = command.environment;
    options.environment["HOME"] = root;
    options.environment["TMPDIR"] = root;
    options.environment["PYTHONDONTWRITEBYTECODE"] = "1";
    options.environment["PYTHONUNBUFFERED"] = "1";
    options.limits = BuildProcessLimits();
    options.isolate_network = !spec_.limits.IsNetworkEnabled() && network_isolation_available_;
    options.max_output_bytes = options_.max_output_bytes;

    utils::Subprocess proc(options);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_.load()) {
            output.terminated = true;
            output.error = "runtime terminated";
            return output;
        }
        if (!proc.Start()) {
            output.error = proc.GetError();
            last_error_ = output.error;
            return output;
        }
        active_ = &proc;
    }

    auto result = proc.Wait();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = nullptr;
    }

    output.exit_code = result.exit_code;
    output.stdout_output = std::move(result.stdout_output);
    output.stderr_output = std::move(result.stderr_output);
    output.output_truncated = result.output_truncated;
    output.elapsed = result.elapsed;
    output.terminated = terminated_.load() || result.killed;
    output.resource_killed = !output.terminated && IsLimitSignal(result.term_signal);

    if (output.resource_killed) {
        spdlog::warn("Process in {} stopped by resource limit (signal {})",
                     ShortRuntimeId(id_), result.term_signal);
    } else if (!output.terminated && output.exit_code != 0 &&
               ReportsAllocationFailure(output.stderr_output)) {
        output.resource_killed = true;
        spdlog::warn("Process in {} exceeded its memory limit", ShortRuntimeId(id_));
    }
    return output;
}

void ProcessRuntime::Terminate() {
    terminated_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ != nullptr) {
        active_->Kill();
    }
}

void ProcessRuntime::Destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    if (scratch_) {
        utils::RemoveDirectoryTree(*scratch_);
        spdlog::debug("Removed scratch directory of {}", id_);
    }
}

std::string ProcessRuntime::GetLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void ProcessRuntime::SetLastError(const std::string& message) {
    spdlog::error("[{}] {}", id_, message);
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = message;
}

// ============================================================================
// ProcessBackend
// ============================================================================

ProcessBackend::ProcessBackend(ProcessBackendOptions options)
    : options_(std::move(options))
    , network_isolation_available_(utils::ProbeNetworkIsolation()) {

    if (!network_isolation_available_) {
        spdlog::warn("DEGRADED ISOLATION: network namespaces unavailable, "
                     "local runtimes share the host network");
    }
}

bool ProcessBackend::Ping() {
    utils::SubprocessOptions options;
    options.argv = {"sh", "-c", "command -v \"$0\" >/dev/null", options_.interpreter};

    auto result = utils::RunCommand(options, kPingTimeout);
    if (!result.started || result.exit_code != 0) {
        spdlog::debug("Interpreter '{}' not found", options_.interpreter);
        return false;
    }
    return true;
}

std::unique_ptr<IsolatedRuntime> ProcessBackend::CreateRuntime(const RuntimeSpec& spec) {
    return std::make_unique<ProcessRuntime>(options_, spec, network_isolation_available_);
}

} // namespace sandbox
} // namespace crucible
