/**
 * @file docker_runtime.cpp
 * @brief docker CLI backend
 *
 * **Command sequence per request**:
 * ```
 * docker create --name crucible_<ts>_<rand> ... <image> tail -f /dev/null
 * docker start  crucible_<ts>_<rand>
 * docker cp     <staging>/. crucible_<ts>_<rand>:/workspace
 * docker exec   -w /workspace crucible_<ts>_<rand> <argv...>
 * docker rm -f  crucible_<ts>_<rand>
 * ```
 * On timeout the watchdog issues `docker kill` and kills the exec client.
 * Terminate() during Create() kills the `docker create` / `docker start`
 * client, so a cancellation does not wait for an image pull.
 * An exec that ends with status 137 without a Terminate() was killed by the
 * kernel OOM killer inside the container's memory cgroup.
 *
 * @date 2025
 */

#include "crucible/sandbox/docker_runtime.hpp"
#include "crucible/utils/file_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace crucible {
namespace sandbox {

namespace {

constexpr int kExitKilled = 137;
constexpr std::chrono::seconds kPingTimeout{5};

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// DockerRuntime
// ============================================================================

DockerRuntime::DockerRuntime(DockerBackendOptions options, RuntimeSpec spec)
    : options_(std::move(options))
    , spec_(std::move(spec))
    , name_(GenerateRuntimeName("crucible")) {
}

DockerRuntime::~DockerRuntime() {
    Destroy();
}

std::vector<std::string> DockerRuntime::GetResourceLimitArgs(const core::ResourceLimits& limits) const {
    std::string memory = std::to_string(limits.GetMemoryBytes());
    return {
        "--memory", memory,
        "--memory-swap", memory,
        "--cpus", FormatCpus(limits.GetCpuShare())
    };
}

std::vector<std::string> DockerRuntime::BuildCreateArgs() const {
    std::vector<std::string> args = {
        "create",
        "--name", name_,
        "--label", kManagedLabel,
        "--network", spec_.limits.IsNetworkEnabled() ? "bridge" : "none"
    };

    auto limit_args = GetResourceLimitArgs(spec_.limits);
    args.insert(args.end(), limit_args.begin(), limit_args.end());

    args.insert(args.end(), {
        "--pids-limit", std::to_string(options_.pids_limit),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-w", spec_.working_directory,
        spec_.image,
        "tail", "-f", "/dev/null"
    });
    return args;
}

std::vector<std::string> DockerRuntime::BuildExecArgs(const RuntimeCommand& command) const {
    std::vector<std::string> args = {"exec", "-w", spec_.working_directory};
    for (const auto& [key, value] : command.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    args.push_back(name_);
    args.insert(args.end(), command.argv.begin(), command.argv.end());
    return args;
}

utils::SubprocessResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    utils::SubprocessOptions options;
    options.argv.push_back(options_.docker_binary);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.limits.no_new_privileges = false;

    spdlog::debug("Executing: {}", utils::StringUtils::FormatCommand(options.argv));
    return utils::RunCommand(options, options_.command_timeout);
}

utils::SubprocessResult DockerRuntime::ExecuteInterruptibleCommand(const std::vector<std::string>& args) {
    utils::SubprocessOptions options;
    options.argv.push_back(options_.docker_binary);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.limits.no_new_privileges = false;

    spdlog::debug("Executing: {}", utils::StringUtils::FormatCommand(options.argv));

    utils::Subprocess proc(options);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_.load()) {
            utils::SubprocessResult result;
            result.killed = true;
            result.error = "runtime terminated";
            return result;
        }
        if (!proc.Start()) {
            utils::SubprocessResult result;
            result.error = proc.GetError();
            return result;
        }
        active_ = &proc;
    }

    auto result = proc.Wait(options_.command_timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    active_ = nullptr;
    return result;
}

bool DockerRuntime::Create() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (created_ || destroyed_) {
            last_error_ = "runtime already created";
            return false;
        }
    }

    auto result = ExecuteInterruptibleCommand(BuildCreateArgs());
    if (terminated_.load()) {
        // The daemon may have registered the container before the client died
        std::lock_guard<std::mutex> lock(mutex_);
        created_ = true;
        last_error_ = "runtime creation cancelled";
        return false;
    }
    if (!result.started || result.exit_code != 0) {
        SetLastError("docker create failed: " +
                     utils::StringUtils::Trim(result.error.empty() ? result.stderr_output : result.error));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        created_ = true;
    }

    result = ExecuteInterruptibleCommand({"start", name_});
    if (terminated_.load()) {
        SetLastError("runtime creation cancelled");
        return false;
    }
    if (result.exit_code != 0) {
        SetLastError("docker start failed: " + utils::StringUtils::Trim(result.stderr_output));
        return false;
    }

    spdlog::debug("Container {} running ({})", name_, spec_.limits.ToString());
    return true;
}

bool DockerRuntime::ApplyLimits(const core::ResourceLimits& limits) {
    if (limits.IsNetworkEnabled() != spec_.limits.IsNetworkEnabled()) {
        SetLastError("network policy cannot change after creation");
        return false;
    }

    std::vector<std::string> args = {"update"};
    auto limit_args = GetResourceLimitArgs(limits);
    args.insert(args.end(), limit_args.begin(), limit_args.end());
    args.push_back(name_);

    auto result = ExecuteDockerCommand(args);
    if (result.exit_code != 0) {
        SetLastError("docker update failed: " + utils::StringUtils::Trim(result.stderr_output));
        return false;
    }

    spec_.limits = limits;
    return true;
}

bool DockerRuntime::InjectFiles(const std::map<std::string, std::string>& files) {
    if (files.empty()) {
        return true;
    }

    auto staging = utils::CreateTempDirectory("crucible_stage_");
    if (!staging) {
        SetLastError("cannot create staging directory");
        return false;
    }

    std::string error;
    bool ok = utils::WriteFileTree(*staging, files, &error);
    if (ok) {
        auto result = ExecuteDockerCommand({
            "cp",
            staging->string() + "/.",
            name_ + ":" + spec_.working_directory
        });
        if (result.exit_code != 0) {
            error = "docker cp failed: " + utils::StringUtils::Trim(result.stderr_output);
            ok = false;
        }
    }

    utils::RemoveDirectoryTree(*staging);

    if (!ok) {
        SetLastError(error);
        return false;
    }
    spdlog::debug("Copied {} file(s) into {}", files.size(), name_);
    return true;
}

RuntimeOutput DockerRuntime::Run(const RuntimeCommand& command) {
    RuntimeOutput output;

    utils::SubprocessOptions options;
    options.argv.push_back(options_.docker_binary);
    auto exec_args = BuildExecArgs(command);
    options.argv.insert(options.argv.end(), exec_args.begin(), exec_args.end());
    options.max_output_bytes = options_.max_output_bytes;
    options.limits.no_new_privileges = false;

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
    output.terminated = terminated_.load();
    output.resource_killed = !output.terminated && output.exit_code == kExitKilled;

    if (output.resource_killed) {
        spdlog::warn("Process in {} was killed by the memory limit", ShortRuntimeId(name_));
    }
    return output;
}

void DockerRuntime::Terminate() {
    terminated_.store(true);

    bool created = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        created = created_ && !destroyed_;
    }

    if (created) {
        auto result = ExecuteDockerCommand({"kill", name_});
        if (result.exit_code != 0) {
            spdlog::debug("docker kill {}: {}", name_, utils::StringUtils::Trim(result.stderr_output));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ != nullptr) {
        active_->Kill();
    }
}

void DockerRuntime::Destroy() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
        if (!created_) {
            return;
        }
    }

    auto result = ExecuteDockerCommand({"rm", "-f", "-v", name_});
    if (result.exit_code != 0) {
        spdlog::error("Failed to remove container {}: {}", name_,
                      utils::StringUtils::Trim(result.error.empty() ? result.stderr_output : result.error));
        return;
    }
    spdlog::debug("Removed container {}", name_);
}

std::string DockerRuntime::GetLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void DockerRuntime::SetLastError(const std::string& message) {
    spdlog::error("[{}] {}", name_, message);
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = message;
}

// ============================================================================
// DockerBackend
// ============================================================================

DockerBackend::DockerBackend(DockerBackendOptions options)
    : options_(std::move(options)) {
}

bool DockerBackend::Ping() {
    utils::SubprocessOptions options;
    options.argv = {options_.docker_binary, "version", "--format", "{{.Server.Version}}"};
    options.limits.no_new_privileges = false;

    auto result = utils::RunCommand(options, kPingTimeout);
    if (!result.started || result.timed_out || result.exit_code != 0) {
        spdlog::debug("Docker ping failed: {}",
                      utils::StringUtils::Trim(result.error.empty() ? result.stderr_output : result.error));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    server_version_ = utils::StringUtils::Trim(result.stdout_output);
    return true;
}

std::unique_ptr<IsolatedRuntime> DockerBackend::CreateRuntime(const RuntimeSpec& spec) {
    return std::make_unique<DockerRuntime>(options_, spec);
}

int DockerBackend::RemoveStaleRuntimes() {
    utils::SubprocessOptions options;
    options.argv = {options_.docker_binary, "ps", "-aq", "--filter",
                    std::string("label=") + kManagedLabel};
    options.limits.no_new_privileges = false;

    auto listed = utils::RunCommand(options, options_.command_timeout);
    if (listed.exit_code != 0) {
        spdlog::error("Failed to list containers: {}", utils::StringUtils::Trim(listed.stderr_output));
        return 0;
    }

    int removed = 0;
    for (const auto& id : utils::StringUtils::SplitLines(listed.stdout_output)) {
        std::string trimmed = utils::StringUtils::Trim(id);
        if (trimmed.empty()) {
            continue;
        }
        options.argv = {options_.docker_binary, "rm", "-f", "-v", trimmed};
        auto result = utils::RunCommand(options, options_.command_timeout);
        if (result.exit_code == 0) {
            spdlog::info("Removed stale container {}", trimmed);
            ++removed;
        } else {
            spdlog::warn("Could not remove container {}: {}", trimmed,
                         utils::StringUtils::Trim(result.stderr_output));
        }
    }
    return removed;
}

std::string DockerBackend::GetServerVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_version_;
}

} // namespace sandbox
} // namespace crucible
