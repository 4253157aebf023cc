/**
 * @file main.cpp
 * @brief Crucible command-line interface
 *
 * Composition root: loads the configuration, builds the isolation backend,
 * the sandbox manager, the execution session and the repair loop, and maps
 * outcomes to exit codes.
 *
 * **Exit codes**:
 * - 0: success (payload passed, loop succeeded, backend available)
 * - 1: execution failure, exhausted or cancelled loop, unavailable backend
 * - 2: invalid request or configuration
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "crucible/core/cancellation.hpp"
#include "crucible/core/config.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/loop/event_sinks.hpp"
#include "crucible/loop/external_generator.hpp"
#include "crucible/loop/feedback_aggregator.hpp"
#include "crucible/loop/loop_controller.hpp"
#include "crucible/loop/static_hint_provider.hpp"
#include "crucible/reporters/json_reporter.hpp"
#include "crucible/sandbox/docker_runtime.hpp"
#include "crucible/sandbox/process_runtime.hpp"
#include "crucible/sandbox/sandbox_manager.hpp"
#include "crucible/session/execution_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

using json = nlohmann::json;
using namespace crucible;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInvalid = 2;

/*******************************************************************************
 * Signal Handling
 ******************************************************************************/

std::atomic<bool> g_stop_requested{false};

extern "C" void HandleStopSignal(int) {
    g_stop_requested.store(true);
}

/**
 * @class SignalMonitor
 * @brief Turns SIGINT/SIGTERM into a cancellation of the given token
 *
 * Signal handlers only set a flag; a watcher thread performs the actual
 * cancellation outside of signal context.
 */
class SignalMonitor {
public:
    explicit SignalMonitor(core::CancellationToken token)
        : token_(std::move(token)) {
        struct sigaction action{};
        action.sa_handler = HandleStopSignal;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        watcher_ = std::thread([this] {
            while (!done_.load()) {
                if (g_stop_requested.exchange(false)) {
                    spdlog::warn("Interrupt received, cancelling...");
                    token_.Cancel();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~SignalMonitor() {
        done_.store(true);
        if (watcher_.joinable()) {
            watcher_.join();
        }
    }

    SignalMonitor(const SignalMonitor&) = delete;
    SignalMonitor& operator=(const SignalMonitor&) = delete;

private:
    core::CancellationToken token_;
    std::atomic<bool> done_{false};
    std::thread watcher_;
};

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::ValidationError("cannot read file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * @brief "relative/path=host/path" pairs into an auxiliary file map
 */
std::map<std::string, std::string> LoadAuxiliaryFiles(const std::vector<std::string>& specs) {
    std::map<std::string, std::string> files;
    for (const auto& spec : specs) {
        auto eq = spec.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
            throw core::ValidationError("expected REL=HOST_PATH, got '" + spec + "'");
        }
        files[spec.substr(0, eq)] = ReadTextFile(spec.substr(eq + 1));
    }
    return files;
}

core::PayloadKind ParseKindOrThrow(const std::string& name) {
    auto kind = core::ParsePayloadKind(name);
    if (!kind) {
        throw core::ValidationError("unknown payload kind: '" + name + "'");
    }
    return *kind;
}

/**
 * @struct LimitOverrides
 * @brief Per-invocation limit flags layered on top of the configuration
 */
struct LimitOverrides {
    std::optional<int> timeout_seconds;
    std::optional<std::string> memory;
    std::optional<double> cpus;
    bool network{false};

    void Register(CLI::App* cmd) {
        cmd->add_option("--timeout", timeout_seconds, "Wall-clock timeout in seconds");
        cmd->add_option("--memory", memory, "Memory limit (e.g. 256m, 1g)");
        cmd->add_option("--cpus", cpus, "CPU share (e.g. 0.5)");
        cmd->add_flag("--network", network, "Enable network access inside the runtime");
    }

    void ApplyTo(core::EngineConfig& config) const {
        if (timeout_seconds) config.execution_timeout_seconds = *timeout_seconds;
        if (memory) config.memory_limit = *memory;
        if (cpus) config.cpu_limit = *cpus;
        if (network) config.network_disabled = false;
    }
};

/*******************************************************************************
 * Composition
 ******************************************************************************/

std::shared_ptr<sandbox::RuntimeBackend> CreateBackend(const core::EngineConfig& config) {
    if (config.backend == "process") {
        sandbox::ProcessBackendOptions options;
        options.max_output_bytes = config.max_output_bytes;
        options.interpreter = config.python_binary;
        return std::make_shared<sandbox::ProcessBackend>(options);
    }

    sandbox::DockerBackendOptions options;
    options.docker_binary = config.docker_binary;
    options.pids_limit = config.max_processes;
    options.max_output_bytes = config.max_output_bytes;
    return std::make_shared<sandbox::DockerBackend>(options);
}

sandbox::SandboxManagerOptions BuildManagerOptions(const core::EngineConfig& config) {
    sandbox::SandboxManagerOptions options;
    options.image = config.backend == "process" ? "host" : config.docker_image;
    options.python_binary = config.python_binary;
    options.pool_size = static_cast<std::size_t>(config.pool_size);
    options.pool_limits = config.ToResourceLimits();
    return options;
}

session::SessionOptions BuildSessionOptions(const core::EngineConfig& config) {
    session::SessionOptions options;
    options.test_markers = config.test_markers;
    return options;
}

void ConfigureLogging(bool verbose, const std::string& level) {
    // stdout carries JSON results; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("crucible"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::from_str(level));
    }
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunStatus(const core::EngineConfig& config, bool show_config) {
    auto backend = CreateBackend(config);
    sandbox::SandboxManager manager(backend, BuildManagerOptions(config));
    reporters::JsonReporter reporter;

    bool available = manager.IsAvailable();

    json j;
    j["backend"] = manager.GetBackendName();
    j["available"] = available;
    j["stats"] = reporter.ToJson(manager.GetStats());
    if (auto docker = std::dynamic_pointer_cast<sandbox::DockerBackend>(backend)) {
        j["server_version"] = docker->GetServerVersion();
    }
    if (auto process = std::dynamic_pointer_cast<sandbox::ProcessBackend>(backend)) {
        j["network_isolation"] = process->HasNetworkIsolation();
    }
    if (show_config) {
        j["config"] = json::parse(config.ToJson());
    }
    std::cout << reporter.Dump(j) << std::endl;

    manager.Shutdown();
    return available ? kExitSuccess : kExitFailure;
}

int RunCleanup(const core::EngineConfig& config) {
    if (config.backend != "docker") {
        spdlog::info("Nothing to clean up for the {} backend", config.backend);
        return kExitSuccess;
    }
    sandbox::DockerBackendOptions options;
    options.docker_binary = config.docker_binary;
    sandbox::DockerBackend backend(options);
    if (!backend.Ping()) {
        spdlog::error("docker is not available");
        return kExitFailure;
    }
    int removed = backend.RemoveStaleRuntimes();
    spdlog::info("✓ Removed {} stale runtime(s)", removed);
    return kExitSuccess;
}

struct ExecArgs {
    std::string code_file;
    std::string code;
    std::string kind{"script"};
    std::vector<std::string> files;
    std::vector<std::string> dependencies;
};

int RunExec(const core::EngineConfig& config, const ExecArgs& args,
            const core::CancellationToken& token) {
    if (args.code.empty() == args.code_file.empty()) {
        throw core::ValidationError("provide exactly one of <file> or --code");
    }
    std::string code = args.code_file.empty() ? args.code : ReadTextFile(args.code_file);
    auto kind = ParseKindOrThrow(args.kind);
    auto files = LoadAuxiliaryFiles(args.files);

    auto backend = CreateBackend(config);
    sandbox::SandboxManager manager(backend, BuildManagerOptions(config));
    if (config.pool_size > 0) {
        manager.WarmUp();
    }
    session::ExecutionSession session(manager, BuildSessionOptions(config));
    reporters::JsonReporter reporter;

    auto result = session.Run(kind, code, files, args.dependencies, config.ToResourceLimits(), token);
    std::cout << reporter.Dump(reporter.ToJson(result)) << std::endl;

    manager.Shutdown();
    return result.success ? kExitSuccess : kExitFailure;
}

struct LoopArgs {
    std::string task;
    std::string task_file;
    std::string generator;
    std::string kind{"script"};
    std::optional<int> max_iterations;
    std::string hints_file;
    std::string target;
    std::vector<std::string> files;
    std::vector<std::string> dependencies;
    bool events{false};
    std::string report;
};

int RunLoop(const core::EngineConfig& config, const LoopArgs& args,
            const core::CancellationToken& token) {
    if (args.task.empty() == args.task_file.empty()) {
        throw core::ValidationError("provide exactly one of --task or --task-file");
    }
    std::string task = args.task_file.empty() ? args.task : ReadTextFile(args.task_file);

    loop::LoopOptions options;
    options.max_iterations = static_cast<std::size_t>(
        args.max_iterations ? *args.max_iterations : config.max_iterations);
    options.payload_kind = ParseKindOrThrow(args.kind);
    options.auxiliary_files = LoadAuxiliaryFiles(args.files);
    options.dependencies = args.dependencies;
    options.limits = config.ToResourceLimits();
    options.hint_target = args.target;

    std::shared_ptr<loop::HintProvider> hints;
    if (!args.hints_file.empty()) {
        hints = std::make_shared<loop::StaticHintProvider>(
            loop::StaticHintProvider::FromFile(args.hints_file));
    }

    auto generator = std::make_shared<loop::ExternalCommandGenerator>(
        loop::ExternalCommandGenerator::FromCommandLine(args.generator));

    std::vector<std::shared_ptr<loop::EventSink>> sinks{std::make_shared<loop::LoggingEventSink>()};
    std::shared_ptr<loop::AsyncEventSink> stream_sink;
    if (args.events) {
        stream_sink = std::make_shared<loop::AsyncEventSink>(
            std::make_shared<loop::JsonLinesEventSink>(std::cout));
        sinks.push_back(stream_sink);
    }
    auto events = std::make_shared<loop::FanOutEventSink>(sinks);

    auto backend = CreateBackend(config);
    sandbox::SandboxManager manager(backend, BuildManagerOptions(config));
    if (config.pool_size > 0) {
        manager.WarmUp();
    }
    session::ExecutionSession session(manager, BuildSessionOptions(config));

    loop::FeedbackOptions feedback_options;
    feedback_options.window = config.feedback_window;
    feedback_options.max_output_chars = config.feedback_max_output_chars;

    loop::LoopController controller(session, generator, loop::FeedbackAggregator(feedback_options),
                                    hints, events);

    auto state = controller.Run(task, options, token);

    if (stream_sink) {
        stream_sink->Stop();
    }
    manager.Shutdown();

    reporters::JsonReporter reporter;
    if (!args.report.empty() && !reporter.WriteReport(state, args.report)) {
        spdlog::warn("Loop report was not written");
    }
    if (!args.events) {
        std::cout << reporter.Dump(reporter.ToJson(state)) << std::endl;
    }

    if (state.status == loop::LoopStatus::SUCCEEDED) {
        return kExitSuccess;
    }
    if (state.cancellation_reason == core::ErrorKind::VALIDATION_ERROR) {
        return kExitInvalid;
    }
    return kExitFailure;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Crucible - sandboxed execution and generate-execute-repair loop"};
    app.require_subcommand(1);

    std::string config_path;
    std::string backend_override;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-b,--backend", backend_override, "Isolation backend")
        ->check(CLI::IsMember({"docker", "process"}));
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // status
    bool show_config = false;
    auto* status_cmd = app.add_subcommand("status", "Probe the backend and print manager stats");
    status_cmd->add_flag("--show-config", show_config, "Include the effective configuration");

    // cleanup
    auto* cleanup_cmd = app.add_subcommand("cleanup", "Remove leftover runtimes of earlier runs");

    // exec
    ExecArgs exec_args;
    LimitOverrides exec_limits;
    auto* exec_cmd = app.add_subcommand("exec", "Run one payload in a fresh runtime");
    exec_cmd->add_option("file", exec_args.code_file, "File containing the payload")
        ->check(CLI::ExistingFile);
    exec_cmd->add_option("--code", exec_args.code, "Payload given inline");
    exec_cmd->add_option("-k,--kind", exec_args.kind, "script | shell | test")
        ->default_val("script");
    exec_cmd->add_option("-f,--file", exec_args.files, "Auxiliary file as REL=HOST_PATH");
    exec_cmd->add_option("-d,--dep", exec_args.dependencies, "Package to install first");
    exec_limits.Register(exec_cmd);

    // loop
    LoopArgs loop_args;
    LimitOverrides loop_limits;
    auto* loop_cmd = app.add_subcommand("loop", "Generate, execute and repair until the code passes");
    loop_cmd->add_option("-t,--task", loop_args.task, "Task description");
    loop_cmd->add_option("--task-file", loop_args.task_file, "File containing the task description")
        ->check(CLI::ExistingFile);
    loop_cmd->add_option("-g,--generator", loop_args.generator,
                         "Host command that reads a JSON request and prints code")
        ->required();
    loop_cmd->add_option("-k,--kind", loop_args.kind, "script | shell | test")
        ->default_val("script");
    loop_cmd->add_option("-n,--max-iterations", loop_args.max_iterations, "Iteration budget");
    loop_cmd->add_option("--hints-file", loop_args.hints_file, "JSON file of context hints")
        ->check(CLI::ExistingFile);
    loop_cmd->add_option("--target", loop_args.target, "Hint lookup key (defaults to the task)");
    loop_cmd->add_option("-f,--file", loop_args.files, "Auxiliary file as REL=HOST_PATH");
    loop_cmd->add_option("-d,--dep", loop_args.dependencies, "Package to install before each run");
    loop_cmd->add_flag("--events", loop_args.events, "Stream loop events as JSON lines on stdout");
    loop_cmd->add_option("-r,--report", loop_args.report, "Write the final loop state to this file");
    loop_limits.Register(loop_cmd);

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging(verbose, "info");

    try {
        std::optional<std::filesystem::path> config_file;
        if (!config_path.empty()) {
            config_file = config_path;
        }
        auto config = core::EngineConfig::Load(config_file);
        if (!backend_override.empty()) {
            config.backend = backend_override;
        }
        exec_limits.ApplyTo(config);
        loop_limits.ApplyTo(config);
        config.Validate();

        if (!verbose) {
            spdlog::set_level(spdlog::level::from_str(config.log_level));
        }

        core::CancellationToken token;
        SignalMonitor signals(token);

        if (*status_cmd) {
            return RunStatus(config, show_config);
        }
        if (*cleanup_cmd) {
            return RunCleanup(config);
        }
        if (*exec_cmd) {
            return RunExec(config, exec_args, token);
        }
        if (*loop_cmd) {
            return RunLoop(config, loop_args, token);
        }
        return kExitInvalid;

    } catch (const core::ValidationError& e) {
        spdlog::error("Invalid request: {}", e.what());
        return kExitInvalid;
    } catch (const core::ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return kExitInvalid;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailure;
    }
}
