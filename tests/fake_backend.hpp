/**
 * @file fake_backend.hpp
 * @brief Scriptable in-memory runtime backend for deterministic tests
 *
 * @date 2025
 */

#pragma once

#include "crucible/sandbox/isolated_runtime.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace crucible {
namespace test {

/**
 * @struct FakeOutcome
 * @brief What one FakeRuntime::Run() call does
 */
struct FakeOutcome {
    sandbox::RuntimeOutput output;
    bool block_until_terminated{false};     ///< Simulate a hung payload
    std::chrono::milliseconds delay{0};     ///< Simulate work (cut short by Terminate())
};

inline FakeOutcome Exited(int exit_code, std::string out = "", std::string err = "") {
    FakeOutcome outcome;
    outcome.output.exit_code = exit_code;
    outcome.output.stdout_output = std::move(out);
    outcome.output.stderr_output = std::move(err);
    return outcome;
}

/**
 * @brief Receives the command and the files injected into the runtime
 */
using FakeResponder = std::function<FakeOutcome(const sandbox::RuntimeCommand&,
                                                const std::map<std::string, std::string>&)>;

class FakeBackend;

class FakeRuntime : public sandbox::IsolatedRuntime {
public:
    FakeRuntime(FakeBackend& backend, sandbox::RuntimeSpec spec);

    const std::string& GetId() const override { return id_; }
    const std::string& GetBaseImage() const override { return spec_.image; }
    std::string GetWorkingDirectory() const override { return spec_.working_directory; }

    bool Create() override;
    bool ApplyLimits(const core::ResourceLimits& limits) override;
    bool InjectFiles(const std::map<std::string, std::string>& files) override;
    sandbox::RuntimeOutput Run(const sandbox::RuntimeCommand& command) override;
    void Terminate() override;
    void Destroy() override;
    std::string GetLastError() const override { return last_error_; }

private:
    FakeBackend& backend_;
    sandbox::RuntimeSpec spec_;
    std::string id_;
    std::string last_error_;
    std::map<std::string, std::string> files_;
    bool created_{false};
    bool destroyed_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool terminated_{false};
};

/**
 * @class FakeBackend
 * @brief Counts runtimes and answers Run() through a responder
 */
class FakeBackend : public sandbox::RuntimeBackend {
public:
    FakeBackend() {
        responder_ = [](const sandbox::RuntimeCommand&, const std::map<std::string, std::string>&) {
            return Exited(0, "ok\n");
        };
    }

    std::string GetName() const override { return "fake"; }

    bool Ping() override {
        ++pings;
        return available.load();
    }

    std::unique_ptr<sandbox::IsolatedRuntime> CreateRuntime(const sandbox::RuntimeSpec& spec) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            specs_.push_back(spec);
        }
        return std::make_unique<FakeRuntime>(*this, spec);
    }

    void SetResponder(FakeResponder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    FakeOutcome Respond(const sandbox::RuntimeCommand& command,
                        const std::map<std::string, std::string>& files) {
        FakeResponder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
            responder = responder_;
        }
        return responder(command, files);
    }

    std::vector<sandbox::RuntimeCommand> GetCommands() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    std::vector<sandbox::RuntimeSpec> GetSpecs() {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs_;
    }

    int Live() const { return created.load() - destroyed.load(); }

    // Knobs
    std::atomic<bool> available{true};
    std::atomic<bool> fail_create{false};
    std::atomic<bool> fail_inject{false};
    std::atomic<bool> go_down_on_create{false};   ///< Backend dies while creating
    std::atomic<bool> block_create{false};        ///< Create() hangs until Terminate()

    // Counters
    std::atomic<int> pings{0};
    std::atomic<int> created{0};
    std::atomic<int> destroyed{0};
    std::atomic<int> limits_applied{0};
    std::atomic<int> terminations{0};
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

private:
    std::mutex mutex_;
    FakeResponder responder_;
    std::vector<sandbox::RuntimeCommand> commands_;
    std::vector<sandbox::RuntimeSpec> specs_;
};

// ============================================================================
// FakeRuntime
// ============================================================================

inline FakeRuntime::FakeRuntime(FakeBackend& backend, sandbox::RuntimeSpec spec)
    : backend_(backend)
    , spec_(std::move(spec))
    , id_(sandbox::GenerateRuntimeName("fake")) {}

inline bool FakeRuntime::Create() {
    if (backend_.go_down_on_create.load()) {
        backend_.available = false;
        last_error_ = "daemon went away";
        return false;
    }
    if (backend_.fail_create.load()) {
        last_error_ = "create failed";
        return false;
    }
    if (backend_.block_create.load()) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(10), [this] { return terminated_; });
        if (terminated_) {
            last_error_ = "creation interrupted";
            return false;
        }
    }
    created_ = true;
    ++backend_.created;
    return true;
}

inline bool FakeRuntime::ApplyLimits(const core::ResourceLimits& limits) {
    spec_.limits = limits;
    ++backend_.limits_applied;
    return true;
}

inline bool FakeRuntime::InjectFiles(const std::map<std::string, std::string>& files) {
    if (backend_.fail_inject.load()) {
        last_error_ = "inject failed";
        return false;
    }
    for (const auto& entry : files) {
        files_[entry.first] = entry.second;
    }
    return true;
}

inline sandbox::RuntimeOutput FakeRuntime::Run(const sandbox::RuntimeCommand& command) {
    FakeOutcome outcome = backend_.Respond(command, files_);

    int now_running = ++backend_.running;
    int seen = backend_.max_running.load();
    while (now_running > seen && !backend_.max_running.compare_exchange_weak(seen, now_running)) {
    }

    sandbox::RuntimeOutput output = outcome.output;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (outcome.block_until_terminated) {
            // Safety net so a broken watchdog fails the test instead of hanging it
            cv_.wait_for(lock, std::chrono::seconds(10), [this] { return terminated_; });
        } else if (outcome.delay.count() > 0) {
            cv_.wait_for(lock, outcome.delay, [this] { return terminated_; });
        }
        if (terminated_) {
            output.terminated = true;
            output.exit_code = 137;
        }
    }

    --backend_.running;
    return output;
}

inline void FakeRuntime::Terminate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_ = true;
    }
    ++backend_.terminations;
    cv_.notify_all();
}

inline void FakeRuntime::Destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    if (created_) {
        ++backend_.destroyed;
    }
}

} // namespace test
} // namespace crucible
