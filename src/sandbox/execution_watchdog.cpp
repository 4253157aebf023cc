/**
 * @file execution_watchdog.cpp
 * @brief Deadline thread for sandbox executions
 *
 * @date 2025
 */

#include "crucible/sandbox/execution_watchdog.hpp"

#include <spdlog/spdlog.h>

namespace crucible {
namespace sandbox {

ExecutionWatchdog::ExecutionWatchdog(IsolatedRuntime& runtime,
                                     std::chrono::steady_clock::time_point deadline,
                                     const core::CancellationToken& token)
    : runtime_(runtime)
    , deadline_(deadline) {

    subscription_ = token.OnCancel([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
        cv_.notify_all();
    });

    thread_ = std::thread(&ExecutionWatchdog::WatchLoop, this);
}

ExecutionWatchdog::~ExecutionWatchdog() {
    Disarm();
    subscription_.Reset();
}

void ExecutionWatchdog::Disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disarmed_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void ExecutionWatchdog::WatchLoop() {
    Outcome outcome = Outcome::NONE;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool woken = cv_.wait_until(lock, deadline_, [this]() {
            return disarmed_ || cancel_requested_;
        });

        if (disarmed_) {
            return;
        }
        outcome = (woken && cancel_requested_) ? Outcome::CANCELLED : Outcome::DEADLINE;
        outcome_.store(outcome);
    }

    if (outcome == Outcome::DEADLINE) {
        spdlog::warn("Runtime {} exceeded its wall-clock limit, terminating",
                     ShortRuntimeId(runtime_.GetId()));
    } else {
        spdlog::info("Runtime {} cancelled, terminating", ShortRuntimeId(runtime_.GetId()));
    }
    runtime_.Terminate();
}

} // namespace sandbox
} // namespace crucible
