/**
 * @file execution_watchdog.hpp
 * @brief Wall-clock deadline and cancellation enforcement for one runtime
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/cancellation.hpp"
#include "crucible/sandbox/isolated_runtime.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace crucible {
namespace sandbox {

/**
 * @class ExecutionWatchdog
 * @brief Terminates a runtime when its deadline passes or the token fires
 *
 * The watchdog thread starts in the constructor and stops in Disarm() or
 * the destructor. It fires at most once.
 */
class ExecutionWatchdog {
public:
    enum class Outcome {
        NONE,       ///< Disarmed before anything happened
        DEADLINE,   ///< Wall-clock deadline passed
        CANCELLED   ///< Cancellation token fired
    };

    ExecutionWatchdog(IsolatedRuntime& runtime,
                      std::chrono::steady_clock::time_point deadline,
                      const core::CancellationToken& token);
    ~ExecutionWatchdog();

    ExecutionWatchdog(const ExecutionWatchdog&) = delete;
    ExecutionWatchdog& operator=(const ExecutionWatchdog&) = delete;

    /**
     * @brief Stop watching; the outcome is frozen afterwards
     */
    void Disarm();

    Outcome GetOutcome() const { return outcome_.load(); }
    bool HasFired() const { return GetOutcome() != Outcome::NONE; }

private:
    void WatchLoop();

    IsolatedRuntime& runtime_;
    std::chrono::steady_clock::time_point deadline_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool disarmed_{false};
    bool cancel_requested_{false};
    std::atomic<Outcome> outcome_{Outcome::NONE};

    core::CancellationToken::Subscription subscription_;
    std::thread thread_;
};

} // namespace sandbox
} // namespace crucible
