/**
 * @file loop_controller.hpp
 * @brief Generator-executor repair loop
 *
 * Drives an explicit state machine: generate code, execute it in the
 * sandbox, evaluate the result and, on failure, feed the history back to
 * the generator until the run succeeds or the iteration budget is spent.
 *
 * **Terminal outcomes**:
 * - SUCCEEDED: an attempt passed
 * - EXHAUSTED: max_iterations attempts all failed
 * - CANCELLED: generation error, invalid request, infrastructure fault,
 *   unavailable backend or external cancellation (see cancellation_reason)
 *
 * Only attempts whose payload actually ran are recorded as iterations.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/cancellation.hpp"
#include "crucible/core/resource_limits.hpp"
#include "crucible/loop/feedback_aggregator.hpp"
#include "crucible/loop/interfaces.hpp"
#include "crucible/loop/loop_types.hpp"
#include "crucible/session/execution_session.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace crucible {
namespace loop {

/**
 * @struct LoopOptions
 * @brief Per-run parameters of the loop
 */
struct LoopOptions {
    std::size_t max_iterations{5};
    core::PayloadKind payload_kind{core::PayloadKind::SCRIPT};
    std::map<std::string, std::string> auxiliary_files;
    std::vector<std::string> dependencies;
    core::ResourceLimits limits;
    std::string hint_target;                ///< Passed to the HintProvider; empty uses the task
};

/**
 * @class LoopController
 * @brief Runs one loop per Run() call; independent runs may share a controller
 *
 * **Usage**:
 * @code
 * LoopController controller(session, generator, FeedbackAggregator());
 * auto state = controller.StartLoop("print the first 10 primes", 5, limits);
 * if (state.status == LoopStatus::SUCCEEDED) {
 *     std::cout << state.final_code;
 * }
 * @endcode
 */
class LoopController {
public:
    /**
     * @param hints  Optional, may be null
     * @param events Optional, may be null
     * @throws std::invalid_argument if generator is null
     */
    LoopController(session::ExecutionSession& session,
                   std::shared_ptr<CodeGenerator> generator,
                   FeedbackAggregator aggregator,
                   std::shared_ptr<HintProvider> hints = nullptr,
                   std::shared_ptr<EventSink> events = nullptr);

    /**
     * @brief Run a script loop with default options
     */
    LoopState StartLoop(const std::string& task,
                        std::size_t max_iterations,
                        const core::ResourceLimits& limits,
                        const core::CancellationToken& token = core::CancellationToken());

    /**
     * @brief Run the loop to a terminal state
     *
     * Never throws; every outcome is described by the returned state.
     */
    LoopState Run(const std::string& task,
                  const LoopOptions& options,
                  const core::CancellationToken& token = core::CancellationToken());

private:
    struct RunContext;

    std::optional<std::string> FetchHints(const std::string& target);
    void Transition(RunContext& ctx, LoopPhase phase, const std::string& message,
                    std::optional<core::FailureKind> failure_kind = std::nullopt);
    void Cancel(RunContext& ctx, core::ErrorKind reason, const std::string& message);
    void Finish(RunContext& ctx, LoopStatus status, LoopPhase phase, const std::string& message);

    session::ExecutionSession& session_;
    std::shared_ptr<CodeGenerator> generator_;
    FeedbackAggregator aggregator_;
    std::shared_ptr<HintProvider> hints_;
    std::shared_ptr<EventSink> events_;
};

/**
 * @brief "loop_<unix-time>_<hex>"
 */
std::string GenerateSessionId();

} // namespace loop
} // namespace crucible
