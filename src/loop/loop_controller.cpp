/**
 * @file loop_controller.cpp
 * @brief Repair loop state machine
 *
 * @date 2025
 */

#include "crucible/loop/loop_controller.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/sandbox/isolated_runtime.hpp"
#include "crucible/utils/hash_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace crucible {
namespace loop {

std::string GenerateSessionId() {
    return sandbox::GenerateRuntimeName("loop");
}

/**
 * @struct LoopController::RunContext
 * @brief Mutable bookkeeping of one Run() call
 */
struct LoopController::RunContext {
    LoopState state;
    std::size_t index{0};
};

LoopController::LoopController(session::ExecutionSession& session,
                               std::shared_ptr<CodeGenerator> generator,
                               FeedbackAggregator aggregator,
                               std::shared_ptr<HintProvider> hints,
                               std::shared_ptr<EventSink> events)
    : session_(session)
    , generator_(std::move(generator))
    , aggregator_(std::move(aggregator))
    , hints_(std::move(hints))
    , events_(std::move(events)) {

    if (!generator_) {
        throw std::invalid_argument("LoopController requires a code generator");
    }
}

LoopState LoopController::StartLoop(const std::string& task,
                                    std::size_t max_iterations,
                                    const core::ResourceLimits& limits,
                                    const core::CancellationToken& token) {
    LoopOptions options;
    options.max_iterations = max_iterations;
    options.limits = limits;
    return Run(task, options, token);
}

// ============================================================================
// STATE MACHINE
// ============================================================================

LoopState LoopController::Run(const std::string& task,
                              const LoopOptions& options,
                              const core::CancellationToken& token) {
    RunContext ctx;
    ctx.state.session_id = GenerateSessionId();
    ctx.state.max_iterations = options.max_iterations;

    spdlog::info("Starting loop {} (max iterations: {})",
                 ctx.state.session_id, options.max_iterations);

    if (options.max_iterations == 0) {
        Cancel(ctx, core::ErrorKind::VALIDATION_ERROR, "max_iterations must be at least 1");
        return ctx.state;
    }
    if (token.IsCancelled()) {
        Cancel(ctx, core::ErrorKind::USER_ABORT, "cancelled before start");
        return ctx.state;
    }
    if (!session_.IsBackendAvailable()) {
        Cancel(ctx, core::ErrorKind::RUNTIME_UNAVAILABLE, "isolation backend is not available");
        return ctx.state;
    }

    auto hints = FetchHints(options.hint_target.empty() ? task : options.hint_target);

    while (!ctx.state.IsTerminal()) {
        // GENERATING
        Transition(ctx, LoopPhase::GENERATING,
                   "attempt " + std::to_string(ctx.index + 1) + " of " +
                   std::to_string(options.max_iterations));

        GenerationRequest generation;
        generation.session_id = ctx.state.session_id;
        generation.iteration = ctx.index;
        generation.task = task;
        generation.hints = hints;
        generation.feedback = aggregator_.BuildContext(ctx.state.iterations);
        generation.prompt = aggregator_.BuildPrompt(task, hints, ctx.state.iterations);

        std::string code;
        try {
            code = utils::StringUtils::ExtractCodeBlock(generator_->Generate(generation, token));
        } catch (const core::GenerationError& e) {
            if (token.IsCancelled()) {
                Cancel(ctx, core::ErrorKind::USER_ABORT, "cancelled during generation");
            } else {
                Cancel(ctx, core::ErrorKind::GENERATION_ERROR, e.what());
            }
            break;
        } catch (const std::exception& e) {
            Cancel(ctx, core::ErrorKind::GENERATION_ERROR,
                   std::string("generator failed: ") + e.what());
            break;
        }
        auto generated_at = std::chrono::system_clock::now();

        if (token.IsCancelled()) {
            Cancel(ctx, core::ErrorKind::USER_ABORT, "cancelled during generation");
            break;
        }
        if (utils::StringUtils::Trim(code).empty()) {
            Cancel(ctx, core::ErrorKind::GENERATION_ERROR, "generator returned no code");
            break;
        }

        // EXECUTING
        Transition(ctx, LoopPhase::EXECUTING,
                   "running " + core::ToString(options.payload_kind) + " payload");

        if (!session_.IsBackendAvailable()) {
            Cancel(ctx, core::ErrorKind::RUNTIME_UNAVAILABLE, "isolation backend became unavailable");
            break;
        }

        auto request = session_.BuildRequest(options.payload_kind, code, options.auxiliary_files,
                                             options.dependencies, options.limits);
        core::ExecutionResult result;
        try {
            result = session_.Execute(request, token);
        } catch (const core::ValidationError& e) {
            Cancel(ctx, core::ErrorKind::VALIDATION_ERROR, e.what());
            break;
        } catch (const std::exception& e) {
            Cancel(ctx, core::ErrorKind::INTERNAL_ERROR, e.what());
            break;
        }
        ctx.state.last_result = result;

        if (result.cancelled || token.IsCancelled()) {
            Cancel(ctx, core::ErrorKind::USER_ABORT, "cancelled during execution");
            break;
        }
        if (result.failure_kind &&
            (*result.failure_kind == core::FailureKind::RUNTIME_UNAVAILABLE ||
             *result.failure_kind == core::FailureKind::INTERNAL_ERROR)) {
            Cancel(ctx, core::ToErrorKind(*result.failure_kind), result.diagnostic);
            break;
        }

        // EVALUATING
        Transition(ctx, LoopPhase::EVALUATING,
                   result.success ? "attempt passed" : "attempt failed",
                   result.failure_kind);

        IterationRecord record;
        record.index = ctx.index;
        record.request = request;
        record.result = result;
        record.generated_at = generated_at;
        record.code_digest = utils::HashUtils::ComputeCodeFingerprint(code);
        ctx.state.iterations.push_back(std::move(record));

        if (result.success) {
            ctx.state.final_code = code;
            Finish(ctx, LoopStatus::SUCCEEDED, LoopPhase::SUCCEEDED,
                   "succeeded after " + std::to_string(ctx.state.iterations.size()) + " attempt(s)");
            break;
        }
        if (ctx.index + 1 >= options.max_iterations) {
            Finish(ctx, LoopStatus::EXHAUSTED, LoopPhase::EXHAUSTED,
                   "no passing attempt within " + std::to_string(options.max_iterations) +
                   " iteration(s)");
            break;
        }

        // REQUESTING_REPAIR
        Transition(ctx, LoopPhase::REQUESTING_REPAIR,
                   result.diagnostic.empty() ? "requesting repair" : result.diagnostic,
                   result.failure_kind);
        ++ctx.index;
    }

    return ctx.state;
}

// ============================================================================
// TRANSITIONS
// ============================================================================

void LoopController::Transition(RunContext& ctx, LoopPhase phase, const std::string& message,
                                std::optional<core::FailureKind> failure_kind) {
    spdlog::debug("[{}] {} ({})", ctx.state.session_id, ToString(phase), message);

    if (!events_) {
        return;
    }

    LoopEvent event;
    event.session_id = ctx.state.session_id;
    event.phase = phase;
    event.iteration = ctx.index;
    event.timestamp = std::chrono::system_clock::now();
    event.message = message;
    event.failure_kind = failure_kind;
    event.cancellation_reason = ctx.state.cancellation_reason;

    try {
        events_->Emit(event);
    } catch (const std::exception& e) {
        spdlog::warn("Event sink failed: {}", e.what());
    }
}

void LoopController::Cancel(RunContext& ctx, core::ErrorKind reason, const std::string& message) {
    ctx.state.cancellation_reason = reason;
    ctx.state.error_message = message;
    spdlog::warn("✗ Loop {} cancelled: {} ({})",
                 ctx.state.session_id, core::ToString(reason), message);
    Finish(ctx, LoopStatus::CANCELLED, LoopPhase::CANCELLED, message);
}

void LoopController::Finish(RunContext& ctx, LoopStatus status, LoopPhase phase,
                            const std::string& message) {
    ctx.state.status = status;
    if (status == LoopStatus::SUCCEEDED) {
        spdlog::info("✓ Loop {} {}", ctx.state.session_id, message);
    } else if (status == LoopStatus::EXHAUSTED) {
        ctx.state.error_message = message;
        spdlog::info("✗ Loop {} exhausted: {}", ctx.state.session_id, message);
    }

    std::optional<core::FailureKind> failure_kind;
    if (status != LoopStatus::SUCCEEDED && ctx.state.last_result) {
        failure_kind = ctx.state.last_result->failure_kind;
    }
    Transition(ctx, phase, message, failure_kind);
}

// ============================================================================
// HINTS
// ============================================================================

std::optional<std::string> LoopController::FetchHints(const std::string& target) {
    if (!hints_) {
        return std::nullopt;
    }
    try {
        auto hints = hints_->ContextHints(target);
        if (hints) {
            spdlog::debug("Loaded {} characters of context hints", hints->size());
        }
        return hints;
    } catch (const std::exception& e) {
        spdlog::warn("Hint provider failed, continuing without hints: {}", e.what());
        return std::nullopt;
    }
}

} // namespace loop
} // namespace crucible
