/**
 * @file interfaces.hpp
 * @brief Collaborators the loop consumes but does not implement
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/cancellation.hpp"
#include "crucible/loop/loop_types.hpp"

#include <optional>
#include <string>

namespace crucible {
namespace loop {

/**
 * @struct GenerationRequest
 * @brief Input handed to a CodeGenerator
 */
struct GenerationRequest {
    std::string session_id;
    std::size_t iteration{0};
    std::string task;                   ///< Original task description
    std::optional<std::string> hints;   ///< Domain context, if any
    std::string feedback;               ///< Repair context, empty on the first attempt
    std::string prompt;                 ///< task + hints + feedback, ready to send
};

/**
 * @class CodeGenerator
 * @brief Produces (or repairs) code
 */
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;

    /**
     * @return Generated code, possibly wrapped in a markdown fence
     * @throws core::GenerationError if no code can be produced
     */
    virtual std::string Generate(const GenerationRequest& request,
                                 const core::CancellationToken& token) = 0;
};

/**
 * @class HintProvider
 * @brief Optional domain context for a target (e.g. a knowledge graph)
 *
 * Failures are never fatal: nullopt or an exception only omit the hints.
 */
class HintProvider {
public:
    virtual ~HintProvider() = default;

    virtual std::optional<std::string> ContextHints(const std::string& target) = 0;
};

/**
 * @class EventSink
 * @brief Best-effort observer of loop transitions
 *
 * Emit() is called on the loop's thread; slow sinks should buffer.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void Emit(const LoopEvent& event) = 0;
};

} // namespace loop
} // namespace crucible
