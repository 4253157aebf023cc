/**
 * @file feedback_aggregator.hpp
 * @brief Turns iteration history into repair context for the generator
 *
 * @date 2025
 */

#pragma once

#include "crucible/loop/loop_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace loop {

/**
 * @struct FeedbackOptions
 */
struct FeedbackOptions {
    std::size_t window{3};              ///< Most recent attempts kept (0 keeps all)
    std::size_t max_output_chars{2000}; ///< Per-stream cap, tail preserved
};

/**
 * @class FeedbackAggregator
 * @brief Pure, deterministic renderer of past attempts
 *
 * The same history always yields the same text. Output streams are capped
 * keeping their tail, since tracebacks end there.
 *
 * **Rendered attempt**:
 * ```
 * ### Attempt 2 (failed: NonZeroExit, exit code 1)
 * Code:
 * ```python
 * ...
 * ```
 * stdout:
 * ...
 * stderr:
 * ...
 * ```
 */
class FeedbackAggregator {
public:
    explicit FeedbackAggregator(FeedbackOptions options = {});

    /**
     * @brief Render the last `window` records oldest-first
     * @return Empty string for an empty history
     */
    std::string BuildContext(const std::vector<IterationRecord>& history) const;

    /**
     * @brief Full generation prompt: task, optional hints, feedback
     */
    std::string BuildPrompt(const std::string& task,
                            const std::optional<std::string>& hints,
                            const std::vector<IterationRecord>& history) const;

    const FeedbackOptions& GetOptions() const { return options_; }

private:
    std::string RenderRecord(const IterationRecord& record,
                             const std::vector<IterationRecord>& history) const;
    std::string RenderStream(const std::string& name, const std::string& content) const;

    FeedbackOptions options_;
};

} // namespace loop
} // namespace crucible
