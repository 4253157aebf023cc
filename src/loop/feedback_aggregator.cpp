/**
 * @file feedback_aggregator.cpp
 * @brief Repair context rendering
 *
 * @date 2025
 */

#include "crucible/loop/feedback_aggregator.hpp"
#include "crucible/utils/string_utils.hpp"

#include <algorithm>
#include <sstream>

namespace crucible {
namespace loop {

namespace {

const char* FenceLanguage(core::PayloadKind kind) {
    switch (kind) {
        case core::PayloadKind::SCRIPT:
        case core::PayloadKind::TEST_SUITE:
            return "python";
        case core::PayloadKind::SHELL_COMMAND:
            return "sh";
    }
    return "";
}

std::string Outcome(const core::ExecutionResult& result) {
    if (result.success) {
        return "succeeded";
    }
    std::ostringstream oss;
    oss << "failed: ";
    if (result.failure_kind) {
        oss << core::ToString(*result.failure_kind);
    } else {
        oss << "no failure kind";
    }
    oss << ", exit code " << result.exit_code;
    return oss.str();
}

} // anonymous namespace

FeedbackAggregator::FeedbackAggregator(FeedbackOptions options)
    : options_(options) {}

// ============================================================================
// CONTEXT
// ============================================================================

std::string FeedbackAggregator::BuildContext(const std::vector<IterationRecord>& history) const {
    if (history.empty()) {
        return "";
    }

    std::size_t first = 0;
    if (options_.window > 0 && history.size() > options_.window) {
        first = history.size() - options_.window;
    }

    std::ostringstream oss;
    oss << "Previous attempts (oldest first, " << (history.size() - first)
        << " of " << history.size() << " shown):\n";
    for (std::size_t i = first; i < history.size(); ++i) {
        oss << "\n" << RenderRecord(history[i], history);
    }
    return oss.str();
}

std::string FeedbackAggregator::RenderRecord(const IterationRecord& record,
                                             const std::vector<IterationRecord>& history) const {
    const auto& result = record.result;
    std::ostringstream oss;

    oss << "### Attempt " << (record.index + 1) << " (" << Outcome(result) << ")\n";

    if (!record.code_digest.empty()) {
        auto earlier = std::find_if(history.begin(), history.end(), [&](const IterationRecord& other) {
            return other.index < record.index && other.code_digest == record.code_digest;
        });
        if (earlier != history.end()) {
            oss << "Note: this code is identical to attempt " << (earlier->index + 1)
                << "; change the approach.\n";
        }
    }

    if (!result.diagnostic.empty()) {
        oss << "Diagnostic: " << result.diagnostic << "\n";
    }

    oss << "Code:\n```" << FenceLanguage(record.request.payload_kind) << "\n"
        << record.request.code;
    if (!utils::StringUtils::EndsWith(record.request.code, "\n")) {
        oss << "\n";
    }
    oss << "```\n";

    oss << RenderStream("stdout", result.stdout_output);
    oss << RenderStream("stderr", result.stderr_output);
    return oss.str();
}

std::string FeedbackAggregator::RenderStream(const std::string& name,
                                             const std::string& content) const {
    if (content.empty()) {
        return name + ": (empty)\n";
    }
    std::string text = options_.max_output_chars > 0
        ? utils::StringUtils::TruncateKeepTail(content, options_.max_output_chars)
        : content;
    if (!utils::StringUtils::EndsWith(text, "\n")) {
        text += "\n";
    }
    return name + ":\n" + text;
}

// ============================================================================
// PROMPT
// ============================================================================

std::string FeedbackAggregator::BuildPrompt(const std::string& task,
                                            const std::optional<std::string>& hints,
                                            const std::vector<IterationRecord>& history) const {
    std::ostringstream oss;
    oss << "## Task\n" << task << "\n";

    if (hints && !utils::StringUtils::Trim(*hints).empty()) {
        oss << "\n## Context hints\n" << *hints << "\n";
    }

    std::string feedback = BuildContext(history);
    if (!feedback.empty()) {
        oss << "\n## Feedback\n" << feedback
            << "\nFix the problems above and return the complete corrected code.\n";
    }
    return oss.str();
}

} // namespace loop
} // namespace crucible
