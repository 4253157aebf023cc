#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "crucible/loop/feedback_aggregator.hpp"
#include "crucible/utils/hash_utils.hpp"

namespace {

using crucible::core::FailureKind;
using crucible::core::PayloadKind;
using crucible::loop::FeedbackAggregator;
using crucible::loop::FeedbackOptions;
using crucible::loop::IterationRecord;
using crucible::utils::HashUtils;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

IterationRecord Failed(std::size_t index, const std::string& code, const std::string& stderr_output) {
  IterationRecord record;
  record.index = index;
  record.request.payload_kind = PayloadKind::SCRIPT;
  record.request.code = code;
  record.code_digest = HashUtils::ComputeCodeFingerprint(code);
  record.result.success = false;
  record.result.exit_code = 1;
  record.result.failure_kind = FailureKind::NON_ZERO_EXIT;
  record.result.stderr_output = stderr_output;
  return record;
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, EmptyHistoryIsEmpty) {
  FeedbackAggregator aggregator;
  EXPECT_EQ(aggregator.BuildContext({}), "");
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, RendersAttempt) {
  FeedbackAggregator aggregator;
  auto context = aggregator.BuildContext(
      {Failed(0, "print(1/0)", "ZeroDivisionError: division by zero\n")});
  EXPECT_THAT(context, StartsWith("Previous attempts (oldest first, 1 of 1 shown):"));
  EXPECT_THAT(context, HasSubstr("### Attempt 1 (failed: NonZeroExit, exit code 1)"));
  EXPECT_THAT(context, HasSubstr("```python\nprint(1/0)\n```"));
  EXPECT_THAT(context, HasSubstr("stdout: (empty)"));
  EXPECT_THAT(context, HasSubstr("stderr:\nZeroDivisionError: division by zero\n"));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, Deterministic) {
  FeedbackAggregator aggregator;
  std::vector<IterationRecord> history = {Failed(0, "a", "e1"), Failed(1, "b", "e2")};
  EXPECT_EQ(aggregator.BuildContext(history), aggregator.BuildContext(history));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, WindowKeepsMostRecent) {
  FeedbackOptions options;
  options.window = 2;
  FeedbackAggregator aggregator(options);
  std::vector<IterationRecord> history = {
      Failed(0, "x = 'first'", "E0"), Failed(1, "x = 'second'", "E1"),
      Failed(2, "x = 'third'", "E2")};
  auto context = aggregator.BuildContext(history);
  EXPECT_THAT(context, HasSubstr("2 of 3 shown"));
  EXPECT_THAT(context, Not(HasSubstr("'first'")));
  EXPECT_THAT(context, HasSubstr("### Attempt 2"));
  EXPECT_THAT(context, HasSubstr("### Attempt 3"));
  EXPECT_LT(context.find("### Attempt 2"), context.find("### Attempt 3"));

  options.window = 0;
  EXPECT_THAT(FeedbackAggregator(options).BuildContext(history), HasSubstr("3 of 3 shown"));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, LongOutputKeepsTail) {
  FeedbackOptions options;
  options.max_output_chars = 50;
  FeedbackAggregator aggregator(options);
  std::string noise(5000, 'n');
  auto context = aggregator.BuildContext(
      {Failed(0, "run()", noise + "\nValueError: the real cause\n")});
  EXPECT_THAT(context, HasSubstr("ValueError: the real cause"));
  EXPECT_THAT(context, HasSubstr("omitted"));
  EXPECT_THAT(context, Not(HasSubstr(std::string(100, 'n'))));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, FlagsRepeatedCode) {
  FeedbackAggregator aggregator;
  auto context = aggregator.BuildContext(
      {Failed(0, "print(x)", "NameError"), Failed(1, "print(x)\n\n", "NameError")});
  EXPECT_THAT(context, HasSubstr("Note: this code is identical to attempt 1"));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, ShellFence) {
  FeedbackAggregator aggregator;
  auto record = Failed(0, "exit 3", "");
  record.request.payload_kind = PayloadKind::SHELL_COMMAND;
  record.result.diagnostic = "exited with code 3";
  auto context = aggregator.BuildContext({record});
  EXPECT_THAT(context, HasSubstr("```sh\nexit 3\n```"));
  EXPECT_THAT(context, HasSubstr("Diagnostic: exited with code 3"));
}

// NOLINTNEXTLINE
TEST(FeedbackAggregatorTest, PromptSections) {
  FeedbackAggregator aggregator;
  auto first = aggregator.BuildPrompt("Sum two numbers", std::nullopt, {});
  EXPECT_EQ(first, "## Task\nSum two numbers\n");

  auto hinted = aggregator.BuildPrompt("Sum two numbers", std::string("use argparse"), {});
  EXPECT_THAT(hinted, HasSubstr("## Context hints\nuse argparse"));
  EXPECT_THAT(hinted, Not(HasSubstr("## Feedback")));

  auto repair = aggregator.BuildPrompt("Sum two numbers", std::string("   "),
                                       {Failed(0, "print(a+b)", "NameError")});
  EXPECT_THAT(repair, Not(HasSubstr("## Context hints")));
  EXPECT_THAT(repair, HasSubstr("## Feedback\nPrevious attempts"));
  EXPECT_THAT(repair, HasSubstr("return the complete corrected code"));
}

}  // namespace
