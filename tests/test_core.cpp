#include <atomic>
#include <chrono>
#include <limits>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "crucible/core/cancellation.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/core/execution_types.hpp"
#include "crucible/core/resource_limits.hpp"

namespace {

using crucible::core::CancellationToken;
using crucible::core::ErrorKind;
using crucible::core::FailureKind;
using crucible::core::PayloadKind;
using crucible::core::ResourceLimits;
using crucible::core::ValidationError;
using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, Defaults) {
  ResourceLimits limits;
  EXPECT_DOUBLE_EQ(limits.GetCpuShare(), 1.0);
  EXPECT_EQ(limits.GetMemoryBytes(), 512LL * 1024 * 1024);
  EXPECT_EQ(limits.GetWallClockTimeout(), std::chrono::seconds(30));
  EXPECT_FALSE(limits.IsNetworkEnabled());
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, RejectsNonPositiveValues) {
  EXPECT_THROW(ResourceLimits(0.0, 1024, std::chrono::seconds(1), false),
               ValidationError);
  EXPECT_THROW(ResourceLimits(-1.0, 1024, std::chrono::seconds(1), false),
               ValidationError);
  EXPECT_THROW(ResourceLimits(std::numeric_limits<double>::quiet_NaN(), 1024,
                              std::chrono::seconds(1), false),
               ValidationError);
  EXPECT_THROW(ResourceLimits(1.0, 0, std::chrono::seconds(1), false),
               ValidationError);
  EXPECT_THROW(ResourceLimits(1.0, 1024, std::chrono::milliseconds(0), false),
               ValidationError);
  EXPECT_NO_THROW(ResourceLimits(0.25, 1, std::chrono::milliseconds(1), true));
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, WithReturnsModifiedCopy) {
  ResourceLimits base;
  auto relaxed = base.WithTimeout(std::chrono::seconds(60)).WithNetwork(true);
  EXPECT_EQ(base.GetWallClockTimeout(), std::chrono::seconds(30));
  EXPECT_FALSE(base.IsNetworkEnabled());
  EXPECT_EQ(relaxed.GetWallClockTimeout(), std::chrono::seconds(60));
  EXPECT_TRUE(relaxed.IsNetworkEnabled());
  EXPECT_NE(base, relaxed);
  EXPECT_EQ(base, ResourceLimits());
  EXPECT_THROW(base.WithCpuShare(0.0), ValidationError);
  EXPECT_THROW(base.WithMemoryBytes(-5), ValidationError);
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, ParseMemoryLimit) {
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit("512m"), 512LL * 1024 * 1024);
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit("512MB"), 512LL * 1024 * 1024);
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit("1g"), 1024LL * 1024 * 1024);
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit("256k"), 256LL * 1024);
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit("1048576"), 1048576);
  EXPECT_EQ(ResourceLimits::ParseMemoryLimit(" 64m "), 64LL * 1024 * 1024);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit(""), ValidationError);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit("m"), ValidationError);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit("12x"), ValidationError);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit("-5m"), ValidationError);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit("0"), ValidationError);
  EXPECT_THROW(ResourceLimits::ParseMemoryLimit("99999999999999999999g"),
               ValidationError);
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, ToString) {
  ResourceLimits limits(0.5, 256LL * 1024 * 1024, std::chrono::seconds(10), false);
  EXPECT_EQ(limits.ToString(), "cpu=0.50 memory=256MiB timeout=10000ms network=off");
}

// NOLINTNEXTLINE
TEST(ErrorsTest, ClassifyFailurePrecedence) {
  EXPECT_EQ(crucible::core::ClassifyFailure(false, false, 0), std::nullopt);
  EXPECT_EQ(crucible::core::ClassifyFailure(false, false, 1),
            FailureKind::NON_ZERO_EXIT);
  EXPECT_EQ(crucible::core::ClassifyFailure(false, true, 137),
            FailureKind::RESOURCE_EXCEEDED);
  EXPECT_EQ(crucible::core::ClassifyFailure(true, true, 137), FailureKind::TIMEOUT);
  EXPECT_EQ(crucible::core::ClassifyFailure(true, false, 0), FailureKind::TIMEOUT);
}

// NOLINTNEXTLINE
TEST(ErrorsTest, Names) {
  EXPECT_EQ(crucible::core::ToString(FailureKind::TIMEOUT), "Timeout");
  EXPECT_EQ(crucible::core::ToString(FailureKind::RUNTIME_UNAVAILABLE),
            "RuntimeUnavailable");
  EXPECT_EQ(crucible::core::ToString(ErrorKind::USER_ABORT), "UserAbort");
  EXPECT_EQ(crucible::core::ToErrorKind(FailureKind::INTERNAL_ERROR),
            ErrorKind::INTERNAL_ERROR);
}

// NOLINTNEXTLINE
TEST(ExecutionTypesTest, ParsePayloadKind) {
  EXPECT_EQ(crucible::core::ParsePayloadKind("script"), PayloadKind::SCRIPT);
  EXPECT_EQ(crucible::core::ParsePayloadKind("shell"), PayloadKind::SHELL_COMMAND);
  EXPECT_EQ(crucible::core::ParsePayloadKind("test_suite"), PayloadKind::TEST_SUITE);
  EXPECT_EQ(crucible::core::ParsePayloadKind("java"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(ExecutionTypesTest, FailureResult) {
  auto result = crucible::core::MakeFailureResult(FailureKind::RUNTIME_UNAVAILABLE,
                                                  "docker is down");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure_kind, FailureKind::RUNTIME_UNAVAILABLE);
  EXPECT_THAT(result.diagnostic, HasSubstr("docker"));
}

// NOLINTNEXTLINE
TEST(CancellationTest, CopiesShareState) {
  CancellationToken token;
  CancellationToken copy = token;
  EXPECT_FALSE(copy.IsCancelled());
  token.Cancel();
  EXPECT_TRUE(copy.IsCancelled());
}

// NOLINTNEXTLINE
TEST(CancellationTest, CallbacksRunOnce) {
  CancellationToken token;
  int calls = 0;
  auto subscription = token.OnCancel([&calls] { ++calls; });
  token.Cancel();
  token.Cancel();
  EXPECT_EQ(calls, 1);
}

// NOLINTNEXTLINE
TEST(CancellationTest, LateSubscriberRunsImmediately) {
  CancellationToken token;
  token.Cancel();
  bool called = false;
  auto subscription = token.OnCancel([&called] { called = true; });
  EXPECT_TRUE(called);
}

// NOLINTNEXTLINE
TEST(CancellationTest, ResetUnregisters) {
  CancellationToken token;
  bool called = false;
  auto subscription = token.OnCancel([&called] { called = true; });
  subscription.Reset();
  token.Cancel();
  EXPECT_FALSE(called);
}

// NOLINTNEXTLINE
TEST(CancellationTest, CancelFromAnotherThread) {
  CancellationToken token;
  std::atomic<bool> called{false};
  auto subscription = token.OnCancel([&called] { called = true; });
  std::thread canceller([token]() mutable { token.Cancel(); });
  canceller.join();
  EXPECT_TRUE(called.load());
  EXPECT_TRUE(token.IsCancelled());
}

}  // namespace
