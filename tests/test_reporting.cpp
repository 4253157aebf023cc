#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "crucible/core/errors.hpp"
#include "crucible/loop/event_sinks.hpp"
#include "crucible/loop/external_generator.hpp"
#include "crucible/loop/static_hint_provider.hpp"
#include "crucible/reporters/json_reporter.hpp"

namespace {

using crucible::core::CancellationToken;
using crucible::core::ConfigError;
using crucible::core::ErrorKind;
using crucible::core::FailureKind;
using crucible::core::GenerationError;
using crucible::loop::AsyncEventSink;
using crucible::loop::EventSink;
using crucible::loop::ExternalCommandGenerator;
using crucible::loop::FanOutEventSink;
using crucible::loop::GenerationRequest;
using crucible::loop::IterationRecord;
using crucible::loop::JsonLinesEventSink;
using crucible::loop::LoopEvent;
using crucible::loop::LoopPhase;
using crucible::loop::LoopState;
using crucible::loop::LoopStatus;
using crucible::loop::StaticHintProvider;
using crucible::reporters::JsonReporter;
using crucible::reporters::JsonReporterConfig;
using json = nlohmann::json;
using ::testing::HasSubstr;
using ::testing::StartsWith;

LoopEvent Event(std::size_t iteration, LoopPhase phase = LoopPhase::GENERATING) {
  LoopEvent event;
  event.session_id = "loop_1_abc";
  event.phase = phase;
  event.iteration = iteration;
  event.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1500));
  event.message = "attempt " + std::to_string(iteration + 1);
  return event;
}

class CollectingSink : public EventSink {
 public:
  void Emit(const LoopEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    iterations.push_back(event.iteration);
  }
  std::vector<std::size_t> Iterations() {
    std::lock_guard<std::mutex> lock(mutex_);
    return iterations;
  }

 private:
  std::mutex mutex_;
  std::vector<std::size_t> iterations;
};

/// Blocks inside Emit() until Release()
class GatedSink : public EventSink {
 public:
  void Emit(const LoopEvent& event) override {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
    delivered.push_back(event.iteration);
  }
  void WaitEntered() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return entered_; });
  }
  void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }
  std::vector<std::size_t> delivered;

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_{false};
  bool released_{false};
};

class ThrowingSink : public EventSink {
 public:
  void Emit(const LoopEvent&) override { throw std::runtime_error("broken pipe"); }
};

// ============================================================================
// JsonReporter
// ============================================================================

// NOLINTNEXTLINE
TEST(JsonReporterTest, TimestampFormat) {
  auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1500));
  EXPECT_EQ(JsonReporter::FormatTimestamp(time), "1970-01-01T00:00:01.500Z");
}

// NOLINTNEXTLINE
TEST(JsonReporterTest, ResultKeys) {
  crucible::core::ExecutionResult result;
  result.success = false;
  result.exit_code = 1;
  result.failure_kind = FailureKind::NON_ZERO_EXIT;
  result.stderr_output = "boom";

  JsonReporter reporter;
  auto j = reporter.ToJson(result);
  EXPECT_EQ(j["failure_kind"], "NonZeroExit");
  EXPECT_EQ(j["exit_code"], 1);
  EXPECT_EQ(j["stderr"], "boom");

  JsonReporterConfig config;
  config.include_output = false;
  EXPECT_FALSE(JsonReporter(config).ToJson(result).contains("stderr"));

  result.failure_kind.reset();
  result.success = true;
  EXPECT_TRUE(reporter.ToJson(result)["failure_kind"].is_null());
}

// NOLINTNEXTLINE
TEST(JsonReporterTest, StateReport) {
  LoopState state;
  state.session_id = "loop_1_abc";
  state.max_iterations = 3;
  state.status = LoopStatus::CANCELLED;
  state.cancellation_reason = ErrorKind::GENERATION_ERROR;
  state.error_message = "generator exited with code 2";

  IterationRecord record;
  record.request.code = "print(1)";
  state.iterations.push_back(record);

  JsonReporter reporter;
  auto j = reporter.ToJson(state);
  EXPECT_EQ(j["status"], "Cancelled");
  EXPECT_EQ(j["cancellation_reason"], "GenerationError");
  EXPECT_EQ(j["max_iterations"], 3);
  ASSERT_EQ(j["iterations"].size(), 1u);
  EXPECT_EQ(j["iterations"][0]["code"], "print(1)");
  EXPECT_TRUE(j["final_code"].is_null());
  EXPECT_TRUE(j["last_result"].is_null());

  auto path = std::filesystem::temp_directory_path() / "crucible_report_test.json";
  ASSERT_TRUE(reporter.WriteReport(state, path));
  std::ifstream in(path);
  auto reread = json::parse(in);
  std::filesystem::remove(path);
  EXPECT_EQ(reread["session_id"], "loop_1_abc");

  EXPECT_FALSE(reporter.WriteReport(state, "/nonexistent/dir/report.json"));
}

// NOLINTNEXTLINE
TEST(JsonReporterTest, InvalidUtf8IsReplaced) {
  crucible::core::ExecutionResult result;
  result.stdout_output = std::string("bad \xff byte");
  JsonReporter reporter;
  std::string line;
  EXPECT_NO_THROW(line = JsonReporter::DumpLine(reporter.ToJson(result)));
  EXPECT_EQ(line.find('\n'), std::string::npos);
}

// ============================================================================
// Event sinks
// ============================================================================

// NOLINTNEXTLINE
TEST(EventSinkTest, JsonLines) {
  std::ostringstream out;
  JsonLinesEventSink sink(out);
  auto failed = Event(1, LoopPhase::EVALUATING);
  failed.failure_kind = FailureKind::TIMEOUT;
  sink.Emit(Event(0));
  sink.Emit(failed);

  std::istringstream in(out.str());
  std::string first;
  std::string second;
  ASSERT_TRUE(std::getline(in, first));
  ASSERT_TRUE(std::getline(in, second));

  auto a = json::parse(first);
  EXPECT_EQ(a["phase"], "generating");
  EXPECT_EQ(a["iteration"], 0);
  EXPECT_FALSE(a.contains("failure_kind"));

  auto b = json::parse(second);
  EXPECT_EQ(b["phase"], "evaluating");
  EXPECT_EQ(b["failure_kind"], "Timeout");
  EXPECT_EQ(b["timestamp"], "1970-01-01T00:00:01.500Z");
}

// NOLINTNEXTLINE
TEST(EventSinkTest, FanOutSurvivesBrokenSink) {
  auto collected = std::make_shared<CollectingSink>();
  FanOutEventSink sink({std::make_shared<ThrowingSink>(), collected});
  EXPECT_NO_THROW(sink.Emit(Event(0)));
  EXPECT_NO_THROW(sink.Emit(Event(1)));
  EXPECT_EQ(collected->Iterations(), (std::vector<std::size_t>{0, 1}));
}

// NOLINTNEXTLINE
TEST(EventSinkTest, AsyncDeliversInOrder) {
  auto collected = std::make_shared<CollectingSink>();
  AsyncEventSink sink(collected);
  for (std::size_t i = 0; i < 50; ++i) sink.Emit(Event(i));
  sink.Flush();

  auto seen = collected->Iterations();
  ASSERT_EQ(seen.size(), 50u);
  for (std::size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i], i);
  EXPECT_EQ(sink.GetDroppedCount(), 0u);

  sink.Stop();
  sink.Stop();
  sink.Emit(Event(99));
  EXPECT_EQ(sink.GetDroppedCount(), 1u);
}

// NOLINTNEXTLINE
TEST(EventSinkTest, AsyncDropsWhenFull) {
  auto gated = std::make_shared<GatedSink>();
  AsyncEventSink sink(gated, 2);

  sink.Emit(Event(0));
  gated->WaitEntered();
  sink.Emit(Event(1));
  sink.Emit(Event(2));
  sink.Emit(Event(3));
  EXPECT_EQ(sink.GetDroppedCount(), 1u);

  gated->Release();
  sink.Flush();
  sink.Stop();
  EXPECT_EQ(gated->delivered, (std::vector<std::size_t>{0, 1, 2}));
}

// NOLINTNEXTLINE
TEST(EventSinkTest, AsyncRejectsBadArguments) {
  EXPECT_THROW(AsyncEventSink(nullptr), std::invalid_argument);
  EXPECT_THROW(AsyncEventSink(std::make_shared<CollectingSink>(), 0), std::invalid_argument);
}

// ============================================================================
// StaticHintProvider
// ============================================================================

// NOLINTNEXTLINE
TEST(StaticHintProviderTest, WildcardAndTarget) {
  auto provider = StaticHintProvider::FromJson(R"({
    "*": "Use only the standard library.",
    "csv_report": ["Input columns: date, amount", "Amounts are in cents"]
  })");
  EXPECT_EQ(provider.Size(), 2u);
  EXPECT_EQ(provider.ContextHints("csv_report"),
            std::string("Use only the standard library.\n"
                        "Input columns: date, amount\nAmounts are in cents"));
  EXPECT_EQ(provider.ContextHints("other"), std::string("Use only the standard library."));
}

// NOLINTNEXTLINE
TEST(StaticHintProviderTest, UnknownTargetWithoutWildcard) {
  StaticHintProvider provider(std::map<std::string, std::string>{{"known", "hint"}});
  EXPECT_EQ(provider.ContextHints("unknown"), std::nullopt);
  EXPECT_EQ(provider.ContextHints("known"), std::string("hint"));
}

// NOLINTNEXTLINE
TEST(StaticHintProviderTest, MalformedDocuments) {
  EXPECT_THROW(StaticHintProvider::FromJson("{"), ConfigError);
  EXPECT_THROW(StaticHintProvider::FromJson("[\"a\"]"), ConfigError);
  EXPECT_THROW(StaticHintProvider::FromJson(R"({"a": 3})"), ConfigError);
  EXPECT_THROW(StaticHintProvider::FromJson(R"({"a": ["x", 1]})"), ConfigError);
  EXPECT_THROW(StaticHintProvider::FromFile("/nonexistent/hints.json"), ConfigError);
}

// ============================================================================
// ExternalCommandGenerator
// ============================================================================

GenerationRequest Request() {
  GenerationRequest request;
  request.session_id = "loop_1_abc";
  request.iteration = 2;
  request.task = "add two numbers";
  request.feedback = "Previous attempts ...";
  request.prompt = "## Task\nadd two numbers\n";
  return request;
}

// NOLINTNEXTLINE
TEST(ExternalGeneratorTest, EncodeRequest) {
  auto j = json::parse(ExternalCommandGenerator::EncodeRequest(Request()));
  EXPECT_EQ(j["session_id"], "loop_1_abc");
  EXPECT_EQ(j["iteration"], 2);
  EXPECT_EQ(j["task"], "add two numbers");
  EXPECT_TRUE(j["hints"].is_null());
  EXPECT_EQ(j["context"], "Previous attempts ...");
}

// NOLINTNEXTLINE
TEST(ExternalGeneratorTest, DecodeResponse) {
  EXPECT_EQ(ExternalCommandGenerator::DecodeResponse(R"j({"code": "print(3)"})j"), "print(3)");
  EXPECT_EQ(ExternalCommandGenerator::DecodeResponse("print(3)\n"), "print(3)\n");
  EXPECT_EQ(ExternalCommandGenerator::DecodeResponse("{'a': 1}"), "{'a': 1}");
  EXPECT_THROW(ExternalCommandGenerator::DecodeResponse("  \n"), GenerationError);
  EXPECT_THROW(ExternalCommandGenerator::DecodeResponse(R"({"error": "quota exceeded"})"),
               GenerationError);
  EXPECT_THROW(ExternalCommandGenerator::DecodeResponse(R"({"text": "x"})"), GenerationError);
}

// NOLINTNEXTLINE
TEST(ExternalGeneratorTest, RunsCommandWithRequestOnStdin) {
  ExternalCommandGenerator generator(ExternalCommandGenerator::FromCommandLine(
      "input=$(cat); case \"$input\" in *'\"task\":\"add two numbers\"'*) "
      "printf '{\"code\": \"print(1 + 2)\"}';; *) exit 1;; esac"));
  EXPECT_EQ(generator.Generate(Request(), CancellationToken()), "print(1 + 2)");
}

// NOLINTNEXTLINE
TEST(ExternalGeneratorTest, CommandFailures) {
  ExternalCommandGenerator failing(
      ExternalCommandGenerator::FromCommandLine("cat >/dev/null; echo 'no API key' >&2; exit 2"));
  try {
    failing.Generate(Request(), CancellationToken());
    FAIL() << "expected GenerationError";
  } catch (const GenerationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("exited with code 2"));
    EXPECT_THAT(e.what(), HasSubstr("no API key"));
  }

  ExternalCommandGenerator reporting(ExternalCommandGenerator::FromCommandLine(
      "cat >/dev/null; echo '{\"error\": \"rate limited\"}'"));
  EXPECT_THROW(reporting.Generate(Request(), CancellationToken()), GenerationError);

  auto options = ExternalCommandGenerator::FromCommandLine("cat >/dev/null; sleep 30");
  options.timeout = std::chrono::milliseconds(300);
  ExternalCommandGenerator slow(options);
  try {
    slow.Generate(Request(), CancellationToken());
    FAIL() << "expected GenerationError";
  } catch (const GenerationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("timed out"));
  }

  EXPECT_THROW(ExternalCommandGenerator(crucible::loop::ExternalGeneratorOptions{}),
               std::invalid_argument);
}

}  // namespace
