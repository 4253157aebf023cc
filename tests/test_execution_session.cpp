#include <memory>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "crucible/core/errors.hpp"
#include "crucible/sandbox/sandbox_manager.hpp"
#include "crucible/session/execution_session.hpp"
#include "fake_backend.hpp"

namespace {

using crucible::core::ExecutionRequest;
using crucible::core::FailureKind;
using crucible::core::PayloadKind;
using crucible::core::ResourceLimits;
using crucible::core::ValidationError;
using crucible::sandbox::RuntimeCommand;
using crucible::sandbox::SandboxManager;
using crucible::sandbox::SandboxManagerOptions;
using crucible::session::ExecutionSession;
using crucible::session::SessionOptions;
using crucible::test::Exited;
using crucible::test::FakeBackend;
using ::testing::HasSubstr;

using Files = std::map<std::string, std::string>;

class ExecutionSessionTest : public ::testing::Test {
 protected:
  ExecutionSessionTest()
      : backend_(std::make_shared<FakeBackend>()),
        manager_(backend_, SandboxManagerOptions{}),
        session_(manager_) {}

  void ExpectRejected(const ExecutionRequest& request) {
    EXPECT_THROW(ExecutionSession::ValidateRequest(request), ValidationError);
  }

  ExecutionRequest Valid() {
    ExecutionRequest request;
    request.code = "print(1)";
    return request;
  }

  std::shared_ptr<FakeBackend> backend_;
  SandboxManager manager_;
  ExecutionSession session_;
};

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, RunBuildsRequest) {
  auto result = session_.Run(PayloadKind::SCRIPT, "print(2+2)", {}, {}, ResourceLimits());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(backend_->created.load(), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, EmptyCodeRejectedBeforeRuntime) {
  EXPECT_THROW(session_.Run(PayloadKind::SCRIPT, "  \n\t", {}, {}, ResourceLimits()),
               ValidationError);
  EXPECT_EQ(backend_->GetSpecs().size(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, UnsafeFilePathsRejected) {
  for (const std::string& path : {"../escape.py", "/etc/passwd", "a\\b", "dir/../../x", ""}) {
    auto request = Valid();
    request.auxiliary_files[path] = "x";
    ExpectRejected(request);
  }
  EXPECT_EQ(backend_->GetSpecs().size(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, StagedFileCollisionRejected) {
  auto request = Valid();
  request.auxiliary_files["main.py"] = "print('shadow')";
  ExpectRejected(request);

  request.auxiliary_files.clear();
  request.auxiliary_files["./main.py"] = "print('shadow')";
  ExpectRejected(request);

  request.payload_kind = PayloadKind::SHELL_COMMAND;
  request.auxiliary_files.clear();
  request.auxiliary_files["main.py"] = "print('fine for shell')";
  EXPECT_NO_THROW(ExecutionSession::ValidateRequest(request));
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, DependencyDirectoryIsReserved) {
  for (const std::string& path : {".crucible_deps/pkg.py", "./.crucible_deps/x", ".crucible_deps"}) {
    auto request = Valid();
    request.auxiliary_files[path] = "x";
    ExpectRejected(request);
  }

  for (const std::string& path : {".crucible_deps2/x", ".crucible_deps.txt", "data/.crucible_deps/x"}) {
    auto request = Valid();
    request.auxiliary_files[path] = "x";
    EXPECT_NO_THROW(ExecutionSession::ValidateRequest(request)) << path;
  }
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, DependencyNames) {
  auto request = Valid();
  request.dependencies = {"requests", "numpy>=1.24", "pkg[extra]==2.0", "a.b_c-d"};
  EXPECT_NO_THROW(ExecutionSession::ValidateRequest(request));

  for (const std::string& bad : {"", "--index-url=http://evil", "-e.", "pkg; rm -rf /", "a b"}) {
    request.dependencies = {bad};
    ExpectRejected(request);
  }
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, WorkingDirectoryMustBeAbsolute) {
  auto request = Valid();
  request.working_directory = "workspace";
  ExpectRejected(request);
  request.working_directory = "/workspace/../etc";
  ExpectRejected(request);
  request.working_directory = "/srv/job";
  EXPECT_NO_THROW(ExecutionSession::ValidateRequest(request));
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, TestSuiteNeedsPassMarker) {
  backend_->SetResponder([](const RuntimeCommand&, const Files&) {
    return Exited(0, "ran some checks\n");
  });
  auto result = session_.Run(PayloadKind::TEST_SUITE, "assert True", {}, {}, ResourceLimits());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.failure_kind.has_value());
  EXPECT_THAT(result.diagnostic, HasSubstr("marker"));
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, TestSuiteWithMarkerPasses) {
  backend_->SetResponder([](const RuntimeCommand&, const Files& files) {
    EXPECT_EQ(files.count("test_main.py"), 1u);
    return Exited(0, "ALL TESTS PASSED\n");
  });
  auto result = session_.Run(PayloadKind::TEST_SUITE, "print('ALL TESTS PASSED')", {}, {},
                             ResourceLimits());
  EXPECT_TRUE(result.success);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, FailedTestSuiteKeepsFailureKind) {
  backend_->SetResponder([](const RuntimeCommand&, const Files&) {
    return Exited(1, "1 failed, 2 passed in 0.03s\n");
  });
  auto result = session_.Run(PayloadKind::TEST_SUITE, "assert False", {}, {},
                             ResourceLimits());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure_kind, FailureKind::NON_ZERO_EXIT);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, PassMarkers) {
  EXPECT_TRUE(session_.HasPassMarker("....\n3 passed in 0.01s\n"));
  EXPECT_TRUE(session_.HasPassMarker("ALL TESTS PASSED"));
  EXPECT_FALSE(session_.HasPassMarker("1 failed, 2 passed in 0.05s\n"));
  EXPECT_FALSE(session_.HasPassMarker("2 passed, 1 error in 0.05s\n"));
  EXPECT_FALSE(session_.HasPassMarker(""));
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, CustomMarkers) {
  SessionOptions options;
  options.test_markers = {"^OK$"};
  ExecutionSession session(manager_, options);
  EXPECT_TRUE(session.HasPassMarker("running\nOK\n"));
  EXPECT_FALSE(session.HasPassMarker("ALL TESTS PASSED"));

  options.test_markers = {"([unclosed"};
  EXPECT_THROW(ExecutionSession(manager_, options), ValidationError);
}

// NOLINTNEXTLINE
TEST_F(ExecutionSessionTest, ForwardsAvailability) {
  EXPECT_TRUE(session_.IsBackendAvailable());
  backend_->available = false;
  EXPECT_FALSE(session_.IsBackendAvailable());
}

}  // namespace
