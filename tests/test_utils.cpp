#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "crucible/utils/file_utils.hpp"
#include "crucible/utils/hash_utils.hpp"
#include "crucible/utils/string_utils.hpp"
#include "crucible/utils/subprocess.hpp"

namespace {

using crucible::utils::HashUtils;
using crucible::utils::StringUtils;
using crucible::utils::Subprocess;
using crucible::utils::SubprocessOptions;
using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StartsWith;

// NOLINTNEXTLINE
TEST(StringUtilsTest, TrimAndSplit) {
  EXPECT_EQ(StringUtils::Trim("  a b \n"), "a b");
  EXPECT_EQ(StringUtils::Trim(""), "");
  EXPECT_THAT(StringUtils::Split("a,,b,", ','), ElementsAre("a", "b"));
  EXPECT_THAT(StringUtils::SplitLines("x\r\n\ny"), ElementsAre("x", "", "y"));
  EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, "-"), "a-b-c");
}

// NOLINTNEXTLINE
TEST(StringUtilsTest, TruncateKeepTail) {
  EXPECT_EQ(StringUtils::TruncateKeepTail("short", 10), "short");
  auto truncated = StringUtils::TruncateKeepTail("0123456789", 4);
  EXPECT_THAT(truncated, StartsWith("... [6 earlier characters omitted]"));
  EXPECT_THAT(truncated, EndsWith("6789"));
}

// NOLINTNEXTLINE
TEST(StringUtilsTest, ExtractCodeBlock) {
  EXPECT_EQ(StringUtils::ExtractCodeBlock("Here you go:\n```python\nprint(1)\n```\nDone."),
            "print(1)\n");
  EXPECT_EQ(StringUtils::ExtractCodeBlock("```\na = 1\nb = 2\n```"), "a = 1\nb = 2\n");
  EXPECT_EQ(StringUtils::ExtractCodeBlock("  print(2)\n"), "print(2)");
  EXPECT_EQ(StringUtils::ExtractCodeBlock("```python\n```"), "");
}

// NOLINTNEXTLINE
TEST(StringUtilsTest, FormatCommand) {
  EXPECT_EQ(StringUtils::FormatCommand({"sh", "-c", "echo hi"}), "sh -c \"echo hi\"");
  EXPECT_EQ(StringUtils::FormatCommand({"a", ""}), "a \"\"");
}

// NOLINTNEXTLINE
TEST(HashUtilsTest, Sha256KnownVector) {
  EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(HashUtils::ShortDigest(HashUtils::ComputeSHA256("abc")), "ba7816bf8f01");
}

// NOLINTNEXTLINE
TEST(HashUtilsTest, FingerprintIgnoresTrailingWhitespace) {
  auto a = HashUtils::ComputeCodeFingerprint("print(1)\nprint(2)");
  auto b = HashUtils::ComputeCodeFingerprint("print(1)  \r\nprint(2)\n\n\n");
  auto c = HashUtils::ComputeCodeFingerprint("print(1)\nprint(3)");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

// NOLINTNEXTLINE
TEST(FileUtilsTest, SafeRelativePaths) {
  EXPECT_TRUE(crucible::utils::IsSafeRelativePath("data.csv"));
  EXPECT_TRUE(crucible::utils::IsSafeRelativePath("pkg/module.py"));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath(""));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath("/etc/passwd"));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath("../escape.py"));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath("a/../../b"));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath("dir\\file"));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath(std::string("a\0b", 3)));
  EXPECT_FALSE(crucible::utils::IsSafeRelativePath("dir/"));
}

// NOLINTNEXTLINE
TEST(FileUtilsTest, WriteAndRemoveTree) {
  auto root = crucible::utils::CreateTempDirectory("crucible_test_");
  ASSERT_TRUE(root.has_value());

  std::string error;
  ASSERT_TRUE(crucible::utils::WriteFileTree(
      *root, {{"a.txt", "alpha"}, {"nested/b.txt", "beta"}}, &error))
      << error;

  std::ifstream in(*root / "nested" / "b.txt");
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "beta");

  EXPECT_FALSE(crucible::utils::WriteFileTree(*root, {{"../x", "y"}}, &error));
  EXPECT_THAT(error, HasSubstr("unsafe"));

  EXPECT_TRUE(crucible::utils::RemoveDirectoryTree(*root));
  EXPECT_FALSE(std::filesystem::exists(*root));
}

// NOLINTNEXTLINE
TEST(SubprocessTest, CapturesStreamsSeparately) {
  SubprocessOptions options;
  options.argv = {"sh", "-c", "echo out; echo err >&2; exit 3"};
  auto result = crucible::utils::RunCommand(options, std::chrono::seconds(10));
  ASSERT_TRUE(result.started) << result.error;
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.stdout_output, "out\n");
  EXPECT_EQ(result.stderr_output, "err\n");
  EXPECT_FALSE(result.timed_out);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, PassesStdinAndEnvironment) {
  SubprocessOptions options;
  options.argv = {"sh", "-c", "cat; printf '%s' \"$CRUCIBLE_TEST_VAR\""};
  options.stdin_data = "from stdin\n";
  options.environment["CRUCIBLE_TEST_VAR"] = "value";
  auto result = crucible::utils::RunCommand(options, std::chrono::seconds(10));
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_output, "from stdin\nvalue");
}

// NOLINTNEXTLINE
TEST(SubprocessTest, TimeoutKillsProcessGroup) {
  SubprocessOptions options;
  options.argv = {"sh", "-c", "echo started; sleep 30"};
  auto start = std::chrono::steady_clock::now();
  auto result = crucible::utils::RunCommand(options, std::chrono::milliseconds(300));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.stdout_output, "started\n");
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

// NOLINTNEXTLINE
TEST(SubprocessTest, KillFromAnotherThread) {
  SubprocessOptions options;
  options.argv = {"sleep", "30"};
  Subprocess proc(options);
  ASSERT_TRUE(proc.Start()) << proc.GetError();
  std::thread killer([&proc] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.Kill();
  });
  auto result = proc.Wait();
  killer.join();
  EXPECT_TRUE(result.killed);
  EXPECT_EQ(result.term_signal, SIGKILL);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, MissingBinaryExits127) {
  SubprocessOptions options;
  options.argv = {"/nonexistent/crucible-binary"};
  auto result = crucible::utils::RunCommand(options, std::chrono::seconds(10));
  EXPECT_EQ(result.exit_code, 127);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, OutputCapKeepsTail) {
  SubprocessOptions options;
  options.argv = {"sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done"};
  options.max_output_bytes = 64;
  auto result = crucible::utils::RunCommand(options, std::chrono::seconds(10));
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.output_truncated);
  EXPECT_LE(result.stdout_output.size(), 64u);
  EXPECT_THAT(result.stdout_output, EndsWith("line1999\n"));
}

}  // namespace
