#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "tests/cli/cli_test_fixture.hpp"

namespace skipgate::test {
namespace {

class PlatformTest : public CliTestFixture {};

// Test: skipgate platform prints normalized host identifiers
TEST_F(PlatformTest, PrintsHostPlatform) {
  auto result = Run({"platform"});

  EXPECT_TRUE(result.Success()) << result.output;
#if defined(__linux__)
  EXPECT_EQ(result.output.rfind("linux ", 0), 0) << result.output;
#elif defined(__APPLE__)
  EXPECT_EQ(result.output.rfind("darwin ", 0), 0) << result.output;
#endif
}

// Test: the env probe reads SKIPGATE_OS/SKIPGATE_ARCH
TEST_F(PlatformTest, EnvProbeUsesOverride) {
  auto result = RunWithEnv(
      {"SKIPGATE_OS=Darwin", "SKIPGATE_ARCH=aarch64"},
      {"platform", "--probe", "env"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "darwin arm64\n");
}

// Test: auto detection honors the override too
TEST_F(PlatformTest, AutoProbeUsesOverride) {
  auto result = RunWithEnv(
      {"SKIPGATE_OS=windows", "SKIPGATE_ARCH=amd64"}, {"platform"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "windows x86_64\n");
}

// Test: the env probe fails when the override is missing
TEST_F(PlatformTest, EnvProbeFailsWithoutOverride) {
  auto result = Run({"platform", "--probe", "env"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.output.find("SKIPGATE_OS"), std::string::npos)
      << result.output;
}

// Test: unknown probe names are rejected
TEST_F(PlatformTest, RejectsUnknownProbe) {
  auto result = Run({"platform", "--probe", "sysctl"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.output.find("unknown probe 'sysctl'"), std::string::npos)
      << result.output;
}

// Test: uname and triple agree on the OS
TEST_F(PlatformTest, UnameAndTripleAgreeOnOs) {
  auto uname = Run({"platform", "--probe", "uname"});
  auto triple = Run({"platform", "--probe", "triple"});

  ASSERT_TRUE(uname.Success()) << uname.output;
  ASSERT_TRUE(triple.Success()) << triple.output;
  EXPECT_EQ(
      uname.output.substr(0, uname.output.find(' ')),
      triple.output.substr(0, triple.output.find(' ')));
}

// Test: -v logs probe details at debug level on stderr
TEST_F(PlatformTest, VerboseLogsProbeToStderr) {
  const std::vector<std::string> env = {
      "SKIPGATE_OS=windows", "SKIPGATE_ARCH=amd64"};

  auto combined = RunWithEnv(env, {"-v", "platform"});
  EXPECT_TRUE(combined.Success()) << combined.output;
  EXPECT_NE(combined.output.find("[skipgate]"), std::string::npos)
      << combined.output;
  EXPECT_NE(
      combined.output.find("[debug] platform windows/x86_64 (probe: env)"),
      std::string::npos)
      << combined.output;

  auto stdout_only = RunStdout(env, {"--verbose", "platform"});
  EXPECT_TRUE(stdout_only.Success()) << stdout_only.output;
  EXPECT_EQ(stdout_only.output, "windows x86_64\n");
}

// Test: without -v debug lines are suppressed
TEST_F(PlatformTest, QuietByDefault) {
  auto result = RunWithEnv(
      {"SKIPGATE_OS=windows", "SKIPGATE_ARCH=amd64"}, {"platform"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output.find("[debug]"), std::string::npos)
      << result.output;
}

}  // namespace
}  // namespace skipgate::test
