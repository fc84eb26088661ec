#include <gtest/gtest.h>
#include <optional>
#include <ostream>
#include <string>

#include "skipgate/platform/platform_descriptor.hpp"
#include "skipgate/platform/probe.hpp"
#include "skipgate/skip/skip_rule.hpp"
#include "tests/common/scoped_env.hpp"

namespace skipgate::skip {
namespace {

using platform::MakePlatform;
using platform::PlatformDescriptor;

struct PlatformCase {
  std::string name;
  PlatformDescriptor platform;
  bool expect_skip;
};

// GTest printer for readable parameter names
inline void PrintTo(const PlatformCase& c, std::ostream* os) {
  *os << c.name;
}

class JitExceptionPredicateTest
    : public ::testing::TestWithParam<PlatformCase> {};

TEST_P(JitExceptionPredicateTest, DecisionMatchesPlatform) {
  const auto& c = GetParam();
  auto decision = ShouldSkip(c.platform);

  EXPECT_EQ(decision.skip, c.expect_skip);
  if (c.expect_skip) {
    EXPECT_FALSE(decision.reason.empty());
    EXPECT_EQ(decision.rule, kMacosArm64JitException);
  } else {
    EXPECT_EQ(decision, SkipDecision::Run());
  }
}

INSTANTIATE_TEST_SUITE_P(
    Platforms, JitExceptionPredicateTest,
    ::testing::Values(
        PlatformCase{"DarwinArm64", MakePlatform("darwin", "arm64"), true},
        PlatformCase{"DarwinAarch64", MakePlatform("Darwin", "aarch64"), true},
        PlatformCase{"MacosxArm64", MakePlatform("macosx", "arm64"), true},
        PlatformCase{"DarwinX86_64", MakePlatform("darwin", "x86_64"), false},
        PlatformCase{"LinuxArm64", MakePlatform("linux", "arm64"), false},
        PlatformCase{"LinuxAarch64", MakePlatform("linux", "aarch64"), false},
        PlatformCase{"WindowsX86_64", MakePlatform("windows", "x86_64"), false},
        PlatformCase{"WindowsArm64", MakePlatform("windows", "arm64"), false},
        PlatformCase{"Unknown", PlatformDescriptor{}, false},
        PlatformCase{"UnknownArch", MakePlatform("darwin", ""), false},
        PlatformCase{"UnknownOs", MakePlatform("", "arm64"), false}),
    [](const ::testing::TestParamInfo<PlatformCase>& info) {
      return info.param.name;
    });

class SkipRuleTest : public ::testing::Test {};

// =============================================================================
// Built-in rule
// =============================================================================

TEST_F(SkipRuleTest, ReasonMentionsJitExceptionHandling) {
  auto decision = ShouldSkip(MakePlatform("darwin", "arm64"));
  ASSERT_TRUE(decision.skip);
  EXPECT_NE(decision.reason.find("JIT"), std::string::npos);
  EXPECT_NE(decision.reason.find("exception"), std::string::npos);
}

TEST_F(SkipRuleTest, BuiltInRuleCarriesTrackingIssue) {
  const auto& rule = MacosArm64JitExceptionRule();
  EXPECT_EQ(rule.name, kMacosArm64JitException);
  EXPECT_EQ(rule.condition.Os(), "darwin");
  EXPECT_EQ(rule.condition.Arch(), "arm64");
  ASSERT_TRUE(rule.tracking_issue.has_value());
  EXPECT_NE(rule.tracking_issue->find("49036"), std::string::npos);
}

TEST_F(SkipRuleTest, HostDecisionIsIdempotent) {
  EXPECT_EQ(ShouldSkip(), ShouldSkip());
}

TEST_F(SkipRuleTest, HostDecisionFollowsEnvironmentOverride) {
  test::ScopedEnv os(platform::kOsOverrideEnv, "darwin");
  test::ScopedEnv arch(platform::kArchOverrideEnv, "arm64");
  EXPECT_TRUE(ShouldSkip().skip);
}

TEST_F(SkipRuleTest, HostDecisionOnThisHost) {
  test::ScopedEnv os(platform::kOsOverrideEnv, std::nullopt);
  test::ScopedEnv arch(platform::kArchOverrideEnv, std::nullopt);
#if defined(__APPLE__) && defined(__aarch64__)
  EXPECT_TRUE(ShouldSkip().skip);
#else
  EXPECT_FALSE(ShouldSkip().skip);
#endif
}

// =============================================================================
// Conditions
// =============================================================================

TEST_F(SkipRuleTest, ConditionNormalizesFields) {
  SkipCondition condition("MacOSX", "AArch64");
  EXPECT_EQ(condition.Os(), "darwin");
  EXPECT_EQ(condition.Arch(), "arm64");
}

TEST_F(SkipRuleTest, WildcardMatchesAnyKnownValue) {
  SkipCondition any_arch("linux", kAnyValue);
  EXPECT_TRUE(any_arch.Matches(MakePlatform("linux", "arm64")));
  EXPECT_TRUE(any_arch.Matches(MakePlatform("linux", "riscv64")));
  EXPECT_FALSE(any_arch.Matches(MakePlatform("darwin", "arm64")));
}

TEST_F(SkipRuleTest, WildcardNeverMatchesUnknownValue) {
  SkipCondition everything(kAnyValue, kAnyValue);
  EXPECT_TRUE(everything.Matches(MakePlatform("linux", "x86_64")));
  EXPECT_FALSE(everything.Matches(MakePlatform("linux", "")));
  EXPECT_FALSE(everything.Matches(PlatformDescriptor{}));
}

TEST_F(SkipRuleTest, EvaluateReportsRuleNameAndReason) {
  SkipRule rule{
      .name = "linux-no-perf-events",
      .condition = SkipCondition("linux", "*"),
      .reason = "perf events unavailable in containers",
      .tracking_issue = std::nullopt,
  };

  auto decision = Evaluate(rule, MakePlatform("linux", "x86_64"));
  EXPECT_EQ(
      decision, (SkipDecision{
                    .skip = true,
                    .reason = "perf events unavailable in containers",
                    .rule = "linux-no-perf-events"}));
  EXPECT_EQ(
      Evaluate(rule, MakePlatform("windows", "x86_64")), SkipDecision::Run());
}

}  // namespace
}  // namespace skipgate::skip
