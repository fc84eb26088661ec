#pragma once

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

#include "skipgate/platform/probe.hpp"
#include "skipgate/skip/skip_registry.hpp"
#include "skipgate/skip/skip_rule.hpp"

namespace skipgate::gtest {

// Full GoogleTest name of the running test ("Suite.Name"), or empty when
// called outside a test.
auto CurrentTestId() -> std::string;

// Registry decision for the running test on the host platform.
auto DecideCurrentTest(const skip::SkipRegistry& registry) -> skip::SkipDecision;

// Skip the current test when `rule` matches `platform`.
// Usable in test bodies and SetUp(). Like the GoogleTest assertions, the
// expansion is a complete if/else, so a caller's `else` binds to the
// caller's `if`.
#define SKIPGATE_SKIP_IF_ON(rule, platform)                                  \
  switch (0)                                                                 \
  case 0:                                                                    \
  default:                                                                   \
    if (const auto skipgate_decision_ =                                      \
            ::skipgate::skip::Evaluate((rule), (platform));                  \
        !skipgate_decision_.skip) {                                          \
    } else                                                                   \
      GTEST_SKIP() << skipgate_decision_.reason

// Skip the current test when `rule` matches the host platform.
#define SKIPGATE_SKIP_IF(rule) \
  SKIPGATE_SKIP_IF_ON(rule, ::skipgate::platform::ReadHostPlatform())

// Skip the current test when a marker in the global registry matches it.
#define SKIPGATE_SKIP_IF_REGISTERED()                                        \
  switch (0)                                                                 \
  case 0:                                                                    \
  default:                                                                   \
    if (const auto skipgate_decision_ =                                      \
            ::skipgate::gtest::DecideCurrentTest(                            \
                ::skipgate::skip::SkipRegistry::Global());                   \
        !skipgate_decision_.skip) {                                          \
    } else                                                                   \
      GTEST_SKIP() << skipgate_decision_.reason

// Fixture whose SetUp consults the global registry, so marked tests are
// reported as skipped before their body runs. Derived fixtures overriding
// SetUp must call GuardedTest::SetUp() first and return if IsSkipped().
class GuardedTest : public ::testing::Test {
 protected:
  void SetUp() override;
};

struct SkippedTest {
  std::string test_id;
  std::string reason;
};

// Collects skipped tests and prints them with their reasons after the run.
class SkipSummaryListener : public ::testing::EmptyTestEventListener {
 public:
  void OnTestEnd(const ::testing::TestInfo& test_info) override;
  void OnTestProgramEnd(const ::testing::UnitTest& unit_test) override;

 private:
  std::vector<SkippedTest> skipped_;
};

// Name of the stderr logger installed by InitSkipgate.
inline constexpr const char* kLoggerName = "skipgate";

// Initialize GoogleTest with argc/argv, then load the rules file
// (SKIPGATE_RULES, else skipgate.yaml searched upward) into the global
// registry and install SkipSummaryListener. Logging is routed to a stderr
// logger named kLoggerName unless one is already registered. Returns false
// and prints the error when the rules file is invalid.
//
// Usage:
//   auto main(int argc, char** argv) -> int {
//     if (!skipgate::gtest::InitSkipgate(&argc, argv)) {
//       return 1;
//     }
//     return RUN_ALL_TESTS();
//   }
auto InitSkipgate(int* argc, char** argv) -> bool;

}  // namespace skipgate::gtest
