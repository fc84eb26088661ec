#include "skipgate/gtest/skip_guard.hpp"

#include <exception>
#include <format>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "skipgate/config/rules_config.hpp"
#include "skipgate/platform/probe.hpp"

namespace skipgate::gtest {

namespace {

// First kSkip part of a result carries the GTEST_SKIP() message.
auto SkipMessage(const ::testing::TestResult& result) -> std::string {
  for (int i = 0; i < result.total_part_count(); ++i) {
    const auto& part = result.GetTestPartResult(i);
    if (part.skipped()) {
      return part.message();
    }
  }
  return {};
}

// GoogleTest owns stdout; keep skipgate's log lines on stderr like the CLI.
void ConfigureLogging() {
  if (spdlog::get(kLoggerName) != nullptr) {
    return;
  }
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern("[%n][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(logger);
}

}  // namespace

auto CurrentTestId() -> std::string {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  if (info == nullptr) {
    return {};
  }
  return std::format("{}.{}", info->test_suite_name(), info->name());
}

auto DecideCurrentTest(const skip::SkipRegistry& registry)
    -> skip::SkipDecision {
  auto test_id = CurrentTestId();
  if (test_id.empty()) {
    return skip::SkipDecision::Run();
  }
  return registry.Decide(test_id, platform::ReadHostPlatform());
}

void GuardedTest::SetUp() {
  SKIPGATE_SKIP_IF_REGISTERED();
}

void SkipSummaryListener::OnTestEnd(const ::testing::TestInfo& test_info) {
  const auto* result = test_info.result();
  if (result == nullptr || !result->Skipped()) {
    return;
  }
  skipped_.push_back(
      SkippedTest{
          .test_id = std::format(
              "{}.{}", test_info.test_suite_name(), test_info.name()),
          .reason = SkipMessage(*result)});
}

void SkipSummaryListener::OnTestProgramEnd(
    const ::testing::UnitTest& /*unit_test*/) {
  if (skipped_.empty()) {
    return;
  }
  fmt::print(
      "{} {} test(s) skipped by platform:\n",
      fmt::styled("[ SKIPGATE ]", fmt::fg(fmt::terminal_color::yellow)),
      skipped_.size());
  for (const auto& test : skipped_) {
    fmt::print(
        "{} {}: {}\n",
        fmt::styled("[ SKIPGATE ]", fmt::fg(fmt::terminal_color::yellow)),
        test.test_id, test.reason.empty() ? "(no reason given)" : test.reason);
  }
}

auto InitSkipgate(int* argc, char** argv) -> bool {
  ::testing::InitGoogleTest(argc, argv);
  ConfigureLogging();

  try {
    if (auto path = config::LocateRulesFile()) {
      auto rules = config::LoadRulesFile(*path);
      config::ApplyRulesConfig(rules, skip::SkipRegistry::Global());
    }
  } catch (const std::exception& e) {
    fmt::print(
        stderr, "{} {}\n",
        fmt::styled(
            "skipgate: error:",
            fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
        e.what());
    return false;
  }

  auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
  // Ownership passes to GoogleTest.
  listeners.Append(new SkipSummaryListener());
  spdlog::debug(
      "skipgate ready on {}",
      platform::FormatPlatform(platform::ReadHostPlatform()));
  return true;
}

}  // namespace skipgate::gtest
