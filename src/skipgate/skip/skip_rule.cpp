#include "skipgate/skip/skip_rule.hpp"

#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "skipgate/platform/platform_descriptor.hpp"
#include "skipgate/platform/probe.hpp"

namespace skipgate::skip {

namespace {

auto NormalizeField(std::string_view value, auto normalize) -> std::string {
  if (value == kAnyValue) {
    return std::string(kAnyValue);
  }
  return normalize(value);
}

auto FieldMatches(const std::string& expected, const std::string& actual)
    -> bool {
  if (actual.empty()) {
    return false;
  }
  return expected == kAnyValue || expected == actual;
}

}  // namespace

SkipCondition::SkipCondition(std::string_view os, std::string_view arch)
    : os_(NormalizeField(os, platform::NormalizeOs)),
      arch_(NormalizeField(arch, platform::NormalizeArch)) {
}

auto SkipCondition::Matches(const platform::PlatformDescriptor& platform) const
    -> bool {
  return FieldMatches(os_, platform.os) && FieldMatches(arch_, platform.arch);
}

auto Evaluate(const SkipRule& rule, const platform::PlatformDescriptor& platform)
    -> SkipDecision {
  if (!rule.condition.Matches(platform)) {
    return SkipDecision::Run();
  }
  return SkipDecision{.skip = true, .reason = rule.reason, .rule = rule.name};
}

auto MacosArm64JitExceptionRule() -> const SkipRule& {
  static const SkipRule kRule{
      .name = std::string(kMacosArm64JitException),
      .condition = SkipCondition(platform::kOsDarwin, platform::kArchArm64),
      .reason =
          "JIT exception handling broken on macOS ARM64 (llvm-project#49036)",
      .tracking_issue = "https://github.com/llvm/llvm-project/issues/49036",
  };
  return kRule;
}

auto ShouldSkip(const platform::PlatformDescriptor& platform) -> SkipDecision {
  auto decision = Evaluate(MacosArm64JitExceptionRule(), platform);
  spdlog::debug(
      "{} on {}: {}", kMacosArm64JitException,
      platform::FormatPlatform(platform), decision.skip ? "skip" : "run");
  return decision;
}

auto ShouldSkip() -> SkipDecision {
  return ShouldSkip(platform::ReadHostPlatform());
}

}  // namespace skipgate::skip
