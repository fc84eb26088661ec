#include "skipgate/skip/skip_registry.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "skipgate/common/internal_error.hpp"

namespace skipgate::skip {

namespace {

auto FindRuleIn(const std::vector<SkipRule>& rules, std::string_view name)
    -> const SkipRule* {
  auto it = std::ranges::find_if(
      rules, [&](const SkipRule& rule) { return rule.name == name; });
  return it == rules.end() ? nullptr : &*it;
}

auto CompilePattern(std::string_view pattern) -> std::regex {
  try {
    return std::regex(pattern.begin(), pattern.end());
  } catch (const std::regex_error& e) {
    throw std::runtime_error(
        std::format("invalid test pattern '{}': {}", pattern, e.what()));
  }
}

}  // namespace

void SkipRegistry::AddRule(SkipRule rule) {
  std::scoped_lock lock(mutex_);
  if (FindRuleIn(rules_, rule.name) != nullptr) {
    throw std::runtime_error(
        std::format("skip rule '{}' is already registered", rule.name));
  }
  spdlog::debug(
      "registered skip rule '{}' ({}/{})", rule.name, rule.condition.Os(),
      rule.condition.Arch());
  rules_.push_back(std::move(rule));
}

void SkipRegistry::Mark(
    std::string_view test_pattern, std::string_view rule_name) {
  auto regex = CompilePattern(test_pattern);

  std::scoped_lock lock(mutex_);
  if (FindRuleIn(rules_, rule_name) == nullptr) {
    throw std::runtime_error(
        std::format(
            "test pattern '{}' refers to unknown skip rule '{}'", test_pattern,
            rule_name));
  }
  markers_.push_back(
      Marker{
          .pattern = std::string(test_pattern),
          .regex = std::move(regex),
          .rule = std::string(rule_name)});
}

auto SkipRegistry::Decide(
    std::string_view test_id,
    const platform::PlatformDescriptor& platform) const -> SkipDecision {
  for (const auto& marker : markers_) {
    if (!std::regex_search(test_id.begin(), test_id.end(), marker.regex)) {
      continue;
    }
    const SkipRule* rule = FindRuleIn(rules_, marker.rule);
    if (rule == nullptr) {
      common::ThrowInternalError(
          "SkipRegistry::Decide",
          std::format("marker '{}' has no rule", marker.pattern));
    }
    auto decision = Evaluate(*rule, platform);
    if (decision.skip) {
      spdlog::info(
          "skipping {} on {}: {}", test_id, platform::FormatPlatform(platform),
          decision.reason);
      return decision;
    }
  }
  return SkipDecision::Run();
}

auto SkipRegistry::HasRule(std::string_view name) const -> bool {
  std::scoped_lock lock(mutex_);
  return FindRuleIn(rules_, name) != nullptr;
}

auto SkipRegistry::FindRule(std::string_view name) const
    -> std::optional<SkipRule> {
  std::scoped_lock lock(mutex_);
  const SkipRule* rule = FindRuleIn(rules_, name);
  if (rule == nullptr) {
    return std::nullopt;
  }
  return *rule;
}

auto SkipRegistry::Global() -> SkipRegistry& {
  static SkipRegistry registry;
  static std::once_flag flag;
  std::call_once(
      flag, [] { registry.AddRule(MacosArm64JitExceptionRule()); });
  return registry;
}

}  // namespace skipgate::skip
