#pragma once

#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "skipgate/platform/platform_descriptor.hpp"
#include "skipgate/skip/skip_rule.hpp"

namespace skipgate::skip {

// Binds test identifiers to skip rules.
//
// Test identifiers are GoogleTest full names: "Suite.Name", or for
// parameterized tests "Prefix/Suite.Name/Param". Marker patterns are
// ECMAScript regexes matched with regex_search, so "^JitException\\." marks
// a whole suite and an exact name marks a single case.
//
// Markers are consulted in registration order; the first marker whose
// pattern matches the test and whose rule matches the platform decides.
//
// Thread safety: AddRule, Mark, HasRule and FindRule take the registry
// mutex. Decide, Rules and Markers read without it and must not overlap
// registration; register everything (static initializers, InitSkipgate)
// before tests start running.
class SkipRegistry {
 public:
  // Throws std::runtime_error if a rule with the same name exists.
  void AddRule(SkipRule rule);

  // Throws std::runtime_error on an invalid pattern or an unknown rule.
  void Mark(std::string_view test_pattern, std::string_view rule_name);

  [[nodiscard]] auto Decide(
      std::string_view test_id,
      const platform::PlatformDescriptor& platform) const -> SkipDecision;

  [[nodiscard]] auto HasRule(std::string_view name) const -> bool;
  // Copy of the named rule, or nullopt when none is registered.
  [[nodiscard]] auto FindRule(std::string_view name) const
      -> std::optional<SkipRule>;

  [[nodiscard]] auto Rules() const -> const std::vector<SkipRule>& {
    return rules_;
  }

  struct Marker {
    std::string pattern;
    std::regex regex;
    std::string rule;
  };
  [[nodiscard]] auto Markers() const -> const std::vector<Marker>& {
    return markers_;
  }

  // Process-wide registry used by the GoogleTest integration. Starts with
  // the built-in macos-arm64-jit-exception rule and no markers.
  static auto Global() -> SkipRegistry&;

 private:
  mutable std::mutex mutex_;
  std::vector<SkipRule> rules_;
  std::vector<Marker> markers_;
};

}  // namespace skipgate::skip
