#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "skipgate/skip/skip_registry.hpp"
#include "skipgate/skip/skip_rule.hpp"

namespace skipgate::config {

inline constexpr const char* kRulesFileName = "skipgate.yaml";
inline constexpr const char* kRulesPathEnv = "SKIPGATE_RULES";

struct MarkerConfig {
  std::string test_pattern;
  std::string rule;
};

// Contents of a skipgate.yaml file:
//
//   rules:
//     <name>:
//       os: darwin            # or "*"
//       arch: arm64           # or "*"
//       reason: "..."
//       issue: "..."          # optional
//   markers:
//     - test: "^JitException\\."
//       rule: <name>
struct RulesConfig {
  std::vector<skip::SkipRule> rules;
  std::vector<MarkerConfig> markers;

  // File the configuration was loaded from
  std::filesystem::path source;
};

// Search for skipgate.yaml starting from start_dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindRulesFile(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// SKIPGATE_RULES if set, otherwise FindRulesFile().
auto LocateRulesFile() -> std::optional<std::filesystem::path>;

// Parse a rules file. Throws std::runtime_error with file and key context on
// parse errors, missing required fields, or duplicate rule names.
auto LoadRulesFile(const std::filesystem::path& path) -> RulesConfig;

// Register the configured rules and markers. Rule names must not collide
// with rules already in the registry; markers may refer to any rule the
// registry knows, built-ins included. Throws std::runtime_error, in which
// case the registry is left unchanged.
void ApplyRulesConfig(const RulesConfig& config, skip::SkipRegistry& registry);

}  // namespace skipgate::config
