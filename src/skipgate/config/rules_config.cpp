#include "skipgate/config/rules_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace skipgate::config {

namespace fs = std::filesystem;

namespace {

auto RequireString(
    const YAML::Node& node, const char* key, const std::string& context)
    -> std::string {
  if (!node[key]) {
    throw std::runtime_error(std::format("{}.{} is required", context, key));
  }
  auto value = node[key].as<std::string>();
  if (value.empty()) {
    throw std::runtime_error(
        std::format("{}.{} must not be empty", context, key));
  }
  return value;
}

auto ParseRule(
    const std::string& name, const YAML::Node& node,
    const std::string& context) -> skip::SkipRule {
  if (!node.IsMap()) {
    throw std::runtime_error(std::format("{} must be a mapping", context));
  }

  auto os = RequireString(node, "os", context);
  auto arch = RequireString(node, "arch", context);

  skip::SkipRule rule{
      .name = name,
      .condition = skip::SkipCondition(os, arch),
      .reason = RequireString(node, "reason", context),
      .tracking_issue = std::nullopt,
  };
  if (node["issue"]) {
    rule.tracking_issue = node["issue"].as<std::string>();
  }
  return rule;
}

}  // namespace

auto FindRulesFile(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path rules_path = dir / kRulesFileName;
    if (fs::exists(rules_path)) {
      return rules_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LocateRulesFile() -> std::optional<fs::path> {
  if (const char* path = std::getenv(kRulesPathEnv)) {
    if (*path != '\0') {
      return fs::path(path);
    }
  }
  return FindRulesFile();
}

auto LoadRulesFile(const fs::path& path) -> RulesConfig {
  if (!fs::exists(path)) {
    throw std::runtime_error(
        std::format("Rules file not found: {}", path.string()));
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(
        std::format("{}: YAML parse error: {}", path.string(), e.what()));
  }

  RulesConfig config;
  config.source = path;

  if (!root.IsDefined() || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error(
        std::format("{}: top level must be a mapping", path.string()));
  }

  if (auto rules = root["rules"]) {
    if (!rules.IsMap()) {
      throw std::runtime_error(
          std::format("{}: 'rules' must be a mapping", path.string()));
    }
    for (const auto& entry : rules) {
      auto name = entry.first.as<std::string>();
      auto context = std::format("{}: rules.{}", path.string(), name);
      try {
        auto duplicate = std::ranges::any_of(
            config.rules,
            [&](const skip::SkipRule& rule) { return rule.name == name; });
        if (duplicate) {
          throw std::runtime_error(
              std::format("{} is defined more than once", context));
        }
        config.rules.push_back(ParseRule(name, entry.second, context));
      } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::format("{}: {}", context, e.what()));
      }
    }
  }

  if (auto markers = root["markers"]) {
    if (!markers.IsSequence()) {
      throw std::runtime_error(
          std::format("{}: 'markers' must be a list", path.string()));
    }
    for (std::size_t i = 0; i < markers.size(); ++i) {
      auto context = std::format("{}: markers[{}]", path.string(), i);
      try {
        const auto& node = markers[i];
        config.markers.push_back(
            MarkerConfig{
                .test_pattern = RequireString(node, "test", context),
                .rule = RequireString(node, "rule", context)});
      } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::format("{}: {}", context, e.what()));
      }
    }
  }

  spdlog::debug(
      "loaded {} rule(s) and {} marker(s) from {}", config.rules.size(),
      config.markers.size(), path.string());
  return config;
}

namespace {

void AddToRegistry(const RulesConfig& config, skip::SkipRegistry& registry) {
  for (const auto& rule : config.rules) {
    try {
      registry.AddRule(rule);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(
          std::format("{}: {}", config.source.string(), e.what()));
    }
  }

  for (std::size_t i = 0; i < config.markers.size(); ++i) {
    const auto& marker = config.markers[i];
    try {
      registry.Mark(marker.test_pattern, marker.rule);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(
          std::format(
              "{}: markers[{}]: {}", config.source.string(), i, e.what()));
    }
  }
}

}  // namespace

void ApplyRulesConfig(const RulesConfig& config, skip::SkipRegistry& registry) {
  // Dry run against a scratch registry holding the same rules; only a config
  // that applies cleanly there touches `registry`.
  skip::SkipRegistry scratch;
  for (const auto& rule : registry.Rules()) {
    scratch.AddRule(rule);
  }
  AddToRegistry(config, scratch);

  AddToRegistry(config, registry);
}

}  // namespace skipgate::config
