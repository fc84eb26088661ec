#include "commands.hpp"

#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "print.hpp"
#include "skipgate/config/rules_config.hpp"
#include "skipgate/platform/platform_descriptor.hpp"
#include "skipgate/platform/probe.hpp"
#include "skipgate/skip/skip_registry.hpp"
#include "skipgate/skip/skip_rule.hpp"

namespace skipgate::driver {

namespace {

auto FieldOrUnknown(const std::string& value) -> const std::string& {
  static const std::string kUnknown = "unknown";
  return value.empty() ? kUnknown : value;
}

// --os/--arch replace host detection; both or neither must be given.
auto ResolvePlatform(const argparse::ArgumentParser& cmd)
    -> std::expected<platform::PlatformDescriptor, std::string> {
  auto os = cmd.present<std::string>("--os");
  auto arch = cmd.present<std::string>("--arch");
  if (os.has_value() != arch.has_value()) {
    return std::unexpected("--os and --arch must be given together");
  }
  if (os) {
    return platform::MakePlatform(*os, *arch);
  }

  auto host = platform::ReadHostPlatform();
  if (!host.IsKnown()) {
    PrintWarning("platform could not be determined; nothing will be skipped");
  }
  return host;
}

// Registry with the built-in rule plus the rules file, if any.
// --rules names the file explicitly; otherwise SKIPGATE_RULES or an upward
// search for skipgate.yaml.
auto BuildRegistry(
    const argparse::ArgumentParser& cmd, skip::SkipRegistry& registry)
    -> bool {
  try {
    registry.AddRule(skip::MacosArm64JitExceptionRule());

    std::optional<std::filesystem::path> rules_path;
    if (auto path = cmd.present<std::string>("--rules")) {
      rules_path = *path;
    } else {
      rules_path = config::LocateRulesFile();
    }
    if (rules_path) {
      config::ApplyRulesConfig(config::LoadRulesFile(*rules_path), registry);
    }
  } catch (const std::exception& e) {
    PrintError(e.what());
    return false;
  }
  return true;
}

}  // namespace

void AddPlatformFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--os").help("Evaluate as if running on this OS");
  cmd.add_argument("--arch").help(
      "Evaluate as if running on this architecture");
  cmd.add_argument("--rules").help(
      "Rules file (default: $SKIPGATE_RULES or skipgate.yaml searched upward)");
}

auto PlatformCommand(const argparse::ArgumentParser& cmd) -> int {
  auto probe_name = cmd.get<std::string>("--probe");

  platform::PlatformDescriptor detected;
  if (probe_name == "auto") {
    detected = platform::ReadHostPlatform();
  } else {
    auto probe = platform::MakeProbe(probe_name);
    if (!probe) {
      PrintError(probe.error());
      return 1;
    }
    auto result = (*probe)->Read();
    if (!result) {
      PrintError(
          std::format("probe '{}' failed: {}", probe_name, result.error()));
      return 1;
    }
    detected = *result;
  }

  fmt::print(
      "{} {}\n", FieldOrUnknown(detected.os), FieldOrUnknown(detected.arch));
  return 0;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto resolved = ResolvePlatform(cmd);
  if (!resolved) {
    PrintError(resolved.error());
    return 1;
  }

  skip::SkipRegistry registry;
  if (!BuildRegistry(cmd, registry)) {
    return 1;
  }

  fmt::print("platform: {}\n", platform::FormatPlatform(*resolved));
  for (const auto& rule : registry.Rules()) {
    auto decision = skip::Evaluate(rule, *resolved);
    fmt::print(
        "{:<4}  {}  {}\n", decision.skip ? "skip" : "run", rule.name,
        rule.reason);
  }
  return 0;
}

auto DecideCommand(const argparse::ArgumentParser& cmd) -> int {
  auto test_id = cmd.get<std::string>("test");

  auto resolved = ResolvePlatform(cmd);
  if (!resolved) {
    PrintError(resolved.error());
    return 1;
  }

  skip::SkipRegistry registry;
  if (!BuildRegistry(cmd, registry)) {
    return 1;
  }

  auto decision = registry.Decide(test_id, *resolved);
  if (decision.skip) {
    fmt::print("skip {}: {}\n", decision.rule, decision.reason);
    return kExitSkip;
  }
  fmt::print("run\n");
  return 0;
}

}  // namespace skipgate::driver
