#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "skipgate/platform/platform_descriptor.hpp"

namespace skipgate::skip {

// Matches any value of a condition field.
inline constexpr std::string_view kAnyValue = "*";

// Platform pair a rule applies to. Fields are normalized on construction.
// A field never matches an unknown (empty) platform value, wildcard
// included, so missing introspection data never causes a skip.
class SkipCondition {
 public:
  SkipCondition(std::string_view os, std::string_view arch);

  [[nodiscard]] auto Matches(const platform::PlatformDescriptor& platform) const
      -> bool;

  [[nodiscard]] auto Os() const -> const std::string& {
    return os_;
  }
  [[nodiscard]] auto Arch() const -> const std::string& {
    return arch_;
  }

 private:
  std::string os_;
  std::string arch_;
};

struct SkipRule {
  std::string name;
  SkipCondition condition;
  std::string reason;
  // Upstream tracking reference. Informational only.
  std::optional<std::string> tracking_issue;
};

// Outcome of evaluating rules for one test. reason and rule are empty when
// the test should run.
struct SkipDecision {
  bool skip = false;
  std::string reason;
  std::string rule;

  static auto Run() -> SkipDecision {
    return SkipDecision{};
  }

  auto operator==(const SkipDecision&) const -> bool = default;
};

inline void PrintTo(const SkipDecision& decision, std::ostream* os) {
  if (decision.skip) {
    *os << "skip(" << decision.rule << ": " << decision.reason << ")";
  } else {
    *os << "run";
  }
}

// Evaluate a single rule. Pure: depends only on the rule and the two
// platform strings.
auto Evaluate(const SkipRule& rule, const platform::PlatformDescriptor& platform)
    -> SkipDecision;

// Name of the built-in rule guarding tests that throw through JIT frames.
inline constexpr std::string_view kMacosArm64JitException =
    "macos-arm64-jit-exception";

// C++ exceptions raised from JIT-compiled code cannot be caught on macOS
// ARM64; the process aborts instead of unwinding. See
// https://github.com/llvm/llvm-project/issues/49036.
auto MacosArm64JitExceptionRule() -> const SkipRule&;

// Whether JIT exception tests must be skipped on the given platform.
auto ShouldSkip(const platform::PlatformDescriptor& platform) -> SkipDecision;

// Same, for the platform of the current process. Reads the platform on
// every call; nothing is cached.
auto ShouldSkip() -> SkipDecision;

}  // namespace skipgate::skip
