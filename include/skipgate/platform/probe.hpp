#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "skipgate/platform/platform_descriptor.hpp"

namespace skipgate::platform {

// Environment variables that override host detection.
inline constexpr const char* kOsOverrideEnv = "SKIPGATE_OS";
inline constexpr const char* kArchOverrideEnv = "SKIPGATE_ARCH";

// Source of platform identifiers. Implementations read the environment
// and report a normalized descriptor, or a message describing why the
// identifiers are unavailable.
class PlatformProbe {
 public:
  PlatformProbe() = default;
  virtual ~PlatformProbe() = default;
  PlatformProbe(const PlatformProbe&) = delete;
  PlatformProbe(PlatformProbe&&) = delete;
  auto operator=(const PlatformProbe&) -> PlatformProbe& = delete;
  auto operator=(PlatformProbe&&) -> PlatformProbe& = delete;

  [[nodiscard]] virtual auto Name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto Read() const
      -> std::expected<PlatformDescriptor, std::string> = 0;
};

// uname(2): sysname -> os, machine -> arch.
class UnameProbe final : public PlatformProbe {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "uname";
  }
  [[nodiscard]] auto Read() const
      -> std::expected<PlatformDescriptor, std::string> override;
};

// LLVM process triple. This is the target JIT-compiled code runs on, which
// can differ from uname when the process runs under translation (Rosetta).
class ProcessTripleProbe final : public PlatformProbe {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "triple";
  }
  [[nodiscard]] auto Read() const
      -> std::expected<PlatformDescriptor, std::string> override;
};

// SKIPGATE_OS / SKIPGATE_ARCH. Fails unless both are set and non-empty.
class EnvironmentProbe final : public PlatformProbe {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "env";
  }
  [[nodiscard]] auto Read() const
      -> std::expected<PlatformDescriptor, std::string> override;
};

// Always reports the descriptor it was constructed with.
class FixedProbe final : public PlatformProbe {
 public:
  explicit FixedProbe(PlatformDescriptor platform)
      : platform_(std::move(platform)) {
  }

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "fixed";
  }
  [[nodiscard]] auto Read() const
      -> std::expected<PlatformDescriptor, std::string> override {
    return platform_;
  }

 private:
  PlatformDescriptor platform_;
};

// Create a probe by name: "uname", "triple" or "env".
// Returns an error for any other name ("auto" is handled by callers).
auto MakeProbe(std::string_view name)
    -> std::expected<std::unique_ptr<PlatformProbe>, std::string>;

// Probe chain used by ReadHostPlatform: env, uname, triple.
auto DefaultProbeChain() -> std::vector<std::unique_ptr<PlatformProbe>>;

// First probe in the chain that yields a known descriptor wins.
// If none does, returns an unknown (empty) descriptor. Never throws.
auto ReadPlatform(const std::vector<std::unique_ptr<PlatformProbe>>& probes)
    -> PlatformDescriptor;

// ReadPlatform over DefaultProbeChain.
auto ReadHostPlatform() -> PlatformDescriptor;

}  // namespace skipgate::platform
