#include "skipgate/platform/probe.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/TargetParser/Host.h>
#include <llvm/TargetParser/Triple.h>
#include <spdlog/spdlog.h>
#include <sys/utsname.h>

namespace skipgate::platform {

namespace {

auto ReadEnv(const char* name) -> std::string_view {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return {};
  }
  return value;
}

}  // namespace

auto UnameProbe::Read() const
    -> std::expected<PlatformDescriptor, std::string> {
  utsname info{};
  if (uname(&info) != 0) {
    return std::unexpected(
        std::format("uname failed: {}", std::strerror(errno)));
  }

  auto platform = MakePlatform(info.sysname, info.machine);
  if (!platform.IsKnown()) {
    return std::unexpected(
        std::format(
            "uname reported empty identifiers (sysname='{}', machine='{}')",
            info.sysname, info.machine));
  }
  return platform;
}

auto ProcessTripleProbe::Read() const
    -> std::expected<PlatformDescriptor, std::string> {
  std::string triple_string = llvm::sys::getProcessTriple();
  llvm::Triple triple(triple_string);

  if (triple.getOS() == llvm::Triple::UnknownOS ||
      triple.getArch() == llvm::Triple::UnknownArch) {
    return std::unexpected(
        std::format("cannot classify process triple '{}'", triple_string));
  }

  // "macosx" triples normalize to "darwin", matching uname on the same host.
  std::string_view os_name = llvm::Triple::getOSTypeName(triple.getOS());
  std::string_view arch_name = llvm::Triple::getArchTypeName(triple.getArch());
  return MakePlatform(os_name, arch_name);
}

auto EnvironmentProbe::Read() const
    -> std::expected<PlatformDescriptor, std::string> {
  auto platform =
      MakePlatform(ReadEnv(kOsOverrideEnv), ReadEnv(kArchOverrideEnv));
  if (!platform.IsKnown()) {
    return std::unexpected(
        std::format(
            "{} and {} must both be set", kOsOverrideEnv, kArchOverrideEnv));
  }
  return platform;
}

auto MakeProbe(std::string_view name)
    -> std::expected<std::unique_ptr<PlatformProbe>, std::string> {
  if (name == "uname") {
    return std::make_unique<UnameProbe>();
  }
  if (name == "triple") {
    return std::make_unique<ProcessTripleProbe>();
  }
  if (name == "env") {
    return std::make_unique<EnvironmentProbe>();
  }
  return std::unexpected(
      std::format(
          "unknown probe '{}', use 'auto', 'uname', 'triple', or 'env'", name));
}

auto DefaultProbeChain() -> std::vector<std::unique_ptr<PlatformProbe>> {
  std::vector<std::unique_ptr<PlatformProbe>> chain;
  chain.push_back(std::make_unique<EnvironmentProbe>());
  chain.push_back(std::make_unique<UnameProbe>());
  chain.push_back(std::make_unique<ProcessTripleProbe>());
  return chain;
}

auto ReadPlatform(const std::vector<std::unique_ptr<PlatformProbe>>& probes)
    -> PlatformDescriptor {
  for (const auto& probe : probes) {
    auto result = probe->Read();
    if (result && result->IsKnown()) {
      spdlog::debug(
          "platform {} (probe: {})", FormatPlatform(*result), probe->Name());
      return *std::move(result);
    }
    // The env probe failing is the normal case, not worth a warning.
    if (probe->Name() != "env") {
      spdlog::warn(
          "platform probe '{}' failed: {}", probe->Name(),
          result ? std::string("incomplete identifiers") : result.error());
    }
  }

  spdlog::warn("platform could not be determined; nothing will be skipped");
  return PlatformDescriptor{};
}

auto ReadHostPlatform() -> PlatformDescriptor {
  return ReadPlatform(DefaultProbeChain());
}

}  // namespace skipgate::platform
