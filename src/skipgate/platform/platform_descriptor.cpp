#include "skipgate/platform/platform_descriptor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace skipgate::platform {

namespace {

using AliasEntry = std::pair<std::string_view, std::string_view>;

constexpr std::array<AliasEntry, 5> kOsAliases = {{
    {"macos", kOsDarwin},
    {"macosx", kOsDarwin},
    {"osx", kOsDarwin},
    {"win32", kOsWindows},
    {"windows_nt", kOsWindows},
}};

constexpr std::array<AliasEntry, 4> kArchAliases = {{
    {"aarch64", kArchArm64},
    {"arm64e", kArchArm64},
    {"amd64", kArchX86_64},
    {"x64", kArchX86_64},
}};

auto TrimLower(std::string_view raw) -> std::string {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  auto begin = std::ranges::find_if_not(raw, is_space);
  auto end = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }

  std::string result(begin, end);
  std::ranges::transform(result, result.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return result;
}

template <std::size_t N>
auto ApplyAlias(std::string value, const std::array<AliasEntry, N>& aliases)
    -> std::string {
  auto it = std::ranges::find_if(
      aliases, [&](const AliasEntry& entry) { return entry.first == value; });
  if (it != aliases.end()) {
    return std::string(it->second);
  }
  return value;
}

}  // namespace

auto NormalizeOs(std::string_view raw) -> std::string {
  return ApplyAlias(TrimLower(raw), kOsAliases);
}

auto NormalizeArch(std::string_view raw) -> std::string {
  return ApplyAlias(TrimLower(raw), kArchAliases);
}

auto MakePlatform(std::string_view raw_os, std::string_view raw_arch)
    -> PlatformDescriptor {
  return PlatformDescriptor{
      .os = NormalizeOs(raw_os), .arch = NormalizeArch(raw_arch)};
}

auto FormatPlatform(const PlatformDescriptor& platform) -> std::string {
  return std::format(
      "{}/{}", platform.os.empty() ? "unknown" : platform.os,
      platform.arch.empty() ? "unknown" : platform.arch);
}

}  // namespace skipgate::platform
