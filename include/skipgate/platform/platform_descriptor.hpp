#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace skipgate::platform {

// Well-known normalized identifiers.
inline constexpr std::string_view kOsDarwin = "darwin";
inline constexpr std::string_view kOsLinux = "linux";
inline constexpr std::string_view kOsWindows = "windows";
inline constexpr std::string_view kArchArm64 = "arm64";
inline constexpr std::string_view kArchX86_64 = "x86_64";

// Operating system and machine architecture of the executing process.
// Both identifiers are lowercase and alias-normalized. An empty field means
// the value could not be determined.
struct PlatformDescriptor {
  std::string os;
  std::string arch;

  [[nodiscard]] auto IsKnown() const -> bool {
    return !os.empty() && !arch.empty();
  }

  auto operator==(const PlatformDescriptor&) const -> bool = default;
};

// Build a descriptor from raw identifiers as reported by the host
// (e.g., "Darwin"/"aarch64"), normalizing both.
auto MakePlatform(std::string_view raw_os, std::string_view raw_arch)
    -> PlatformDescriptor;

// Lowercase, trim, and map OS aliases: macos/macosx/osx -> darwin,
// win32/windows_nt -> windows.
auto NormalizeOs(std::string_view raw) -> std::string;

// Lowercase, trim, and map architecture aliases: aarch64/arm64e -> arm64,
// amd64/x64 -> x86_64.
auto NormalizeArch(std::string_view raw) -> std::string;

// "os/arch", with "unknown" standing in for empty fields.
auto FormatPlatform(const PlatformDescriptor& platform) -> std::string;

inline void PrintTo(const PlatformDescriptor& platform, std::ostream* os) {
  *os << FormatPlatform(platform);
}

}  // namespace skipgate::platform
