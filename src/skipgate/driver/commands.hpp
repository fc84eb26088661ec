#pragma once

#include <argparse/argparse.hpp>

namespace skipgate::driver {

// Exit code of `decide` when the test should be skipped.
inline constexpr int kExitSkip = 2;

void AddPlatformFlags(argparse::ArgumentParser& cmd);

auto PlatformCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto DecideCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace skipgate::driver
