#include <exception>
#include <iostream>
#include <string>

#include <argparse/argparse.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

// Logs go to stderr; stdout carries results for scripts.
void ConfigureLogging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("skipgate");
  logger->set_pattern("[%n][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("skipgate", "0.1.0");
  program.add_description(
      "Decide which platform-sensitive tests run on this host");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log probe and rule evaluation details to stderr");

  // Subcommand: platform
  argparse::ArgumentParser platform_cmd("platform");
  platform_cmd.add_description("Print the detected OS and architecture");
  platform_cmd.add_argument("--probe")
      .default_value(std::string("auto"))
      .help("Probe: auto (default), uname, triple, or env");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Evaluate every skip rule for the platform");
  skipgate::driver::AddPlatformFlags(check_cmd);

  // Subcommand: decide
  argparse::ArgumentParser decide_cmd("decide");
  decide_cmd.add_description(
      "Decide whether one test runs (exit 0) or is skipped (exit 2)");
  decide_cmd.add_argument("test").help(
      "GoogleTest full name, e.g. JitException.ThrowFromKernel");
  skipgate::driver::AddPlatformFlags(decide_cmd);

  program.add_subparser(platform_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(decide_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    skipgate::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  ConfigureLogging(program.get<bool>("--verbose"));

  if (program.is_subcommand_used("platform")) {
    return skipgate::driver::PlatformCommand(platform_cmd);
  }

  if (program.is_subcommand_used("check")) {
    return skipgate::driver::CheckCommand(check_cmd);
  }

  if (program.is_subcommand_used("decide")) {
    return skipgate::driver::DecideCommand(decide_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
