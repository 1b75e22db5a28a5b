/**
 * @file CommandLine.cpp
 * @brief hostfetch flag handling over helpers::args.
 */

#include "src/cli/inc/CommandLine.hpp"
#include "src/collect/inc/Platform.hpp"
#include "src/display/inc/Logo.hpp"

#include <fmt/core.h>

namespace hostfetch {

namespace cli {

namespace {

/// Name of the compiler that built this binary.
std::string compilerName() {
#if defined(__clang__)
  return fmt::format("Clang {}.{}.{}", __clang_major__, __clang_minor__, __clang_patchlevel__);
#elif defined(__GNUC__)
  return fmt::format("GCC {}.{}.{}", __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  return fmt::format("MSVC {}", _MSC_VER);
#else
  return "an unknown compiler";
#endif
}

} // namespace

/* ----------------------------- Action toString ----------------------------- */

const char* toString(Action action) noexcept {
  switch (action) {
  case Action::RUN:
    return "run";
  case Action::HELP:
    return "help";
  case Action::VERSION:
    return "version";
  case Action::INVALID:
  default:
    return "invalid";
  }
}

/* ----------------------------- API ----------------------------- */

helpers::args::ArgMap buildArgMap() {
  helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message", "-h", true};
  map[ARG_VERSION] = {"--version", 0, false, "Show version information", "-v", true};
  map[ARG_NO_LOGO] = {"--no-logo", 0, false, "Hide the ASCII logo"};
  map[ARG_NO_COLORS] = {"--no-colors", 0, false, "Disable colored output"};
  map[ARG_NO_TIMING] = {"--no-timing", 0, false, "Hide execution timing"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

Options parseCommandLine(std::span<const std::string_view> args) {
  Options opts{};

  const helpers::args::ArgMap ARG_MAP = buildArgMap();
  helpers::args::ParsedArgs pargs;
  if (!helpers::args::parseArgs(args, ARG_MAP, pargs, opts.error)) {
    opts.action = Action::INVALID;
    return opts;
  }

  // Terminal flags: at most one of them was consumed before parsing stopped
  if (pargs.count(ARG_HELP) != 0) {
    opts.action = Action::HELP;
    return opts;
  }
  if (pargs.count(ARG_VERSION) != 0) {
    opts.action = Action::VERSION;
    return opts;
  }

  opts.display.showLogo = (pargs.count(ARG_NO_LOGO) == 0);
  opts.display.showColors = (pargs.count(ARG_NO_COLORS) == 0);
  opts.showTiming = (pargs.count(ARG_NO_TIMING) == 0);
  opts.json = (pargs.count(ARG_JSON) != 0);

  if (opts.json) {
    opts.display.showLogo = false;
    opts.display.showColors = false;
    opts.showTiming = false;
  }

  return opts;
}

std::string versionText() {
  const char* arch = (collect::TARGET_ARCH_NAME != nullptr) ? collect::TARGET_ARCH_NAME : "unknown";
  return fmt::format("{} {}\nCompiled with {}\nTarget: {}-{}\n", display::PRODUCT_NAME, VERSION,
                     compilerName(), arch, collect::TARGET_OS_NAME);
}

std::string usageHint(std::string_view progName) {
  return fmt::format("Run '{} --help' for usage information.", progName);
}

void printHelp(std::string_view progName) {
  helpers::args::printUsage(progName, DESCRIPTION, buildArgMap());
  fmt::print("\nExamples:\n");
  fmt::print("  {:<22} Show system information with logo\n", progName);
  fmt::print("  {:<22} Show info without ASCII art\n", fmt::format("{} --no-logo", progName));
  fmt::print("  {:<22} Show info without colors\n", fmt::format("{} --no-colors", progName));
}

} // namespace cli

} // namespace hostfetch
