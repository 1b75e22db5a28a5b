/**
 * @file hostfetch.cpp
 * @brief Host information display with an OS logo.
 *
 * Collects one snapshot from the provider of the build platform and prints
 * it as the text layout (default) or as JSON (--json). Help and version are
 * printed without collecting anything.
 */

#include "src/cli/inc/CommandLine.hpp"
#include "src/collect/inc/Platform.hpp"
#include "src/collect/inc/SystemInfoProvider.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/display/inc/Formatter.hpp"
#include "src/display/inc/JsonOutput.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace cli = hostfetch::cli;
namespace collect = hostfetch::collect;
namespace display = hostfetch::display;

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const std::uint64_t START_NS = hostfetch::helpers::clock::getMonotonicNs();
  const std::string_view PROG = (argc > 0) ? std::string_view(argv[0]) : std::string_view("hostfetch");

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  const cli::Options OPTS = cli::parseCommandLine(args);

  switch (OPTS.action) {
  case cli::Action::HELP:
    cli::printHelp(PROG);
    return OPTS.exitCode();
  case cli::Action::VERSION:
    fmt::print("{}", cli::versionText());
    return OPTS.exitCode();
  case cli::Action::INVALID:
    fmt::print(stderr, "Error: {}\n", OPTS.error);
    fmt::print(stderr, "{}\n", cli::usageHint(PROG));
    return OPTS.exitCode();
  case cli::Action::RUN:
  default:
    break;
  }

  const auto PROVIDER = collect::makeProvider(collect::currentPlatform());
  const collect::SystemSnapshot SNAP = collect::collectSnapshot(*PROVIDER);

  if (OPTS.json) {
    fmt::print("{}\n", display::renderJson(SNAP));
    return cli::EXIT_OK;
  }

  for (const std::string& line : display::renderLines(SNAP, OPTS.display)) {
    fmt::print("{}\n", line);
  }

  if (OPTS.showTiming) {
    const std::uint64_t ELAPSED_MS = hostfetch::helpers::clock::elapsedMs(START_NS);
    fmt::print("\n{}\n", display::renderTimingLine(ELAPSED_MS, OPTS.display.showColors));
  }

  return cli::EXIT_OK;
}
