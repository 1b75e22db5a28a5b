#ifndef HOSTFETCH_CLI_COMMAND_LINE_HPP
#define HOSTFETCH_CLI_COMMAND_LINE_HPP
/**
 * @file CommandLine.hpp
 * @brief Flag table, parsing and help/version text of the hostfetch CLI.
 *
 * Parsing is separated from main() so the flag semantics (terminal help and
 * version, rejection of unknown tokens, option defaults) are unit-testable.
 */

#include "src/display/inc/Formatter.hpp"
#include "src/helpers/inc/Args.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#ifndef HOSTFETCH_VERSION
#define HOSTFETCH_VERSION "0.1.0"
#endif

namespace hostfetch {

namespace cli {

/* ----------------------------- Constants ----------------------------- */

/// Release version reported by --version.
inline constexpr std::string_view VERSION = HOSTFETCH_VERSION;

/// Tool description for --help.
inline constexpr std::string_view DESCRIPTION =
    "Display host information (OS, kernel, hardware, memory, disk, desktop,\n"
    "network, battery, packages) next to an ASCII logo of the OS.";

/// Process exit codes.
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_USAGE = 1;

/* ----------------------------- Enums ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_NO_LOGO = 2,
  ARG_NO_COLORS = 3,
  ARG_NO_TIMING = 4,
  ARG_JSON = 5,
};

/**
 * @brief What main() does after parsing.
 */
enum class Action : std::uint8_t {
  RUN = 0, ///< Collect and render
  HELP,    ///< Print usage, exit 0
  VERSION, ///< Print version, exit 0
  INVALID, ///< Print error and hint, exit 1
};

/**
 * @brief Convert Action to human-readable string.
 * @param action Action enum value.
 * @return Static string representation.
 */
[[nodiscard]] const char* toString(Action action) noexcept;

/* ----------------------------- Main Struct ----------------------------- */

/**
 * @brief Result of parsing the command line.
 */
struct Options {
  Action action{Action::RUN};
  display::DisplayOptions display{}; ///< Logo and color switches
  bool showTiming{true};             ///< Append "completed in <n>ms"
  bool json{false};                  ///< Emit JSON instead of the text layout
  std::string error{};               ///< Parse error (INVALID only)

  /// Exit code implied by the action (RUN is decided by main()).
  [[nodiscard]] int exitCode() const noexcept {
    return (action == Action::INVALID) ? EXIT_USAGE : EXIT_OK;
  }
};

/* ----------------------------- API ----------------------------- */

/// Build argument definitions.
[[nodiscard]] helpers::args::ArgMap buildArgMap();

/**
 * @brief Parse arguments (program name excluded).
 *
 * Tokens are handled left to right: help and version end parsing as soon as
 * they are seen, any unrecognized token yields INVALID. --json turns off the
 * logo, colors and timing line.
 *
 * @param args Arguments after argv[0].
 * @return Parsed options.
 */
[[nodiscard]] Options parseCommandLine(std::span<const std::string_view> args);

/**
 * @brief Version block: name and version, compiler, build target.
 * @return Three lines, newline-terminated.
 */
[[nodiscard]] std::string versionText();

/// "Run '<prog> --help' for usage information."
[[nodiscard]] std::string usageHint(std::string_view progName);

/// Print usage, options and examples to stdout.
void printHelp(std::string_view progName);

} // namespace cli

} // namespace hostfetch

#endif // HOSTFETCH_CLI_COMMAND_LINE_HPP
