#ifndef HOSTFETCH_DISPLAY_FORMATTER_HPP
#define HOSTFETCH_DISPLAY_FORMATTER_HPP
/**
 * @file Formatter.hpp
 * @brief Text layout of a SystemSnapshot: logo, header, info lines, palette.
 *
 * Rendering is a pure function of (snapshot, options). Lines are returned
 * without trailing newlines; the caller writes them.
 *
 * Line order:
 *  - logo rows and a blank line (showLogo)
 *  - "user@host" header and a dash separator of the same width
 *  - one "Label: value" line per field, optional fields omitted when "Unknown"
 *  - a blank line and the color palette bar (showColors)
 */

#include "src/collect/inc/SystemSnapshot.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hostfetch {

namespace display {

/* ----------------------------- Options ----------------------------- */

/**
 * @brief Presentation switches set from the command line.
 */
struct DisplayOptions {
  bool showLogo{true};   ///< Draw the OS logo above the info block
  bool showColors{true}; ///< Emit ANSI escapes and the palette bar
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Render one info line.
 * @param label Field label (e.g. "Kernel").
 * @param value Field value.
 * @param showColors Bold blue label when true.
 * @return "label: value", with escapes when colored.
 */
[[nodiscard]] std::string renderInfoLine(std::string_view label, std::string_view value,
                                         bool showColors);

/// Eight color blocks: red, green, yellow, blue, magenta, cyan, white, bold.
[[nodiscard]] std::string renderPalette();

/**
 * @brief Render the full text layout.
 * @param snap Collected snapshot.
 * @param options Presentation switches.
 * @return Output lines in display order.
 */
[[nodiscard]] std::vector<std::string> renderLines(const collect::SystemSnapshot& snap,
                                                   const DisplayOptions& options);

/**
 * @brief Render the trailing run-time line.
 * @param elapsedMs Wall time of the run in milliseconds.
 * @param showColors Bold when true.
 * @return "hostfetch completed in <n>ms" (the caller precedes it with a blank line).
 */
[[nodiscard]] std::string renderTimingLine(std::uint64_t elapsedMs, bool showColors);

} // namespace display

} // namespace hostfetch

#endif // HOSTFETCH_DISPLAY_FORMATTER_HPP
