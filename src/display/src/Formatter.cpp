/**
 * @file Formatter.cpp
 * @brief Info-line table, suppression policy and unit formatting.
 */

#include "src/display/inc/Formatter.hpp"
#include "src/display/inc/Colors.hpp"
#include "src/display/inc/Logo.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <initializer_list>

#include <fmt/core.h>

namespace hostfetch {

namespace display {

using collect::isUnknown;
using collect::SystemSnapshot;
namespace fmtutil = hostfetch::helpers::format;
namespace strings = hostfetch::helpers::strings;

namespace {

/// Palette block glyphs.
constexpr const char* PALETTE_BLOCK = "███";

/// Appends label lines, honoring the color switch.
class LineWriter {
public:
  LineWriter(std::vector<std::string>& lines, bool showColors) noexcept
      : lines_(lines), showColors_(showColors) {}

  void always(std::string_view label, std::string_view value) {
    lines_.push_back(renderInfoLine(label, value, showColors_));
  }

  /// Omit the line when the value is the "Unknown" sentinel.
  void unlessUnknown(std::string_view label, std::string_view value) {
    if (!isUnknown(value)) {
      always(label, value);
    }
  }

private:
  std::vector<std::string>& lines_;
  bool showColors_;
};

std::string batteryText(std::uint8_t percent, std::string_view status) {
  if (isUnknown(status)) {
    return fmt::format("{}%", static_cast<unsigned>(percent));
  }
  return fmt::format("{}% ({})", static_cast<unsigned>(percent), status);
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::string renderInfoLine(std::string_view label, std::string_view value, bool showColors) {
  if (showColors) {
    return fmt::format("{}{}{}: {}{}", color::BOLD, color::BLUE, label, color::RESET, value);
  }
  return fmt::format("{}: {}", label, value);
}

std::string renderPalette() {
  std::string out;
  for (const char* code : {color::RED, color::GREEN, color::YELLOW, color::BLUE, color::MAGENTA,
                           color::CYAN, color::WHITE, color::BOLD}) {
    out += fmt::format("{}{}{}", code, PALETTE_BLOCK, color::RESET);
  }
  return out;
}

std::vector<std::string> renderLines(const SystemSnapshot& snap, const DisplayOptions& options) {
  const bool COLORS = options.showColors;
  std::vector<std::string> lines;

  if (options.showLogo) {
    lines = renderLogo(snap.osName, COLORS);
    lines.emplace_back();
  }

  // Header
  const char* nameColor = color::when(COLORS, color::CYAN);
  const char* reset = color::when(COLORS, color::RESET);
  lines.push_back(fmt::format("{}{}{}@{}{}{}", nameColor, snap.username, reset, nameColor,
                              snap.hostname, reset));
  const std::size_t HEADER_WIDTH =
      strings::utf8Length(snap.username) + 1 + strings::utf8Length(snap.hostname);
  lines.emplace_back(HEADER_WIDTH, '-');

  LineWriter out(lines, COLORS);

  out.always("OS", snap.osName);
  out.unlessUnknown("Version", snap.osVersion);
  out.always("Kernel", snap.kernelVersion);
  out.always("Uptime", fmtutil::uptime(snap.uptimeSeconds));
  out.unlessUnknown("Packages", snap.packages);
  out.always("Shell", snap.shell);
  out.always("Terminal", snap.terminal);
  out.unlessUnknown("Font", snap.terminalFont);
  out.unlessUnknown("DE", snap.desktopEnvironment);
  out.unlessUnknown("WM", snap.windowManager);
  out.unlessUnknown("WM Theme", snap.wmTheme);
  out.unlessUnknown("Theme", snap.theme);
  out.unlessUnknown("Icons", snap.icons);
  out.unlessUnknown("Resolution", snap.resolution);
  out.always("CPU", fmt::format("{} ({} cores)", snap.cpuModel, snap.cpuCores));
  out.unlessUnknown("GPU", snap.gpu);

  if (snap.ramTotalBytes > 0) {
    out.always("Memory",
               fmtutil::usagePair(snap.ramUsedBytes, snap.ramTotalBytes, fmtutil::MIB, "MiB"));
  }
  if (snap.diskTotalBytes > 0) {
    out.always("Disk (/)",
               fmtutil::usagePair(snap.diskUsedBytes, snap.diskTotalBytes, fmtutil::GIB, "GiB"));
  }
  if (snap.batteryPercent) {
    out.always("Battery", batteryText(*snap.batteryPercent, snap.batteryStatus));
  }

  out.unlessUnknown("Local IP", snap.localIp);
  out.unlessUnknown("Locale", snap.locale);

  if (COLORS) {
    lines.emplace_back();
    lines.push_back(renderPalette());
  }

  return lines;
}

std::string renderTimingLine(std::uint64_t elapsedMs, bool showColors) {
  return fmt::format("{}{} completed in {}ms{}", color::when(showColors, color::BOLD),
                     PRODUCT_NAME, elapsedMs, color::when(showColors, color::RESET));
}

} // namespace display

} // namespace hostfetch
