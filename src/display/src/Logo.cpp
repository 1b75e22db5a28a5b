/**
 * @file Logo.cpp
 * @brief Logo art tables and family/color selection.
 */

#include "src/display/inc/Logo.hpp"
#include "src/display/inc/Colors.hpp"

#include <array>
#include <span>
#include <utility> // std::move

#include <fmt/core.h>

namespace hostfetch {

namespace display {

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Row of each logo that carries the product name.
constexpr std::size_t NAME_ROW = 1;

/// Gap between the art and the product name.
constexpr const char* NAME_GAP = "   ";

/// Distribution names recognised as Linux (substring match).
constexpr std::array<std::string_view, 14> LINUX_DISTROS = {
    "Linux",   "Ubuntu", "Debian", "Fedora",  "Arch",   "Manjaro",   "CentOS",
    "RHEL",    "openSUSE", "Mint", "Pop!_OS", "Gentoo", "Slackware", "Alpine",
};

/// Letter colors of the product name, cycled.
constexpr std::array<const char*, 6> NAME_COLORS = {
    color::RED, color::GREEN, color::YELLOW, color::BLUE, color::MAGENTA, color::CYAN,
};

/* ----------------------------- Art ----------------------------- */

constexpr std::array<const char*, 7> LINUX_ART = {
    "        .--. ",
    "       |o_o |",
    "       |:_/ |",
    "      //   \\ \\",
    "     (|     | )",
    "    /'\\_   _/`\\",
    "    \\___)=(___/",
};

constexpr std::array<const char*, 7> MACOS_ART = {
    "        .:''",
    "    __ :'__",
    " .'`__`-'__``.",
    ":__________.-'",
    ":_________:",
    " :_________`-;",
    "  `.__.-.__.' ",
};

constexpr std::array<const char*, 5> WINDOWS_ART = {
    "  _______",
    " |   |   |",
    " |___|___|",
    " |   |   |",
    " |___|___|",
};

constexpr std::array<const char*, 5> GENERIC_ART = {
    "    _____",
    "   /     \\",
    "  |   ?   |",
    "  |       |",
    "   \\_____/",
};

bool contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

std::span<const char* const> artFor(LogoFamily family) noexcept {
  switch (family) {
  case LogoFamily::LINUX:
    return LINUX_ART;
  case LogoFamily::MACOS:
    return MACOS_ART;
  case LogoFamily::WINDOWS:
    return WINDOWS_ART;
  case LogoFamily::GENERIC:
  default:
    return GENERIC_ART;
  }
}

/// Product name with one color per letter.
std::string coloredProductName() {
  std::string out;
  for (std::size_t i = 0; i < PRODUCT_NAME.size(); ++i) {
    out += fmt::format("{}{}{}", NAME_COLORS[i % NAME_COLORS.size()], PRODUCT_NAME[i],
                       color::RESET);
  }
  return out;
}

} // namespace

/* ----------------------------- LogoFamily toString ----------------------------- */

const char* toString(LogoFamily family) noexcept {
  switch (family) {
  case LogoFamily::LINUX:
    return "linux";
  case LogoFamily::MACOS:
    return "macos";
  case LogoFamily::WINDOWS:
    return "windows";
  case LogoFamily::GENERIC:
  default:
    return "generic";
  }
}

/* ----------------------------- API ----------------------------- */

bool isLinuxFamily(std::string_view osName) noexcept {
  for (const std::string_view DISTRO : LINUX_DISTROS) {
    if (contains(osName, DISTRO)) {
      return true;
    }
  }
  return false;
}

LogoFamily logoFamily(std::string_view osName) noexcept {
  if (isLinuxFamily(osName)) {
    return LogoFamily::LINUX;
  }
  if (osName == "macOS" || contains(osName, "Darwin")) {
    return LogoFamily::MACOS;
  }
  if (contains(osName, "Windows")) {
    return LogoFamily::WINDOWS;
  }
  return LogoFamily::GENERIC;
}

const char* logoColor(std::string_view osName) noexcept {
  if (contains(osName, "Ubuntu") || contains(osName, "Debian")) {
    return color::RED;
  }
  if (contains(osName, "Fedora")) {
    return color::BLUE;
  }
  if (contains(osName, "Arch")) {
    return color::CYAN;
  }
  if (contains(osName, "Manjaro") || contains(osName, "openSUSE")) {
    return color::GREEN;
  }
  if (contains(osName, "macOS")) {
    return color::WHITE;
  }
  if (contains(osName, "Windows")) {
    return color::BLUE;
  }
  return color::YELLOW;
}

std::vector<std::string> renderLogo(std::string_view osName, bool showColors) {
  const std::span<const char* const> ART = artFor(logoFamily(osName));
  const char* artColor = color::when(showColors, logoColor(osName));
  const char* reset = color::when(showColors, color::RESET);

  std::vector<std::string> rows;
  rows.reserve(ART.size());
  for (std::size_t i = 0; i < ART.size(); ++i) {
    std::string row = fmt::format("{}{}{}", artColor, ART[i], reset);
    if (i == NAME_ROW) {
      row += NAME_GAP;
      row += showColors ? coloredProductName() : std::string(PRODUCT_NAME);
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace display

} // namespace hostfetch
