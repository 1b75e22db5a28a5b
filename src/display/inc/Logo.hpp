#ifndef HOSTFETCH_DISPLAY_LOGO_HPP
#define HOSTFETCH_DISPLAY_LOGO_HPP
/**
 * @file Logo.hpp
 * @brief ASCII-art banner selection and rendering keyed by OS name.
 *
 * The family is chosen by substring match on the detected OS name, so
 * "Ubuntu 22.04.3 LTS" and "Arch Linux" both select the Linux art. The
 * second row of every logo carries the product name.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hostfetch {

namespace display {

/* ----------------------------- Constants ----------------------------- */

/// Name drawn next to the logo.
inline constexpr std::string_view PRODUCT_NAME = "hostfetch";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Logo art families.
 */
enum class LogoFamily : std::uint8_t {
  LINUX = 0, ///< Tux
  MACOS,     ///< Apple
  WINDOWS,   ///< Four panes
  GENERIC,   ///< Question mark
};

/**
 * @brief Convert LogoFamily to human-readable string.
 * @param family LogoFamily enum value.
 * @return Static string representation.
 */
[[nodiscard]] const char* toString(LogoFamily family) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check whether an OS name belongs to a Linux distribution.
 * @param osName Detected OS name.
 * @return true if it contains a known distribution name.
 */
[[nodiscard]] bool isLinuxFamily(std::string_view osName) noexcept;

/**
 * @brief Pick the logo family for an OS name.
 *
 * Linux distributions first, then macOS (exact "macOS" or containing
 * "Darwin"), then anything containing "Windows", else GENERIC.
 */
[[nodiscard]] LogoFamily logoFamily(std::string_view osName) noexcept;

/**
 * @brief ANSI color of the logo art for an OS name.
 * @return Escape sequence (yellow when no distribution matches).
 */
[[nodiscard]] const char* logoColor(std::string_view osName) noexcept;

/**
 * @brief Render the logo for an OS name.
 * @param osName Detected OS name.
 * @param showColors Wrap art rows in the logo color and color the product name.
 * @return One string per row, without newlines.
 */
[[nodiscard]] std::vector<std::string> renderLogo(std::string_view osName, bool showColors);

} // namespace display

} // namespace hostfetch

#endif // HOSTFETCH_DISPLAY_LOGO_HPP
