#ifndef HOSTFETCH_DISPLAY_COLORS_HPP
#define HOSTFETCH_DISPLAY_COLORS_HPP
/**
 * @file Colors.hpp
 * @brief ANSI SGR escape sequences used by the text layout.
 */

namespace hostfetch {
namespace display {
namespace color {

/* ----------------------------- Constants ----------------------------- */

inline constexpr const char* RESET = "\x1b[0m";
inline constexpr const char* BOLD = "\x1b[1m";
inline constexpr const char* RED = "\x1b[31m";
inline constexpr const char* GREEN = "\x1b[32m";
inline constexpr const char* YELLOW = "\x1b[33m";
inline constexpr const char* BLUE = "\x1b[34m";
inline constexpr const char* MAGENTA = "\x1b[35m";
inline constexpr const char* CYAN = "\x1b[36m";
inline constexpr const char* WHITE = "\x1b[37m";

/// Select a sequence only when colors are enabled.
[[nodiscard]] constexpr const char* when(bool enabled, const char* sequence) noexcept {
  return enabled ? sequence : "";
}

} // namespace color
} // namespace display
} // namespace hostfetch

#endif // HOSTFETCH_DISPLAY_COLORS_HPP
