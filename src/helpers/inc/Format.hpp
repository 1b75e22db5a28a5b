#ifndef HOSTFETCH_HELPERS_FORMAT_HPP
#define HOSTFETCH_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for byte pairs and uptime.
 *
 * Provides consistent formatting for the info lines and the JSON output.
 * Uses fmt library for string formatting.
 *
 * @note All functions returning std::string allocate. Use only when rendering.
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace hostfetch {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t KIB = 1024ULL;
inline constexpr std::uint64_t MIB = KIB * 1024ULL;
inline constexpr std::uint64_t GIB = MIB * 1024ULL;

inline constexpr std::uint64_t SECONDS_PER_MINUTE = 60;
inline constexpr std::uint64_t SECONDS_PER_HOUR = 3600;
inline constexpr std::uint64_t SECONDS_PER_DAY = 86400;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Percentage of used over total.
 * @param used Used amount.
 * @param total Total amount.
 * @return used / total * 100, or 0.0 when total is zero.
 */
[[nodiscard]] inline double percent(std::uint64_t used, std::uint64_t total) noexcept {
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(used) / static_cast<double>(total) * 100.0;
}

/**
 * @brief Format a used/total byte pair in a fixed unit.
 * @param usedBytes Used bytes.
 * @param totalBytes Total bytes.
 * @param unitBytes Unit divisor (MIB or GIB); values are floored.
 * @param unitName Unit label (e.g. "MiB").
 * @return "<used> <unit> / <total> <unit> (<percent>%)", percent with one decimal.
 */
[[nodiscard]] inline std::string usagePair(std::uint64_t usedBytes, std::uint64_t totalBytes,
                                           std::uint64_t unitBytes, const char* unitName) {
  return fmt::format("{} {} / {} {} ({:.1f}%)", usedBytes / unitBytes, unitName,
                     totalBytes / unitBytes, unitName, percent(usedBytes, totalBytes));
}

/**
 * @brief Format uptime down to the largest non-zero tier.
 *
 * Examples: 0 -> "0 secs", 61 -> "1 mins", 3661 -> "1 hours, 1 mins",
 * 90061 -> "1 days, 1 hours, 1 mins".
 *
 * @param seconds Uptime in seconds.
 * @return Formatted string.
 */
[[nodiscard]] inline std::string uptime(std::uint64_t seconds) {
  const std::uint64_t DAYS = seconds / SECONDS_PER_DAY;
  const std::uint64_t HOURS = (seconds % SECONDS_PER_DAY) / SECONDS_PER_HOUR;
  const std::uint64_t MINUTES = (seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE;

  if (DAYS > 0) {
    return fmt::format("{} days, {} hours, {} mins", DAYS, HOURS, MINUTES);
  }
  if (HOURS > 0) {
    return fmt::format("{} hours, {} mins", HOURS, MINUTES);
  }
  if (MINUTES > 0) {
    return fmt::format("{} mins", MINUTES);
  }
  return fmt::format("{} secs", seconds);
}

} // namespace format
} // namespace helpers
} // namespace hostfetch

#endif // HOSTFETCH_HELPERS_FORMAT_HPP
