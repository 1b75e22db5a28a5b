#ifndef HOSTFETCH_HELPERS_CLOCK_HPP
#define HOSTFETCH_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic timestamps for the run timing line.
 */

#include <cstdint>

#if defined(_WIN32)
#include <chrono> // steady_clock
#else
#include <ctime> // clock_gettime, CLOCK_MONOTONIC
#endif

namespace hostfetch {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC so the measurement is unaffected by wall-clock
 * adjustments during the run.
 *
 * @return Current monotonic time in nanoseconds.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
#if defined(_WIN32)
  const auto NOW = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(NOW).count());
#else
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
#endif
}

/// Whole milliseconds elapsed since a getMonotonicNs() timestamp.
[[nodiscard]] inline std::uint64_t elapsedMs(std::uint64_t startNs) noexcept {
  const std::uint64_t NOW = getMonotonicNs();
  return (NOW > startNs) ? (NOW - startNs) / 1'000'000ULL : 0;
}

} // namespace clock
} // namespace helpers
} // namespace hostfetch

#endif // HOSTFETCH_HELPERS_CLOCK_HPP
