#ifndef HOSTFETCH_COLLECT_SYSTEM_SNAPSHOT_HPP
#define HOSTFETCH_COLLECT_SYSTEM_SNAPSHOT_HPP
/**
 * @file SystemSnapshot.hpp
 * @brief Immutable record of every collected host attribute for one run.
 *
 * Produced once by collectSnapshot(), consumed read-only by the display
 * module, discarded at exit. All strings are owned by the snapshot.
 */

#include <cstdint>     // std::uint64_t, std::uint8_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace hostfetch {

namespace collect {

class SystemInfoProvider;

/* ----------------------------- Constants ----------------------------- */

/// Sentinel for text fields whose detection failed or is unsupported.
inline constexpr std::string_view UNKNOWN = "Unknown";

/// True if a text value is the "Unknown" sentinel.
[[nodiscard]] inline bool isUnknown(std::string_view value) noexcept { return value == UNKNOWN; }

/* ----------------------------- Main Struct ----------------------------- */

/**
 * @brief One value per queried attribute.
 *
 * Text fields hold UNKNOWN rather than being empty when undetected. Byte
 * sizes are always bytes (0 = not available). cpuCores is never 0.
 */
struct SystemSnapshot {
  /* --- Identity --- */
  std::string osName;
  std::string osVersion;
  std::string kernelVersion;
  std::string hostname;
  std::string username;
  std::uint64_t uptimeSeconds{0};

  /* --- Shell and terminal --- */
  std::string shell;
  std::string terminal;
  std::string terminalFont;

  /* --- Desktop --- */
  std::string desktopEnvironment;
  std::string windowManager;
  std::string wmTheme;
  std::string theme;
  std::string icons;

  /* --- Hardware --- */
  std::string cpuModel;
  std::uint32_t cpuCores{1};
  std::string architecture;
  std::string gpu;

  /* --- Memory and storage (bytes) --- */
  std::uint64_t ramTotalBytes{0};
  std::uint64_t ramUsedBytes{0};
  std::uint64_t diskTotalBytes{0};
  std::uint64_t diskUsedBytes{0};

  /* --- Display, network, power --- */
  std::string resolution;
  std::string localIp;
  std::optional<std::uint8_t> batteryPercent; ///< Absent when no battery
  std::string batteryStatus;

  /* --- Packages and locale --- */
  std::string packages;
  std::string locale;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build one snapshot by invoking every provider operation exactly once.
 * @param provider Bound platform provider.
 * @return Fully populated snapshot.
 * @note Allocates the snapshot strings. Never fails on a single field.
 */
[[nodiscard]] SystemSnapshot collectSnapshot(const SystemInfoProvider& provider);

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_SYSTEM_SNAPSHOT_HPP
