#ifndef HOSTFETCH_COLLECT_PROC_PARSERS_HPP
#define HOSTFETCH_COLLECT_PROC_PARSERS_HPP
/**
 * @file ProcParsers.hpp
 * @brief Pure parsers for procfs, sysfs and /etc content used by LinuxProvider.
 *
 * Every function takes file content already read into memory and returns a
 * value or nullopt. None of them touch the filesystem, so they are tested
 * directly against literal content.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hostfetch {

namespace collect {

namespace procfs {

/* ----------------------------- /proc/meminfo ----------------------------- */

/**
 * @brief Raw /proc/meminfo counters in kB (nullopt when the key is missing).
 */
struct MemInfo {
  std::optional<std::uint64_t> totalKb;     ///< MemTotal
  std::optional<std::uint64_t> freeKb;      ///< MemFree
  std::optional<std::uint64_t> availableKb; ///< MemAvailable (kernel >= 3.14)
  std::optional<std::uint64_t> buffersKb;   ///< Buffers
  std::optional<std::uint64_t> cachedKb;    ///< Cached
};

/**
 * @brief Parse /proc/meminfo content.
 * @param content File content.
 * @return Counters found; keys not present stay nullopt.
 */
[[nodiscard]] MemInfo parseMemInfo(std::string_view content) noexcept;

/// MemTotal in bytes, 0 when missing.
[[nodiscard]] std::uint64_t memTotalBytes(const MemInfo& info) noexcept;

/**
 * @brief Used memory in bytes.
 *
 * MemTotal - MemAvailable when MemAvailable is present, otherwise
 * MemTotal - (MemFree + Buffers + Cached) when all three are present.
 * Clamped at 0. Returns 0 when MemTotal or both fallbacks are missing.
 */
[[nodiscard]] std::uint64_t memUsedBytes(const MemInfo& info) noexcept;

/* ----------------------------- /proc/uptime ----------------------------- */

/**
 * @brief Whole seconds from the first field of /proc/uptime.
 * @param content File content ("12345.67 54321.00").
 * @return Truncated seconds, 0 when missing, negative or malformed.
 */
[[nodiscard]] std::uint64_t parseUptimeSeconds(std::string_view content) noexcept;

/* ----------------------------- /etc/os-release ----------------------------- */

/**
 * @brief Value of the first "KEY=" line, surrounding quotes stripped.
 * @param content os-release content.
 * @param key Key including '=' (e.g. "PRETTY_NAME=").
 * @return Unquoted value, nullopt when the key is missing or the value empty.
 */
[[nodiscard]] std::optional<std::string_view> parseOsReleaseValue(std::string_view content,
                                                                  std::string_view key) noexcept;

/* ----------------------------- /proc/cpuinfo ----------------------------- */

/// True for lines starting with "processor" (one per logical CPU on x86).
[[nodiscard]] bool isProcessorLine(std::string_view line) noexcept;

/**
 * @brief CPU model from a "model name" line.
 * @param line One cpuinfo line ("model name\t: Intel(R) Core(TM) ...").
 * @return Trimmed text after ':', nullopt for other lines or an empty value.
 */
[[nodiscard]] std::optional<std::string_view> parseModelNameLine(std::string_view line) noexcept;

/* ----------------------------- /proc/net/route ----------------------------- */

/**
 * @brief Interface of the first default route (Destination 00000000).
 * @param content /proc/net/route content, header line included.
 * @return Interface name, nullopt when there is no default route.
 */
[[nodiscard]] std::optional<std::string_view>
parseDefaultRouteInterface(std::string_view content) noexcept;

/* ----------------------------- /sys/class/drm ----------------------------- */

/**
 * @brief Map a PCI vendor id to a GPU vendor name.
 * @param vendorId Content of device/vendor ("0x10de").
 * @return "NVIDIA", "AMD", "Intel", or nullptr for other vendors.
 */
[[nodiscard]] const char* gpuVendorName(std::string_view vendorId) noexcept;

/// True for DRM card entries ("card0"), false for connectors ("card0-HDMI-A-1").
[[nodiscard]] bool isDrmCardName(std::string_view name) noexcept;

/// True for DRM connector entries ("card0-eDP-1").
[[nodiscard]] bool isDrmConnectorName(std::string_view name) noexcept;

/* ----------------------------- /sys/class/power_supply ----------------------------- */

/**
 * @brief Parse a battery capacity file.
 * @param content File content ("87").
 * @return Percent in [0, 100], nullopt when malformed or out of range.
 */
[[nodiscard]] std::optional<std::uint8_t> parseBatteryCapacity(std::string_view content) noexcept;

/* ----------------------------- Process tables ----------------------------- */

/**
 * @brief Process name and the label shown for it.
 */
struct ProcessAlias {
  const char* comm;    ///< Name as it appears in /proc/<pid>/comm
  const char* display; ///< Label reported when running
};

/// Desktop environment session processes, highest priority first.
inline constexpr std::array<ProcessAlias, 8> DESKTOP_PROCESSES = {{
    {"gnome-shell", "GNOME"},
    {"plasmashell", "KDE Plasma"},
    {"xfce4-session", "Xfce"},
    {"cinnamon", "Cinnamon"},
    {"mate-session", "MATE"},
    {"lxsession", "LXDE"},
    {"lxqt-session", "LXQt"},
    {"budgie-wm", "Budgie"},
}};

/// Window manager and compositor processes, highest priority first.
inline constexpr std::array<ProcessAlias, 15> WM_PROCESSES = {{
    {"i3", "i3"},
    {"sway", "Sway"},
    {"bspwm", "bspwm"},
    {"dwm", "dwm"},
    {"awesome", "Awesome"},
    {"openbox", "Openbox"},
    {"fluxbox", "Fluxbox"},
    {"xfwm4", "Xfwm4"},
    {"kwin_x11", "KWin"},
    {"kwin_wayland", "KWin"},
    {"mutter", "Mutter"},
    {"marco", "Marco"},
    {"Hyprland", "Hyprland"},
    {"hyprland", "Hyprland"},
    {"qtile", "Qtile"},
}};

/**
 * @brief First table entry whose process is running.
 * @param table Priority-ordered aliases.
 * @param running Process names currently running.
 * @return Display label, or nullptr when none is running.
 */
[[nodiscard]] const char* findFirstRunning(std::span<const ProcessAlias> table,
                                           std::span<const std::string> running) noexcept;

} // namespace procfs

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_PROC_PARSERS_HPP
