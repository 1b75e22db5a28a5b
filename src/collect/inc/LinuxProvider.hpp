#ifndef HOSTFETCH_COLLECT_LINUX_PROVIDER_HPP
#define HOSTFETCH_COLLECT_LINUX_PROVIDER_HPP
/**
 * @file LinuxProvider.hpp
 * @brief Host information from /proc, /sys, /etc and a few syscalls (Linux only).
 *
 * Sources:
 *  - /etc/os-release - OS name and version
 *  - uname() - kernel release
 *  - /proc/uptime, /proc/cpuinfo, /proc/meminfo
 *  - /proc/<pid>/comm - desktop and window manager detection
 *  - /proc/net/route + ioctl(SIOCGIFADDR) - local IPv4 address
 *  - /sys/class/drm - GPU vendor and display mode
 *  - /sys/class/power_supply/BAT{0,1} - battery
 *  - statvfs() - root filesystem usage
 *  - dpkg, pacman, flatpak and snap databases - package count
 *  - $HOME/.config/gtk-3.0/settings.ini - GTK and icon theme
 *
 * Every file path is resolved under a root prefix ("" = live system) so the
 * collectors can be driven from a fixture tree.
 */

#include "src/collect/inc/GenericProvider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hostfetch {

namespace collect {

/* ----------------------------- LinuxProvider ----------------------------- */

class LinuxProvider : public GenericProvider {
public:
  /**
   * @brief Construct a provider.
   * @param root Directory prepended to every absolute path ("" = live system).
   */
  explicit LinuxProvider(std::string root = {});

  /// Root prefix this provider reads under.
  [[nodiscard]] const std::string& root() const noexcept { return root_; }

  [[nodiscard]] std::string osName() const noexcept override;
  [[nodiscard]] std::string osVersion() const noexcept override;
  [[nodiscard]] std::string kernelVersion() const noexcept override;
  [[nodiscard]] std::uint64_t uptimeSeconds() const noexcept override;

  [[nodiscard]] std::string desktopEnvironment() const noexcept override;
  [[nodiscard]] std::string windowManager() const noexcept override;
  [[nodiscard]] std::string theme() const noexcept override;
  [[nodiscard]] std::string icons() const noexcept override;

  [[nodiscard]] std::string cpuModel() const noexcept override;
  [[nodiscard]] std::uint32_t cpuCores() const noexcept override;
  [[nodiscard]] std::string gpu() const noexcept override;

  [[nodiscard]] std::uint64_t ramTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t ramUsedBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskUsedBytes() const noexcept override;

  [[nodiscard]] std::string resolution() const noexcept override;
  [[nodiscard]] std::string localIpAddress() const noexcept override;
  [[nodiscard]] std::optional<std::uint8_t> batteryPercent() const noexcept override;
  [[nodiscard]] std::string batteryStatus() const noexcept override;

  [[nodiscard]] std::string packages() const noexcept override;

private:
  /// Read root_ + absPath into buf. Returns bytes read, 0 on error.
  std::size_t readUnderRoot(const char* absPath, char* buf, std::size_t size) const noexcept;

  /// Value of a gtk-3.0 settings.ini key, UNKNOWN when missing.
  std::string gtkSetting(const char* key) const noexcept;

  /// Full path of the first battery (BAT0, BAT1) with a capacity file.
  std::optional<std::string> batteryDir() const noexcept;

  /// Process names listed under root_/proc.
  std::vector<std::string> runningProcesses() const noexcept;

  std::string root_;
};

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_LINUX_PROVIDER_HPP
