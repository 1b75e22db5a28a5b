#ifndef HOSTFETCH_COLLECT_SYSTEM_INFO_PROVIDER_HPP
#define HOSTFETCH_COLLECT_SYSTEM_INFO_PROVIDER_HPP
/**
 * @file SystemInfoProvider.hpp
 * @brief Capability interface implemented once per platform.
 *
 * Every operation is total: it returns a parsed value or the field's
 * sentinel (UNKNOWN text, 0 bytes, 1 core, no battery), never an error.
 * Operations are independent of each other and hold no state across calls.
 */

#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string

namespace hostfetch {

namespace collect {

/**
 * @brief Field collector operations for one platform.
 */
class SystemInfoProvider {
public:
  virtual ~SystemInfoProvider() = default;

  /* --- Identity --- */
  [[nodiscard]] virtual std::string osName() const noexcept = 0;
  [[nodiscard]] virtual std::string osVersion() const noexcept = 0;
  [[nodiscard]] virtual std::string kernelVersion() const noexcept = 0;
  [[nodiscard]] virtual std::string hostname() const noexcept = 0;
  [[nodiscard]] virtual std::string username() const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t uptimeSeconds() const noexcept = 0;

  /* --- Shell and terminal --- */
  [[nodiscard]] virtual std::string shell() const noexcept = 0;
  [[nodiscard]] virtual std::string terminal() const noexcept = 0;
  [[nodiscard]] virtual std::string terminalFont() const noexcept = 0;

  /* --- Desktop --- */
  [[nodiscard]] virtual std::string desktopEnvironment() const noexcept = 0;
  [[nodiscard]] virtual std::string windowManager() const noexcept = 0;
  [[nodiscard]] virtual std::string wmTheme() const noexcept = 0;
  [[nodiscard]] virtual std::string theme() const noexcept = 0;
  [[nodiscard]] virtual std::string icons() const noexcept = 0;

  /* --- Hardware --- */
  [[nodiscard]] virtual std::string cpuModel() const noexcept = 0;
  /// @return Logical core count, at least 1.
  [[nodiscard]] virtual std::uint32_t cpuCores() const noexcept = 0;
  [[nodiscard]] virtual std::string architecture() const noexcept = 0;
  [[nodiscard]] virtual std::string gpu() const noexcept = 0;

  /* --- Memory and storage --- */
  [[nodiscard]] virtual std::uint64_t ramTotalBytes() const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t ramUsedBytes() const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t diskTotalBytes() const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t diskUsedBytes() const noexcept = 0;

  /* --- Display, network, power --- */
  [[nodiscard]] virtual std::string resolution() const noexcept = 0;
  [[nodiscard]] virtual std::string localIpAddress() const noexcept = 0;
  /// @return Charge 0-100, or nullopt when no battery is present.
  [[nodiscard]] virtual std::optional<std::uint8_t> batteryPercent() const noexcept = 0;
  [[nodiscard]] virtual std::string batteryStatus() const noexcept = 0;

  /* --- Packages and locale --- */
  [[nodiscard]] virtual std::string packages() const noexcept = 0;
  [[nodiscard]] virtual std::string locale() const noexcept = 0;
};

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_SYSTEM_INFO_PROVIDER_HPP
