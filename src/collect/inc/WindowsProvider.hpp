#ifndef HOSTFETCH_COLLECT_WINDOWS_PROVIDER_HPP
#define HOSTFETCH_COLLECT_WINDOWS_PROVIDER_HPP
/**
 * @file WindowsProvider.hpp
 * @brief Host information from Win32 calls and the process environment (Windows only).
 *
 * Sources:
 *  - GetComputerNameA() - hostname
 *  - GetTickCount64() - uptime
 *  - PROCESSOR_IDENTIFIER, NUMBER_OF_PROCESSORS - CPU
 *  - GlobalMemoryStatusEx() - RAM
 *  - GetDiskFreeSpaceExA("C:\\") - system drive usage
 *  - GetSystemPowerStatus() - battery
 */

#include "src/collect/inc/GenericProvider.hpp"

namespace hostfetch {

namespace collect {

/* ----------------------------- WindowsProvider ----------------------------- */

class WindowsProvider : public GenericProvider {
public:
  [[nodiscard]] std::string osName() const noexcept override;
  [[nodiscard]] std::string kernelVersion() const noexcept override;
  [[nodiscard]] std::string hostname() const noexcept override;
  [[nodiscard]] std::uint64_t uptimeSeconds() const noexcept override;

  [[nodiscard]] std::string desktopEnvironment() const noexcept override;
  [[nodiscard]] std::string windowManager() const noexcept override;

  [[nodiscard]] std::string cpuModel() const noexcept override;
  [[nodiscard]] std::uint32_t cpuCores() const noexcept override;

  [[nodiscard]] std::uint64_t ramTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t ramUsedBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskUsedBytes() const noexcept override;

  [[nodiscard]] std::optional<std::uint8_t> batteryPercent() const noexcept override;
  [[nodiscard]] std::string batteryStatus() const noexcept override;
};

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_WINDOWS_PROVIDER_HPP
