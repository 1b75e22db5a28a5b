#ifndef HOSTFETCH_COLLECT_MACOS_PROVIDER_HPP
#define HOSTFETCH_COLLECT_MACOS_PROVIDER_HPP
/**
 * @file MacosProvider.hpp
 * @brief Host information from sysctl, Mach and BSD calls (macOS only).
 *
 * Sources:
 *  - sysctlbyname() - kern.osproductversion, kern.osrelease, kern.boottime,
 *    machdep.cpu.brand_string, hw.ncpu, hw.memsize, hw.pagesize
 *  - host_statistics64(HOST_VM_INFO64) - active, wired and compressed pages
 *  - statfs("/") - root volume usage
 *  - getifaddrs() - first non-loopback IPv4 address
 *  - Homebrew Cellar/Caskroom and MacPorts directories - package count
 */

#include "src/collect/inc/GenericProvider.hpp"

namespace hostfetch {

namespace collect {

/* ----------------------------- MacosProvider ----------------------------- */

class MacosProvider : public GenericProvider {
public:
  [[nodiscard]] std::string osName() const noexcept override;
  [[nodiscard]] std::string osVersion() const noexcept override;
  [[nodiscard]] std::string kernelVersion() const noexcept override;
  [[nodiscard]] std::uint64_t uptimeSeconds() const noexcept override;

  [[nodiscard]] std::string desktopEnvironment() const noexcept override;
  [[nodiscard]] std::string windowManager() const noexcept override;

  [[nodiscard]] std::string cpuModel() const noexcept override;
  [[nodiscard]] std::uint32_t cpuCores() const noexcept override;

  [[nodiscard]] std::uint64_t ramTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t ramUsedBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskUsedBytes() const noexcept override;

  [[nodiscard]] std::string localIpAddress() const noexcept override;
  [[nodiscard]] std::string packages() const noexcept override;
};

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_MACOS_PROVIDER_HPP
