/**
 * @file MacosProvider.cpp
 * @brief macOS collectors over sysctl, Mach VM statistics, statfs and getifaddrs.
 */

#include "src/collect/inc/MacosProvider.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/helpers/inc/Files.hpp"

#include <arpa/inet.h> // inet_ntop
#include <ifaddrs.h>   // getifaddrs, freeifaddrs
#include <mach/mach.h> // host_statistics64, mach_host_self
#include <net/if.h>    // IFF_LOOPBACK
#include <netinet/in.h>
#include <sys/mount.h>  // statfs
#include <sys/sysctl.h> // sysctlbyname
#include <sys/time.h>   // timeval

#include <array>
#include <ctime> // time

#include <fmt/core.h>

namespace hostfetch {

namespace collect {

using hostfetch::helpers::files::countDirEntries;

namespace {

/// Buffer for string sysctls (brand string is at most 48 bytes).
constexpr std::size_t SYSCTL_STRING_SIZE = 256;

/// Package directories: Homebrew (Intel and Apple Silicon prefixes), then MacPorts.
constexpr std::array<const char*, 5> PACKAGE_DIRS = {
    "/usr/local/Cellar",    "/opt/homebrew/Cellar", "/usr/local/Caskroom",
    "/opt/homebrew/Caskroom", "/opt/local/var/macports/software",
};

/// String sysctl, UNKNOWN on failure or empty value.
std::string sysctlString(const char* name) noexcept {
  std::array<char, SYSCTL_STRING_SIZE> buf{};
  std::size_t size = buf.size() - 1;
  if (::sysctlbyname(name, buf.data(), &size, nullptr, 0) != 0 || buf[0] == '\0') {
    return std::string(UNKNOWN);
  }
  return std::string(buf.data());
}

/// Fixed-size integer sysctl.
template <typename T> std::optional<T> sysctlValue(const char* name) noexcept {
  T value{};
  std::size_t size = sizeof(value);
  if (::sysctlbyname(name, &value, &size, nullptr, 0) != 0 || size != sizeof(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<struct statfs> rootVolume() noexcept {
  struct statfs st{};
  if (::statfs("/", &st) != 0) {
    return std::nullopt;
  }
  return st;
}

} // namespace

/* ----------------------------- Identity ----------------------------- */

std::string MacosProvider::osName() const noexcept { return "macOS"; }

std::string MacosProvider::osVersion() const noexcept {
  return sysctlString("kern.osproductversion");
}

std::string MacosProvider::kernelVersion() const noexcept { return sysctlString("kern.osrelease"); }

std::uint64_t MacosProvider::uptimeSeconds() const noexcept {
  const auto BOOT = sysctlValue<struct timeval>("kern.boottime");
  if (!BOOT) {
    return 0;
  }
  const std::time_t NOW = std::time(nullptr);
  if (NOW < BOOT->tv_sec) {
    return 0;
  }
  return static_cast<std::uint64_t>(NOW - BOOT->tv_sec);
}

/* ----------------------------- Desktop ----------------------------- */

std::string MacosProvider::desktopEnvironment() const noexcept { return "Aqua"; }

std::string MacosProvider::windowManager() const noexcept { return "Quartz Compositor"; }

/* ----------------------------- Hardware ----------------------------- */

std::string MacosProvider::cpuModel() const noexcept {
  return sysctlString("machdep.cpu.brand_string");
}

std::uint32_t MacosProvider::cpuCores() const noexcept {
  const auto NCPU = sysctlValue<int>("hw.ncpu");
  return (NCPU && *NCPU > 0) ? static_cast<std::uint32_t>(*NCPU) : 1;
}

/* ----------------------------- Memory and storage ----------------------------- */

std::uint64_t MacosProvider::ramTotalBytes() const noexcept {
  return sysctlValue<std::uint64_t>("hw.memsize").value_or(0);
}

std::uint64_t MacosProvider::ramUsedBytes() const noexcept {
  const auto PAGE_SIZE_BYTES = sysctlValue<int>("hw.pagesize");
  if (!PAGE_SIZE_BYTES || *PAGE_SIZE_BYTES <= 0) {
    return 0;
  }

  vm_statistics64_data_t stats{};
  mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
  const kern_return_t KR = ::host_statistics64(
      ::mach_host_self(), HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&stats), &count);
  if (KR != KERN_SUCCESS) {
    return 0;
  }

  // Active + wired + compressed is what Activity Monitor calls "used"
  const std::uint64_t PAGES = static_cast<std::uint64_t>(stats.active_count) +
                              static_cast<std::uint64_t>(stats.wire_count) +
                              static_cast<std::uint64_t>(stats.compressor_page_count);
  return PAGES * static_cast<std::uint64_t>(*PAGE_SIZE_BYTES);
}

std::uint64_t MacosProvider::diskTotalBytes() const noexcept {
  const auto FS = rootVolume();
  if (!FS) {
    return 0;
  }
  return static_cast<std::uint64_t>(FS->f_blocks) * static_cast<std::uint64_t>(FS->f_bsize);
}

std::uint64_t MacosProvider::diskUsedBytes() const noexcept {
  const auto FS = rootVolume();
  if (!FS || FS->f_bfree > FS->f_blocks) {
    return 0;
  }
  return static_cast<std::uint64_t>(FS->f_blocks - FS->f_bfree) *
         static_cast<std::uint64_t>(FS->f_bsize);
}

/* ----------------------------- Network ----------------------------- */

std::string MacosProvider::localIpAddress() const noexcept {
  struct ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) {
    return std::string(UNKNOWN);
  }

  std::string address(UNKNOWN);
  for (const struct ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET ||
        (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }

    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_addr);
    std::array<char, INET_ADDRSTRLEN> text{};
    if (::inet_ntop(AF_INET, &sin->sin_addr, text.data(), text.size()) != nullptr) {
      address = text.data();
      break;
    }
  }
  ::freeifaddrs(list);

  return address;
}

/* ----------------------------- Packages ----------------------------- */

std::string MacosProvider::packages() const noexcept {
  std::size_t total = 0;
  for (const char* dir : PACKAGE_DIRS) {
    total += countDirEntries(dir);
  }
  return (total > 0) ? fmt::format("{} (brew)", total) : std::string(UNKNOWN);
}

} // namespace collect

} // namespace hostfetch
