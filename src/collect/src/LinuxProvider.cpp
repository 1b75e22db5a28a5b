/**
 * @file LinuxProvider.cpp
 * @brief Linux collectors: procfs/sysfs reads, uname, statvfs, ioctl.
 */

#include "src/collect/inc/LinuxProvider.hpp"
#include "src/collect/inc/ProcParsers.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <arpa/inet.h>  // inet_ntop
#include <dirent.h>     // opendir, readdir, closedir
#include <net/if.h>     // ifreq, IFNAMSIZ
#include <netinet/in.h> // sockaddr_in
#include <sys/ioctl.h>  // ioctl, SIOCGIFADDR
#include <sys/socket.h> // socket
#include <sys/statvfs.h>
#include <sys/utsname.h> // uname
#include <unistd.h>      // close

#include <algorithm> // std::sort
#include <array>
#include <cstdio>  // fopen, fgets, snprintf
#include <cstring> // strlen, strncpy
#include <utility> // std::move

namespace hostfetch {

namespace collect {

using hostfetch::helpers::files::countDirEntries;
using hostfetch::helpers::files::FILE_READ_BUFFER_SIZE;
using hostfetch::helpers::files::isDirectory;
using hostfetch::helpers::files::PATH_BUFFER_SIZE;
using hostfetch::helpers::files::pathExists;
using hostfetch::helpers::files::readFileToBuffer;
using hostfetch::helpers::strings::isAllDigits;
using hostfetch::helpers::strings::trim;

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Buffer for small multi-line files (os-release, meminfo, net/route, settings.ini).
constexpr std::size_t TEXT_BUFFER_SIZE = 4096;

/// Line buffer for streaming /proc/cpuinfo (grows with the core count).
constexpr std::size_t CPUINFO_LINE_SIZE = 4096;

constexpr const char* OS_RELEASE_PATH = "/etc/os-release";
constexpr const char* UPTIME_PATH = "/proc/uptime";
constexpr const char* CPUINFO_PATH = "/proc/cpuinfo";
constexpr const char* MEMINFO_PATH = "/proc/meminfo";
constexpr const char* ROUTE_PATH = "/proc/net/route";
constexpr const char* PROC_PATH = "/proc";
constexpr const char* DRM_PATH = "/sys/class/drm";
constexpr const char* POWER_SUPPLY_PATH = "/sys/class/power_supply";

/// Batteries probed in order.
constexpr std::array<const char*, 2> BATTERY_NAMES = {"BAT0", "BAT1"};

/* ----------------------------- Path Helpers ----------------------------- */

using PathBuffer = std::array<char, PATH_BUFFER_SIZE>;

/// root + absPath, truncated to the buffer.
PathBuffer joinPath(const std::string& root, const char* absPath) noexcept {
  PathBuffer out{};
  std::snprintf(out.data(), out.size(), "%s%s", root.c_str(), absPath);
  return out;
}

/// Entry names of a directory (without "." and ".."), sorted.
std::vector<std::string> listDir(const char* dirPath) noexcept {
  std::vector<std::string> names;

  DIR* dir = ::opendir(dirPath);
  if (dir == nullptr) {
    return names;
  }

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    const char* NAME = entry->d_name;
    if (NAME[0] == '.' && (NAME[1] == '\0' || (NAME[1] == '.' && NAME[2] == '\0'))) {
      continue;
    }
    names.emplace_back(NAME);
  }
  ::closedir(dir);

  std::sort(names.begin(), names.end());
  return names;
}

/// IPv4 address bound to an interface, rendered dotted-quad.
std::string interfaceAddress(std::string_view iface) noexcept {
  if (iface.empty() || iface.size() >= IFNAMSIZ) {
    return std::string(UNKNOWN);
  }

  const int SOCK = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (SOCK < 0) {
    return std::string(UNKNOWN);
  }

  struct ifreq ifr{};
  ifr.ifr_addr.sa_family = AF_INET;
  std::memcpy(ifr.ifr_name, iface.data(), iface.size());
  const int RET = ::ioctl(SOCK, SIOCGIFADDR, &ifr);
  ::close(SOCK);
  if (RET != 0) {
    return std::string(UNKNOWN);
  }

  sockaddr_in addr{};
  std::memcpy(&addr, &ifr.ifr_addr, sizeof(addr));

  std::array<char, INET_ADDRSTRLEN> text{};
  if (::inet_ntop(AF_INET, &addr.sin_addr, text.data(), text.size()) == nullptr) {
    return std::string(UNKNOWN);
  }
  return std::string(text.data());
}

/// statvfs of root + "/", nullopt on failure.
std::optional<struct statvfs> rootFilesystem(const std::string& root) noexcept {
  const PathBuffer PATH = joinPath(root, "/");
  struct statvfs st{};
  if (::statvfs(PATH.data(), &st) != 0) {
    return std::nullopt;
  }
  return st;
}

} // namespace

/* ----------------------------- LinuxProvider ----------------------------- */

LinuxProvider::LinuxProvider(std::string root) : root_(std::move(root)) {
  // A trailing '/' would double up with the absolute paths appended to it
  while (!root_.empty() && root_.back() == '/') {
    root_.pop_back();
  }
}

std::size_t LinuxProvider::readUnderRoot(const char* absPath, char* buf,
                                         std::size_t size) const noexcept {
  const PathBuffer PATH = joinPath(root_, absPath);
  return readFileToBuffer(PATH.data(), buf, size);
}

/* ----------------------------- Identity ----------------------------- */

std::string LinuxProvider::osName() const noexcept {
  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readUnderRoot(OS_RELEASE_PATH, buf.data(), buf.size()) == 0) {
    return "Linux";
  }
  const auto NAME = procfs::parseOsReleaseValue(buf.data(), "PRETTY_NAME=");
  return NAME ? std::string(*NAME) : std::string("Linux");
}

std::string LinuxProvider::osVersion() const noexcept {
  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readUnderRoot(OS_RELEASE_PATH, buf.data(), buf.size()) == 0) {
    return std::string(UNKNOWN);
  }
  const auto VERSION = procfs::parseOsReleaseValue(buf.data(), "VERSION_ID=");
  return VERSION ? std::string(*VERSION) : std::string(UNKNOWN);
}

std::string LinuxProvider::kernelVersion() const noexcept {
  struct utsname uts{};
  if (::uname(&uts) != 0 || uts.release[0] == '\0') {
    return std::string(UNKNOWN);
  }
  return std::string(uts.release);
}

std::uint64_t LinuxProvider::uptimeSeconds() const noexcept {
  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  if (readUnderRoot(UPTIME_PATH, buf.data(), buf.size()) == 0) {
    return 0;
  }
  return procfs::parseUptimeSeconds(buf.data());
}

/* ----------------------------- Desktop ----------------------------- */

std::vector<std::string> LinuxProvider::runningProcesses() const noexcept {
  std::vector<std::string> names;

  const PathBuffer PROC = joinPath(root_, PROC_PATH);
  DIR* dir = ::opendir(PROC.data());
  if (dir == nullptr) {
    return names;
  }

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (!isAllDigits(entry->d_name)) {
      continue;
    }

    PathBuffer commPath{};
    std::snprintf(commPath.data(), commPath.size(), "%s/%s/comm", PROC.data(), entry->d_name);

    // Process may exit between readdir and open
    std::array<char, FILE_READ_BUFFER_SIZE> comm{};
    if (readFileToBuffer(commPath.data(), comm.data(), comm.size()) == 0) {
      continue;
    }
    const std::string_view NAME = trim(comm.data());
    if (!NAME.empty()) {
      names.emplace_back(NAME);
    }
  }
  ::closedir(dir);

  return names;
}

std::string LinuxProvider::desktopEnvironment() const noexcept {
  std::string fromEnv = GenericProvider::desktopEnvironment();
  if (!isUnknown(fromEnv)) {
    return fromEnv;
  }

  const std::vector<std::string> RUNNING = runningProcesses();
  const char* label = procfs::findFirstRunning(procfs::DESKTOP_PROCESSES, RUNNING);
  return (label != nullptr) ? std::string(label) : std::string(UNKNOWN);
}

std::string LinuxProvider::windowManager() const noexcept {
  const std::vector<std::string> RUNNING = runningProcesses();
  const char* label = procfs::findFirstRunning(procfs::WM_PROCESSES, RUNNING);
  return (label != nullptr) ? std::string(label) : std::string(UNKNOWN);
}

std::string LinuxProvider::gtkSetting(const char* key) const noexcept {
  const auto HOME = getEnv("HOME");
  if (!HOME) {
    return std::string(UNKNOWN);
  }

  PathBuffer path{};
  std::snprintf(path.data(), path.size(), "%s/.config/gtk-3.0/settings.ini", HOME->c_str());

  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path.data(), buf.data(), buf.size()) == 0) {
    return std::string(UNKNOWN);
  }

  const auto VALUE = hostfetch::helpers::strings::findKeyValue(buf.data(), key);
  if (!VALUE) {
    return std::string(UNKNOWN);
  }
  const std::string_view TRIMMED = trim(*VALUE);
  return TRIMMED.empty() ? std::string(UNKNOWN) : std::string(TRIMMED);
}

std::string LinuxProvider::theme() const noexcept { return gtkSetting("gtk-theme-name="); }

std::string LinuxProvider::icons() const noexcept { return gtkSetting("gtk-icon-theme-name="); }

/* ----------------------------- CPU and GPU ----------------------------- */

std::string LinuxProvider::cpuModel() const noexcept {
  const PathBuffer PATH = joinPath(root_, CPUINFO_PATH);
  std::FILE* file = std::fopen(PATH.data(), "re");
  if (file == nullptr) {
    return std::string(UNKNOWN);
  }

  std::string model(UNKNOWN);
  std::array<char, CPUINFO_LINE_SIZE> line{};
  while (std::fgets(line.data(), static_cast<int>(line.size()), file) != nullptr) {
    if (const auto NAME = procfs::parseModelNameLine(line.data())) {
      model = std::string(*NAME);
      break;
    }
  }
  std::fclose(file);

  return model;
}

std::uint32_t LinuxProvider::cpuCores() const noexcept {
  const PathBuffer PATH = joinPath(root_, CPUINFO_PATH);
  std::FILE* file = std::fopen(PATH.data(), "re");
  if (file == nullptr) {
    return 1;
  }

  std::uint32_t count = 0;
  bool atLineStart = true;
  std::array<char, CPUINFO_LINE_SIZE> line{};
  while (std::fgets(line.data(), static_cast<int>(line.size()), file) != nullptr) {
    if (atLineStart && procfs::isProcessorLine(line.data())) {
      ++count;
    }
    // Over-long lines arrive in several chunks; only the first starts a line
    const std::size_t LEN = std::strlen(line.data());
    atLineStart = (LEN > 0 && line[LEN - 1] == '\n');
  }
  std::fclose(file);

  return (count > 0) ? count : 1;
}

std::string LinuxProvider::gpu() const noexcept {
  const PathBuffer DRM = joinPath(root_, DRM_PATH);

  for (const std::string& name : listDir(DRM.data())) {
    if (!procfs::isDrmCardName(name)) {
      continue;
    }

    PathBuffer vendorPath{};
    std::snprintf(vendorPath.data(), vendorPath.size(), "%s/%s/device/vendor", DRM.data(),
                  name.c_str());

    std::array<char, FILE_READ_BUFFER_SIZE> vendor{};
    if (readFileToBuffer(vendorPath.data(), vendor.data(), vendor.size()) == 0) {
      continue;
    }

    // Virtual or unlisted adapters are skipped in favour of a later card
    if (const char* label = procfs::gpuVendorName(vendor.data())) {
      return std::string(label);
    }
  }

  return std::string(UNKNOWN);
}

/* ----------------------------- Memory and storage ----------------------------- */

std::uint64_t LinuxProvider::ramTotalBytes() const noexcept {
  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readUnderRoot(MEMINFO_PATH, buf.data(), buf.size()) == 0) {
    return 0;
  }
  return procfs::memTotalBytes(procfs::parseMemInfo(buf.data()));
}

std::uint64_t LinuxProvider::ramUsedBytes() const noexcept {
  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readUnderRoot(MEMINFO_PATH, buf.data(), buf.size()) == 0) {
    return 0;
  }
  return procfs::memUsedBytes(procfs::parseMemInfo(buf.data()));
}

std::uint64_t LinuxProvider::diskTotalBytes() const noexcept {
  const auto FS = rootFilesystem(root_);
  if (!FS) {
    return 0;
  }
  return static_cast<std::uint64_t>(FS->f_blocks) * static_cast<std::uint64_t>(FS->f_frsize);
}

std::uint64_t LinuxProvider::diskUsedBytes() const noexcept {
  const auto FS = rootFilesystem(root_);
  if (!FS || FS->f_bfree > FS->f_blocks) {
    return 0;
  }
  return static_cast<std::uint64_t>(FS->f_blocks - FS->f_bfree) *
         static_cast<std::uint64_t>(FS->f_frsize);
}

/* ----------------------------- Display and network ----------------------------- */

std::string LinuxProvider::resolution() const noexcept {
  const PathBuffer DRM = joinPath(root_, DRM_PATH);

  for (const std::string& name : listDir(DRM.data())) {
    if (!procfs::isDrmConnectorName(name)) {
      continue;
    }

    PathBuffer modesPath{};
    std::snprintf(modesPath.data(), modesPath.size(), "%s/%s/modes", DRM.data(), name.c_str());

    // First line is the preferred mode; disconnected outputs have none
    std::array<char, FILE_READ_BUFFER_SIZE> mode{};
    if (hostfetch::helpers::files::readFileLine(modesPath.data(), mode) == 0) {
      continue;
    }
    const std::string_view TRIMMED = trim(mode.data());
    if (!TRIMMED.empty()) {
      return std::string(TRIMMED);
    }
  }

  return std::string(UNKNOWN);
}

std::string LinuxProvider::localIpAddress() const noexcept {
  std::array<char, TEXT_BUFFER_SIZE> buf{};
  if (readUnderRoot(ROUTE_PATH, buf.data(), buf.size()) == 0) {
    return std::string(UNKNOWN);
  }

  const auto IFACE = procfs::parseDefaultRouteInterface(buf.data());
  if (!IFACE) {
    return std::string(UNKNOWN);
  }
  return interfaceAddress(*IFACE);
}

/* ----------------------------- Battery ----------------------------- */

std::optional<std::string> LinuxProvider::batteryDir() const noexcept {
  const PathBuffer SUPPLY = joinPath(root_, POWER_SUPPLY_PATH);

  for (const char* battery : BATTERY_NAMES) {
    PathBuffer capacity{};
    std::snprintf(capacity.data(), capacity.size(), "%s/%s/capacity", SUPPLY.data(), battery);
    if (pathExists(capacity.data())) {
      PathBuffer dir{};
      std::snprintf(dir.data(), dir.size(), "%s/%s", SUPPLY.data(), battery);
      return std::string(dir.data());
    }
  }
  return std::nullopt;
}

std::optional<std::uint8_t> LinuxProvider::batteryPercent() const noexcept {
  const auto DIR_PATH = batteryDir();
  if (!DIR_PATH) {
    return std::nullopt;
  }

  PathBuffer path{};
  std::snprintf(path.data(), path.size(), "%s/capacity", DIR_PATH->c_str());

  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path.data(), buf.data(), buf.size()) == 0) {
    return std::nullopt;
  }
  return procfs::parseBatteryCapacity(buf.data());
}

std::string LinuxProvider::batteryStatus() const noexcept {
  const auto DIR_PATH = batteryDir();
  if (!DIR_PATH) {
    return std::string(UNKNOWN);
  }

  PathBuffer path{};
  std::snprintf(path.data(), path.size(), "%s/status", DIR_PATH->c_str());

  std::array<char, FILE_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path.data(), buf.data(), buf.size()) == 0) {
    return std::string(UNKNOWN);
  }
  const std::string_view STATUS = trim(buf.data());
  return STATUS.empty() ? std::string(UNKNOWN) : std::string(STATUS);
}

/* ----------------------------- Packages ----------------------------- */

std::string LinuxProvider::packages() const noexcept {
  std::size_t total = 0;

  total += countDirEntries(joinPath(root_, "/var/lib/dpkg/info").data(), ".list");
  total += countDirEntries(joinPath(root_, "/var/lib/pacman/local").data());
  total += countDirEntries(joinPath(root_, "/var/lib/flatpak/app").data());

  // /snap holds one directory per snap plus the "bin" launcher directory
  std::size_t snaps = countDirEntries(joinPath(root_, "/snap").data());
  if (snaps > 0 && isDirectory(joinPath(root_, "/snap/bin").data())) {
    --snaps;
  }
  total += snaps;

  return (total > 0) ? std::to_string(total) : std::string(UNKNOWN);
}

} // namespace collect

} // namespace hostfetch
