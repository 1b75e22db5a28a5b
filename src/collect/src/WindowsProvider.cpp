/**
 * @file WindowsProvider.cpp
 * @brief Windows collectors over Win32 system information calls.
 */

#include "src/collect/inc/WindowsProvider.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/helpers/inc/Strings.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <array>

namespace hostfetch {

namespace collect {

using hostfetch::helpers::strings::parseUint;
using hostfetch::helpers::strings::trim;

namespace {

constexpr const char* SYSTEM_DRIVE = "C:\\";

/// SYSTEM_POWER_STATUS sentinels.
constexpr BYTE BATTERY_PERCENT_UNKNOWN = 255;
constexpr BYTE BATTERY_FLAG_CHARGING = 8;
constexpr BYTE BATTERY_FLAG_NO_BATTERY = 128;
constexpr BYTE BATTERY_FLAG_UNKNOWN = 255;

std::optional<MEMORYSTATUSEX> memoryStatus() noexcept {
  MEMORYSTATUSEX status{};
  status.dwLength = sizeof(status);
  if (::GlobalMemoryStatusEx(&status) == 0) {
    return std::nullopt;
  }
  return status;
}

/// Power status with a battery present, nullopt otherwise.
std::optional<SYSTEM_POWER_STATUS> batteryPowerStatus() noexcept {
  SYSTEM_POWER_STATUS status{};
  if (::GetSystemPowerStatus(&status) == 0) {
    return std::nullopt;
  }
  if (status.BatteryFlag == BATTERY_FLAG_UNKNOWN ||
      (status.BatteryFlag & BATTERY_FLAG_NO_BATTERY) != 0 ||
      status.BatteryLifePercent == BATTERY_PERCENT_UNKNOWN) {
    return std::nullopt;
  }
  return status;
}

} // namespace

/* ----------------------------- Identity ----------------------------- */

std::string WindowsProvider::osName() const noexcept { return "Windows"; }

std::string WindowsProvider::kernelVersion() const noexcept { return "NT"; }

std::string WindowsProvider::hostname() const noexcept {
  std::array<char, MAX_COMPUTERNAME_LENGTH + 1> buf{};
  DWORD size = static_cast<DWORD>(buf.size());
  if (::GetComputerNameA(buf.data(), &size) == 0 || size == 0) {
    return std::string(UNKNOWN);
  }
  return std::string(buf.data(), size);
}

std::uint64_t WindowsProvider::uptimeSeconds() const noexcept {
  return static_cast<std::uint64_t>(::GetTickCount64()) / 1000;
}

/* ----------------------------- Desktop ----------------------------- */

std::string WindowsProvider::desktopEnvironment() const noexcept { return "Windows Shell"; }

std::string WindowsProvider::windowManager() const noexcept { return "Desktop Window Manager"; }

/* ----------------------------- Hardware ----------------------------- */

std::string WindowsProvider::cpuModel() const noexcept {
  return getEnv("PROCESSOR_IDENTIFIER").value_or(std::string(UNKNOWN));
}

std::uint32_t WindowsProvider::cpuCores() const noexcept {
  const auto VALUE = getEnv("NUMBER_OF_PROCESSORS");
  if (!VALUE) {
    return 1;
  }
  const auto COUNT = parseUint(trim(*VALUE));
  if (!COUNT || *COUNT == 0 || *COUNT > UINT32_MAX) {
    return 1;
  }
  return static_cast<std::uint32_t>(*COUNT);
}

/* ----------------------------- Memory and storage ----------------------------- */

std::uint64_t WindowsProvider::ramTotalBytes() const noexcept {
  const auto STATUS = memoryStatus();
  return STATUS ? STATUS->ullTotalPhys : 0;
}

std::uint64_t WindowsProvider::ramUsedBytes() const noexcept {
  const auto STATUS = memoryStatus();
  if (!STATUS || STATUS->ullAvailPhys > STATUS->ullTotalPhys) {
    return 0;
  }
  return STATUS->ullTotalPhys - STATUS->ullAvailPhys;
}

std::uint64_t WindowsProvider::diskTotalBytes() const noexcept {
  ULARGE_INTEGER total{};
  if (::GetDiskFreeSpaceExA(SYSTEM_DRIVE, nullptr, &total, nullptr) == 0) {
    return 0;
  }
  return total.QuadPart;
}

std::uint64_t WindowsProvider::diskUsedBytes() const noexcept {
  ULARGE_INTEGER total{};
  ULARGE_INTEGER freeBytes{};
  if (::GetDiskFreeSpaceExA(SYSTEM_DRIVE, nullptr, &total, &freeBytes) == 0 ||
      freeBytes.QuadPart > total.QuadPart) {
    return 0;
  }
  return total.QuadPart - freeBytes.QuadPart;
}

/* ----------------------------- Battery ----------------------------- */

std::optional<std::uint8_t> WindowsProvider::batteryPercent() const noexcept {
  const auto STATUS = batteryPowerStatus();
  if (!STATUS || STATUS->BatteryLifePercent > 100) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(STATUS->BatteryLifePercent);
}

std::string WindowsProvider::batteryStatus() const noexcept {
  const auto STATUS = batteryPowerStatus();
  if (!STATUS) {
    return std::string(UNKNOWN);
  }
  if ((STATUS->BatteryFlag & BATTERY_FLAG_CHARGING) != 0) {
    return "Charging";
  }
  switch (STATUS->ACLineStatus) {
  case 0:
    return "Discharging";
  case 1:
    return "Not charging";
  default:
    return std::string(UNKNOWN);
  }
}

} // namespace collect

} // namespace hostfetch
