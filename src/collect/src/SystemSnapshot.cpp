/**
 * @file SystemSnapshot.cpp
 * @brief Aggregation of provider operations into one snapshot.
 */

#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/collect/inc/SystemInfoProvider.hpp"

namespace hostfetch {

namespace collect {

SystemSnapshot collectSnapshot(const SystemInfoProvider& provider) {
  SystemSnapshot snap{};

  snap.osName = provider.osName();
  snap.osVersion = provider.osVersion();
  snap.kernelVersion = provider.kernelVersion();
  snap.hostname = provider.hostname();
  snap.username = provider.username();
  snap.uptimeSeconds = provider.uptimeSeconds();

  snap.shell = provider.shell();
  snap.terminal = provider.terminal();
  snap.terminalFont = provider.terminalFont();

  snap.desktopEnvironment = provider.desktopEnvironment();
  snap.windowManager = provider.windowManager();
  snap.wmTheme = provider.wmTheme();
  snap.theme = provider.theme();
  snap.icons = provider.icons();

  snap.cpuModel = provider.cpuModel();
  const std::uint32_t CORES = provider.cpuCores();
  snap.cpuCores = (CORES > 0) ? CORES : 1;
  snap.architecture = provider.architecture();
  snap.gpu = provider.gpu();

  snap.ramTotalBytes = provider.ramTotalBytes();
  snap.ramUsedBytes = provider.ramUsedBytes();
  snap.diskTotalBytes = provider.diskTotalBytes();
  snap.diskUsedBytes = provider.diskUsedBytes();

  snap.resolution = provider.resolution();
  snap.localIp = provider.localIpAddress();
  snap.batteryPercent = provider.batteryPercent();
  snap.batteryStatus = provider.batteryStatus();

  snap.packages = provider.packages();
  snap.locale = provider.locale();

  return snap;
}

} // namespace collect

} // namespace hostfetch
