/**
 * @file LinuxProvider_uTest.cpp
 * @brief Unit tests for hostfetch::collect::LinuxProvider.
 *
 * Notes:
 *  - Fixture tests build a fake root (etc, proc, sys, var) in a mkdtemp() directory.
 *  - Live tests run against root "" and assert invariants only.
 *  - Environment variables touched by a test are restored in TearDown.
 */

#include "src/collect/inc/LinuxProvider.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdio>
#include <cstdlib> // mkdtemp, setenv, unsetenv
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using hostfetch::collect::isUnknown;
using hostfetch::collect::LinuxProvider;

class LinuxProviderTest : public ::testing::Test {
protected:
  std::string root_;
  std::vector<std::pair<std::string, std::optional<std::string>>> savedEnv_;

  void SetUp() override {
    std::array<char, 64> tmpl{};
    std::snprintf(tmpl.data(), tmpl.size(), "/tmp/hostfetch_linux_XXXXXX");
    ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
    root_ = tmpl.data();
  }

  void TearDown() override {
    for (const auto& [name, value] : savedEnv_) {
      if (value) {
        ::setenv(name.c_str(), value->c_str(), 1);
      } else {
        ::unsetenv(name.c_str());
      }
    }
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  /// Write root_ + relPath, creating parent directories.
  void write(const std::string& relPath, const std::string& content) {
    const std::filesystem::path PATH = root_ + relPath;
    std::filesystem::create_directories(PATH.parent_path());
    std::FILE* file = std::fopen(PATH.c_str(), "w");
    ASSERT_NE(file, nullptr);
    std::fputs(content.c_str(), file);
    std::fclose(file);
  }

  void makeDir(const std::string& relPath) { std::filesystem::create_directories(root_ + relPath); }

  void setEnv(const char* name, const char* value) {
    const char* old = std::getenv(name);
    savedEnv_.emplace_back(name, old ? std::optional<std::string>(old) : std::nullopt);
    if (value != nullptr) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }
};

/* ----------------------------- Construction ----------------------------- */

/** @test Trailing slashes are dropped from the root prefix. */
TEST_F(LinuxProviderTest, RootTrailingSlashStripped) {
  const LinuxProvider PROVIDER(root_ + "//");
  EXPECT_EQ(PROVIDER.root(), root_);
  EXPECT_TRUE(LinuxProvider().root().empty());
}

/* ----------------------------- Empty Root ----------------------------- */

/** @test A root with no files yields fallbacks everywhere. */
TEST_F(LinuxProviderTest, EmptyRootFallbacks) {
  setEnv("XDG_CURRENT_DESKTOP", nullptr);
  setEnv("DESKTOP_SESSION", nullptr);
  const LinuxProvider PROVIDER(root_);

  EXPECT_EQ(PROVIDER.osName(), "Linux");
  EXPECT_TRUE(isUnknown(PROVIDER.osVersion()));
  EXPECT_EQ(PROVIDER.uptimeSeconds(), 0U);
  EXPECT_TRUE(isUnknown(PROVIDER.desktopEnvironment()));
  EXPECT_TRUE(isUnknown(PROVIDER.windowManager()));
  EXPECT_TRUE(isUnknown(PROVIDER.cpuModel()));
  EXPECT_EQ(PROVIDER.cpuCores(), 1U);
  EXPECT_TRUE(isUnknown(PROVIDER.gpu()));
  EXPECT_EQ(PROVIDER.ramTotalBytes(), 0U);
  EXPECT_EQ(PROVIDER.ramUsedBytes(), 0U);
  EXPECT_TRUE(isUnknown(PROVIDER.resolution()));
  EXPECT_TRUE(isUnknown(PROVIDER.localIpAddress()));
  EXPECT_FALSE(PROVIDER.batteryPercent().has_value());
  EXPECT_TRUE(isUnknown(PROVIDER.batteryStatus()));
  EXPECT_TRUE(isUnknown(PROVIDER.packages()));
}

/** @test A root that does not exist behaves like an empty one. */
TEST_F(LinuxProviderTest, MissingRootFallbacks) {
  const LinuxProvider PROVIDER(root_ + "/does-not-exist");
  EXPECT_EQ(PROVIDER.osName(), "Linux");
  EXPECT_EQ(PROVIDER.cpuCores(), 1U);
  EXPECT_EQ(PROVIDER.diskTotalBytes(), 0U);
  EXPECT_EQ(PROVIDER.diskUsedBytes(), 0U);
}

/* ----------------------------- Identity ----------------------------- */

/** @test os-release PRETTY_NAME and VERSION_ID are used. */
TEST_F(LinuxProviderTest, OsRelease) {
  write("/etc/os-release", "NAME=\"Fedora Linux\"\n"
                           "VERSION_ID=39\n"
                           "PRETTY_NAME=\"Fedora Linux 39 (Workstation Edition)\"\n");
  const LinuxProvider PROVIDER(root_);
  EXPECT_EQ(PROVIDER.osName(), "Fedora Linux 39 (Workstation Edition)");
  EXPECT_EQ(PROVIDER.osVersion(), "39");
}

/** @test os-release without PRETTY_NAME falls back to "Linux". */
TEST_F(LinuxProviderTest, OsReleaseWithoutPrettyName) {
  write("/etc/os-release", "NAME=Alpine\n");
  EXPECT_EQ(LinuxProvider(root_).osName(), "Linux");
}

/** @test Uptime is the whole-second part of /proc/uptime. */
TEST_F(LinuxProviderTest, Uptime) {
  write("/proc/uptime", "90061.42 350000.10\n");
  EXPECT_EQ(LinuxProvider(root_).uptimeSeconds(), 90061U);
}

/* ----------------------------- CPU ----------------------------- */

/** @test Model comes from the first model name line; cores count processor lines. */
TEST_F(LinuxProviderTest, CpuInfo) {
  std::string cpuinfo;
  for (int i = 0; i < 4; ++i) {
    cpuinfo += "processor\t: " + std::to_string(i) + "\n";
    cpuinfo += "vendor_id\t: GenuineIntel\n";
    cpuinfo += "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n";
    cpuinfo += "flags\t\t: " + std::string(5000, 'f') + "\n\n";
  }
  write("/proc/cpuinfo", cpuinfo);

  const LinuxProvider PROVIDER(root_);
  EXPECT_EQ(PROVIDER.cpuModel(), "Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz");
  EXPECT_EQ(PROVIDER.cpuCores(), 4U);
}

/** @test cpuinfo without processor lines still reports one core. */
TEST_F(LinuxProviderTest, CpuInfoNoProcessorLines) {
  write("/proc/cpuinfo", "Hardware\t: BCM2835\n");
  EXPECT_EQ(LinuxProvider(root_).cpuCores(), 1U);
}

/* ----------------------------- Memory ----------------------------- */

/** @test meminfo totals are reported in bytes. */
TEST_F(LinuxProviderTest, MemInfo) {
  write("/proc/meminfo", "MemTotal:        8000000 kB\n"
                         "MemFree:          500000 kB\n"
                         "MemAvailable:    6000000 kB\n");
  const LinuxProvider PROVIDER(root_);
  EXPECT_EQ(PROVIDER.ramTotalBytes(), 8000000ULL * 1024);
  EXPECT_EQ(PROVIDER.ramUsedBytes(), 2000000ULL * 1024);
}

/* ----------------------------- Desktop ----------------------------- */

/** @test Window manager comes from the table, not from process order. */
TEST_F(LinuxProviderTest, WindowManagerFromProc) {
  write("/proc/1/comm", "systemd\n");
  write("/proc/200/comm", "sway\n");
  write("/proc/300/comm", "kwin_x11\n");
  write("/proc/self/comm", "i3\n");
  EXPECT_EQ(LinuxProvider(root_).windowManager(), "Sway");
}

/** @test The environment takes precedence for the desktop environment. */
TEST_F(LinuxProviderTest, DesktopFromEnvironment) {
  setEnv("XDG_CURRENT_DESKTOP", "ubuntu:GNOME");
  write("/proc/12/comm", "plasmashell\n");
  EXPECT_EQ(LinuxProvider(root_).desktopEnvironment(), "ubuntu:GNOME");
}

/** @test Without environment hints the process table decides. */
TEST_F(LinuxProviderTest, DesktopFromProc) {
  setEnv("XDG_CURRENT_DESKTOP", nullptr);
  setEnv("DESKTOP_SESSION", nullptr);
  write("/proc/12/comm", "xfce4-session\n");
  EXPECT_EQ(LinuxProvider(root_).desktopEnvironment(), "Xfce");
}

/** @test GTK theme and icons are read from $HOME. */
TEST_F(LinuxProviderTest, GtkSettings) {
  write("/home/.config/gtk-3.0/settings.ini", "[Settings]\n"
                                              "gtk-theme-name=Adwaita-dark\n"
                                              "gtk-icon-theme-name = Papirus\n"
                                              "gtk-icon-theme-name=Papirus\n");
  setEnv("HOME", (root_ + "/home").c_str());
  const LinuxProvider PROVIDER(root_);
  EXPECT_EQ(PROVIDER.theme(), "Adwaita-dark");
  EXPECT_EQ(PROVIDER.icons(), "Papirus");
}

/** @test Missing settings file reports Unknown. */
TEST_F(LinuxProviderTest, GtkSettingsMissing) {
  setEnv("HOME", root_.c_str());
  EXPECT_TRUE(isUnknown(LinuxProvider(root_).theme()));
}

/* ----------------------------- GPU and Display ----------------------------- */

/** @test Unlisted vendors are skipped in favour of a later card. */
TEST_F(LinuxProviderTest, GpuSkipsUnknownVendor) {
  write("/sys/class/drm/card0/device/vendor", "0x1af4\n");
  write("/sys/class/drm/card1/device/vendor", "0x10de\n");
  write("/sys/class/drm/card1-DP-1/modes", "");
  EXPECT_EQ(LinuxProvider(root_).gpu(), "NVIDIA");
}

/** @test The first connector with a mode provides the resolution. */
TEST_F(LinuxProviderTest, ResolutionFirstConnectedOutput) {
  write("/sys/class/drm/card0-DP-1/modes", "");
  write("/sys/class/drm/card0-eDP-1/modes", "2560x1440\n1920x1080\n");
  write("/sys/class/drm/card0-eDP-2/modes", "3840x2160\n");
  EXPECT_EQ(LinuxProvider(root_).resolution(), "2560x1440");
}

/** @test Connectors are tried in byte order of their names ("HDMI" before "eDP"). */
TEST_F(LinuxProviderTest, ResolutionConnectorByteOrder) {
  write("/sys/class/drm/card0-eDP-1/modes", "2560x1440\n");
  write("/sys/class/drm/card0-HDMI-A-1/modes", "3840x2160\n");
  EXPECT_EQ(LinuxProvider(root_).resolution(), "3840x2160");
}

/* ----------------------------- Network ----------------------------- */

/** @test A default route on an absent interface yields Unknown. */
TEST_F(LinuxProviderTest, LocalIpMissingInterface) {
  write("/proc/net/route",
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\n"
        "hfnone0\t00000000\t0100A8C0\t0003\t0\t0\t100\t00000000\n");
  EXPECT_TRUE(isUnknown(LinuxProvider(root_).localIpAddress()));
}

/** @test Without a default route the address is Unknown. */
TEST_F(LinuxProviderTest, LocalIpNoDefaultRoute) {
  write("/proc/net/route", "Iface\tDestination\tGateway\n"
                           "eth0\t0000A8C0\t00000000\n");
  EXPECT_TRUE(isUnknown(LinuxProvider(root_).localIpAddress()));
}

/* ----------------------------- Battery ----------------------------- */

/** @test BAT1 is used when BAT0 is absent; status comes from the same battery. */
TEST_F(LinuxProviderTest, BatteryFallsBackToBat1) {
  write("/sys/class/power_supply/AC/online", "1\n");
  write("/sys/class/power_supply/BAT1/capacity", "87\n");
  write("/sys/class/power_supply/BAT1/status", "Charging\n");
  const LinuxProvider PROVIDER(root_);
  ASSERT_TRUE(PROVIDER.batteryPercent().has_value());
  EXPECT_EQ(*PROVIDER.batteryPercent(), 87U);
  EXPECT_EQ(PROVIDER.batteryStatus(), "Charging");
}

/** @test An out-of-range capacity reads as no battery. */
TEST_F(LinuxProviderTest, BatteryCapacityOutOfRange) {
  write("/sys/class/power_supply/BAT0/capacity", "150\n");
  EXPECT_FALSE(LinuxProvider(root_).batteryPercent().has_value());
}

/* ----------------------------- Packages ----------------------------- */

/** @test Package managers are summed; the snap bin directory is not a package. */
TEST_F(LinuxProviderTest, PackagesSummed) {
  write("/var/lib/dpkg/info/bash.list", "");
  write("/var/lib/dpkg/info/bash.md5sums", "");
  write("/var/lib/dpkg/info/coreutils.list", "");
  makeDir("/var/lib/flatpak/app/org.mozilla.firefox");
  makeDir("/snap/bin");
  makeDir("/snap/core22");
  makeDir("/snap/firefox");
  EXPECT_EQ(LinuxProvider(root_).packages(), "5");
}

/** @test A lone snap/bin directory counts as nothing. */
TEST_F(LinuxProviderTest, PackagesSnapBinOnly) {
  makeDir("/snap/bin");
  EXPECT_TRUE(isUnknown(LinuxProvider(root_).packages()));
}

/* ----------------------------- Disk ----------------------------- */

/** @test Disk usage of the fixture filesystem is consistent. */
TEST_F(LinuxProviderTest, DiskUsageConsistent) {
  const LinuxProvider PROVIDER(root_);
  EXPECT_GT(PROVIDER.diskTotalBytes(), 0U);
  EXPECT_LE(PROVIDER.diskUsedBytes(), PROVIDER.diskTotalBytes());
}

/* ----------------------------- Live System ----------------------------- */

/** @test Live reads satisfy basic invariants. */
TEST_F(LinuxProviderTest, LiveInvariants) {
  const LinuxProvider PROVIDER;
  EXPECT_FALSE(PROVIDER.osName().empty());
  EXPECT_FALSE(PROVIDER.kernelVersion().empty());
  EXPECT_GE(PROVIDER.cpuCores(), 1U);
  EXPECT_LE(PROVIDER.ramUsedBytes(), PROVIDER.ramTotalBytes());
  EXPECT_LE(PROVIDER.diskUsedBytes(), PROVIDER.diskTotalBytes());
  if (const auto PCT = PROVIDER.batteryPercent()) {
    EXPECT_LE(*PCT, 100U);
  }
}
