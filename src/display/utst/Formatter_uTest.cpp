/**
 * @file Formatter_uTest.cpp
 * @brief Unit tests for hostfetch::display text layout.
 *
 * Notes:
 *  - Snapshots are built by hand; no provider is involved.
 */

#include "src/display/inc/Colors.hpp"
#include "src/display/inc/Formatter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace color = hostfetch::display::color;
using hostfetch::collect::SystemSnapshot;
using hostfetch::display::DisplayOptions;
using hostfetch::display::renderInfoLine;
using hostfetch::display::renderLines;
using hostfetch::display::renderPalette;
using hostfetch::display::renderTimingLine;

class FormatterTest : public ::testing::Test {
protected:
  SystemSnapshot snap_{};
  const DisplayOptions plain_{false, false};

  void SetUp() override {
    snap_.osName = "Ubuntu 22.04.3 LTS";
    snap_.osVersion = "22.04";
    snap_.kernelVersion = "6.5.0-14-generic";
    snap_.hostname = "thinkpad";
    snap_.username = "alice";
    snap_.uptimeSeconds = 3661;
    snap_.shell = "zsh";
    snap_.terminal = "xterm-256color";
    snap_.terminalFont = "Unknown";
    snap_.desktopEnvironment = "GNOME";
    snap_.windowManager = "Mutter";
    snap_.wmTheme = "Unknown";
    snap_.theme = "Yaru";
    snap_.icons = "Unknown";
    snap_.cpuModel = "Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz";
    snap_.cpuCores = 8;
    snap_.architecture = "x86_64";
    snap_.gpu = "Intel";
    snap_.ramTotalBytes = 16384ULL * 1024 * 1024;
    snap_.ramUsedBytes = 8192ULL * 1024 * 1024;
    snap_.diskTotalBytes = 0;
    snap_.diskUsedBytes = 0;
    snap_.resolution = "1920x1080";
    snap_.localIp = "192.168.1.20";
    snap_.batteryStatus = "Unknown";
    snap_.packages = "1532";
    snap_.locale = "en_US.UTF-8";
  }

  static bool hasLine(const std::vector<std::string>& lines, const std::string& text) {
    return std::find(lines.begin(), lines.end(), text) != lines.end();
  }

  static bool hasLabel(const std::vector<std::string>& lines, const std::string& label) {
    return std::any_of(lines.begin(), lines.end(), [&label](const std::string& line) {
      return line.rfind(label + ": ", 0) == 0;
    });
  }
};

/* ----------------------------- Info Lines ----------------------------- */

/** @test Plain and colored label forms. */
TEST_F(FormatterTest, InfoLineForms) {
  EXPECT_EQ(renderInfoLine("Kernel", "6.5.0", false), "Kernel: 6.5.0");
  EXPECT_EQ(renderInfoLine("Kernel", "6.5.0", true),
            std::string(color::BOLD) + color::BLUE + "Kernel: " + color::RESET + "6.5.0");
}

/* ----------------------------- Header ----------------------------- */

/** @test Header and separator lead when the logo is off. */
TEST_F(FormatterTest, HeaderAndSeparator) {
  const auto LINES = renderLines(snap_, plain_);
  ASSERT_GE(LINES.size(), 2U);
  EXPECT_EQ(LINES[0], "alice@thinkpad");
  EXPECT_EQ(LINES[1], std::string(14, '-'));
}

/** @test The separator counts characters, not bytes. */
TEST_F(FormatterTest, SeparatorCountsCodePoints) {
  snap_.username = "Jos\xc3\xa9";
  snap_.hostname = "host";
  const auto LINES = renderLines(snap_, plain_);
  ASSERT_GE(LINES.size(), 2U);
  EXPECT_EQ(LINES[0], "Jos\xc3\xa9@host");
  EXPECT_EQ(LINES[1], std::string(9, '-'));
}

/** @test The logo and a blank line precede the header. */
TEST_F(FormatterTest, LogoPrecedesHeader) {
  const auto LINES = renderLines(snap_, DisplayOptions{true, false});
  ASSERT_GE(LINES.size(), 9U);
  EXPECT_TRUE(LINES[7].empty());
  EXPECT_EQ(LINES[8], "alice@thinkpad");
}

/* ----------------------------- Fields ----------------------------- */

/** @test Present fields render in order with their labels. */
TEST_F(FormatterTest, PresentFields) {
  const auto LINES = renderLines(snap_, plain_);
  EXPECT_EQ(LINES[2], "OS: Ubuntu 22.04.3 LTS");
  EXPECT_EQ(LINES[3], "Version: 22.04");
  EXPECT_EQ(LINES[4], "Kernel: 6.5.0-14-generic");
  EXPECT_EQ(LINES[5], "Uptime: 1 hours, 1 mins");
  EXPECT_EQ(LINES[6], "Packages: 1532");
  EXPECT_TRUE(hasLine(LINES, "CPU: Intel(R) Core(TM) i7-8650U CPU @ 1.90GHz (8 cores)"));
  EXPECT_TRUE(hasLine(LINES, "Memory: 8192 MiB / 16384 MiB (50.0%)"));
  EXPECT_TRUE(hasLine(LINES, "Local IP: 192.168.1.20"));
  EXPECT_EQ(LINES.back(), "Locale: en_US.UTF-8");
}

/** @test Optional fields holding Unknown are omitted. */
TEST_F(FormatterTest, UnknownOptionalSuppressed) {
  const auto LINES = renderLines(snap_, plain_);
  EXPECT_FALSE(hasLabel(LINES, "Font"));
  EXPECT_FALSE(hasLabel(LINES, "WM Theme"));
  EXPECT_FALSE(hasLabel(LINES, "Icons"));
  EXPECT_TRUE(hasLabel(LINES, "Theme"));
}

/** @test Core fields are printed even when Unknown. */
TEST_F(FormatterTest, CoreFieldsAlwaysShown) {
  snap_.kernelVersion = "Unknown";
  snap_.shell = "Unknown";
  snap_.terminal = "Unknown";
  const auto LINES = renderLines(snap_, plain_);
  EXPECT_TRUE(hasLine(LINES, "Kernel: Unknown"));
  EXPECT_TRUE(hasLine(LINES, "Shell: Unknown"));
  EXPECT_TRUE(hasLine(LINES, "Terminal: Unknown"));
}

/** @test Zero totals hide memory and disk lines. */
TEST_F(FormatterTest, ZeroTotalsHidden) {
  snap_.ramTotalBytes = 0;
  const auto LINES = renderLines(snap_, plain_);
  EXPECT_FALSE(hasLabel(LINES, "Memory"));
  EXPECT_FALSE(hasLabel(LINES, "Disk (/)"));
}

/** @test Disk is reported in GiB. */
TEST_F(FormatterTest, DiskInGib) {
  snap_.diskTotalBytes = 512ULL * 1024 * 1024 * 1024;
  snap_.diskUsedBytes = 128ULL * 1024 * 1024 * 1024;
  EXPECT_TRUE(hasLine(renderLines(snap_, plain_), "Disk (/): 128 GiB / 512 GiB (25.0%)"));
}

/* ----------------------------- Battery ----------------------------- */

/** @test No battery, no line. */
TEST_F(FormatterTest, BatteryAbsent) {
  EXPECT_FALSE(hasLabel(renderLines(snap_, plain_), "Battery"));
}

/** @test Percent with and without a status. */
TEST_F(FormatterTest, BatteryForms) {
  snap_.batteryPercent = 87;
  EXPECT_TRUE(hasLine(renderLines(snap_, plain_), "Battery: 87%"));
  snap_.batteryStatus = "Charging";
  EXPECT_TRUE(hasLine(renderLines(snap_, plain_), "Battery: 87% (Charging)"));
}

/* ----------------------------- Colors ----------------------------- */

/** @test Plain output carries no escape sequences. */
TEST_F(FormatterTest, NoEscapesWhenPlain) {
  for (const std::string& line : renderLines(snap_, DisplayOptions{true, false})) {
    EXPECT_EQ(line.find('\x1b'), std::string::npos) << line;
  }
}

/** @test The palette closes colored output after a blank line. */
TEST_F(FormatterTest, PaletteOnlyWithColors) {
  const auto COLORED = renderLines(snap_, DisplayOptions{false, true});
  ASSERT_GE(COLORED.size(), 2U);
  EXPECT_EQ(COLORED.back(), renderPalette());
  EXPECT_TRUE(COLORED[COLORED.size() - 2].empty());

  EXPECT_FALSE(hasLine(renderLines(snap_, plain_), renderPalette()));
}

/** @test The palette holds eight reset-terminated blocks. */
TEST_F(FormatterTest, PaletteBlocks) {
  const std::string PALETTE = renderPalette();
  std::size_t resets = 0;
  for (std::size_t pos = PALETTE.find(color::RESET); pos != std::string::npos;
       pos = PALETTE.find(color::RESET, pos + 1)) {
    ++resets;
  }
  EXPECT_EQ(resets, 8U);
}

/* ----------------------------- Timing ----------------------------- */

/** @test Timing line, plain and bold. */
TEST_F(FormatterTest, TimingLine) {
  EXPECT_EQ(renderTimingLine(12, false), "hostfetch completed in 12ms");
  EXPECT_EQ(renderTimingLine(3, true),
            std::string(color::BOLD) + "hostfetch completed in 3ms" + color::RESET);
}
