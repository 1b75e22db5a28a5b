/**
 * @file GenericProvider_uTest.cpp
 * @brief Unit tests for hostfetch::collect::GenericProvider.
 *
 * Notes:
 *  - Environment variables are set per test and restored in TearDown.
 */

#include "src/collect/inc/GenericProvider.hpp"
#include "src/collect/inc/Platform.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"

#include <gtest/gtest.h>

#include <cstdlib> // setenv, unsetenv
#include <optional>
#include <string>
#include <utility>
#include <vector>

using hostfetch::collect::GenericProvider;
using hostfetch::collect::getEnv;
using hostfetch::collect::isUnknown;

class GenericProviderTest : public ::testing::Test {
protected:
  GenericProvider provider_;
  std::vector<std::pair<std::string, std::optional<std::string>>> savedEnv_;

  void TearDown() override {
    for (auto it = savedEnv_.rbegin(); it != savedEnv_.rend(); ++it) {
      if (it->second) {
        ::setenv(it->first.c_str(), it->second->c_str(), 1);
      } else {
        ::unsetenv(it->first.c_str());
      }
    }
  }

  /// Set (or unset when value is nullptr) a variable for this test only.
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

/* ----------------------------- getEnv ----------------------------- */

/** @test Set variables are returned; unset and empty ones are not. */
TEST_F(GenericProviderTest, GetEnv) {
  setEnv("HOSTFETCH_TEST_VAR", "value");
  EXPECT_EQ(getEnv("HOSTFETCH_TEST_VAR"), "value");
  setEnv("HOSTFETCH_TEST_VAR", "");
  EXPECT_FALSE(getEnv("HOSTFETCH_TEST_VAR").has_value());
  setEnv("HOSTFETCH_TEST_VAR", nullptr);
  EXPECT_FALSE(getEnv("HOSTFETCH_TEST_VAR").has_value());
}

/* ----------------------------- Environment Fields ----------------------------- */

/** @test USER wins over USERNAME; USERNAME is the fallback. */
TEST_F(GenericProviderTest, Username) {
  setEnv("USER", "alice");
  setEnv("USERNAME", "bob");
  EXPECT_EQ(provider_.username(), "alice");
  setEnv("USER", nullptr);
  EXPECT_EQ(provider_.username(), "bob");
  setEnv("USERNAME", nullptr);
  EXPECT_TRUE(isUnknown(provider_.username()));
}

/** @test Shell is the basename of SHELL. */
TEST_F(GenericProviderTest, Shell) {
  setEnv("SHELL", "/usr/bin/zsh");
  EXPECT_EQ(provider_.shell(), "zsh");
  setEnv("SHELL", "fish");
  EXPECT_EQ(provider_.shell(), "fish");
  setEnv("SHELL", "");
  EXPECT_TRUE(isUnknown(provider_.shell()));
}

/** @test TERM_PROGRAM is preferred over TERM. */
TEST_F(GenericProviderTest, Terminal) {
  setEnv("TERM_PROGRAM", "WezTerm");
  setEnv("TERM", "xterm-256color");
  EXPECT_EQ(provider_.terminal(), "WezTerm");
  setEnv("TERM_PROGRAM", nullptr);
  EXPECT_EQ(provider_.terminal(), "xterm-256color");
}

/** @test Desktop comes from XDG_CURRENT_DESKTOP, then DESKTOP_SESSION. */
TEST_F(GenericProviderTest, DesktopEnvironment) {
  setEnv("XDG_CURRENT_DESKTOP", nullptr);
  setEnv("DESKTOP_SESSION", "plasma");
  EXPECT_EQ(provider_.desktopEnvironment(), "plasma");
  setEnv("XDG_CURRENT_DESKTOP", "KDE");
  EXPECT_EQ(provider_.desktopEnvironment(), "KDE");
}

/** @test LC_ALL overrides LC_MESSAGES, which overrides LANG. */
TEST_F(GenericProviderTest, LocalePrecedence) {
  setEnv("LC_ALL", nullptr);
  setEnv("LC_MESSAGES", nullptr);
  setEnv("LANG", "en_US.UTF-8");
  EXPECT_EQ(provider_.locale(), "en_US.UTF-8");
  setEnv("LC_MESSAGES", "de_DE.UTF-8");
  EXPECT_EQ(provider_.locale(), "de_DE.UTF-8");
  setEnv("LC_ALL", "C");
  EXPECT_EQ(provider_.locale(), "C");
  setEnv("LC_ALL", nullptr);
  setEnv("LC_MESSAGES", nullptr);
  setEnv("LANG", nullptr);
  EXPECT_TRUE(isUnknown(provider_.locale()));
}

/* ----------------------------- Sentinels ----------------------------- */

/** @test Fields with no portable source hold their sentinel. */
TEST_F(GenericProviderTest, Sentinels) {
  EXPECT_TRUE(isUnknown(provider_.osVersion()));
  EXPECT_TRUE(isUnknown(provider_.kernelVersion()));
  EXPECT_EQ(provider_.uptimeSeconds(), 0U);
  EXPECT_TRUE(isUnknown(provider_.terminalFont()));
  EXPECT_TRUE(isUnknown(provider_.windowManager()));
  EXPECT_TRUE(isUnknown(provider_.wmTheme()));
  EXPECT_TRUE(isUnknown(provider_.theme()));
  EXPECT_TRUE(isUnknown(provider_.icons()));
  EXPECT_TRUE(isUnknown(provider_.cpuModel()));
  EXPECT_EQ(provider_.cpuCores(), 1U);
  EXPECT_TRUE(isUnknown(provider_.gpu()));
  EXPECT_EQ(provider_.ramTotalBytes(), 0U);
  EXPECT_EQ(provider_.ramUsedBytes(), 0U);
  EXPECT_EQ(provider_.diskTotalBytes(), 0U);
  EXPECT_EQ(provider_.diskUsedBytes(), 0U);
  EXPECT_TRUE(isUnknown(provider_.resolution()));
  EXPECT_TRUE(isUnknown(provider_.localIpAddress()));
  EXPECT_FALSE(provider_.batteryPercent().has_value());
  EXPECT_TRUE(isUnknown(provider_.batteryStatus()));
  EXPECT_TRUE(isUnknown(provider_.packages()));
}

/* ----------------------------- Build Target ----------------------------- */

/** @test OS name and architecture come from the build target. */
TEST_F(GenericProviderTest, BuildTarget) {
  EXPECT_EQ(provider_.osName(), hostfetch::collect::TARGET_OS_NAME);
  if (hostfetch::collect::TARGET_ARCH_NAME != nullptr) {
    EXPECT_EQ(provider_.architecture(), hostfetch::collect::TARGET_ARCH_NAME);
  } else {
    EXPECT_TRUE(isUnknown(provider_.architecture()));
  }
}

/** @test The live hostname is never empty. */
TEST_F(GenericProviderTest, HostnameNonEmpty) { EXPECT_FALSE(provider_.hostname().empty()); }
