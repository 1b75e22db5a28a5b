/**
 * @file GenericProvider.cpp
 * @brief Environment-based collectors shared by every platform.
 */

#include "src/collect/inc/GenericProvider.hpp"
#include "src/collect/inc/Platform.hpp"
#include "src/collect/inc/SystemSnapshot.hpp"
#include "src/helpers/inc/Strings.hpp"

#if !defined(_WIN32)
#include <unistd.h> // gethostname
#endif

#include <array>
#include <cstdlib> // getenv

namespace hostfetch {

namespace collect {

using hostfetch::helpers::strings::basename;

namespace {

/// Buffer for gethostname (HOST_NAME_MAX is 64 on Linux, 255 on BSD).
constexpr std::size_t HOSTNAME_BUFFER_SIZE = 256;

/// First non-empty variable among names, else UNKNOWN.
template <std::size_t N>
std::string firstEnv(const std::array<const char*, N>& names) noexcept {
  for (const char* name : names) {
    if (auto value = getEnv(name)) {
      return *value;
    }
  }
  return std::string(UNKNOWN);
}

} // namespace

/* ----------------------------- Environment ----------------------------- */

std::optional<std::string> getEnv(const char* name) noexcept {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

/* ----------------------------- Identity ----------------------------- */

std::string GenericProvider::osName() const noexcept { return TARGET_OS_NAME; }

std::string GenericProvider::osVersion() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::kernelVersion() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::hostname() const noexcept {
#if defined(_WIN32)
  return std::string(UNKNOWN);
#else
  std::array<char, HOSTNAME_BUFFER_SIZE> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
    return std::string(UNKNOWN);
  }
  return std::string(buf.data());
#endif
}

std::string GenericProvider::username() const noexcept {
  return firstEnv(std::array<const char*, 2>{"USER", "USERNAME"});
}

std::uint64_t GenericProvider::uptimeSeconds() const noexcept { return 0; }

/* ----------------------------- Shell and terminal ----------------------------- */

std::string GenericProvider::shell() const noexcept {
  const auto SHELL = getEnv("SHELL");
  if (!SHELL) {
    return std::string(UNKNOWN);
  }
  const std::string_view NAME = basename(*SHELL);
  return NAME.empty() ? std::string(UNKNOWN) : std::string(NAME);
}

std::string GenericProvider::terminal() const noexcept {
  return firstEnv(std::array<const char*, 3>{"TERM_PROGRAM", "TERM", "TERMINAL"});
}

std::string GenericProvider::terminalFont() const noexcept { return std::string(UNKNOWN); }

/* ----------------------------- Desktop ----------------------------- */

std::string GenericProvider::desktopEnvironment() const noexcept {
  return firstEnv(std::array<const char*, 2>{"XDG_CURRENT_DESKTOP", "DESKTOP_SESSION"});
}

std::string GenericProvider::windowManager() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::wmTheme() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::theme() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::icons() const noexcept { return std::string(UNKNOWN); }

/* ----------------------------- Hardware ----------------------------- */

std::string GenericProvider::cpuModel() const noexcept { return std::string(UNKNOWN); }

std::uint32_t GenericProvider::cpuCores() const noexcept { return 1; }

std::string GenericProvider::architecture() const noexcept {
  return (TARGET_ARCH_NAME != nullptr) ? std::string(TARGET_ARCH_NAME) : std::string(UNKNOWN);
}

std::string GenericProvider::gpu() const noexcept { return std::string(UNKNOWN); }

/* ----------------------------- Memory and storage ----------------------------- */

std::uint64_t GenericProvider::ramTotalBytes() const noexcept { return 0; }

std::uint64_t GenericProvider::ramUsedBytes() const noexcept { return 0; }

std::uint64_t GenericProvider::diskTotalBytes() const noexcept { return 0; }

std::uint64_t GenericProvider::diskUsedBytes() const noexcept { return 0; }

/* ----------------------------- Display, network, power ----------------------------- */

std::string GenericProvider::resolution() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::localIpAddress() const noexcept { return std::string(UNKNOWN); }

std::optional<std::uint8_t> GenericProvider::batteryPercent() const noexcept {
  return std::nullopt;
}

std::string GenericProvider::batteryStatus() const noexcept { return std::string(UNKNOWN); }

/* ----------------------------- Packages and locale ----------------------------- */

std::string GenericProvider::packages() const noexcept { return std::string(UNKNOWN); }

std::string GenericProvider::locale() const noexcept {
  return firstEnv(std::array<const char*, 3>{"LC_ALL", "LC_MESSAGES", "LANG"});
}

} // namespace collect

} // namespace hostfetch
