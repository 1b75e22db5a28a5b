/**
 * @file Platform.cpp
 * @brief Provider factory keyed by platform family.
 */

#include "src/collect/inc/Platform.hpp"
#include "src/collect/inc/GenericProvider.hpp"

#if defined(__linux__)
#include "src/collect/inc/LinuxProvider.hpp"
#elif defined(__APPLE__)
#include "src/collect/inc/MacosProvider.hpp"
#elif defined(_WIN32)
#include "src/collect/inc/WindowsProvider.hpp"
#endif

namespace hostfetch {

namespace collect {

/* ----------------------------- Platform toString ----------------------------- */

const char* toString(Platform platform) noexcept {
  switch (platform) {
  case Platform::LINUX:
    return "linux";
  case Platform::MACOS:
    return "macos";
  case Platform::WINDOWS:
    return "windows";
  case Platform::GENERIC:
  default:
    return "generic";
  }
}

/* ----------------------------- API ----------------------------- */

bool isCompiledIn(Platform platform) noexcept {
  return platform == Platform::GENERIC || platform == currentPlatform();
}

std::unique_ptr<SystemInfoProvider> makeProvider(Platform platform) {
  switch (platform) {
#if defined(__linux__)
  case Platform::LINUX:
    return std::make_unique<LinuxProvider>();
#elif defined(__APPLE__)
  case Platform::MACOS:
    return std::make_unique<MacosProvider>();
#elif defined(_WIN32)
  case Platform::WINDOWS:
    return std::make_unique<WindowsProvider>();
#endif
  default:
    return std::make_unique<GenericProvider>();
  }
}

} // namespace collect

} // namespace hostfetch
