#ifndef HOSTFETCH_COLLECT_PLATFORM_HPP
#define HOSTFETCH_COLLECT_PLATFORM_HPP
/**
 * @file Platform.hpp
 * @brief Static selection of the provider for the build target.
 *
 * The platform is a compile-time property of the binary. The selector is
 * consulted once at startup and never re-evaluated.
 */

#include <cstdint> // std::uint8_t
#include <memory>  // std::unique_ptr

namespace hostfetch {

namespace collect {

class SystemInfoProvider;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Platform family a provider is bound to.
 */
enum class Platform : std::uint8_t {
  LINUX = 0, ///< /proc, /sys, statvfs, ioctl
  MACOS,     ///< sysctl, Mach, statfs, getifaddrs
  WINDOWS,   ///< Win32
  GENERIC,   ///< Environment variables only, sentinel elsewhere
};

/**
 * @brief Convert Platform to human-readable string.
 * @param platform Platform enum value.
 * @return Static string representation.
 */
[[nodiscard]] const char* toString(Platform platform) noexcept;

/* ----------------------------- Target Identity ----------------------------- */

/// Operating system of the build target (as used in "Target: <arch>-<os>").
inline constexpr const char* TARGET_OS_NAME =
#if defined(__linux__)
    "linux";
#elif defined(__APPLE__)
    "macos";
#elif defined(_WIN32)
    "windows";
#elif defined(__FreeBSD__)
    "freebsd";
#elif defined(__OpenBSD__)
    "openbsd";
#elif defined(__NetBSD__)
    "netbsd";
#elif defined(__DragonFly__)
    "dragonfly";
#elif defined(__sun)
    "solaris";
#elif defined(__HAIKU__)
    "haiku";
#else
    "generic";
#endif

/// CPU architecture of the build target, nullptr when not recognized.
inline constexpr const char* TARGET_ARCH_NAME =
#if defined(__x86_64__) || defined(_M_X64)
    "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    "x86";
#elif defined(__aarch64__) || defined(_M_ARM64)
    "aarch64";
#elif defined(__arm__) || defined(_M_ARM)
    "arm";
#elif defined(__riscv) && (__riscv_xlen == 64)
    "riscv64";
#elif defined(__riscv)
    "riscv32";
#elif defined(__powerpc64__) && defined(__LITTLE_ENDIAN__)
    "powerpc64le";
#elif defined(__powerpc64__)
    "powerpc64";
#elif defined(__s390x__)
    "s390x";
#elif defined(__loongarch64)
    "loongarch64";
#elif defined(__mips__)
    "mips";
#else
    nullptr;
#endif

/* ----------------------------- API ----------------------------- */

/**
 * @brief Platform family this binary was built for.
 * @return LINUX, MACOS or WINDOWS for those targets, GENERIC otherwise.
 */
[[nodiscard]] constexpr Platform currentPlatform() noexcept {
#if defined(__linux__)
  return Platform::LINUX;
#elif defined(__APPLE__)
  return Platform::MACOS;
#elif defined(_WIN32)
  return Platform::WINDOWS;
#else
  return Platform::GENERIC;
#endif
}

/**
 * @brief Check whether a platform's provider is compiled into this binary.
 * @param platform Requested platform.
 * @return true for GENERIC and for currentPlatform().
 */
[[nodiscard]] bool isCompiledIn(Platform platform) noexcept;

/**
 * @brief Create the provider bound to a platform.
 * @param platform Requested platform.
 * @return Provider for platform, or the generic provider when that platform's
 *         collectors are not compiled into this binary. Never null.
 */
[[nodiscard]] std::unique_ptr<SystemInfoProvider> makeProvider(Platform platform);

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_PLATFORM_HPP
