#ifndef HOSTFETCH_COLLECT_GENERIC_PROVIDER_HPP
#define HOSTFETCH_COLLECT_GENERIC_PROVIDER_HPP
/**
 * @file GenericProvider.hpp
 * @brief Portable fallback provider and base of the platform providers.
 *
 * Implements the operations that only need environment variables, the
 * hostname call or the build target. Everything else returns the sentinel.
 * Platform providers derive from this class and override what their OS
 * exposes.
 */

#include "src/collect/inc/SystemInfoProvider.hpp"

#include <optional>
#include <string>

namespace hostfetch {

namespace collect {

/* ----------------------------- Environment ----------------------------- */

/**
 * @brief Read an environment variable.
 * @param name Variable name.
 * @return Value, or nullopt when unset or empty.
 */
[[nodiscard]] std::optional<std::string> getEnv(const char* name) noexcept;

/* ----------------------------- GenericProvider ----------------------------- */

/**
 * @brief Environment-only provider, total on every platform.
 *
 * Sources:
 *  - gethostname() - hostname
 *  - USER, USERNAME - username
 *  - SHELL (basename) - shell
 *  - TERM_PROGRAM, TERM, TERMINAL - terminal
 *  - XDG_CURRENT_DESKTOP, DESKTOP_SESSION - desktop environment
 *  - LC_ALL, LC_MESSAGES, LANG - locale
 *  - build target - OS name, architecture
 */
class GenericProvider : public SystemInfoProvider {
public:
  [[nodiscard]] std::string osName() const noexcept override;
  [[nodiscard]] std::string osVersion() const noexcept override;
  [[nodiscard]] std::string kernelVersion() const noexcept override;
  [[nodiscard]] std::string hostname() const noexcept override;
  [[nodiscard]] std::string username() const noexcept override;
  [[nodiscard]] std::uint64_t uptimeSeconds() const noexcept override;

  [[nodiscard]] std::string shell() const noexcept override;
  [[nodiscard]] std::string terminal() const noexcept override;
  [[nodiscard]] std::string terminalFont() const noexcept override;

  [[nodiscard]] std::string desktopEnvironment() const noexcept override;
  [[nodiscard]] std::string windowManager() const noexcept override;
  [[nodiscard]] std::string wmTheme() const noexcept override;
  [[nodiscard]] std::string theme() const noexcept override;
  [[nodiscard]] std::string icons() const noexcept override;

  [[nodiscard]] std::string cpuModel() const noexcept override;
  [[nodiscard]] std::uint32_t cpuCores() const noexcept override;
  [[nodiscard]] std::string architecture() const noexcept override;
  [[nodiscard]] std::string gpu() const noexcept override;

  [[nodiscard]] std::uint64_t ramTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t ramUsedBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskTotalBytes() const noexcept override;
  [[nodiscard]] std::uint64_t diskUsedBytes() const noexcept override;

  [[nodiscard]] std::string resolution() const noexcept override;
  [[nodiscard]] std::string localIpAddress() const noexcept override;
  [[nodiscard]] std::optional<std::uint8_t> batteryPercent() const noexcept override;
  [[nodiscard]] std::string batteryStatus() const noexcept override;

  [[nodiscard]] std::string packages() const noexcept override;
  [[nodiscard]] std::string locale() const noexcept override;
};

} // namespace collect

} // namespace hostfetch

#endif // HOSTFETCH_COLLECT_GENERIC_PROVIDER_HPP
