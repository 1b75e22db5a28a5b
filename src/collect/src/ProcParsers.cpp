/**
 * @file ProcParsers.cpp
 * @brief Line-oriented parsers for Linux pseudo-filesystem content.
 */

#include "src/collect/inc/ProcParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace hostfetch {

namespace collect {

namespace procfs {

using hostfetch::helpers::strings::extractNumericValue;
using hostfetch::helpers::strings::findKeyValue;
using hostfetch::helpers::strings::parseUint;
using hostfetch::helpers::strings::trim;

namespace {

constexpr std::uint64_t BYTES_PER_KB = 1024;

/// Whitespace separating procfs columns.
constexpr std::string_view FIELD_SEPARATORS = " \t";

/// Call fn(line) for each '\n'-separated line until it returns true.
template <typename Fn> void forEachLine(std::string_view content, Fn&& fn) noexcept {
  std::size_t pos = 0;
  while (pos < content.size()) {
    std::size_t eol = content.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = content.size();
    }
    if (fn(content.substr(pos, eol - pos))) {
      return;
    }
    pos = eol + 1;
  }
}

/// Split off the next whitespace-delimited field, advancing rest past it.
std::string_view nextField(std::string_view& rest) noexcept {
  const std::size_t START = rest.find_first_not_of(FIELD_SEPARATORS);
  if (START == std::string_view::npos) {
    rest = {};
    return {};
  }
  rest.remove_prefix(START);
  const std::size_t END = rest.find_first_of(FIELD_SEPARATORS);
  const std::string_view FIELD = rest.substr(0, END);
  rest.remove_prefix(END == std::string_view::npos ? rest.size() : END);
  return FIELD;
}

bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.substr(0, prefix.size()) == prefix;
}

} // namespace

/* ----------------------------- /proc/meminfo ----------------------------- */

MemInfo parseMemInfo(std::string_view content) noexcept {
  MemInfo info{};

  forEachLine(content, [&info](std::string_view line) {
    std::optional<std::uint64_t>* target = nullptr;
    if (startsWith(line, "MemTotal:")) {
      target = &info.totalKb;
    } else if (startsWith(line, "MemFree:")) {
      target = &info.freeKb;
    } else if (startsWith(line, "MemAvailable:")) {
      target = &info.availableKb;
    } else if (startsWith(line, "Buffers:")) {
      target = &info.buffersKb;
    } else if (startsWith(line, "Cached:")) {
      target = &info.cachedKb;
    }

    if (target != nullptr && !target->has_value()) {
      *target = parseUint(extractNumericValue(line));
    }
    return false;
  });

  return info;
}

std::uint64_t memTotalBytes(const MemInfo& info) noexcept {
  return info.totalKb ? *info.totalKb * BYTES_PER_KB : 0;
}

std::uint64_t memUsedBytes(const MemInfo& info) noexcept {
  if (!info.totalKb) {
    return 0;
  }
  const std::uint64_t TOTAL = *info.totalKb;

  std::uint64_t reclaimable = 0;
  if (info.availableKb) {
    reclaimable = *info.availableKb;
  } else if (info.freeKb && info.buffersKb && info.cachedKb) {
    reclaimable = *info.freeKb + *info.buffersKb + *info.cachedKb;
  } else {
    return 0;
  }

  return (TOTAL > reclaimable) ? (TOTAL - reclaimable) * BYTES_PER_KB : 0;
}

/* ----------------------------- /proc/uptime ----------------------------- */

std::uint64_t parseUptimeSeconds(std::string_view content) noexcept {
  std::string_view rest = content;
  const std::string_view FIELD = nextField(rest);

  // Integer part, then an optional fraction of digits only
  const std::size_t DOT = FIELD.find('.');
  const std::string_view WHOLE = FIELD.substr(0, DOT);
  if (DOT != std::string_view::npos) {
    const std::string_view FRACTION = FIELD.substr(DOT + 1);
    if (!FRACTION.empty() && !parseUint(FRACTION)) {
      return 0;
    }
  }

  return parseUint(WHOLE).value_or(0);
}

/* ----------------------------- /etc/os-release ----------------------------- */

std::optional<std::string_view> parseOsReleaseValue(std::string_view content,
                                                    std::string_view key) noexcept {
  const auto RAW = findKeyValue(content, key);
  if (!RAW) {
    return std::nullopt;
  }

  const std::string_view VALUE = trim(trim(*RAW), "\"'");
  if (VALUE.empty()) {
    return std::nullopt;
  }
  return VALUE;
}

/* ----------------------------- /proc/cpuinfo ----------------------------- */

bool isProcessorLine(std::string_view line) noexcept { return startsWith(line, "processor"); }

std::optional<std::string_view> parseModelNameLine(std::string_view line) noexcept {
  if (!startsWith(line, "model name")) {
    return std::nullopt;
  }
  const std::size_t COLON = line.find(':');
  if (COLON == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view VALUE = trim(line.substr(COLON + 1));
  if (VALUE.empty()) {
    return std::nullopt;
  }
  return VALUE;
}

/* ----------------------------- /proc/net/route ----------------------------- */

std::optional<std::string_view> parseDefaultRouteInterface(std::string_view content) noexcept {
  std::optional<std::string_view> iface;
  bool header = true;

  forEachLine(content, [&](std::string_view line) {
    if (header) {
      header = false;
      return false;
    }
    std::string_view rest = line;
    const std::string_view NAME = nextField(rest);
    const std::string_view DESTINATION = nextField(rest);
    if (!NAME.empty() && DESTINATION == "00000000") {
      iface = NAME;
      return true;
    }
    return false;
  });

  return iface;
}

/* ----------------------------- /sys/class/drm ----------------------------- */

const char* gpuVendorName(std::string_view vendorId) noexcept {
  const std::string_view ID = trim(vendorId);
  if (ID == "0x10de") {
    return "NVIDIA";
  }
  if (ID == "0x1002") {
    return "AMD";
  }
  if (ID == "0x8086") {
    return "Intel";
  }
  return nullptr;
}

bool isDrmCardName(std::string_view name) noexcept {
  return startsWith(name, "card") && name.find('-') == std::string_view::npos;
}

bool isDrmConnectorName(std::string_view name) noexcept {
  return startsWith(name, "card") && name.find('-') != std::string_view::npos;
}

/* ----------------------------- /sys/class/power_supply ----------------------------- */

std::optional<std::uint8_t> parseBatteryCapacity(std::string_view content) noexcept {
  const auto VALUE = parseUint(trim(content));
  if (!VALUE || *VALUE > 100) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(*VALUE);
}

/* ----------------------------- Process tables ----------------------------- */

const char* findFirstRunning(std::span<const ProcessAlias> table,
                             std::span<const std::string> running) noexcept {
  for (const ProcessAlias& alias : table) {
    for (const std::string& name : running) {
      if (name == alias.comm) {
        return alias.display;
      }
    }
  }
  return nullptr;
}

} // namespace procfs

} // namespace collect

} // namespace hostfetch
