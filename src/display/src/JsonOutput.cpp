/**
 * @file JsonOutput.cpp
 * @brief JSON object writer for the snapshot.
 */

#include "src/display/inc/JsonOutput.hpp"

#include <fmt/core.h>

#include <cstddef>

namespace hostfetch {

namespace display {

namespace {

/// Length of the well-formed UTF-8 sequence starting at text[pos], or 0.
std::size_t validSequenceLength(std::string_view text, std::size_t pos) noexcept {
  const auto BYTE = [text](std::size_t i) { return static_cast<unsigned char>(text[i]); };
  const unsigned char LEAD = BYTE(pos);

  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (LEAD >= 0xC2 && LEAD <= 0xDF) {
    length = 2;
  } else if (LEAD >= 0xE0 && LEAD <= 0xEF) {
    length = 3;
    if (LEAD == 0xE0) {
      low = 0xA0;
    } else if (LEAD == 0xED) {
      high = 0x9F;
    }
  } else if (LEAD >= 0xF0 && LEAD <= 0xF4) {
    length = 4;
    if (LEAD == 0xF0) {
      low = 0x90;
    } else if (LEAD == 0xF4) {
      high = 0x8F;
    }
  } else {
    return 0;
  }

  if (pos + length > text.size()) {
    return 0;
  }
  if (BYTE(pos + 1) < low || BYTE(pos + 1) > high) {
    return 0;
  }
  for (std::size_t i = pos + 2; i < pos + length; ++i) {
    if (BYTE(i) < 0x80 || BYTE(i) > 0xBF) {
      return 0;
    }
  }
  return length;
}

} // namespace

std::string jsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const char C = text[pos];
    if (static_cast<unsigned char>(C) >= 0x80) {
      const std::size_t LENGTH = validSequenceLength(text, pos);
      if (LENGTH == 0) {
        // One replacement per rejected byte; the next byte is retried as a lead.
        out += "\\ufffd";
        ++pos;
      } else {
        out.append(text.substr(pos, LENGTH));
        pos += LENGTH;
      }
      continue;
    }

    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(C)));
      } else {
        out += C;
      }
      break;
    }
    ++pos;
  }

  return out;
}

std::string renderJson(const collect::SystemSnapshot& snap) {
  std::string out;
  out.reserve(1024);

  const auto TEXT = [&out](std::string_view key, std::string_view value) {
    out += fmt::format("  \"{}\": \"{}\",\n", key, jsonEscape(value));
  };
  const auto NUMBER = [&out](std::string_view key, std::uint64_t value) {
    out += fmt::format("  \"{}\": {},\n", key, value);
  };

  out += "{\n";
  TEXT("osName", snap.osName);
  TEXT("osVersion", snap.osVersion);
  TEXT("kernelVersion", snap.kernelVersion);
  TEXT("hostname", snap.hostname);
  TEXT("username", snap.username);
  NUMBER("uptimeSeconds", snap.uptimeSeconds);
  TEXT("shell", snap.shell);
  TEXT("terminal", snap.terminal);
  TEXT("terminalFont", snap.terminalFont);
  TEXT("desktopEnvironment", snap.desktopEnvironment);
  TEXT("windowManager", snap.windowManager);
  TEXT("wmTheme", snap.wmTheme);
  TEXT("theme", snap.theme);
  TEXT("icons", snap.icons);
  TEXT("cpuModel", snap.cpuModel);
  NUMBER("cpuCores", snap.cpuCores);
  TEXT("architecture", snap.architecture);
  TEXT("gpu", snap.gpu);
  NUMBER("ramTotalBytes", snap.ramTotalBytes);
  NUMBER("ramUsedBytes", snap.ramUsedBytes);
  NUMBER("diskTotalBytes", snap.diskTotalBytes);
  NUMBER("diskUsedBytes", snap.diskUsedBytes);
  TEXT("resolution", snap.resolution);
  TEXT("localIp", snap.localIp);
  if (snap.batteryPercent) {
    NUMBER("batteryPercent", *snap.batteryPercent);
  } else {
    out += "  \"batteryPercent\": null,\n";
  }
  TEXT("batteryStatus", snap.batteryStatus);
  TEXT("packages", snap.packages);
  out += fmt::format("  \"locale\": \"{}\"\n", jsonEscape(snap.locale));
  out += "}";

  return out;
}

} // namespace display

} // namespace hostfetch
