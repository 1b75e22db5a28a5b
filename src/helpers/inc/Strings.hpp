#ifndef HOSTFETCH_HELPERS_STRINGS_HPP
#define HOSTFETCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String parsing helpers for procfs/sysfs and KEY=value content.
 *
 * Pointer-based helpers operate on null-terminated buffers filled by the
 * bounded readers in Files.hpp. View-based helpers return slices of their
 * input and never allocate.
 *
 * @note All functions are noexcept with no allocations.
 */

#include <cstddef>
#include <cstdint>
#include <cstring> // strlen, strncmp
#include <optional>
#include <string_view>

namespace hostfetch {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Return the first run of decimal digits in a line.
 *
 * "MemTotal:       16384000 kB" yields "16384000"; a line without digits
 * yields an empty view.
 *
 * @param line Input line.
 * @return View into line, or empty view.
 */
[[nodiscard]] inline std::string_view extractNumericValue(std::string_view line) noexcept {
  std::size_t i = 0;
  while (i < line.size() && (line[i] < '0' || line[i] > '9')) {
    ++i;
  }
  std::size_t j = i;
  while (j < line.size() && line[j] >= '0' && line[j] <= '9') {
    ++j;
  }
  return line.substr(i, j - i);
}

/**
 * @brief Parse an unsigned decimal number occupying the whole view.
 * @param digits Digit run (e.g. from extractNumericValue).
 * @return Parsed value, or nullopt when empty, non-numeric or overflowing.
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUint(std::string_view digits) noexcept {
  if (digits.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char C : digits) {
    if (C < '0' || C > '9') {
      return std::nullopt;
    }
    const std::uint64_t DIGIT = static_cast<std::uint64_t>(C - '0');
    if (value > (UINT64_MAX - DIGIT) / 10) {
      return std::nullopt;
    }
    value = value * 10 + DIGIT;
  }
  return value;
}

/**
 * @brief Trim any of the given characters from both ends.
 * @param str Input view.
 * @param chars Characters to strip.
 * @return Trimmed view.
 */
[[nodiscard]] inline std::string_view trim(std::string_view str,
                                           std::string_view chars = " \t\r\n") noexcept {
  const std::size_t FIRST = str.find_first_not_of(chars);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = str.find_last_not_of(chars);
  return str.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Find the value of the first line starting with key.
 *
 * Used for os-release ("PRETTY_NAME=") and GTK settings.ini
 * ("gtk-theme-name=") content. The key includes its separator.
 *
 * @param content Multi-line text.
 * @param key Line prefix to match.
 * @return Remainder of the first matching line (without trailing '\r').
 */
[[nodiscard]] inline std::optional<std::string_view> findKeyValue(std::string_view content,
                                                                 std::string_view key) noexcept {
  std::size_t pos = 0;
  while (pos <= content.size()) {
    std::size_t eol = content.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = content.size();
    }
    std::string_view line = content.substr(pos, eol - pos);
    if (line.substr(0, key.size()) == key) {
      line.remove_prefix(key.size());
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
      return line;
    }
    pos = eol + 1;
  }
  return std::nullopt;
}

/**
 * @brief Last path component ("/usr/bin/zsh" -> "zsh").
 * @param path Path string.
 * @return Text after the last '/', or the whole input when there is none.
 */
[[nodiscard]] inline std::string_view basename(std::string_view path) noexcept {
  const std::size_t SLASH = path.rfind('/');
  if (SLASH == std::string_view::npos) {
    return path;
  }
  return path.substr(SLASH + 1);
}

/**
 * @brief Number of UTF-8 code points in text.
 *
 * Continuation bytes (10xxxxxx) are not counted, so malformed input still
 * yields a bounded count.
 */
[[nodiscard]] inline std::size_t utf8Length(std::string_view text) noexcept {
  std::size_t count = 0;
  for (const char C : text) {
    if ((static_cast<unsigned char>(C) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

/**
 * @brief Check that a string is a non-empty run of digits (e.g. a PID directory).
 * @param str Null-terminated string.
 * @return true if every character is a decimal digit.
 */
[[nodiscard]] inline bool isAllDigits(const char* str) noexcept {
  if (str == nullptr || *str == '\0') {
    return false;
  }
  for (; *str != '\0'; ++str) {
    if (*str < '0' || *str > '9') {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/* ----------------------------- Matching ----------------------------- */

/**
 * @brief Check if string ends with suffix.
 * @param str String to check.
 * @param suffix Suffix to look for.
 * @return true if str ends with suffix.
 */
[[nodiscard]] inline bool endsWith(const char* str, const char* suffix) noexcept {
  if (str == nullptr || suffix == nullptr) {
    return false;
  }
  const std::size_t STR_LEN = std::strlen(str);
  const std::size_t SUFFIX_LEN = std::strlen(suffix);
  if (SUFFIX_LEN > STR_LEN) {
    return false;
  }
  return std::strcmp(str + STR_LEN - SUFFIX_LEN, suffix) == 0;
}

} // namespace strings
} // namespace helpers
} // namespace hostfetch

#endif // HOSTFETCH_HELPERS_STRINGS_HPP
