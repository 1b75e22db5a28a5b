#ifndef HOSTFETCH_HELPERS_FILES_HPP
#define HOSTFETCH_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Bounded file reads and directory probes for procfs/sysfs collectors.
 *
 * Provides file operations using C-style I/O (open/read/close, opendir) with
 * fixed-size caller buffers. Every descriptor is closed before return.
 *
 * @note No heap allocation. Path checks use stat() syscalls.
 */

#include "src/helpers/inc/Strings.hpp"

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close

#include <array>
#include <cstddef>

namespace hostfetch {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Default buffer size for file reads.
inline constexpr std::size_t FILE_READ_BUFFER_SIZE = 256;

/// Buffer size for composed paths.
inline constexpr std::size_t PATH_BUFFER_SIZE = 512;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Reads at most bufSize - 1 bytes. Strips trailing newlines and carriage
 * returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  hostfetch::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Read first line from file into fixed array.
 * @tparam N Array size.
 * @param path File path to read.
 * @param out Output array.
 * @return Number of characters read (excluding null), 0 on error.
 */
template <std::size_t N>
[[nodiscard]] inline std::size_t readFileLine(const char* path, std::array<char, N>& out) noexcept {
  out[0] = '\0';

  std::array<char, N> buf{};
  const std::size_t LEN = readFileToBuffer(path, buf.data(), buf.size());
  if (LEN == 0) {
    return 0;
  }

  std::size_t copyLen = 0;
  while (copyLen < LEN && copyLen < N - 1 && buf[copyLen] != '\n' && buf[copyLen] != '\0') {
    out[copyLen] = buf[copyLen];
    ++copyLen;
  }
  out[copyLen] = '\0';

  return copyLen;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a directory.
 * @param path Path to check.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/* ----------------------------- Directory Utilities ----------------------------- */

/**
 * @brief Count entries of a directory, skipping "." and "..".
 * @param dirPath Directory to scan.
 * @param suffix Only count names ending with this suffix (nullptr counts all).
 * @return Number of matching entries, 0 if the directory cannot be opened.
 */
[[nodiscard]] inline std::size_t countDirEntries(const char* dirPath,
                                                 const char* suffix = nullptr) noexcept {
  DIR* dir = ::opendir(dirPath);
  if (dir == nullptr) {
    return 0;
  }

  std::size_t count = 0;
  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    const char* NAME = entry->d_name;
    if (NAME[0] == '.' && (NAME[1] == '\0' || (NAME[1] == '.' && NAME[2] == '\0'))) {
      continue;
    }
    if (suffix != nullptr && !hostfetch::helpers::strings::endsWith(NAME, suffix)) {
      continue;
    }
    ++count;
  }

  ::closedir(dir);
  return count;
}

} // namespace files
} // namespace helpers
} // namespace hostfetch

#endif // HOSTFETCH_HELPERS_FILES_HPP
