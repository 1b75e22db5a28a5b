#ifndef HOSTFETCH_HELPERS_ARGS_HPP
#define HOSTFETCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Provides fixed-arity argument parsing for the CLI. Every token must match a
 * known flag (or one of its aliases); anything else is reported as an error.
 *
 * @note Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <array>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace hostfetch {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;    ///< Flag string, e.g. "--foo"
  std::uint8_t nargs;       ///< Number of values required after the flag
  bool required;            ///< True if flag must be provided
  std::string_view desc{};  ///< Description for help output (optional)
  std::string_view alias{}; ///< Short form, e.g. "-f" (optional)
  bool terminal{false};     ///< Stop parsing once seen (help, version)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Append unsigned int to string without fmt/iostreams.
inline void appendUint(std::string& s, unsigned int x) {
  std::array<char, 12> buf{};
  char* p = buf.data() + buf.size();
  *--p = '\0';
  do {
    *--p = static_cast<char>('0' + (x % 10));
    x /= 10;
  } while (x);
  s.append(p);
}

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  bool terminal;
  std::string_view flag;
};

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag is matched, it consumes the next nargs tokens
 * literally as its values. Tokens are processed left to right; a terminal flag
 * ends parsing, so tokens after it are neither parsed nor validated.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  const std::size_t N = args.size();

  // Build reverse LUT once: flag or alias -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const std::uint8_t KEY = KV.first;
    const ArgDef& DEF = KV.second;
    const detail::ArgDefView VIEW{KEY, DEF.nargs, DEF.terminal, DEF.flag};
    lut.emplace(DEF.flag, VIEW);
    if (!DEF.alias.empty()) {
      lut.emplace(DEF.alias, VIEW);
    }
  }

  std::bitset<256> seen;
  const std::string_view* const ARGV = args.data();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = ARGV[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (error) {
        std::string& e = error->get();
        e.assign("Unknown option: ");
        e.append(TOK);
      }
      return false;
    }

    const detail::ArgDefView& D = it->second;

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        std::string& e = error->get();
        e.assign("Argument out of bounds: expected ");
        detail::appendUint(e, D.need);
        e.append(" values for flag '");
        e.append(D.flag);
        e.push_back('\'');
      }
      return false;
    }

    auto emplaceRes = pargs.try_emplace(D.key);
    auto& out = emplaceRes.first->second;
    out.clear();
    out.reserve(D.need);
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(ARGV[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;

    if (D.terminal) {
      return true;
    }
  }

  // Validate required flags
  for (const auto& KV : map) {
    const ArgDef& DEF = KV.second;
    if (DEF.required && !seen.test(KV.first)) {
      if (error) {
        std::string& e = error->get();
        e.assign("Missing required argument: '");
        e.append(DEF.flag);
        e.push_back('\'');
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * Generates formatted help text from the argument map.
 *
 * @param progName    Program name.
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(std::string_view progName, std::string_view description,
                       const ArgMap& map) noexcept {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Collect and sort flags for consistent output
  std::vector<std::pair<std::string_view, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(KV.second.flag, &KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  // Build flag column text and its width
  std::vector<std::string> flagCol;
  flagCol.reserve(entries.size());
  std::size_t maxFlagWidth = 16;
  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;
    std::string flagStr;
    flagStr.reserve(32);
    if (!DEF.alias.empty()) {
      flagStr.append(DEF.alias);
      flagStr.append(", ");
    }
    flagStr.append(DEF.flag);
    if (DEF.nargs > 1) {
      flagStr.append(" <value> ...");
    } else if (DEF.nargs == 1) {
      flagStr.append(" <value>");
    }
    maxFlagWidth = std::max(maxFlagWidth, flagStr.size());
    flagCol.push_back(std::move(flagStr));
  }
  maxFlagWidth = std::min<std::size_t>(maxFlagWidth, 30);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i].second;

    fmt::print("  {:<{}}  ", flagCol[i], maxFlagWidth);

    if (!DEF.desc.empty()) {
      fmt::print("{}", DEF.desc);
    }

    if (DEF.required) {
      if (!DEF.desc.empty()) {
        fmt::print(" ");
      }
      fmt::print("(required)");
    }

    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace hostfetch

#endif // HOSTFETCH_HELPERS_ARGS_HPP
