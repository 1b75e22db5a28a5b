#ifndef HOSTFETCH_DISPLAY_JSON_OUTPUT_HPP
#define HOSTFETCH_DISPLAY_JSON_OUTPUT_HPP
/**
 * @file JsonOutput.hpp
 * @brief Machine-readable rendering of a SystemSnapshot (--json).
 */

#include "src/collect/inc/SystemSnapshot.hpp"

#include <string>
#include <string_view>

namespace hostfetch {

namespace display {

/**
 * @brief Escape text for use inside a JSON string literal.
 * @param text Raw text.
 * @return Text with quotes, backslashes and control characters escaped.
 *         Malformed UTF-8 bytes are replaced by \ufffd, one per byte.
 */
[[nodiscard]] std::string jsonEscape(std::string_view text);

/**
 * @brief Render every snapshot field as one JSON object.
 *
 * Byte sizes are raw byte counts. batteryPercent is null when absent. Text
 * fields keep the "Unknown" sentinel.
 *
 * @param snap Collected snapshot.
 * @return Pretty-printed JSON, no trailing newline.
 */
[[nodiscard]] std::string renderJson(const collect::SystemSnapshot& snap);

} // namespace display

} // namespace hostfetch

#endif // HOSTFETCH_DISPLAY_JSON_OUTPUT_HPP
