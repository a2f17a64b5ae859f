#pragma once
/**
 * @file pretty.hpp
 * @brief Human and script friendly renderings of decoded RadarLink messages.
 *
 * @details
 * Three views of the same `DecodedMessage`:
 *
 *  - `decode_pretty()` : one line of `key=value` pairs, grep friendly.
 *      "status=ok msg=System_Status id=0xcef00403 seq=7 radar_state=4 ..."
 *    Names with spaces are written with underscores ("System_Status").
 *  - `describe()`      : multi-line block for a terminal, with units applied
 *    and unavailable TargetData fields shown as "(n/a)".
 *  - `to_json()`       : nlohmann::json object for `--format json` and logs
 *    that feed other tools.
 *
 * Plus the hex helpers the CLI uses to take frames on the command line.
 *
 * Output is lossy on purpose. Use the codec for exact values.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "radarlink/message.hpp"

namespace radarlink {

/// One line, `key=value` separated by spaces.
std::string decode_pretty(const DecodedMessage& dm);

/// Multi-line block, two-space indented fields.
std::string describe(const DecodedMessage& dm);

/// Structured view; scale factors applied where the record defines them.
nlohmann::json to_json(const DecodedMessage& dm);

/// Lowercase hex, no separators.
std::string to_hex(const uint8_t* data, size_t len);
inline std::string to_hex(const std::vector<uint8_t>& b) { return to_hex(b.data(), b.size()); }

/**
 * @brief Parse hex text into bytes.
 * @details Accepts an optional "0x" prefix and ignores spaces, colons and
 *          dashes between byte pairs.
 * @return false on an odd digit count or a non-hex character.
 */
bool parse_hex(const std::string& text, std::vector<uint8_t>& out);

} // namespace radarlink
