#pragma once
/**
 * @file link_config.hpp
 * @brief LinkConfig — JSON-backed settings for one C2 ↔ RC link.
 *
 * @details
 * PURPOSE
 * -------
 * Everything an operator may need to change without a rebuild: which header
 * and SystemControl revision the RC speaks, who we are on the wire, the
 * session thresholds and cadences, the SystemControl defaults, and where the
 * RC listens. The file is plain JSON so it can be read and edited by hand.
 *
 * FORMAT (all keys optional; missing keys keep their defaults)
 * ------
 * @code
 * {
 *   "header_revision":       "icd-2135m-004",
 *   "control_revision":      "icd-40",
 *   "source_id":             1,
 *   "host":                  "127.0.0.1",
 *   "port":                  5000,
 *   "keepalive_interval_ms": 1000,
 *   "standby_threshold":     2,
 *   "operate_threshold":     6,
 *   "ack_every":             3,
 *   "standby_state":         2,
 *   "operate_state":         4,
 *   "passive":               false,
 *   "max_message_size":      65536,
 *   "mission_category":      0,
 *   "sensor_controls":       [0,0,0,0,0,0,0,0],
 *   "freq_index":            0
 * }
 * @endcode
 *
 * FAILURE MODES
 * -------------
 * Loading never throws. A missing file, malformed JSON, a wrong type or an
 * unknown revision name returns false with a short `reason` token
 * ("open_failed", "parse_error", "bad_type:port", "unknown_header_revision"...)
 * suitable for a `status=error reason=...` line.
 */

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"
#include "radarlink/channel.hpp"
#include "radarlink/codec.hpp"

namespace radarlink {

/// Smallest accepted max_message_size: header + SingleTargetExtended payload.
static constexpr size_t MIN_MAX_MESSAGE = HEADER_SIZE + EXTENDED_PAYLOAD;

struct LinkConfig {
  std::string   host{"127.0.0.1"};
  uint16_t      port{5000};
  ChannelConfig channel;
};

/**
 * @brief Overlay values from a JSON object onto @p cfg.
 * @return false (cfg partially updated, reason set) on a bad key.
 */
bool apply_link_config(const nlohmann::json& j, LinkConfig& cfg, std::string& reason);

/**
 * @brief Read a JSON file and overlay it onto @p cfg.
 * @return false with @p reason set on any failure.
 */
bool load_link_config(const std::string& path, LinkConfig& cfg, std::string& reason);

/// Full effective configuration, every key present.
nlohmann::json link_config_to_json(const LinkConfig& cfg);

} // namespace radarlink
