// -----------------------------------------------------------------------------
// link_config.cpp — JSON load/dump for LinkConfig
//
// API & file format:
//   see include/radarlink/link_config.hpp
//
// NOTE: nlohmann::json throws on type mismatches. Every access below is
// type-checked first; the try/catch at the file boundary only covers parsing.
// -----------------------------------------------------------------------------
#include "radarlink/link_config.hpp"

#include <fstream>
#include <limits>

namespace radarlink {

using json = nlohmann::json;

namespace {

// Read an unsigned field if present. false = present but wrong type/range.
template <typename T>
bool read_uint(const json& j, const char* key, T& out, std::string& reason) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
    reason = std::string("bad_type:") + key;
    return false;
  }
  const uint64_t u = v.get<uint64_t>();
  if (u > std::numeric_limits<T>::max()) {
    reason = std::string("out_of_range:") + key;
    return false;
  }
  out = static_cast<T>(u);
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, std::string& reason) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_string()) {
    reason = std::string("bad_type:") + key;
    return false;
  }
  out = v.get<std::string>();
  return true;
}

bool read_bool(const json& j, const char* key, bool& out, std::string& reason) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_boolean()) {
    reason = std::string("bad_type:") + key;
    return false;
  }
  out = v.get<bool>();
  return true;
}

} // namespace

// -----------------------------------------------------------------------------
// apply_link_config() — Overlay known keys; unknown keys are ignored.
// POLICY:
//   - Revision names must resolve, otherwise the load fails (a silent fallback
//     to the default revision would talk garbage to the RC).
//   - operate_threshold below standby_threshold is rejected.
//   - max_message_size must hold the largest fixed message (SingleTargetExtended).
// -----------------------------------------------------------------------------
bool apply_link_config(const json& j, LinkConfig& cfg, std::string& reason) {
  if (!j.is_object()) { reason = "not_an_object"; return false; }

  ChannelConfig& ch = cfg.channel;
  SessionConfig& s  = ch.session;

  std::string header_rev, control_rev;
  if (!read_string(j, "header_revision", header_rev, reason)) return false;
  if (!read_string(j, "control_revision", control_rev, reason)) return false;
  if (!header_rev.empty() && !header_layout_by_name(header_rev.c_str(), ch.codec.header)) {
    reason = "unknown_header_revision";
    return false;
  }
  if (!control_rev.empty() && !control_layout_by_name(control_rev.c_str(), ch.codec.control)) {
    reason = "unknown_control_revision";
    return false;
  }

  if (!read_string(j, "host", cfg.host, reason)) return false;
  if (!read_uint(j, "port", cfg.port, reason)) return false;
  if (!read_uint(j, "source_id", ch.source_id, reason)) return false;
  if (!read_uint(j, "max_message_size", ch.max_message, reason)) return false;
  if (ch.max_message < MIN_MAX_MESSAGE) {
    reason = "out_of_range:max_message_size";
    return false;
  }

  if (!read_uint(j, "keepalive_interval_ms", s.keepalive_interval_ms, reason)) return false;
  if (!read_uint(j, "standby_threshold", s.standby_threshold, reason)) return false;
  if (!read_uint(j, "operate_threshold", s.operate_threshold, reason)) return false;
  if (!read_uint(j, "ack_every", s.ack_every, reason)) return false;
  if (!read_uint(j, "standby_state", s.standby_state, reason)) return false;
  if (!read_uint(j, "operate_state", s.operate_state, reason)) return false;
  if (!read_bool(j, "passive", s.passive, reason)) return false;

  SystemControl& c = s.control_template;
  if (!read_uint(j, "mission_category", c.mission_category, reason)) return false;
  if (!read_uint(j, "freq_index", c.freq_index, reason)) return false;
  if (j.contains("sensor_controls")) {
    const json& arr = j.at("sensor_controls");
    if (!arr.is_array() || arr.size() != SENSOR_CONTROL_COUNT) {
      reason = "bad_type:sensor_controls";
      return false;
    }
    for (size_t i = 0; i < SENSOR_CONTROL_COUNT; ++i) {
      const json& v = arr.at(i);
      if (!v.is_number_integer() || v.get<int64_t>() < 0 || v.get<int64_t>() > 255) {
        reason = "bad_type:sensor_controls";
        return false;
      }
      c.sensor_controls[i] = static_cast<uint8_t>(v.get<int64_t>());
    }
  }

  if (s.operate_threshold < s.standby_threshold) {
    reason = "operate_threshold_below_standby_threshold";
    return false;
  }
  return true;
}

bool load_link_config(const std::string& path, LinkConfig& cfg, std::string& reason) {
  std::ifstream in(path);
  if (!in) { reason = "open_failed"; return false; }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error&) {
    reason = "parse_error";
    return false;
  }
  return apply_link_config(j, cfg, reason);
}

json link_config_to_json(const LinkConfig& cfg) {
  const ChannelConfig& ch = cfg.channel;
  const SessionConfig& s  = ch.session;

  json j;
  j["header_revision"]       = ch.codec.header.name;
  j["control_revision"]      = ch.codec.control.name;
  j["source_id"]             = ch.source_id;
  j["host"]                  = cfg.host;
  j["port"]                  = cfg.port;
  j["keepalive_interval_ms"] = s.keepalive_interval_ms;
  j["standby_threshold"]     = s.standby_threshold;
  j["operate_threshold"]     = s.operate_threshold;
  j["ack_every"]             = s.ack_every;
  j["standby_state"]         = s.standby_state;
  j["operate_state"]         = s.operate_state;
  j["passive"]               = s.passive;
  j["max_message_size"]      = ch.max_message;
  j["mission_category"]      = s.control_template.mission_category;
  json sensors = json::array();
  for (auto v : s.control_template.sensor_controls) sensors.push_back(v);
  j["sensor_controls"]       = sensors;
  j["freq_index"]            = s.control_template.freq_index;
  return j;
}

} // namespace radarlink
