// -----------------------------------------------------------------------------
// pretty.cpp — Renderings of decoded messages (kv line, block, JSON) + hex
//
// API & examples:
//   see include/radarlink/pretty.hpp
//
// Runnable checks:
//   see tests/test_pretty.cpp
//
// NOTE: decode_pretty() output is parsed by shell scripts. Keep key names
// stable; add keys at the end of a kind's list rather than renaming.
// -----------------------------------------------------------------------------
#include "radarlink/pretty.hpp"

#include <iomanip>
#include <sstream>

namespace radarlink {

namespace {

using json = nlohmann::json;

static constexpr size_t HEX_PREVIEW_BYTES = 64;

std::string fixed(double v, int prec) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(prec) << v;
  return os.str();
}

std::string hex32(uint32_t v) {
  std::ostringstream os;
  os << "0x" << std::hex << std::setw(8) << std::setfill('0') << v;
  return os.str();
}

std::string underscored(const char* name) {
  std::string s(name ? name : "");
  for (char& c : s) if (c == ' ') c = '_';
  return s;
}

std::string hex_preview(const std::vector<uint8_t>& b) {
  if (b.size() <= HEX_PREVIEW_BYTES) return to_hex(b);
  return to_hex(b.data(), HEX_PREVIEW_BYTES) + "...";
}

std::string triple_str(const Triple& t, int prec) {
  return fixed(t.a, prec) + "," + fixed(t.b, prec) + "," + fixed(t.c, prec);
}

// ---------- key=value line ----------

struct KvWriter {
  std::ostringstream& os;

  void operator()(const KeepAlive&) const {}

  void operator()(const SystemControl& c) const {
    os << " radar_state=" << c.radar_state
       << " mission=" << c.mission_category
       << " sensors=";
    for (size_t i = 0; i < c.sensor_controls.size(); ++i) {
      if (i) os << ',';
      os << unsigned(c.sensor_controls[i]);
    }
    os << " freq_index=" << c.freq_index;
  }

  void operator()(const SystemStatus& s) const {
    os << " radar_state=" << s.radar_state
       << " mode=" << s.operating_mode
       << " error=" << s.error_code;
    if (auto t = s.temperature_c())        os << " temp_c=" << fixed(*t, 1);
    if (s.power_status)                    os << " power=" << hex32(*s.power_status);
    if (auto a = s.antenna_position_deg()) os << " antenna_deg=" << fixed(*a, 2);
  }

  void operator()(const Acknowledge& a) const { os << " acked_seq=" << a.acked_sequence; }

  void operator()(const TargetReport& r) const {
    os << " count=" << r.declared_count
       << " decoded=" << r.targets.size()
       << " truncated=" << (r.truncated ? 1 : 0);
    for (const auto& t : r.targets) {
      os << " target=" << t.id << ':' << fixed(t.range_m(), 3) << "m/"
         << fixed(t.azimuth_deg(), 3) << "deg";
    }
  }

  void operator()(const SingleTargetReport& r) const {
    const Target& t = r.target;
    os << " target_id=" << t.id
       << " range_m=" << fixed(t.range_m(), 3)
       << " az_deg=" << fixed(t.azimuth_deg(), 3)
       << " el_deg=" << fixed(t.elevation_deg(), 3)
       << " vel_ms=" << fixed(t.velocity_ms(), 2)
       << " rcs_dbsm=" << fixed(t.rcs_dbsm(), 2)
       << " class=" << target_class_name(t.classification)
       << " conf=" << t.confidence;
  }

  void operator()(const SingleTargetExtended& r) const {
    const TargetData& d = r.track;
    os << " track_id=" << d.id
       << " track_status=" << track_status_name(d.status)
       << " class=" << d.classification
       << " range_m=" << fixed(d.polar_position.c, 3)
       << " az_deg=" << fixed(d.polar_position.b * RAD_TO_DEG, 3)
       << " el_deg=" << fixed(d.polar_position.a * RAD_TO_DEG, 3)
       << " avail=" << hex32(d.availability);
    if (auto g = d.geo_location()) {
      os << " geo=" << fixed(g->a * RAD_TO_DEG, 7) << ',' << fixed(g->b * RAD_TO_DEG, 7)
         << ',' << fixed(g->c, 1);
    } else {
      os << " geo=n/a";
    }
    os << " plot_id=" << r.plot.id << " snr_db=" << fixed(r.plot.snr, 1);
  }

  void operator()(const SystemMotion& m) const {
    const MotionRecord& r = m.motion;
    const Triple att = r.attitude_deg();
    os << " lat_deg=" << fixed(r.latitude_deg(), 7)
       << " lon_deg=" << fixed(r.longitude_deg(), 7)
       << " alt_m=" << fixed(r.position.c, 2)
       << " roll_deg=" << fixed(att.a, 3)
       << " pitch_deg=" << fixed(att.b, 3)
       << " yaw_deg=" << fixed(att.c, 3);
  }

  void operator()(const SensorPosition& s) const {
    os << " lat_deg=" << fixed(s.latitude_deg(), 7)
       << " lon_deg=" << fixed(s.longitude_deg(), 7)
       << " alt_m=" << fixed(s.altitude_m(), 3)
       << " heading_deg=" << fixed(s.heading_deg(), 3)
       << " pitch_deg=" << fixed(s.pitch_deg(), 3)
       << " roll_deg=" << fixed(s.roll_deg(), 3);
  }

  void operator()(const Generic& g) const {
    os << " bytes=" << g.payload.size();
    if (!g.payload.empty()) os << " hex=" << hex_preview(g.payload);
  }
};

// ---------- multi-line block ----------

struct BlockWriter {
  std::ostringstream& os;

  void line(const char* k, const std::string& v) const {
    os << "  " << std::left << std::setw(20) << k << v << "\n";
  }
  void opt(const char* k, const std::optional<Triple>& t, int prec) const {
    line(k, t ? triple_str(*t, prec) : std::string("(n/a)"));
  }

  void operator()(const KeepAlive&) const { line("payload", "(empty)"); }

  void operator()(const SystemControl& c) const {
    line("radar_state", std::to_string(c.radar_state));
    line("mission_category", std::to_string(c.mission_category));
    for (size_t i = 0; i < c.sensor_controls.size(); ++i) {
      const std::string k = (i < 4 ? "hfl_sensor_" : "radar_") + std::to_string(i % 4 + 1);
      line(k.c_str(), c.sensor_controls[i] == 0 ? "enabled" : "disabled");
    }
    line("freq_index", std::to_string(c.freq_index));
  }

  void operator()(const SystemStatus& s) const {
    line("radar_state", std::to_string(s.radar_state));
    line("operating_mode", std::to_string(s.operating_mode));
    line("error_code", std::to_string(s.error_code));
    if (auto t = s.temperature_c()) line("temperature", fixed(*t, 1) + " C");
    if (s.power_status) {
      const uint32_t p = *s.power_status;
      std::string bits;
      auto add = [&bits, p](uint32_t bit, const char* name) {
        if (p & bit) { if (!bits.empty()) bits += ","; bits += name; }
      };
      add(power::MAIN, "main");
      add(power::BACKUP, "backup");
      add(power::TRANSMITTER, "transmitter");
      add(power::RECEIVER, "receiver");
      add(power::ANTENNA_DRIVE, "antenna_drive");
      add(power::PROCESSING_UNIT, "processing_unit");
      line("power_status", hex32(p) + (bits.empty() ? "" : " (" + bits + ")"));
    }
    if (auto a = s.antenna_position_deg()) line("antenna_position", fixed(*a, 2) + " deg");
  }

  void operator()(const Acknowledge& a) const {
    line("acked_sequence", std::to_string(a.acked_sequence));
  }

  void operator()(const TargetReport& r) const {
    line("declared_count", std::to_string(r.declared_count));
    line("decoded", std::to_string(r.targets.size()) + (r.truncated ? " (truncated)" : ""));
    for (const auto& t : r.targets) {
      os << "  - id=" << t.id
         << " range=" << fixed(t.range_m(), 3) << "m"
         << " az=" << fixed(t.azimuth_deg(), 3) << "deg"
         << " el=" << fixed(t.elevation_deg(), 3) << "deg"
         << " vel=" << fixed(t.velocity_ms(), 2) << "m/s"
         << " class=" << target_class_name(t.classification)
         << " conf=" << t.confidence << "%\n";
    }
  }

  void operator()(const SingleTargetReport& r) const {
    const Target& t = r.target;
    line("id", std::to_string(t.id));
    line("range", fixed(t.range_m(), 3) + " m");
    line("azimuth", fixed(t.azimuth_deg(), 3) + " deg");
    line("elevation", fixed(t.elevation_deg(), 3) + " deg");
    line("velocity", fixed(t.velocity_ms(), 2) + " m/s");
    line("rcs", fixed(t.rcs_dbsm(), 2) + " dBsm");
    line("classification", target_class_name(t.classification));
    line("confidence", std::to_string(t.confidence) + " %");
  }

  void operator()(const SingleTargetExtended& r) const {
    const TargetData& d = r.track;
    line("track_id", std::to_string(d.id));
    line("track_status", track_status_name(d.status));
    line("classification", std::to_string(d.classification));
    line("score", fixed(d.score, 3));
    line("rcs", fixed(d.rcs, 2) + " dBsm");
    line("availability", hex32(d.availability));
    opt("polar_location", d.polar_location(), 4);
    opt("geo_location", d.geo_location(), 7);
    opt("cartesian_location", d.cartesian_location(), 2);
    opt("cartesian_velocity", d.cartesian_velocity(), 2);
    opt("polar_velocity", d.polar_velocity(), 2);
    opt("absolute_velocity", d.absolute_velocity(), 2);
    line("plot_id", std::to_string(r.plot.id));
    line("plot_doppler", fixed(r.plot.doppler, 2) + " m/s");
    line("plot_snr", fixed(r.plot.snr, 1) + " dB");
  }

  void operator()(const SystemMotion& m) const {
    const MotionRecord& r = m.motion;
    line("time_us", std::to_string(r.time));
    line("position", fixed(r.latitude_deg(), 7) + "," + fixed(r.longitude_deg(), 7) + "," +
                     fixed(r.position.c, 2));
    line("attitude_deg", triple_str(r.attitude_deg(), 3));
    line("velocity_ned", triple_str(r.velocity, 2));
    line("angular_rate_deg", triple_str(r.angular_velocity_deg(), 3));
    line("acceleration_ned", triple_str(r.acceleration, 2));
    line("navigation_mode", std::to_string(r.navigation_mode));
    line("validity", hex32(r.validity));
  }

  void operator()(const SensorPosition& s) const {
    line("latitude", fixed(s.latitude_deg(), 7) + " deg");
    line("longitude", fixed(s.longitude_deg(), 7) + " deg");
    line("altitude", fixed(s.altitude_m(), 3) + " m");
    line("heading", fixed(s.heading_deg(), 3) + " deg");
    line("pitch", fixed(s.pitch_deg(), 3) + " deg");
    line("roll", fixed(s.roll_deg(), 3) + " deg");
  }

  void operator()(const Generic& g) const {
    line("bytes", std::to_string(g.payload.size()));
    if (!g.payload.empty()) line("hex", hex_preview(g.payload));
  }
};

// ---------- JSON ----------

json triple_json(const Triple& t) { return json::array({t.a, t.b, t.c}); }

json opt_json(const std::optional<Triple>& t) {
  return t ? triple_json(*t) : json(nullptr);
}

json target_json(const Target& t) {
  json j;
  j["id"]             = t.id;
  j["range_m"]        = t.range_m();
  j["azimuth_deg"]    = t.azimuth_deg();
  j["elevation_deg"]  = t.elevation_deg();
  j["velocity_ms"]    = t.velocity_ms();
  j["rcs_dbsm"]       = t.rcs_dbsm();
  j["classification"] = target_class_name(t.classification);
  j["confidence"]     = t.confidence;
  return j;
}

struct JsonWriter {
  json& j;

  void operator()(const KeepAlive&) const {}

  void operator()(const SystemControl& c) const {
    j["radar_state"]      = c.radar_state;
    j["mission_category"] = c.mission_category;
    json s = json::array();
    for (auto v : c.sensor_controls) s.push_back(v);
    j["sensor_controls"]  = s;
    j["freq_index"]       = c.freq_index;
  }

  void operator()(const SystemStatus& s) const {
    j["radar_state"]    = s.radar_state;
    j["operating_mode"] = s.operating_mode;
    j["error_code"]     = s.error_code;
    if (auto t = s.temperature_c())        j["temperature_c"] = *t;
    if (s.power_status)                    j["power_status"] = *s.power_status;
    if (auto a = s.antenna_position_deg()) j["antenna_position_deg"] = *a;
  }

  void operator()(const Acknowledge& a) const { j["acked_sequence"] = a.acked_sequence; }

  void operator()(const TargetReport& r) const {
    j["declared_count"] = r.declared_count;
    j["truncated"]      = r.truncated;
    json arr = json::array();
    for (const auto& t : r.targets) arr.push_back(target_json(t));
    j["targets"] = arr;
  }

  void operator()(const SingleTargetReport& r) const { j["target"] = target_json(r.target); }

  void operator()(const SingleTargetExtended& r) const {
    const TargetData& d = r.track;
    json t;
    t["id"]                 = d.id;
    t["update_time_us"]     = d.update_time;
    t["creation_time_us"]   = d.creation_time;
    t["source"]             = d.source;
    t["status"]             = track_status_name(d.status);
    t["score"]              = d.score;
    t["classification"]     = d.classification;
    t["class_confidence"]   = d.class_confidence;
    t["seniority"]          = d.seniority;
    t["rcs_dbsm"]           = d.rcs;
    t["velocity_ms"]        = d.velocity;
    t["course_rad"]         = d.course;
    t["availability"]       = d.availability;
    t["polar_location"]     = opt_json(d.polar_location());
    t["geo_location"]       = opt_json(d.geo_location());
    t["cartesian_location"] = opt_json(d.cartesian_location());
    t["cartesian_velocity"] = opt_json(d.cartesian_velocity());
    t["cartesian_sigma"]    = opt_json(d.cartesian_sigma());
    t["polar_velocity"]     = opt_json(d.polar_velocity());
    t["absolute_velocity"]  = opt_json(d.absolute_velocity());
    j["track"] = t;

    json p;
    p["time_us"]        = r.plot.time;
    p["id"]             = r.plot.id;
    p["polar_position"] = triple_json(r.plot.polar_position);
    p["doppler_ms"]     = r.plot.doppler;
    p["snr_db"]         = r.plot.snr;
    j["plot"] = p;
  }

  void operator()(const SystemMotion& m) const {
    const MotionRecord& r = m.motion;
    j["time_us"]          = r.time;
    j["latitude_deg"]     = r.latitude_deg();
    j["longitude_deg"]    = r.longitude_deg();
    j["altitude_m"]       = r.position.c;
    j["attitude_deg"]     = triple_json(r.attitude_deg());
    j["velocity_ned"]     = triple_json(r.velocity);
    j["angular_rate_deg"] = triple_json(r.angular_velocity_deg());
    j["acceleration_ned"] = triple_json(r.acceleration);
    j["navigation_mode"]  = r.navigation_mode;
    j["validity"]         = r.validity;
  }

  void operator()(const SensorPosition& s) const {
    j["latitude_deg"]  = s.latitude_deg();
    j["longitude_deg"] = s.longitude_deg();
    j["altitude_m"]    = s.altitude_m();
    j["heading_deg"]   = s.heading_deg();
    j["pitch_deg"]     = s.pitch_deg();
    j["roll_deg"]      = s.roll_deg();
  }

  void operator()(const Generic& g) const {
    j["bytes"] = g.payload.size();
    j["hex"]   = to_hex(g.payload);
  }
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

// -----------------------------------------------------------------------------
// decode_pretty() — One-line summary.
// Output examples:
//   "status=ok msg=Keep_Alive id=0xcef00400 src=1 seq=3 len=20 time=1000"
//   "status=insufficient_payload msg=System_Status ... bytes=8 hex=..."
//   "status=error reason=too_short"
// -----------------------------------------------------------------------------
std::string decode_pretty(const DecodedMessage& dm) {
  std::ostringstream os;
  if (dm.status == DecodeStatus::TooShort) {
    os << "status=error reason=too_short";
    return os.str();
  }

  os << "status=" << to_string(dm.status)
     << " msg=" << underscored(dm.name())
     << " id=" << hex32(dm.header.message_id)
     << " src=" << dm.header.source_id
     << " seq=" << dm.header.sequence_number
     << " len=" << dm.header.message_length
     << " time=" << dm.header.time_tag;
  if (dm.header_check != HeaderCheck::Consistent) os << " warn=" << to_string(dm.header_check);

  std::visit(KvWriter{os}, dm.body);
  return os.str();
}

std::string describe(const DecodedMessage& dm) {
  std::ostringstream os;
  if (dm.status == DecodeStatus::TooShort) {
    os << "(too short for a header)\n";
    return os.str();
  }

  os << dm.name() << " [" << hex32(dm.header.message_id) << "]";
  if (dm.status != DecodeStatus::Ok) os << " " << to_string(dm.status);
  os << "\n";
  BlockWriter w{os};
  w.line("source_id", std::to_string(dm.header.source_id));
  w.line("sequence", std::to_string(dm.header.sequence_number));
  w.line("length", std::to_string(dm.header.message_length));
  w.line("time_tag_ms", std::to_string(dm.header.time_tag));
  if (dm.header_check != HeaderCheck::Consistent) w.line("warning", to_string(dm.header_check));
  std::visit(w, dm.body);
  return os.str();
}

json to_json(const DecodedMessage& dm) {
  json j;
  j["status"] = to_string(dm.status);
  if (dm.status == DecodeStatus::TooShort) return j;

  j["name"] = dm.name();
  j["kind"] = to_string(dm.kind);
  json h;
  h["source_id"]       = dm.header.source_id;
  h["message_id"]      = dm.header.message_id;
  h["message_length"]  = dm.header.message_length;
  h["time_tag"]        = dm.header.time_tag;
  h["sequence_number"] = dm.header.sequence_number;
  j["header"] = h;
  j["header_check"] = to_string(dm.header_check);

  json body = json::object();
  std::visit(JsonWriter{body}, dm.body);
  j["body"] = body;
  return j;
}

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* DIGITS = "0123456789abcdef";
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    s.push_back(DIGITS[data[i] >> 4]);
    s.push_back(DIGITS[data[i] & 0x0F]);
  }
  return s;
}

bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
  std::string digits;
  size_t start = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) start = 2;
  for (size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (c == ' ' || c == ':' || c == '-' || c == '\t' || c == '\n') continue;
    if (hex_value(c) < 0) return false;
    digits.push_back(c);
  }
  if (digits.size() % 2 != 0) return false;

  out.clear();
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((hex_value(digits[i]) << 4) | hex_value(digits[i + 1])));
  }
  return true;
}

} // namespace radarlink
