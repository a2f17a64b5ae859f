// -----------------------------------------------------------------------------
// codec.cpp — Registry dispatch and per-kind payload decoders/encoders
//
// API & decoder minimums:
//   see include/radarlink/codec.hpp
//
// Runnable checks:
//   see tests/test_codec.cpp
//
// NOTE: The decoder table is indexed by MessageKind and must list one row per
// Body alternative, in the same order. The static_assert below keeps the
// three (enum, variant, table) in step.
// -----------------------------------------------------------------------------
#include "radarlink/codec.hpp"
#include "radarlink/byte_order.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace radarlink {

namespace {

using PayloadDecoder = DecodeStatus (*)(const uint8_t* p, size_t len, uint32_t id,
                                        const CodecOptions& opt, Body& out);

// Short payload: keep the bytes for diagnostics, report, move on.
DecodeStatus insufficient(const uint8_t* p, size_t len, uint32_t id, Body& out) {
  Generic g;
  g.message_id = id;
  if (len) g.payload.assign(p, p + len);
  out = std::move(g);
  return DecodeStatus::InsufficientPayload;
}

DecodeStatus decode_keep_alive(const uint8_t*, size_t, uint32_t, const CodecOptions&, Body& out) {
  out = KeepAlive{};
  return DecodeStatus::Ok;
}

DecodeStatus decode_system_control(const uint8_t* p, size_t len, uint32_t id,
                                   const CodecOptions& opt, Body& out) {
  const ControlLayout& l = opt.control;
  if (len < l.min_payload()) return insufficient(p, len, id, out);

  SystemControl c;
  c.radar_state      = wire::get_u32(p, l.state_off);
  c.mission_category = wire::get_u32(p, l.mission_off);
  for (size_t i = 0; i < SENSOR_CONTROL_COUNT; ++i) {
    c.sensor_controls[i] = wire::get_u8(p, l.sensors_off + i);
  }
  c.freq_index = wire::get_u32(p, l.freq_off);
  out = c;
  return DecodeStatus::Ok;
}

// -----------------------------------------------------------------------------
// decode_system_status() — Progressive decode; each 4 bytes past 12 adds a field.
// POLICY:
//   - Below 12 bytes: InsufficientPayload, raw kept. The session still counts it.
//   - Bytes past STATUS_MAX_PAYLOAD are ignored (newer RC firmware may append more).
// -----------------------------------------------------------------------------
DecodeStatus decode_system_status(const uint8_t* p, size_t len, uint32_t id,
                                  const CodecOptions&, Body& out) {
  if (len < STATUS_MIN_PAYLOAD) return insufficient(p, len, id, out);

  SystemStatus s;
  s.radar_state    = wire::get_u32(p, 0);
  s.operating_mode = wire::get_u32(p, 4);
  s.error_code     = wire::get_u32(p, 8);
  if (len >= 16)                 s.temperature_dc        = wire::get_i32(p, 12);
  if (len >= 20)                 s.power_status          = wire::get_u32(p, 16);
  if (len >= STATUS_MAX_PAYLOAD) s.antenna_position_cdeg = wire::get_u32(p, 20);
  out = s;
  return DecodeStatus::Ok;
}

DecodeStatus decode_acknowledge(const uint8_t* p, size_t len, uint32_t id,
                                const CodecOptions&, Body& out) {
  if (len < 4) return insufficient(p, len, id, out);
  out = Acknowledge{ wire::get_u32(p, 0) };
  return DecodeStatus::Ok;
}

// -----------------------------------------------------------------------------
// decode_target_report() — Count + N fixed records, tolerant of truncation.
// POLICY:
//   - Records decoded = min(declared, complete 32-byte records present).
//   - Fewer than declared sets `truncated`; it is not a failure.
//   - Trailing partial record bytes are ignored.
// -----------------------------------------------------------------------------
DecodeStatus decode_target_report(const uint8_t* p, size_t len, uint32_t id,
                                  const CodecOptions&, Body& out) {
  if (len < 4) return insufficient(p, len, id, out);

  TargetReport r;
  r.declared_count = wire::get_u32(p, 0);
  const size_t present = (len - 4) / TARGET_SIZE;
  const size_t n = std::min(static_cast<size_t>(r.declared_count), present);
  r.targets.resize(n);
  for (size_t i = 0; i < n; ++i) {
    decode_target(p + 4 + i * TARGET_SIZE, r.targets[i]);
  }
  r.truncated = n < r.declared_count;
  out = std::move(r);
  return DecodeStatus::Ok;
}

DecodeStatus decode_single_target(const uint8_t* p, size_t len, uint32_t id,
                                  const CodecOptions&, Body& out) {
  if (len < TARGET_SIZE) return insufficient(p, len, id, out);
  SingleTargetReport r;
  decode_target(p, r.target);
  out = r;
  return DecodeStatus::Ok;
}

DecodeStatus decode_single_target_extended(const uint8_t* p, size_t len, uint32_t id,
                                           const CodecOptions&, Body& out) {
  if (len < EXTENDED_PAYLOAD) return insufficient(p, len, id, out);
  SingleTargetExtended r;
  decode_target_data(p, r.track);
  decode_plot_data(p + TARGET_DATA_SIZE, r.plot);
  out = r;
  return DecodeStatus::Ok;
}

DecodeStatus decode_system_motion(const uint8_t* p, size_t len, uint32_t id,
                                  const CodecOptions&, Body& out) {
  if (len < MOTION_SIZE) return insufficient(p, len, id, out);
  SystemMotion m;
  decode_motion(p, m.motion);
  out = m;
  return DecodeStatus::Ok;
}

DecodeStatus decode_sensor_position(const uint8_t* p, size_t len, uint32_t id,
                                    const CodecOptions&, Body& out) {
  if (len < SENSOR_POSITION_SIZE) return insufficient(p, len, id, out);
  SensorPosition s;
  s.latitude_e7  = wire::get_i32(p, 0);
  s.longitude_e7 = wire::get_i32(p, 4);
  s.altitude_mm  = wire::get_i32(p, 8);
  s.heading_mdeg = wire::get_i32(p, 12);
  s.pitch_mdeg   = wire::get_i32(p, 16);
  s.roll_mdeg    = wire::get_i32(p, 20);
  out = s;
  return DecodeStatus::Ok;
}

DecodeStatus decode_generic(const uint8_t* p, size_t len, uint32_t id,
                            const CodecOptions&, Body& out) {
  Generic g;
  g.message_id = id;
  if (len) g.payload.assign(p, p + len);
  out = std::move(g);
  return DecodeStatus::Ok;
}

// Indexed by MessageKind.
const std::array<PayloadDecoder, MESSAGE_KIND_COUNT> DECODERS = {{
  decode_keep_alive,
  decode_system_control,
  decode_system_status,
  decode_acknowledge,
  decode_target_report,
  decode_single_target,
  decode_single_target_extended,
  decode_system_motion,
  decode_sensor_position,
  decode_generic,
}};

static_assert(std::variant_size<Body>::value == MESSAGE_KIND_COUNT,
              "Body alternatives and MessageKind must match one to one");

// ---------- encoders ----------

struct BodyEncoder {
  const CodecOptions& opt;
  std::vector<uint8_t>& out;

  void operator()(const KeepAlive&) const {}

  void operator()(const SystemControl& c) const {
    const ControlLayout& l = opt.control;
    const size_t base = out.size();
    out.resize(base + l.payload_size, 0);
    uint8_t* p = out.data() + base;
    wire::set_u32(p, l.state_off, c.radar_state);
    wire::set_u32(p, l.mission_off, c.mission_category);
    for (size_t i = 0; i < SENSOR_CONTROL_COUNT; ++i) {
      p[l.sensors_off + i] = c.sensor_controls[i];
    }
    wire::set_u32(p, l.freq_off, c.freq_index);
  }

  // Optional tail stops at the first absent field; later fields cannot be
  // sent without the earlier ones.
  void operator()(const SystemStatus& s) const {
    wire::put_u32(out, s.radar_state);
    wire::put_u32(out, s.operating_mode);
    wire::put_u32(out, s.error_code);
    if (!s.temperature_dc) return;
    wire::put_i32(out, *s.temperature_dc);
    if (!s.power_status) return;
    wire::put_u32(out, *s.power_status);
    if (!s.antenna_position_cdeg) return;
    wire::put_u32(out, *s.antenna_position_cdeg);
  }

  void operator()(const Acknowledge& a) const { wire::put_u32(out, a.acked_sequence); }

  void operator()(const TargetReport& r) const {
    wire::put_u32(out, r.declared_count);
    for (const auto& t : r.targets) encode_target(t, out);
  }

  void operator()(const SingleTargetReport& r) const { encode_target(r.target, out); }

  void operator()(const SingleTargetExtended& r) const {
    encode_target_data(r.track, out);
    encode_plot_data(r.plot, out);
  }

  void operator()(const SystemMotion& m) const { encode_motion(m.motion, out); }

  void operator()(const SensorPosition& s) const {
    wire::put_i32(out, s.latitude_e7);
    wire::put_i32(out, s.longitude_e7);
    wire::put_i32(out, s.altitude_mm);
    wire::put_i32(out, s.heading_mdeg);
    wire::put_i32(out, s.pitch_mdeg);
    wire::put_i32(out, s.roll_mdeg);
  }

  void operator()(const Generic& g) const {
    out.insert(out.end(), g.payload.begin(), g.payload.end());
  }
};

} // namespace

DecodeStatus decode_body(MessageKind kind, uint32_t message_id,
                         const uint8_t* payload, size_t len,
                         const CodecOptions& opt, Body& out) {
  const size_t idx = static_cast<size_t>(kind);
  if (idx >= DECODERS.size()) return decode_generic(payload, len, message_id, opt, out);
  return DECODERS[idx](payload, len, message_id, opt, out);
}

// -----------------------------------------------------------------------------
// decode_message() — Header, length check, registry lookup, payload decode.
// POLICY:
//   - Payload is everything after the header that was handed in, not what
//     the header claims. A mismatch is surfaced in header_check only.
// -----------------------------------------------------------------------------
DecodedMessage decode_message(const uint8_t* data, size_t len, const CodecOptions& opt) {
  DecodedMessage dm;
  dm.status = decode_header(data, len, opt.header, dm.header);
  if (dm.status != DecodeStatus::Ok) return dm;

  dm.header_check = check_length(dm.header, len);
  dm.kind = kind_for_id(dm.header.message_id);

  const uint8_t* payload = data + HEADER_SIZE;
  const size_t payload_len = len - HEADER_SIZE;
  if (payload_len) dm.payload.assign(payload, payload + payload_len);

  dm.status = decode_body(dm.kind, dm.header.message_id, payload, payload_len, opt, dm.body);
  return dm;
}

void encode_body(const Body& body, const CodecOptions& opt, std::vector<uint8_t>& out) {
  std::visit(BodyEncoder{opt, out}, body);
}

uint32_t message_id_for(const Body& body) {
  if (const Generic* g = std::get_if<Generic>(&body)) return g->message_id;
  return id_for_kind(kind_of(body));
}

std::vector<uint8_t> encode_message(const MessageHeader& fields, const Body& body,
                                    const CodecOptions& opt) {
  std::vector<uint8_t> frame(HEADER_SIZE, 0);
  encode_body(body, opt, frame);

  MessageHeader h = fields;
  h.message_id     = message_id_for(body);
  h.message_length = static_cast<uint32_t>(frame.size());
  encode_header(h, opt.header, frame.data());
  return frame;
}

} // namespace radarlink
