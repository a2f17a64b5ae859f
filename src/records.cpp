// -----------------------------------------------------------------------------
// records.cpp — Fixed-size record codecs (Target, TargetData, PlotData, Motion)
//
// API, offsets & units:
//   see include/radarlink/records.hpp
//
// Runnable checks:
//   see tests/test_records.cpp
//
// NOTE: Every reader walks the whole record at fixed offsets. Availability
// flags never change how many bytes are consumed.
// -----------------------------------------------------------------------------
#include "radarlink/records.hpp"
#include "radarlink/byte_order.hpp"

namespace radarlink {

namespace {

Triple read_triple(const uint8_t* p, size_t off) {
  return Triple{ wire::get_f64(p, off), wire::get_f64(p, off + 8), wire::get_f64(p, off + 16) };
}

void write_triple(std::vector<uint8_t>& b, const Triple& t) {
  wire::put_f64(b, t.a);
  wire::put_f64(b, t.b);
  wire::put_f64(b, t.c);
}

std::optional<Triple> flagged(bool on, const Triple& t) {
  if (!on) return std::nullopt;
  return t;
}

} // namespace

// ---------- Target ----------

void decode_target(const uint8_t* p, Target& out) {
  out.id             = wire::get_u32(p, 0);
  out.range_mm       = wire::get_u32(p, 4);
  out.azimuth_mdeg   = wire::get_u32(p, 8);
  out.elevation_mdeg = wire::get_u32(p, 12);
  out.velocity_cms   = wire::get_i32(p, 16);
  out.rcs_cdbsm      = wire::get_i32(p, 20);
  out.classification = wire::get_i32(p, 24);
  out.confidence     = wire::get_i32(p, 28);
}

void encode_target(const Target& t, std::vector<uint8_t>& out) {
  wire::put_u32(out, t.id);
  wire::put_u32(out, t.range_mm);
  wire::put_u32(out, t.azimuth_mdeg);
  wire::put_u32(out, t.elevation_mdeg);
  wire::put_i32(out, t.velocity_cms);
  wire::put_i32(out, t.rcs_cdbsm);
  wire::put_i32(out, t.classification);
  wire::put_i32(out, t.confidence);
}

const char* target_class_name(int32_t classification) {
  switch (static_cast<TargetClass>(classification)) {
    case TargetClass::Unknown:    return "Unknown";
    case TargetClass::Aircraft:   return "Aircraft";
    case TargetClass::Helicopter: return "Helicopter";
    case TargetClass::Bird:       return "Bird";
    case TargetClass::Clutter:    return "Clutter";
    case TargetClass::Weather:    return "Weather";
  }
  return "Unknown";
}

// ---------- TargetData ----------

std::optional<Triple> TargetData::geo_location() const {
  return flagged(has(avail::GEO_LOCATION), geo_location_raw);
}
std::optional<Triple> TargetData::cartesian_location() const {
  return flagged(has(avail::CARTESIAN_LOCATION), cartesian_location_raw);
}
std::optional<Triple> TargetData::cartesian_velocity() const {
  return flagged(has(avail::CARTESIAN_VELOCITY), cartesian_velocity_raw);
}
std::optional<Triple> TargetData::cartesian_sigma() const {
  return flagged(has(avail::CARTESIAN_VARIANCE), cartesian_sigma_raw);
}
std::optional<Triple> TargetData::cartesian_velocity_sigma() const {
  return flagged(has(avail::CARTESIAN_VARIANCE), cartesian_velocity_sigma_raw);
}
std::optional<Triple> TargetData::polar_location() const {
  return flagged(has(avail::POLAR_LOCATION), polar_position);
}
std::optional<Triple> TargetData::polar_velocity() const {
  return flagged(has(avail::POLAR_VELOCITY), polar_velocity_raw);
}
std::optional<Triple> TargetData::polar_velocity_variance() const {
  return flagged(has(avail::POLAR_VELOCITY), polar_velocity_variance_raw);
}
std::optional<Triple> TargetData::absolute_velocity() const {
  return flagged(has(avail::ABSOLUTE_VELOCITY),
                 Triple{ ground_speed_raw, ground_heading_raw, 0.0 });
}

bool TargetData::operator==(const TargetData& o) const {
  return id == o.id && update_time == o.update_time && creation_time == o.creation_time &&
         source == o.source && status == o.status && score == o.score &&
         classification == o.classification && class_confidence == o.class_confidence &&
         seniority == o.seniority && rcs == o.rcs && polar_position == o.polar_position &&
         velocity == o.velocity && course == o.course && polar_sigma == o.polar_sigma &&
         dimensionality == o.dimensionality && coordinate_system == o.coordinate_system &&
         availability == o.availability && geo_location_raw == o.geo_location_raw &&
         cartesian_location_raw == o.cartesian_location_raw &&
         cartesian_velocity_raw == o.cartesian_velocity_raw &&
         cartesian_sigma_raw == o.cartesian_sigma_raw &&
         cartesian_velocity_sigma_raw == o.cartesian_velocity_sigma_raw &&
         polar_velocity_raw == o.polar_velocity_raw &&
         polar_velocity_variance_raw == o.polar_velocity_variance_raw &&
         ground_speed_raw == o.ground_speed_raw && ground_heading_raw == o.ground_heading_raw;
}

// -----------------------------------------------------------------------------
// decode_target_data() — Read all 332 bytes of an extended track record.
// PRE:   p holds at least TARGET_DATA_SIZE bytes.
// POLICY:
//   - Flagged triples are stored whatever the flag says; the accessors gate.
//   - Reserved bytes 125..127 and 312..331 are skipped, not validated.
// -----------------------------------------------------------------------------
void decode_target_data(const uint8_t* p, TargetData& out) {
  out.id                = wire::get_u32(p, 0);
  out.update_time       = wire::get_u64(p, 4);
  out.creation_time     = wire::get_u64(p, 12);
  out.source            = wire::get_u32(p, 20);
  out.status            = wire::get_u32(p, 24);
  out.score             = wire::get_f32(p, 28);
  out.classification    = wire::get_u32(p, 32);
  out.class_confidence  = wire::get_f32(p, 36);
  out.seniority         = wire::get_u32(p, 40);
  out.rcs               = wire::get_f64(p, 44);
  out.polar_position    = read_triple(p, 52);
  out.velocity          = wire::get_f64(p, 76);
  out.course            = wire::get_f64(p, 84);
  out.polar_sigma       = read_triple(p, 92);
  out.dimensionality    = wire::get_u32(p, 116);
  out.coordinate_system = wire::get_u32(p, 120);
  out.availability      = wire::get_u8(p, 124);

  out.geo_location_raw             = read_triple(p, 128);
  out.cartesian_location_raw       = read_triple(p, 152);
  out.cartesian_velocity_raw       = read_triple(p, 176);
  out.cartesian_sigma_raw          = read_triple(p, 200);
  out.cartesian_velocity_sigma_raw = read_triple(p, 224);
  out.polar_velocity_raw           = read_triple(p, 248);
  out.polar_velocity_variance_raw  = read_triple(p, 272);
  out.ground_speed_raw             = wire::get_f64(p, 296);
  out.ground_heading_raw           = wire::get_f64(p, 304);
}

void encode_target_data(const TargetData& t, std::vector<uint8_t>& out) {
  wire::put_u32(out, t.id);
  wire::put_u64(out, t.update_time);
  wire::put_u64(out, t.creation_time);
  wire::put_u32(out, t.source);
  wire::put_u32(out, t.status);
  wire::put_f32(out, t.score);
  wire::put_u32(out, t.classification);
  wire::put_f32(out, t.class_confidence);
  wire::put_u32(out, t.seniority);
  wire::put_f64(out, t.rcs);
  write_triple(out, t.polar_position);
  wire::put_f64(out, t.velocity);
  wire::put_f64(out, t.course);
  write_triple(out, t.polar_sigma);
  wire::put_u32(out, t.dimensionality);
  wire::put_u32(out, t.coordinate_system);
  wire::put_u8(out, t.availability);
  wire::put_zeros(out, 3);

  write_triple(out, t.geo_location_raw);
  write_triple(out, t.cartesian_location_raw);
  write_triple(out, t.cartesian_velocity_raw);
  write_triple(out, t.cartesian_sigma_raw);
  write_triple(out, t.cartesian_velocity_sigma_raw);
  write_triple(out, t.polar_velocity_raw);
  write_triple(out, t.polar_velocity_variance_raw);
  wire::put_f64(out, t.ground_speed_raw);
  wire::put_f64(out, t.ground_heading_raw);
  wire::put_zeros(out, 20);
}

const char* track_status_name(uint32_t status) {
  switch (status) {
    case static_cast<uint32_t>(TrackStatus::New):         return "new";
    case static_cast<uint32_t>(TrackStatus::Update):      return "update";
    case static_cast<uint32_t>(TrackStatus::Delete):      return "delete";
    case static_cast<uint32_t>(TrackStatus::Extrapolate): return "extrapolate";
    default: break;
  }
  return "unknown";
}

// ---------- PlotData ----------

void decode_plot_data(const uint8_t* p, PlotData& out) {
  out.time           = wire::get_u64(p, 0);
  out.id             = wire::get_u32(p, 8);
  // 12: reserved u32
  out.polar_position = read_triple(p, 16);
  out.doppler        = wire::get_f64(p, 40);
  out.snr            = wire::get_f64(p, 48);
  out.polar_sigma    = read_triple(p, 56);
  out.doppler_sigma  = wire::get_f64(p, 80);
}

void encode_plot_data(const PlotData& d, std::vector<uint8_t>& out) {
  wire::put_u64(out, d.time);
  wire::put_u32(out, d.id);
  wire::put_zeros(out, 4);
  write_triple(out, d.polar_position);
  wire::put_f64(out, d.doppler);
  wire::put_f64(out, d.snr);
  write_triple(out, d.polar_sigma);
  wire::put_f64(out, d.doppler_sigma);
  wire::put_zeros(out, 88);
}

// ---------- MotionRecord ----------

void decode_motion(const uint8_t* p, MotionRecord& out) {
  out.time             = wire::get_u64(p, 0);
  out.position         = read_triple(p, 8);
  out.attitude         = read_triple(p, 32);
  out.velocity         = read_triple(p, 56);
  out.angular_velocity = read_triple(p, 80);
  out.acceleration     = read_triple(p, 104);
  out.attitude_sigma   = read_triple(p, 128);
  out.navigation_mode  = wire::get_u32(p, 152);
  out.validity         = wire::get_u32(p, 156);
}

void encode_motion(const MotionRecord& m, std::vector<uint8_t>& out) {
  wire::put_u64(out, m.time);
  write_triple(out, m.position);
  write_triple(out, m.attitude);
  write_triple(out, m.velocity);
  write_triple(out, m.angular_velocity);
  write_triple(out, m.acceleration);
  write_triple(out, m.attitude_sigma);
  wire::put_u32(out, m.navigation_mode);
  wire::put_u32(out, m.validity);
  wire::put_zeros(out, 12);
}

} // namespace radarlink
