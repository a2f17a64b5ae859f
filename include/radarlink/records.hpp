/**
 * @file records.hpp
 * @brief Fixed-size track and platform records carried inside RadarLink payloads.
 *
 * @details
 * Four records, each with a fixed size that never varies on the wire:
 *
 * | Record        | Bytes | Carried by                          |
 * |---------------|-------|-------------------------------------|
 * | `Target`      | 32    | TargetReport, SingleTargetReport    |
 * | `TargetData`  | 332   | SingleTargetExtended (first part)   |
 * | `PlotData`    | 176   | SingleTargetExtended (second part)  |
 * | `MotionRecord`| 172   | SystemMotion                        |
 *
 * ### Availability flags are not presence flags
 * `TargetData` carries an 8-bit availability vector. Every optional triple
 * (geo location, cartesian location, ...) is *always* in the byte stream at
 * its fixed offset. The flag only says whether the bytes mean anything.
 * The record therefore stores every field plus the raw flag byte, and the
 * accessors (`geo_location()`, `cartesian_location()`, ...) return an empty
 * optional when the governing bit is clear. Never skip bytes based on a flag.
 *
 * ### Units
 * `Target` is fixed-point integers; the `*_m()`, `*_deg()` helpers apply the
 * ICD scale factors. `TargetData`, `PlotData` and `MotionRecord` are IEEE-754
 * doubles in SI units with angles in radians; `*_deg` helpers convert for
 * display.
 *
 * All decode functions read from a pointer the caller has already length
 * checked (use the `*_SIZE` constants). All encode functions append.
 */
#ifndef RADARLINK_RECORDS_HPP
#define RADARLINK_RECORDS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace radarlink {

static constexpr size_t TARGET_SIZE      = 32;
static constexpr size_t TARGET_DATA_SIZE = 332;
static constexpr size_t PLOT_DATA_SIZE   = 176;
static constexpr size_t MOTION_SIZE      = 172;

static constexpr double RAD_TO_DEG = 57.29577951308232;

/// Three doubles that always travel together (x/y/z, lat/lon/alt, el/az/range...).
struct Triple {
  double a{0.0};
  double b{0.0};
  double c{0.0};

  bool operator==(const Triple& o) const { return a == o.a && b == o.b && c == o.c; }
  bool operator!=(const Triple& o) const { return !(*this == o); }
};

// -----------------------------------------------------------------------------
// Target (legacy 32-byte record)
// -----------------------------------------------------------------------------

/// Target classification codes used by the legacy record.
enum class TargetClass : int32_t {
  Unknown = 0, Aircraft = 1, Helicopter = 2, Bird = 3, Clutter = 4, Weather = 5,
};

struct Target {
  uint32_t id{0};
  uint32_t range_mm{0};         ///< millimetres
  uint32_t azimuth_mdeg{0};     ///< millidegrees
  uint32_t elevation_mdeg{0};   ///< millidegrees
  int32_t  velocity_cms{0};     ///< centimetres per second
  int32_t  rcs_cdbsm{0};        ///< hundredths of dBsm
  int32_t  classification{0};   ///< TargetClass value
  int32_t  confidence{0};       ///< percent

  double range_m()       const { return range_mm / 1000.0; }
  double azimuth_deg()   const { return azimuth_mdeg / 1000.0; }
  double elevation_deg() const { return elevation_mdeg / 1000.0; }
  double velocity_ms()   const { return velocity_cms / 100.0; }
  double rcs_dbsm()      const { return rcs_cdbsm / 100.0; }

  bool operator==(const Target& o) const {
    return id == o.id && range_mm == o.range_mm && azimuth_mdeg == o.azimuth_mdeg &&
           elevation_mdeg == o.elevation_mdeg && velocity_cms == o.velocity_cms &&
           rcs_cdbsm == o.rcs_cdbsm && classification == o.classification &&
           confidence == o.confidence;
  }
  bool operator!=(const Target& o) const { return !(*this == o); }
};

void decode_target(const uint8_t* p, Target& out);
void encode_target(const Target& t, std::vector<uint8_t>& out);

/// "Aircraft", "Bird", ... or "Unknown" for out-of-range codes.
const char* target_class_name(int32_t classification);

// -----------------------------------------------------------------------------
// TargetData (extended 332-byte track record)
// -----------------------------------------------------------------------------

enum class TrackStatus : uint32_t { New = 0, Update = 1, Delete = 2, Extrapolate = 3 };

/// Bits of TargetData::availability.
namespace avail {
  static constexpr uint8_t CARTESIAN_LOCATION = 1u << 0;
  static constexpr uint8_t CARTESIAN_VELOCITY = 1u << 1;
  static constexpr uint8_t POLAR_LOCATION     = 1u << 2;
  static constexpr uint8_t POLAR_VELOCITY     = 1u << 3;
  static constexpr uint8_t GEO_LOCATION       = 1u << 4;
  static constexpr uint8_t ABSOLUTE_VELOCITY  = 1u << 5;
  static constexpr uint8_t CARTESIAN_VARIANCE = 1u << 6;
}

struct TargetData {
  uint32_t id{0};
  uint64_t update_time{0};        ///< µs since midnight
  uint64_t creation_time{0};      ///< µs since midnight
  uint32_t source{0};
  uint32_t status{0};             ///< TrackStatus value
  float    score{0.0f};
  uint32_t classification{0};
  float    class_confidence{0.0f};
  uint32_t seniority{0};
  double   rcs{0.0};              ///< dBsm
  Triple   polar_position;        ///< elevation rad, azimuth rad, range m
  double   velocity{0.0};         ///< m/s
  double   course{0.0};           ///< rad
  Triple   polar_sigma;
  uint32_t dimensionality{0};     ///< 0 = 2D, 1 = 3D
  uint32_t coordinate_system{0};  ///< 0 polar, 1 cartesian, 2 geodetic
  uint8_t  availability{0};       ///< avail:: bits

  // Always present in the byte stream; meaningful only when flagged.
  Triple   geo_location_raw;           ///< lat rad, lon rad, alt m
  Triple   cartesian_location_raw;
  Triple   cartesian_velocity_raw;
  Triple   cartesian_sigma_raw;
  Triple   cartesian_velocity_sigma_raw;
  Triple   polar_velocity_raw;
  Triple   polar_velocity_variance_raw;
  double   ground_speed_raw{0.0};      ///< m/s
  double   ground_heading_raw{0.0};    ///< rad

  bool has(uint8_t bit) const { return (availability & bit) != 0; }

  std::optional<Triple> geo_location() const;
  std::optional<Triple> cartesian_location() const;
  std::optional<Triple> cartesian_velocity() const;
  std::optional<Triple> cartesian_sigma() const;
  std::optional<Triple> cartesian_velocity_sigma() const;
  std::optional<Triple> polar_location() const;
  std::optional<Triple> polar_velocity() const;
  std::optional<Triple> polar_velocity_variance() const;
  /// Ground speed (a) and heading (b); c unused.
  std::optional<Triple> absolute_velocity() const;

  bool operator==(const TargetData& o) const;
  bool operator!=(const TargetData& o) const { return !(*this == o); }
};

void decode_target_data(const uint8_t* p, TargetData& out);
void encode_target_data(const TargetData& t, std::vector<uint8_t>& out);

/// "new", "update", "delete", "extrapolate" or "unknown".
const char* track_status_name(uint32_t status);

// -----------------------------------------------------------------------------
// PlotData (176 bytes)
// -----------------------------------------------------------------------------

struct PlotData {
  uint64_t time{0};           ///< µs since midnight
  uint32_t id{0};
  Triple   polar_position;    ///< elevation rad, azimuth rad, range m
  double   doppler{0.0};      ///< m/s
  double   snr{0.0};          ///< dB
  Triple   polar_sigma;
  double   doppler_sigma{0.0};

  bool operator==(const PlotData& o) const {
    return time == o.time && id == o.id && polar_position == o.polar_position &&
           doppler == o.doppler && snr == o.snr && polar_sigma == o.polar_sigma &&
           doppler_sigma == o.doppler_sigma;
  }
  bool operator!=(const PlotData& o) const { return !(*this == o); }
};

void decode_plot_data(const uint8_t* p, PlotData& out);
void encode_plot_data(const PlotData& d, std::vector<uint8_t>& out);

// -----------------------------------------------------------------------------
// MotionRecord (SystemMotion payload, 172 bytes)
// -----------------------------------------------------------------------------

struct MotionRecord {
  uint64_t time{0};             ///< µs since midnight
  Triple   position;            ///< lat rad, lon rad, alt m
  Triple   attitude;            ///< roll, pitch, yaw rad
  Triple   velocity;            ///< north, east, down m/s
  Triple   angular_velocity;    ///< roll, pitch, yaw rate rad/s
  Triple   acceleration;        ///< north, east, down m/s^2
  Triple   attitude_sigma;      ///< rad
  uint32_t navigation_mode{0};
  uint32_t validity{0};

  double latitude_deg()  const { return position.a * RAD_TO_DEG; }
  double longitude_deg() const { return position.b * RAD_TO_DEG; }
  Triple attitude_deg() const {
    return Triple{attitude.a * RAD_TO_DEG, attitude.b * RAD_TO_DEG, attitude.c * RAD_TO_DEG};
  }
  Triple angular_velocity_deg() const {
    return Triple{angular_velocity.a * RAD_TO_DEG, angular_velocity.b * RAD_TO_DEG,
                  angular_velocity.c * RAD_TO_DEG};
  }

  bool operator==(const MotionRecord& o) const {
    return time == o.time && position == o.position && attitude == o.attitude &&
           velocity == o.velocity && angular_velocity == o.angular_velocity &&
           acceleration == o.acceleration && attitude_sigma == o.attitude_sigma &&
           navigation_mode == o.navigation_mode && validity == o.validity;
  }
  bool operator!=(const MotionRecord& o) const { return !(*this == o); }
};

void decode_motion(const uint8_t* p, MotionRecord& out);
void encode_motion(const MotionRecord& m, std::vector<uint8_t>& out);

} // namespace radarlink

#endif // RADARLINK_RECORDS_HPP
