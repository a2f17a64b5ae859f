/**
 * @file control_layout.hpp
 * @brief SystemControl payload layouts, selected by protocol revision name.
 *
 * @details
 * The SystemControl payload is the one place where field revisions disagree
 * on offsets and total size. Rather than hard-code one, the layout is data:
 *
 * | Revision       | state | mission | sensors[8] | freq | payload |
 * |----------------|-------|---------|------------|------|---------|
 * | `icd-40`       | 0     | 4       | 8..15      | 16   | 40      |
 * | `extended-44`  | 0     | 4       | 8..15      | 20   | 44      |
 *
 * `extended-44` carries a 4-byte reserved gap (16..19) after the sensor
 * controls. Everything after the frequency index is spare and encodes as zero.
 *
 * The decoder needs the fixed fields only (`min_payload()`); the encoder
 * always pads to `payload_size`.
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace radarlink {

struct ControlLayout {
  const char* name;
  uint8_t state_off;
  uint8_t mission_off;
  uint8_t sensors_off;
  uint8_t freq_off;
  uint8_t payload_size;

  /// Bytes needed to read every named field.
  size_t min_payload() const { return static_cast<size_t>(freq_off) + 4; }

  static constexpr ControlLayout icd40() {
    return ControlLayout{"icd-40", 0, 4, 8, 16, 40};
  }
  static constexpr ControlLayout extended44() {
    return ControlLayout{"extended-44", 0, 4, 8, 20, 44};
  }
};

/// Number of per-sensor enable bytes (HFL 1-4, radar 1-4).
static constexpr size_t SENSOR_CONTROL_COUNT = 8;

/**
 * @brief Look up a SystemControl layout by revision name.
 * @return false for an unknown name (out untouched).
 */
bool control_layout_by_name(const char* name, ControlLayout& out);

} // namespace radarlink
