/**
 * @file message.hpp
 * @brief RadarLink message values — one struct per message kind, joined in a closed variant.
 *
 * @details
 * A decoded (or to-be-encoded) message is a `MessageHeader` plus a `Body`.
 * `Body` is a `std::variant` whose alternative order matches `MessageKind`,
 * so `kind_of(body)` is just the variant index. Adding a kind means adding an
 * alternative here, a catalog row, and a decoder/encoder row in codec.cpp.
 * The compiler then points at every `std::visit` that needs a new branch.
 *
 * All values are plain, independently owned copies. Nothing here points back
 * into a receive buffer.
 *
 * ### SystemStatus tail
 * The payload grows in 4-byte steps and each step adds one field:
 *
 * | Payload | Fields present                                      |
 * |---------|-----------------------------------------------------|
 * | 12      | radar_state, operating_mode, error_code             |
 * | 16      | + temperature (i32, tenths of °C)                   |
 * | 20      | + power_status (u32 bitmask, see `power::`)         |
 * | 24      | + antenna_position (u32, hundredths of a degree)    |
 *
 * Presence is decided by length alone. There is no flag.
 */
#ifndef RADARLINK_MESSAGE_HPP
#define RADARLINK_MESSAGE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "radarlink/control_layout.hpp"
#include "radarlink/header.hpp"
#include "radarlink/message_catalog.hpp"
#include "radarlink/records.hpp"

namespace radarlink {

/// ICD RDR_STATE values the session drives. Both are configurable in LinkConfig.
namespace radar_state {
  static constexpr uint32_t STANDBY = 2;
  static constexpr uint32_t OPERATE = 4;
}

/// SystemStatus power_status bits.
namespace power {
  static constexpr uint32_t MAIN            = 0x01;
  static constexpr uint32_t BACKUP          = 0x02;
  static constexpr uint32_t TRANSMITTER     = 0x04;
  static constexpr uint32_t RECEIVER        = 0x08;
  static constexpr uint32_t ANTENNA_DRIVE   = 0x10;
  static constexpr uint32_t PROCESSING_UNIT = 0x20;
}

struct KeepAlive {
  bool operator==(const KeepAlive&) const { return true; }
  bool operator!=(const KeepAlive&) const { return false; }
};

struct SystemControl {
  uint32_t radar_state{0};
  uint32_t mission_category{0};
  std::array<uint8_t, SENSOR_CONTROL_COUNT> sensor_controls{};  ///< 0 = enabled
  uint32_t freq_index{0};

  bool operator==(const SystemControl& o) const {
    return radar_state == o.radar_state && mission_category == o.mission_category &&
           sensor_controls == o.sensor_controls && freq_index == o.freq_index;
  }
  bool operator!=(const SystemControl& o) const { return !(*this == o); }
};

struct SystemStatus {
  uint32_t radar_state{0};
  uint32_t operating_mode{0};
  uint32_t error_code{0};
  std::optional<int32_t>  temperature_dc;       ///< tenths of °C
  std::optional<uint32_t> power_status;         ///< power:: bits
  std::optional<uint32_t> antenna_position_cdeg;///< hundredths of a degree

  std::optional<double> temperature_c() const {
    if (!temperature_dc) return std::nullopt;
    return *temperature_dc / 10.0;
  }
  std::optional<double> antenna_position_deg() const {
    if (!antenna_position_cdeg) return std::nullopt;
    return *antenna_position_cdeg / 100.0;
  }

  bool operator==(const SystemStatus& o) const {
    return radar_state == o.radar_state && operating_mode == o.operating_mode &&
           error_code == o.error_code && temperature_dc == o.temperature_dc &&
           power_status == o.power_status && antenna_position_cdeg == o.antenna_position_cdeg;
  }
  bool operator!=(const SystemStatus& o) const { return !(*this == o); }
};

struct Acknowledge {
  uint32_t acked_sequence{0};

  bool operator==(const Acknowledge& o) const { return acked_sequence == o.acked_sequence; }
  bool operator!=(const Acknowledge& o) const { return !(*this == o); }
};

struct TargetReport {
  uint32_t declared_count{0};
  std::vector<Target> targets;
  bool truncated{false};        ///< fewer complete records than declared

  bool operator==(const TargetReport& o) const {
    return declared_count == o.declared_count && targets == o.targets && truncated == o.truncated;
  }
  bool operator!=(const TargetReport& o) const { return !(*this == o); }
};

struct SingleTargetReport {
  Target target;

  bool operator==(const SingleTargetReport& o) const { return target == o.target; }
  bool operator!=(const SingleTargetReport& o) const { return !(*this == o); }
};

struct SingleTargetExtended {
  TargetData track;
  PlotData   plot;

  bool operator==(const SingleTargetExtended& o) const { return track == o.track && plot == o.plot; }
  bool operator!=(const SingleTargetExtended& o) const { return !(*this == o); }
};

struct SystemMotion {
  MotionRecord motion;

  bool operator==(const SystemMotion& o) const { return motion == o.motion; }
  bool operator!=(const SystemMotion& o) const { return !(*this == o); }
};

struct SensorPosition {
  int32_t latitude_e7{0};    ///< degrees * 1e7
  int32_t longitude_e7{0};   ///< degrees * 1e7
  int32_t altitude_mm{0};    ///< millimetres
  int32_t heading_mdeg{0};   ///< millidegrees
  int32_t pitch_mdeg{0};
  int32_t roll_mdeg{0};

  double latitude_deg()  const { return latitude_e7 / 10000000.0; }
  double longitude_deg() const { return longitude_e7 / 10000000.0; }
  double altitude_m()    const { return altitude_mm / 1000.0; }
  double heading_deg()   const { return heading_mdeg / 1000.0; }
  double pitch_deg()     const { return pitch_mdeg / 1000.0; }
  double roll_deg()      const { return roll_mdeg / 1000.0; }

  bool operator==(const SensorPosition& o) const {
    return latitude_e7 == o.latitude_e7 && longitude_e7 == o.longitude_e7 &&
           altitude_mm == o.altitude_mm && heading_mdeg == o.heading_mdeg &&
           pitch_mdeg == o.pitch_mdeg && roll_mdeg == o.roll_mdeg;
  }
  bool operator!=(const SensorPosition& o) const { return !(*this == o); }
};

/// Identifier with no dedicated layout (or a short payload): raw bytes only.
struct Generic {
  uint32_t message_id{0};
  std::vector<uint8_t> payload;

  bool operator==(const Generic& o) const { return message_id == o.message_id && payload == o.payload; }
  bool operator!=(const Generic& o) const { return !(*this == o); }
};

/// Alternative order == MessageKind order.
using Body = std::variant<KeepAlive, SystemControl, SystemStatus, Acknowledge, TargetReport,
                          SingleTargetReport, SingleTargetExtended, SystemMotion,
                          SensorPosition, Generic>;

inline MessageKind kind_of(const Body& body) {
  return static_cast<MessageKind>(body.index());
}

/**
 * @struct DecodedMessage
 * @brief Everything `decode_message()` learned about one frame.
 *
 * - `status == TooShort`: nothing else is meaningful.
 * - `status == InsufficientPayload`: header, kind and `payload` are valid;
 *   `body` holds a `Generic` with the same bytes.
 * - `status == Ok`: `body` holds the alternative for `kind`.
 *
 * `header_check` is a warning, not a failure: a frame whose declared length
 * disagrees with the bytes seen still decodes.
 */
struct DecodedMessage {
  DecodeStatus  status{DecodeStatus::TooShort};
  MessageHeader header;
  HeaderCheck   header_check{HeaderCheck::Consistent};
  MessageKind   kind{MessageKind::Generic};
  Body          body{Generic{}};
  std::vector<uint8_t> payload;   ///< bytes after the header, as received

  bool ok() const { return status == DecodeStatus::Ok; }
  const char* name() const { return message_name(header.message_id); }
};

} // namespace radarlink

#endif // RADARLINK_MESSAGE_HPP
