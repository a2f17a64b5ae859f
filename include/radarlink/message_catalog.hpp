/**
 * @file message_catalog.hpp
 * @brief RadarLink message catalog — identifiers, display names, and decoder kinds.
 *
 * @details
 * The ICD assigns each message a 32-bit identifier. The catalog maps an
 * identifier to:
 *   - a human-readable name for logs and pretty output, and
 *   - a `MessageKind`, which selects the payload decoder in codec.cpp.
 *
 * Identifiers the catalog names but has no dedicated layout for
 * (maintenance, BIT, resource requests, the simulator data stream) map to
 * `MessageKind::Generic` and keep their names. Identifiers the catalog does
 * not know at all are *not* errors: they are `Generic` with the name
 * "Unknown". The RC is known to send vendor IDs outside the ICD.
 *
 * Adding a message kind is one row in the table in message_catalog.cpp plus
 * one decoder row in codec.cpp.
 */
#ifndef RADARLINK_MESSAGE_CATALOG_HPP
#define RADARLINK_MESSAGE_CATALOG_HPP

#include <cstddef>
#include <cstdint>

namespace radarlink {

/// ICD 2135M-004 message identifiers.
namespace msg_id {
  static constexpr uint32_t KEEP_ALIVE             = 0xCEF00400;
  static constexpr uint32_t SYSTEM_CONTROL         = 0xCEF00401;
  static constexpr uint32_t SYSTEM_MOTION          = 0xCEF00402;
  static constexpr uint32_t SYSTEM_STATUS          = 0xCEF00403;
  static constexpr uint32_t TARGET_REPORT          = 0xCEF00404;
  static constexpr uint32_t ACKNOWLEDGE            = 0xCEF00405;
  static constexpr uint32_t SINGLE_TARGET_REPORT   = 0xCEF00406;
  static constexpr uint32_t MAINTENANCE_DATA       = 0xCEF00407;
  static constexpr uint32_t SINGLE_TARGET_EXTENDED = 0xCEF00408;
  static constexpr uint32_t BIT_STATUS_DATA        = 0xCEF00409;
  static constexpr uint32_t BIT_REQUEST            = 0xCEF0040A;
  static constexpr uint32_t RESOURCE_REQUEST       = 0xCEF0040B;
  static constexpr uint32_t MAINTENANCE_REQUEST    = 0xCEF0040C;
  static constexpr uint32_t SET_SENSOR_POSITION    = 0xCEF00418;
  static constexpr uint32_t GET_SENSOR_POSITION    = 0xCEF00419;
  static constexpr uint32_t SENSOR_POSITION        = 0xCEF0041A;
  static constexpr uint32_t RADAR_DATA_STREAM      = 0x00000210;  ///< simulator stream, not in the ICD
}

/// Which payload decoder handles a message. One per variant of `Body`.
enum class MessageKind : uint8_t {
  KeepAlive = 0,
  SystemControl,
  SystemStatus,
  Acknowledge,
  TargetReport,
  SingleTargetReport,
  SingleTargetExtended,
  SystemMotion,
  SensorPosition,
  Generic,
};

/// Number of MessageKind values (decoder table size).
static constexpr size_t MESSAGE_KIND_COUNT = static_cast<size_t>(MessageKind::Generic) + 1;

struct CatalogEntry {
  uint32_t    id;
  const char* name;
  MessageKind kind;
};

/// Catalog row for @p id, or nullptr for an unknown identifier.
const CatalogEntry* find_catalog_entry(uint32_t id);

/// Display name for @p id; "Unknown" when not in the catalog.
const char* message_name(uint32_t id);

/// Decoder kind for @p id; Generic when not in the catalog.
MessageKind kind_for_id(uint32_t id);

/// Canonical identifier for a kind (Generic has none and returns 0).
uint32_t id_for_kind(MessageKind kind);

/// Short token for a kind: "keep_alive", "system_status", ...
const char* to_string(MessageKind kind);

/// Whole table, for listings (`radarlink-cli decode --list`).
const CatalogEntry* catalog_begin();
const CatalogEntry* catalog_end();

} // namespace radarlink

#endif // RADARLINK_MESSAGE_CATALOG_HPP
