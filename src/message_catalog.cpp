// -----------------------------------------------------------------------------
// message_catalog.cpp — identifier table for the RC/C2 link
//
// Linear scan over a small constant table. Seventeen rows; a map buys nothing.
// -----------------------------------------------------------------------------
#include "radarlink/message_catalog.hpp"

namespace radarlink {

namespace {

const CatalogEntry CATALOG[] = {
  { msg_id::KEEP_ALIVE,             "Keep Alive",             MessageKind::KeepAlive },
  { msg_id::SYSTEM_CONTROL,         "System Control",         MessageKind::SystemControl },
  { msg_id::SYSTEM_MOTION,          "System Motion",          MessageKind::SystemMotion },
  { msg_id::SYSTEM_STATUS,          "System Status",          MessageKind::SystemStatus },
  { msg_id::TARGET_REPORT,          "Target Report",          MessageKind::TargetReport },
  { msg_id::ACKNOWLEDGE,            "Acknowledge",            MessageKind::Acknowledge },
  { msg_id::SINGLE_TARGET_REPORT,   "Single Target Report",   MessageKind::SingleTargetReport },
  { msg_id::MAINTENANCE_DATA,       "Maintenance Data",       MessageKind::Generic },
  { msg_id::SINGLE_TARGET_EXTENDED, "Single Target Extended", MessageKind::SingleTargetExtended },
  { msg_id::BIT_STATUS_DATA,        "BIT Status Data",        MessageKind::Generic },
  { msg_id::BIT_REQUEST,            "BIT Request",            MessageKind::Generic },
  { msg_id::RESOURCE_REQUEST,       "Resource Request",       MessageKind::Generic },
  { msg_id::MAINTENANCE_REQUEST,    "Maintenance Request",    MessageKind::Generic },
  { msg_id::SET_SENSOR_POSITION,    "Set Sensor Position",    MessageKind::Generic },
  { msg_id::GET_SENSOR_POSITION,    "Get Sensor Position",    MessageKind::Generic },
  { msg_id::SENSOR_POSITION,        "Sensor Position",        MessageKind::SensorPosition },
  { msg_id::RADAR_DATA_STREAM,      "Radar Data Stream",      MessageKind::Generic },
};

} // namespace

const CatalogEntry* catalog_begin() { return CATALOG; }
const CatalogEntry* catalog_end()   { return CATALOG + sizeof(CATALOG) / sizeof(CATALOG[0]); }

const CatalogEntry* find_catalog_entry(uint32_t id) {
  for (const CatalogEntry* e = catalog_begin(); e != catalog_end(); ++e) {
    if (e->id == id) return e;
  }
  return nullptr;
}

const char* message_name(uint32_t id) {
  const CatalogEntry* e = find_catalog_entry(id);
  return e ? e->name : "Unknown";
}

MessageKind kind_for_id(uint32_t id) {
  const CatalogEntry* e = find_catalog_entry(id);
  return e ? e->kind : MessageKind::Generic;
}

uint32_t id_for_kind(MessageKind kind) {
  if (kind == MessageKind::Generic) return 0;
  for (const CatalogEntry* e = catalog_begin(); e != catalog_end(); ++e) {
    if (e->kind == kind) return e->id;
  }
  return 0;
}

const char* to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::KeepAlive:            return "keep_alive";
    case MessageKind::SystemControl:        return "system_control";
    case MessageKind::SystemStatus:         return "system_status";
    case MessageKind::Acknowledge:          return "acknowledge";
    case MessageKind::TargetReport:         return "target_report";
    case MessageKind::SingleTargetReport:   return "single_target_report";
    case MessageKind::SingleTargetExtended: return "single_target_extended";
    case MessageKind::SystemMotion:         return "system_motion";
    case MessageKind::SensorPosition:       return "sensor_position";
    case MessageKind::Generic:              return "generic";
  }
  return "generic";
}

} // namespace radarlink
