// -----------------------------------------------------------------------------
// header.cpp — Implementation of the RadarLink 20-byte header codec
//
// API & layout tables:
//   see include/radarlink/header.hpp
//
// Runnable checks:
//   see tests/test_header.cpp
// -----------------------------------------------------------------------------
#include "radarlink/header.hpp"
#include "radarlink/byte_order.hpp"

#include <cstring>

namespace radarlink {

bool header_layout_by_name(const char* name, HeaderLayout& out) {
  if (!name) return false;
  const HeaderLayout known[] = { HeaderLayout::icd(), HeaderLayout::message_first() };
  for (const auto& l : known) {
    if (std::strcmp(l.name, name) == 0) { out = l; return true; }
  }
  return false;
}

DecodeStatus decode_header(const uint8_t* data, size_t len,
                           const HeaderLayout& layout, MessageHeader& out) {
  if (!data || len < HEADER_SIZE) return DecodeStatus::TooShort;

  out.source_id       = wire::get_u32(data, layout.source_off);
  out.message_id      = wire::get_u32(data, layout.message_off);
  out.message_length  = wire::get_u32(data, layout.length_off);
  out.time_tag        = wire::get_u32(data, layout.time_off);
  out.sequence_number = wire::get_u32(data, layout.sequence_off);
  return DecodeStatus::Ok;
}

void encode_header(const MessageHeader& h, const HeaderLayout& layout, uint8_t* out) {
  wire::set_u32(out, layout.source_off,   h.source_id);
  wire::set_u32(out, layout.message_off,  h.message_id);
  wire::set_u32(out, layout.length_off,   h.message_length);
  wire::set_u32(out, layout.time_off,     h.time_tag);
  wire::set_u32(out, layout.sequence_off, h.sequence_number);
}

uint32_t peek_message_length(const uint8_t* data, const HeaderLayout& layout) {
  return wire::get_u32(data, layout.length_off);
}

HeaderCheck check_length(const MessageHeader& h, size_t bytes_available) {
  if (h.message_length < HEADER_SIZE)      return HeaderCheck::LengthBelowHeader;
  if (h.message_length > bytes_available)  return HeaderCheck::LengthExceedsData;
  if (h.message_length < bytes_available)  return HeaderCheck::LengthBelowData;
  return HeaderCheck::Consistent;
}

const char* to_string(DecodeStatus s) {
  switch (s) {
    case DecodeStatus::Ok:                  return "ok";
    case DecodeStatus::TooShort:            return "too_short";
    case DecodeStatus::InsufficientPayload: return "insufficient_payload";
  }
  return "unknown";
}

const char* to_string(HeaderCheck c) {
  switch (c) {
    case HeaderCheck::Consistent:        return "consistent";
    case HeaderCheck::LengthBelowHeader: return "length_below_header";
    case HeaderCheck::LengthExceedsData: return "length_exceeds_data";
    case HeaderCheck::LengthBelowData:   return "length_below_data";
  }
  return "unknown";
}

} // namespace radarlink
