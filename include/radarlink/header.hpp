/**
 * @file header.hpp
 * @brief RadarLink MessageHeader — the fixed 20-byte prefix of every RC/C2 message.
 *
 * @details
 * Every message on the link starts with five little-endian u32 fields:
 *
 * | Field            | Bytes | Meaning                                         |
 * |------------------|-------|-------------------------------------------------|
 * | source_id        | 4     | Sender identity                                 |
 * | message_id       | 4     | Catalog identifier (see message_catalog.hpp)    |
 * | message_length   | 4     | Total bytes, header + payload                   |
 * | time_tag         | 4     | Milliseconds since local midnight               |
 * | sequence_number  | 4     | Per-sender counter, monotonically increasing    |
 *
 * ### Field order is a revision, not a constant
 * Two incompatible orders have been seen on the wire. The order is therefore
 * carried as a `HeaderLayout` value and passed to every encode/decode call:
 *
 *  - `HeaderLayout::icd()` — source, message, length, time, sequence.
 *    This is the supported revision (ICD 2135M-004) and the default.
 *  - `HeaderLayout::message_first()` — message, length, time, sequence, source.
 *
 * A layout is just the byte offset of each field, so a third revision is a
 * one-line addition.
 *
 * ### Validity & policy
 * - Decoding needs at least 20 bytes; fewer is `DecodeStatus::TooShort`.
 * - The header codec never judges `message_length`. That is the caller's
 *   call via `check_length()`, which reports mismatches as warnings.
 */
#ifndef RADARLINK_HEADER_HPP
#define RADARLINK_HEADER_HPP

#include <cstddef>
#include <cstdint>

namespace radarlink {

/// Size of the fixed header on the wire.
static constexpr size_t HEADER_SIZE = 20;

/// Result codes shared by the header codec and the payload decoders.
enum class DecodeStatus : uint8_t {
  Ok = 0,
  TooShort,             ///< fewer than HEADER_SIZE bytes
  InsufficientPayload,  ///< payload below the decoder's minimum; raw bytes kept
};

/// Outcome of comparing a header's declared length with the bytes observed.
enum class HeaderCheck : uint8_t {
  Consistent = 0,
  LengthBelowHeader,    ///< declared length < 20
  LengthExceedsData,    ///< declared length > bytes available
  LengthBelowData,      ///< declared length < bytes available
};

struct MessageHeader {
  uint32_t source_id{0};
  uint32_t message_id{0};
  uint32_t message_length{0};
  uint32_t time_tag{0};
  uint32_t sequence_number{0};

  /// Payload bytes implied by message_length (0 if the length is bogus).
  uint32_t declared_payload_size() const {
    return message_length >= HEADER_SIZE ? message_length - HEADER_SIZE : 0;
  }

  bool operator==(const MessageHeader& o) const {
    return source_id == o.source_id && message_id == o.message_id &&
           message_length == o.message_length && time_tag == o.time_tag &&
           sequence_number == o.sequence_number;
  }
  bool operator!=(const MessageHeader& o) const { return !(*this == o); }
};

/**
 * @struct HeaderLayout
 * @brief Byte offsets of the five header fields for one protocol revision.
 */
struct HeaderLayout {
  const char* name;
  uint8_t source_off;
  uint8_t message_off;
  uint8_t length_off;
  uint8_t time_off;
  uint8_t sequence_off;

  /// ICD 2135M-004: source, message, length, time, sequence.
  static constexpr HeaderLayout icd() {
    return HeaderLayout{"icd-2135m-004", 0, 4, 8, 12, 16};
  }

  /// Alternate order: message, length, time, sequence, source.
  static constexpr HeaderLayout message_first() {
    return HeaderLayout{"message-first", 16, 0, 4, 8, 12};
  }
};

/**
 * @brief Look up a header layout by its revision name.
 * @param name  "icd-2135m-004" or "message-first".
 * @param out   Receives the layout on success.
 * @return false if the name is unknown (out untouched).
 */
bool header_layout_by_name(const char* name, HeaderLayout& out);

/**
 * @brief Decode a header from the first 20 bytes of @p data.
 * @return DecodeStatus::TooShort if @p len < HEADER_SIZE, otherwise Ok.
 */
DecodeStatus decode_header(const uint8_t* data, size_t len,
                           const HeaderLayout& layout, MessageHeader& out);

/**
 * @brief Encode @p h into exactly HEADER_SIZE bytes at @p out.
 * @param out Buffer of at least HEADER_SIZE bytes.
 */
void encode_header(const MessageHeader& h, const HeaderLayout& layout, uint8_t* out);

/**
 * @brief Read only the length field. Used by the stream framer.
 * @pre @p data holds at least HEADER_SIZE bytes.
 */
uint32_t peek_message_length(const uint8_t* data, const HeaderLayout& layout);

/// Compare the declared length against the number of bytes actually held.
HeaderCheck check_length(const MessageHeader& h, size_t bytes_available);

/// Short token for logs: "ok", "too_short", "insufficient_payload".
const char* to_string(DecodeStatus s);

/// Short token for logs: "consistent", "length_exceeds_data", ...
const char* to_string(HeaderCheck c);

} // namespace radarlink

#endif // RADARLINK_HEADER_HPP
