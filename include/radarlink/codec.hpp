/**
 * @file codec.hpp
 * @brief RadarLink message codec — registry dispatch, payload decoders and encoders.
 *
 * @details
 * ### Decode
 * `decode_message(bytes, len, options)`:
 *   1. fewer than 20 bytes → `DecodeStatus::TooShort`;
 *   2. decode the header under `options.header`; payload = bytes[20:len];
 *   3. look up the identifier in the catalog and run that kind's decoder;
 *      unknown identifiers decode as `Generic`. That is not an error.
 *
 * Decoder minimums:
 *
 * | Kind                 | Minimum payload              | Short payload            |
 * |----------------------|------------------------------|--------------------------|
 * | KeepAlive            | 0                            | n/a                      |
 * | SystemControl        | `ControlLayout::min_payload` | InsufficientPayload      |
 * | SystemStatus         | 12 (tail grows to 24)        | InsufficientPayload      |
 * | Acknowledge          | 4                            | InsufficientPayload      |
 * | TargetReport         | 4 (count)                    | InsufficientPayload      |
 * | SingleTargetReport   | 32                           | InsufficientPayload      |
 * | SingleTargetExtended | 508 (332 + 176)              | InsufficientPayload      |
 * | SystemMotion         | 172                          | InsufficientPayload      |
 * | SensorPosition       | 24                           | InsufficientPayload      |
 * | Generic              | 0                            | n/a                      |
 *
 * A TargetReport that declares more records than it carries decodes the
 * complete ones and sets `truncated`.
 *
 * ### Encode
 * `encode_message()` builds the header itself (identifier from the body,
 * length from the encoded payload), so a caller only supplies source, time
 * tag and sequence. SystemControl pads to the layout's payload size.
 *
 * Decode and encode are pure: no globals, no I/O, no exceptions.
 */
#ifndef RADARLINK_CODEC_HPP
#define RADARLINK_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "radarlink/control_layout.hpp"
#include "radarlink/header.hpp"
#include "radarlink/message.hpp"

namespace radarlink {

/// Protocol revision choices shared by encode and decode.
struct CodecOptions {
  HeaderLayout  header  = HeaderLayout::icd();
  ControlLayout control = ControlLayout::icd40();
};

static constexpr size_t STATUS_MIN_PAYLOAD   = 12;
static constexpr size_t STATUS_MAX_PAYLOAD   = 24;
static constexpr size_t EXTENDED_PAYLOAD     = TARGET_DATA_SIZE + PLOT_DATA_SIZE;
static constexpr size_t SENSOR_POSITION_SIZE = 24;

/// Decode one complete frame.
DecodedMessage decode_message(const uint8_t* data, size_t len,
                              const CodecOptions& opt = CodecOptions());

inline DecodedMessage decode_message(const std::vector<uint8_t>& frame,
                                     const CodecOptions& opt = CodecOptions()) {
  return decode_message(frame.data(), frame.size(), opt);
}

/**
 * @brief Run the decoder for @p kind over a bare payload.
 * @param message_id  Carried into Generic bodies.
 * @return Ok, or InsufficientPayload (out then holds Generic with the bytes).
 */
DecodeStatus decode_body(MessageKind kind, uint32_t message_id,
                         const uint8_t* payload, size_t len,
                         const CodecOptions& opt, Body& out);

/// Append the wire form of @p body (payload only, no header).
void encode_body(const Body& body, const CodecOptions& opt, std::vector<uint8_t>& out);

/// Identifier a body is sent under (Generic carries its own).
uint32_t message_id_for(const Body& body);

/**
 * @brief Encode header + payload.
 * @param fields  source_id, time_tag and sequence_number are used as given;
 *                message_id and message_length are filled in.
 */
std::vector<uint8_t> encode_message(const MessageHeader& fields, const Body& body,
                                    const CodecOptions& opt = CodecOptions());

} // namespace radarlink

#endif // RADARLINK_CODEC_HPP
