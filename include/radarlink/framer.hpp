#pragma once

/**
 * @file framer.hpp
 * @brief Length-prefixed stream framer: TCP bytes in, complete RadarLink frames out.
 *
 * @details
 * OVERVIEW
 * --------
 * TCP delivers a byte stream, not messages. A single `recv()` may hold half a
 * header, three whole messages, or the tail of one and the head of the next.
 * The framer buffers whatever it is fed and hands back one complete frame at a
 * time, exactly `message_length` bytes long, starting at a message boundary.
 *
 * RULES
 * -----
 *   - Fewer than 20 bytes buffered: wait.
 *   - Read `message_length` from the header (position depends on the layout).
 *   - `message_length` < 20 or > `max_message`: the stream is out of step.
 *     Drop ONE byte, count a desync, try again at the next offset.
 *   - Fewer than `message_length` bytes buffered: wait.
 *   - Otherwise: emit the frame; the remaining bytes belong to the next one.
 *
 * Resync by single-byte slide never skips a real header that starts inside
 * the garbage. Consumed bytes are tracked by a read offset, so sliding is
 * O(1) per byte; the buffer is compacted once the offset passes half of it.
 * A garbage window whose length field happens to be in range still holds
 * the scan until that many bytes arrive (a smaller `max_message` narrows it).
 *
 * CANCELLATION
 * ------------
 * `reset()` discards any partial frame. Call it when the channel stops or
 * reconnects; a half frame from an old connection is never completed with
 * bytes from a new one.
 *
 * EXAMPLE
 * -------
 * @code
 *   radarlink::StreamFramer framer;
 *   framer.feed(buf, n);
 *   std::vector<uint8_t> frame;
 *   while (framer.next(frame)) {
 *       auto dm = radarlink::decode_message(frame);
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "radarlink/header.hpp"

namespace radarlink {

/// Outcome of the most recent `next()` scan.
enum class FramerStatus : uint8_t {
  Ok = 0,   ///< no inconsistency seen
  Desync,   ///< at least one byte was dropped to resynchronise
};

class StreamFramer {
public:
  static constexpr size_t DEFAULT_MAX_MESSAGE = 65536;

  explicit StreamFramer(const HeaderLayout& layout = HeaderLayout::icd(),
                        size_t max_message = DEFAULT_MAX_MESSAGE);

  /// Append raw stream bytes.
  void feed(const uint8_t* data, size_t len);

  /**
   * @brief Extract the next complete frame, if one is buffered.
   * @param frame  Overwritten with exactly `message_length` bytes on success.
   * @return true if a frame was produced.
   */
  bool next(std::vector<uint8_t>& frame);

  /// Drop everything buffered (partial frames included). Counters survive.
  void reset();

  size_t buffered() const { return buf_.size() - head_; }
  uint64_t desync_count() const { return desyncs_; }
  FramerStatus last_status() const { return last_status_; }
  size_t max_message() const { return max_message_; }

private:
  HeaderLayout layout_;
  size_t max_message_;
  void compact();

  std::vector<uint8_t> buf_;
  size_t head_{0};              ///< first unconsumed byte in buf_
  uint64_t desyncs_{0};
  FramerStatus last_status_{FramerStatus::Ok};
};

} // namespace radarlink
