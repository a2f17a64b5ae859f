/**
 * @file channel.hpp
 * @brief RadarLink Channel — one link's loop: bytes in, decoded traffic and frames out.
 *
 * @details
 * ## Field Brief
 * A Channel is the per-connection brain. It doesn't know sockets. It only
 * knows **bytes in**, **messages decoded**, **frames out**. The transport
 * wrapper (tcp_io in the CLI, a test harness, a replay tool) moves bytes.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Wrapper: TCP/replay/test]            [Channel]
 *             │                              │
 *   recv() bytes ─── add_bytes() ──────►  StreamFramer (bounded)
 *             │                              │
 *             │                    tick(now_ms) ──► at most one frame:
 *             │                              │        decode_message()
 *             │                              │        step(Received) ──► outbox
 *             │                              │        forward ─────────► decoded queue
 *             │                              │      step(Tick) ───────► keep-alive
 *             │                              │
 *   send() ◄──────────── get_message() ── outbox (bounded, encoded frames)
 *   print  ◄──────────── get_decoded() ── decoded queue (bounded)
 *   log    ◄──────────── get_note() ───── notes (bounded)
 * ```
 *
 * - **At most one** frame processed per tick. `tick()` returns true while
 *   there is more work, so a wrapper that wants to drain can loop on it.
 * - The Channel owns the outbound sequence counter (starts at 1, wraps from
 *   0xFFFFFFFF back to 1) and stamps `source_id` and the time tag.
 *
 * ---
 *
 * @par Failure Model
 * - **Receive buffer full:** `add_bytes()` returns false and keeps nothing.
 *   The caller decides whether to drop the connection.
 * - **Outbox / decoded queue / notes full:** newest item is dropped and
 *   counted (`dropped_outbound()`, `dropped_decoded()`).
 * - **Garbage on the wire:** the framer slides and counts; see framer.hpp.
 * - **Stop / reconnect:** `disconnect()` discards partial frames and
 *   unsent frames; nothing from an old connection leaks into a new one.
 *
 * @par Minimal Usage Example
 * @code
 * radarlink::Channel ch(cfg);
 * ch.connect(now_ms());
 * for (;;) {
 *   n = read_some(fd, buf, sizeof(buf), 100);
 *   if (n > 0) ch.add_bytes(buf, n);
 *   while (ch.tick(now_ms())) {}
 *   std::vector<uint8_t> frame;
 *   while (ch.get_message(frame)) write_all(fd, frame.data(), frame.size());
 * }
 * @endcode
 */
#ifndef RADARLINK_CHANNEL_HPP
#define RADARLINK_CHANNEL_HPP

#include <stdint.h>
#include <vector>
#include "etl/deque.h"
#include "radarlink/codec.hpp"
#include "radarlink/framer.hpp"
#include "radarlink/session.hpp"

namespace radarlink {

/// Everything a Channel needs that is not a byte.
struct ChannelConfig {
  uint32_t      source_id{0};
  CodecOptions  codec;
  SessionConfig session;
  size_t        max_message{StreamFramer::DEFAULT_MAX_MESSAGE};
};

/// Milliseconds since local midnight, the header time tag.
uint32_t ms_since_midnight();

class Channel {
public:
  /// @name Capacities
  ///@{
  static constexpr size_t OUTBOX_CAP  = 16;   ///< encoded frames waiting to be sent
  static constexpr size_t DECODED_CAP = 32;   ///< decoded messages waiting for the caller
  static constexpr size_t NOTES_CAP   = 32;   ///< session notes waiting for the logger
  static constexpr size_t RX_BUFFER_FRAMES = 4; ///< framer may hold this many max-size frames
  ///@}

  using TimeTagFn = uint32_t (*)();

  explicit Channel(const ChannelConfig& cfg);

  /// Start (or restart) the session. Emits the first KeepAlive.
  void connect(uint64_t now_ms);

  /// End the session: partial frames and unsent frames are discarded.
  void disconnect();

  /**
   * @brief Feed raw stream bytes.
   * @return false if they do not fit in the receive buffer (nothing kept).
   */
  bool add_bytes(const uint8_t* data, size_t len);

  /**
   * @brief Process at most one complete frame, then run the keep-alive timer.
   * @return true if a frame was processed and another may be waiting.
   */
  bool tick(uint64_t now_ms);

  /// Pop the next encoded outbound frame.
  bool get_message(std::vector<uint8_t>& out);

  /// Pop the next decoded inbound message.
  bool get_decoded(DecodedMessage& out);

  /// Pop the next session note (`event=transition from=... to=...`).
  bool get_note(NoteStr& out);

  /**
   * @brief Encode and queue a message outside the session's own script.
   * @return false if the outbox is full.
   */
  bool send(const Body& body);

  const SessionState& session() const { return state_; }
  LinkState state() const { return state_.state; }
  const ChannelConfig& config() const { return cfg_; }

  uint32_t next_sequence() const { return next_seq_; }
  void set_next_sequence(uint32_t seq) { next_seq_ = seq ? seq : 1; }

  /// Replace the wall clock used for header time tags (tests, replays).
  void set_time_tag_source(TimeTagFn fn) { time_tag_fn_ = fn; }

  uint64_t frames_received() const { return frames_rx_; }
  uint64_t frames_sent() const { return frames_tx_; }
  uint64_t dropped_outbound() const { return dropped_out_; }
  uint64_t dropped_decoded() const { return dropped_decoded_; }
  uint64_t desync_count() const { return framer_.desync_count(); }

private:
  void apply(const Actions& a);
  bool enqueue(const Body& body);
  uint32_t take_sequence();

  ChannelConfig cfg_;
  StreamFramer  framer_;
  SessionState  state_;
  TimeTagFn     time_tag_fn_{&ms_since_midnight};
  uint32_t      next_seq_{1};

  etl::deque<std::vector<uint8_t>, OUTBOX_CAP> outbox_;
  etl::deque<DecodedMessage, DECODED_CAP>      decoded_;
  etl::deque<NoteStr, NOTES_CAP>               notes_;

  uint64_t frames_rx_{0};
  uint64_t frames_tx_{0};
  uint64_t dropped_out_{0};
  uint64_t dropped_decoded_{0};
};

} // namespace radarlink

#endif // RADARLINK_CHANNEL_HPP
