// -----------------------------------------------------------------------------
// channel.cpp — Implementation of the per-connection Channel loop
//
// API & failure model:
//   see include/radarlink/channel.hpp
//
// Runnable checks:
//   see tests/test_channel.cpp
// -----------------------------------------------------------------------------
#include "radarlink/channel.hpp"

#include <chrono>
#include <ctime>
#include <utility>

namespace radarlink {

uint32_t ms_since_midnight() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&t, &local);
  const uint32_t ms = static_cast<uint32_t>(
      duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
  return static_cast<uint32_t>((local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec) * 1000) + ms;
}

// ---------- public ----------

Channel::Channel(const ChannelConfig& cfg)
: cfg_(cfg),
  framer_(cfg.codec.header, cfg.max_message) {}

void Channel::connect(uint64_t now_ms) {
  framer_.reset();                          // nothing from a previous stream
  apply(step(state_, cfg_.session, Event::connected(now_ms)));
}

void Channel::disconnect() {
  framer_.reset();                          // partial frames are discarded, not processed
  outbox_.clear();
  apply(step(state_, cfg_.session, Event::channel_lost()));
}

// add_bytes() — All or nothing; a half-accepted chunk would desync the stream.
bool Channel::add_bytes(const uint8_t* data, size_t len) {
  if (!data || !len) return true;
  const size_t cap = RX_BUFFER_FRAMES * framer_.max_message();
  if (framer_.buffered() + len > cap) return false;
  framer_.feed(data, len);
  return true;
}

// -----------------------------------------------------------------------------
// tick() — Decode one frame (if any), step the session, then run the timer.
// POLICY:
//   - Frames are only processed while connected; otherwise they stay buffered
//     until connect() resets the framer.
//   - Every decoded frame is forwarded, status included, so wrappers can print
//     the whole conversation.
// -----------------------------------------------------------------------------
bool Channel::tick(uint64_t now_ms) {
  bool processed = false;

  if (state_.state != LinkState::Disconnected) {
    std::vector<uint8_t> frame;
    if (framer_.next(frame)) {
      processed = true;
      ++frames_rx_;
      DecodedMessage dm = decode_message(frame, cfg_.codec);
      apply(step(state_, cfg_.session, Event::received(dm, now_ms)));
      if (decoded_.full()) {
        ++dropped_decoded_;
      } else {
        decoded_.push_back(std::move(dm));
      }
    }
  }

  apply(step(state_, cfg_.session, Event::tick(now_ms)));
  return processed;
}

bool Channel::get_message(std::vector<uint8_t>& out) {
  if (outbox_.empty()) return false;
  out = std::move(outbox_.front());
  outbox_.pop_front();
  return true;
}

bool Channel::get_decoded(DecodedMessage& out) {
  if (decoded_.empty()) return false;
  out = std::move(decoded_.front());
  decoded_.pop_front();
  return true;
}

bool Channel::get_note(NoteStr& out) {
  if (notes_.empty()) return false;
  out = notes_.front();
  notes_.pop_front();
  return true;
}

bool Channel::send(const Body& body) {
  return enqueue(body);
}

// ---------- private ----------

void Channel::apply(const Actions& a) {
  for (const auto& n : a.notes) {
    if (!notes_.full()) notes_.push_back(n);
  }
  for (const auto& body : a.outbound) enqueue(body);   // drops counted in dropped_out_
}

// enqueue() — Stamp a fresh header and queue the encoded frame; drop newest if full.
bool Channel::enqueue(const Body& body) {
  if (outbox_.full()) {
    ++dropped_out_;
    return false;
  }
  MessageHeader h;
  h.source_id       = cfg_.source_id;
  h.time_tag        = time_tag_fn_ ? time_tag_fn_() : 0;
  h.sequence_number = take_sequence();
  outbox_.push_back(encode_message(h, body, cfg_.codec));
  ++frames_tx_;
  return true;
}

// take_sequence() — Monotonic per sender; 0 is never used on the wire.
uint32_t Channel::take_sequence() {
  const uint32_t seq = next_seq_;
  next_seq_ = (next_seq_ == 0xFFFFFFFFu) ? 1 : next_seq_ + 1;
  return seq;
}

} // namespace radarlink
