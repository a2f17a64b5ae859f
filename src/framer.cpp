// -----------------------------------------------------------------------------
// framer.cpp — Stream framer implementation
//
// API & rules:
//   see include/radarlink/framer.hpp
//
// Runnable checks:
//   see tests/test_framer.cpp
// -----------------------------------------------------------------------------
#include "radarlink/framer.hpp"

namespace radarlink {

StreamFramer::StreamFramer(const HeaderLayout& layout, size_t max_message)
: layout_(layout),
  max_message_(max_message < HEADER_SIZE ? HEADER_SIZE : max_message) {}

void StreamFramer::feed(const uint8_t* data, size_t len) {
  if (!data || !len) return;
  buf_.insert(buf_.end(), data, data + len);
}

// -----------------------------------------------------------------------------
// next() — Scan the buffer for one complete frame.
// POLICY:
//   - A bogus length slides the window by one byte (desync++), never more.
//   - Slides and extractions only advance head_; memmove happens in compact().
//   - last_status_ reports whether THIS call had to slide.
// -----------------------------------------------------------------------------
bool StreamFramer::next(std::vector<uint8_t>& frame) {
  last_status_ = FramerStatus::Ok;
  bool got = false;

  while (buf_.size() - head_ >= HEADER_SIZE) {
    const uint32_t len = peek_message_length(buf_.data() + head_, layout_);
    if (len < HEADER_SIZE || len > max_message_) {
      ++head_;                            // slide one byte and look again
      ++desyncs_;
      last_status_ = FramerStatus::Desync;
      continue;
    }
    if (buf_.size() - head_ < len) break; // wait for the rest

    frame.assign(buf_.begin() + head_, buf_.begin() + head_ + len);
    head_ += len;
    got = true;
    break;
  }

  compact();
  return got;
}

void StreamFramer::reset() {
  buf_.clear();
  head_ = 0;
  last_status_ = FramerStatus::Ok;
}

// compact() — Drop consumed bytes once they are at least half the buffer.
void StreamFramer::compact() {
  if (head_ == buf_.size()) {
    buf_.clear();
    head_ = 0;
  } else if (head_ > buf_.size() / 2) {
    buf_.erase(buf_.begin(), buf_.begin() + head_);
    head_ = 0;
  }
}

} // namespace radarlink
