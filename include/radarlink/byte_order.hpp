#pragma once

/**
 * @file byte_order.hpp
 * @brief Little-endian field readers and writers used by every RadarLink codec.
 *
 * @details
 * Every numeric field on the RC link is little-endian, regardless of host.
 * These helpers move bytes explicitly (no memcpy of structs, no packed
 * attributes) so a layout table in a header comment maps 1:1 onto a sequence
 * of calls here.
 *
 * Two flavours:
 *  - `get_*()` read from a raw pointer at a byte offset. Callers check the
 *    length once up front; the getters do not bounds-check.
 *  - `put_*()` append to a `std::vector<uint8_t>` the way the command
 *    builders grow a frame.
 *
 * Floating point fields are IEEE-754 and are moved through their integer bit
 * pattern, so a NaN written is the same NaN read back.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace radarlink {
namespace wire {

// ---------------------------------------------------------------------------
// Readers
// ---------------------------------------------------------------------------

inline uint8_t get_u8(const uint8_t* p, size_t off) { return p[off]; }

inline uint32_t get_u32(const uint8_t* p, size_t off) {
    return  static_cast<uint32_t>(p[off])
         | (static_cast<uint32_t>(p[off + 1]) << 8)
         | (static_cast<uint32_t>(p[off + 2]) << 16)
         | (static_cast<uint32_t>(p[off + 3]) << 24);
}

inline int32_t get_i32(const uint8_t* p, size_t off) {
    return static_cast<int32_t>(get_u32(p, off));
}

inline uint64_t get_u64(const uint8_t* p, size_t off) {
    return  static_cast<uint64_t>(get_u32(p, off))
         | (static_cast<uint64_t>(get_u32(p, off + 4)) << 32);
}

inline float get_f32(const uint8_t* p, size_t off) {
    const uint32_t bits = get_u32(p, off);
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

inline double get_f64(const uint8_t* p, size_t off) {
    const uint64_t bits = get_u64(p, off);
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

// ---------------------------------------------------------------------------
// Writers (append)
// ---------------------------------------------------------------------------

inline void put_u8(std::vector<uint8_t>& b, uint8_t v) { b.push_back(v); }

inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));          // low byte first
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

inline void put_i32(std::vector<uint8_t>& b, int32_t v) {
    put_u32(b, static_cast<uint32_t>(v));
}

inline void put_u64(std::vector<uint8_t>& b, uint64_t v) {
    put_u32(b, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    put_u32(b, static_cast<uint32_t>(v >> 32));
}

inline void put_f32(std::vector<uint8_t>& b, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u32(b, bits);
}

inline void put_f64(std::vector<uint8_t>& b, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u64(b, bits);
}

/// Append @p n zero bytes (reserved / spare regions).
inline void put_zeros(std::vector<uint8_t>& b, size_t n) { b.insert(b.end(), n, 0); }

/// Overwrite a u32 already in the buffer (length back-fill).
inline void set_u32(uint8_t* p, size_t off, uint32_t v) {
    p[off]     = static_cast<uint8_t>(v & 0xFF);
    p[off + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[off + 2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[off + 3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

} // namespace wire
} // namespace radarlink
