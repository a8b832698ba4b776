#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace medslice {

// Voxels are stored little-endian on disk regardless of host byte order.
inline uint16_t read_u16_le(uint8_t byte0, uint8_t byte1) {
    return static_cast<uint16_t>(static_cast<uint16_t>(byte0) |
                                 static_cast<uint16_t>(byte1 << 8));
}

inline uint16_t read_u16_le(const uint8_t* p) { return read_u16_le(p[0], p[1]); }

inline std::array<uint8_t, 2> write_u16_le(uint16_t v) {
    return {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF)};
}

// Little-endian byte sink for file headers and raw sample dumps.
class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_i32_le(int32_t v) { write_u32_le(static_cast<uint32_t>(v)); }
    void write_zeros(size_t n) { buf_.insert(buf_.end(), n, 0); }
    void clear() { buf_.clear(); }

    const std::vector<uint8_t>& bytes() const { return buf_; }
    size_t size() const { return buf_.size(); }
private:
    std::vector<uint8_t> buf_;
};

// Map a 12-bit sample (0..4095) onto the 8-bit display range.
// Single precision and std::round keep the result identical to the reference
// frames; the caller guarantees value <= 4095 so the cast cannot overflow.
uint8_t normalize(uint16_t value);

} // namespace medslice
