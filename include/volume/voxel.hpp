#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace medslice {

// A single 12-bit sample held in a 16-bit container.
// The only way to obtain a Voxel is through create()/decode_le(), both of which
// reject values above kMaxValue, so every Voxel in existence is in range.
class Voxel {
public:
    static constexpr uint16_t kMaxValue = 4095;

    // Throws VoxelValueOutOfRange when value > kMaxValue.
    static Voxel create(uint16_t value);

    // Little-endian pair, as stored in the volume buffer.
    static Voxel decode_le(uint8_t byte0, uint8_t byte1);
    static Voxel decode_le(const uint8_t* bytes);

    uint16_t value() const { return value_; }

    // round(value / 4095 * 255)
    uint8_t normalized() const;

    std::array<uint8_t, 2> encode_le() const;

    // Size of the on-disk encoding.
    static constexpr size_t byte_width() { return sizeof(uint16_t); }

    bool operator==(const Voxel& other) const { return value_ == other.value_; }
    bool operator!=(const Voxel& other) const { return value_ != other.value_; }

private:
    explicit Voxel(uint16_t value) : value_(value) {}

    uint16_t value_;
};

} // namespace medslice
