#include "volume/voxel.hpp"

#include "util/byte_utils.hpp"
#include "volume/errors.hpp"

namespace medslice {

Voxel Voxel::create(uint16_t value) {
    if (value > kMaxValue) throw VoxelValueOutOfRange(value);
    return Voxel(value);
}

Voxel Voxel::decode_le(uint8_t byte0, uint8_t byte1) {
    return create(read_u16_le(byte0, byte1));
}

Voxel Voxel::decode_le(const uint8_t* bytes) {
    return create(read_u16_le(bytes));
}

uint8_t Voxel::normalized() const {
    return normalize(value_);
}

std::array<uint8_t, 2> Voxel::encode_le() const {
    return write_u16_le(value_);
}

} // namespace medslice
