#include "util/byte_utils.hpp"

#include <cmath>

namespace medslice {

uint8_t normalize(uint16_t value) {
    constexpr float kVoxelMax = 4095.0f;
    constexpr float kDisplayMax = 255.0f;

    const float normalized = std::round((static_cast<float>(value) / kVoxelMax) * kDisplayMax);
    return static_cast<uint8_t>(normalized);
}

} // namespace medslice
