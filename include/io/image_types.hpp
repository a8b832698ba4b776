#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace medslice {

enum class PixelType : uint8_t {
    U8  = 1,  // normalized display value
    U16 = 2,  // raw 12-bit sample
};

// A materialized grayscale frame, ready for an image encoder.
struct Image {
    int width = 0;
    int height = 0;
    int bits_stored = 0;      // 8 for U8, 12 for U16
    PixelType type = PixelType::U8;
    std::vector<uint16_t> pixels; // row-major, y * width + x

    size_t size() const { return pixels.size(); }
    bool empty() const { return pixels.empty(); }
    int bits_allocated() const { return type == PixelType::U8 ? 8 : 16; }
};

} // namespace medslice
