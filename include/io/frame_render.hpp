#pragma once

#include <iosfwd>

#include "io/image_types.hpp"
#include "volume/frame.hpp"

namespace medslice {

// Decode every element of `frame` into an Image of frame.width() x
// frame.height(). U8 stores the normalized value, U16 the raw sample.
// The first out-of-range voxel aborts rendering with VoxelValueOutOfRange.
Image render_frame(const Frame& frame, PixelType type);

// Stream the raw samples as 16-bit little-endian words in frame order.
void write_raw_frame(std::ostream& os, const Frame& frame);

} // namespace medslice
