#pragma once

#include <string>

#include "io/image_types.hpp"
#include "volume/frame.hpp"

namespace medslice {

// Binary PGM (P5): 8-bit, or big-endian 16-bit with maxval 2^bits_stored - 1.
void save_pgm(const std::string& path, const Image& im);

// Uncompressed 24-bit BMP, gray value copied to B, G and R. U8 images only.
void save_bmp(const std::string& path, const Image& im);

// Single-frame MONOCHROME2 Secondary Capture, explicit VR little endian.
void save_dicom(const std::string& path, const Image& im);

// Raw 16-bit little-endian dump, streamed straight from the frame.
void save_raw(const std::string& path, const Frame& frame);

} // namespace medslice
