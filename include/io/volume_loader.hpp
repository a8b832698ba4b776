#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace medslice {

// Whole-file readers for the metadata header and the raw voxel payload.
// Both throw std::runtime_error when the file cannot be opened or read fully.
std::string read_text_file(const std::string& path);
std::vector<uint8_t> read_binary_file(const std::string& path);

} // namespace medslice
