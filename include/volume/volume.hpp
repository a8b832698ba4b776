#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "volume/frame.hpp"
#include "volume/volume_metadata.hpp"

namespace medslice {

// A view of a flat voxel buffer (row-major, X fastest, 2 bytes per voxel,
// little-endian) shaped by its metadata. The buffer is borrowed, never copied,
// and must stay alive and unmodified while the Volume or any Frame taken from
// it is in use.
//
// Only the buffer size is validated when opening; sample values are checked
// one at a time as frames are decoded.
class Volume {
public:
    // Throws DataSizeMismatch / DataSizeUneven.
    static Volume open(const VolumeMetadata& metadata, const uint8_t* data, size_t size);
    static Volume open(const VolumeMetadata& metadata, const std::vector<uint8_t>& data);
    static Volume open(const VolumeMetadata& metadata, std::vector<uint8_t>&& data) = delete;

    const VolumeMetadata& metadata() const { return metadata_; }
    const uint8_t* data() const { return data_; }
    size_t size_bytes() const { return size_; }

    // Frame orthogonal to the given axis. Throws std::out_of_range when index
    // is not below that axis' dimension.
    Frame xframe(size_t index) const;
    Frame yframe(size_t index) const;
    Frame zframe(size_t index) const;
    Frame frame(Axis axis, size_t index) const;

    size_t dim(Axis axis) const;

private:
    Volume(const VolumeMetadata& metadata, const uint8_t* data, size_t size)
        : metadata_(metadata), data_(data), size_(size) {}

    VolumeMetadata metadata_;
    const uint8_t* data_;
    size_t size_;
};

} // namespace medslice
