#include "volume/volume.hpp"

#include "volume/errors.hpp"
#include "volume/voxel.hpp"

#include <plog/Log.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace medslice {
namespace {

// Saturates at SIZE_MAX; no real buffer can be that large, so an overflowing
// product always ends up as a size mismatch.
static size_t saturating_mul(size_t a, size_t b) {
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a) {
        return std::numeric_limits<size_t>::max();
    }
    return a * b;
}

} // namespace

Volume Volume::open(const VolumeMetadata& metadata, const uint8_t* data, size_t size) {
    size_t expected = saturating_mul(metadata.xdim(), metadata.ydim());
    expected = saturating_mul(expected, metadata.zdim());
    expected = saturating_mul(expected, Voxel::byte_width());

    if (size != expected) throw DataSizeMismatch(size, expected);

    // Cannot fire once the check above passed, kept as an independent guard.
    if (size % Voxel::byte_width() != 0) throw DataSizeUneven(size);

    LOGV << "Opened volume " << metadata.xdim() << "x" << metadata.ydim() << "x"
         << metadata.zdim() << " over " << size << " bytes";
    return Volume(metadata, data, size);
}

Volume Volume::open(const VolumeMetadata& metadata, const std::vector<uint8_t>& data) {
    return open(metadata, data.data(), data.size());
}

size_t Volume::dim(Axis axis) const {
    switch (axis) {
    case Axis::X: return metadata_.xdim();
    case Axis::Y: return metadata_.ydim();
    case Axis::Z: return metadata_.zdim();
    }
    return 0;
}

Frame Volume::frame(Axis axis, size_t index) const {
    const size_t n = dim(axis);
    if (index >= n) {
        throw std::out_of_range(std::string(axis_name(axis)) + "-frame index " +
                                std::to_string(index) + " out of range (dimension " +
                                std::to_string(n) + ")");
    }
    return Frame(data_, metadata_, axis, index);
}

Frame Volume::xframe(size_t index) const { return frame(Axis::X, index); }
Frame Volume::yframe(size_t index) const { return frame(Axis::Y, index); }
Frame Volume::zframe(size_t index) const { return frame(Axis::Z, index); }

} // namespace medslice
