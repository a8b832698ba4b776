#include "volume/frame.hpp"

namespace medslice {

const char* axis_name(Axis axis) {
    switch (axis) {
    case Axis::X: return "X";
    case Axis::Y: return "Y";
    case Axis::Z: return "Z";
    }
    return "?";
}

size_t Frame::width() const {
    return axis_ == Axis::X ? md_.ydim() : md_.xdim();
}

size_t Frame::height() const {
    return axis_ == Axis::Z ? md_.ydim() : md_.zdim();
}

size_t Frame::byte_offset(size_t i) const {
    const size_t vw = Voxel::byte_width();
    const size_t row_bytes = md_.xdim() * vw;
    const size_t zframe_bytes = md_.zframe_len() * vw;

    switch (axis_) {
    case Axis::Z:
        // single contiguous run
        return index_ * zframe_bytes + i * vw;
    case Axis::Y: {
        // one contiguous row per Z-frame, last Z-frame first
        const size_t z = md_.zdim() - 1 - i / md_.xdim();
        const size_t x = i % md_.xdim();
        return z * zframe_bytes + index_ * row_bytes + x * vw;
    }
    case Axis::X: {
        // column: one voxel per row, rows are row_bytes apart
        const size_t z = md_.zdim() - 1 - i / md_.ydim();
        const size_t row = i % md_.ydim();
        return z * zframe_bytes + row * row_bytes + index_ * vw;
    }
    }
    return 0;
}

} // namespace medslice
