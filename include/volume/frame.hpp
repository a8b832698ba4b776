#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "volume/volume_metadata.hpp"
#include "volume/voxel.hpp"

namespace medslice {

enum class Axis : uint8_t {
    X = 0,
    Y = 1,
    Z = 2,
};

const char* axis_name(Axis axis);

// One sample of a frame together with its 2D position in that frame.
// The two source bytes are only decoded when voxel() is called, so an
// out-of-range sample is reported for this element alone.
class FrameElement {
public:
    FrameElement(const uint8_t* bytes, size_t x, size_t y) : bytes_(bytes), x_(x), y_(y) {}

    // Throws VoxelValueOutOfRange.
    Voxel voxel() const { return Voxel::decode_le(bytes_); }

    size_t x() const { return x_; }
    size_t y() const { return y_; }

private:
    const uint8_t* bytes_;
    size_t x_;
    size_t y_;
};

// A lazy 2D slice through a volume buffer, orthogonal to `axis` at `index`.
//
// Elements come out row-major in display order (y outer, x inner). The
// element index i maps to a byte offset in the volume buffer:
//
//   Z-frame: contiguous frame at index; i-th voxel of it
//   Y-frame: row `index` of every Z-frame, Z-frames walked zdim-1 .. 0
//   X-frame: column `index` of every Z-frame, Z-frames walked zdim-1 .. 0
//
// Nothing is copied; iteration is pure index arithmetic over the borrowed
// buffer, which must outlive the Frame.
class Frame {
public:
    class Iterator;

    // Precondition: index < the dimension of `axis`; Volume checks it.
    Frame(const uint8_t* data, const VolumeMetadata& md, Axis axis, size_t index)
        : data_(data), md_(md), axis_(axis), index_(index) {}

    Axis axis() const { return axis_; }
    size_t index() const { return index_; }

    // First and second dimension of the 2D frame.
    size_t width() const;
    size_t height() const;
    size_t size() const { return width() * height(); }

    // Offset into the volume buffer of the i-th element (i < size()).
    size_t byte_offset(size_t i) const;

    FrameElement at(size_t i) const {
        const size_t w = width();
        return FrameElement(data_ + byte_offset(i), i % w, i / w);
    }

    Iterator begin() const;
    Iterator end() const;

private:
    const uint8_t* data_;
    VolumeMetadata md_;
    Axis axis_;
    size_t index_;
};

class Frame::Iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = FrameElement;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = FrameElement;

    Iterator(const Frame& frame, size_t pos) : frame_(frame), pos_(pos) {}

    FrameElement operator*() const { return frame_.at(pos_); }

    Iterator& operator++() {
        ++pos_;
        return *this;
    }
    Iterator operator++(int) {
        Iterator tmp = *this;
        ++pos_;
        return tmp;
    }

    bool operator==(const Iterator& o) const { return pos_ == o.pos_; }
    bool operator!=(const Iterator& o) const { return pos_ != o.pos_; }

private:
    // Held by value so an iterator stays valid after a temporary Frame is gone.
    Frame frame_;
    size_t pos_;
};

inline Frame::Iterator Frame::begin() const { return Iterator(*this, 0); }
inline Frame::Iterator Frame::end() const { return Iterator(*this, size()); }

} // namespace medslice
