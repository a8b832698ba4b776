#pragma once

#include <cstddef>
#include <string>

namespace medslice {

// Dimensions of a volume, in voxels.
class VolumeMetadata {
public:
    VolumeMetadata(size_t xdim, size_t ydim, size_t zdim)
        : xdim_(xdim), ydim_(ydim), zdim_(zdim) {}

    // Best-effort scan of a MetaImage-style "key = value" header.
    // Only the `DimSize` entry is interpreted; every other line is skipped.
    // The value is everything after the first '=', so a further '=' becomes
    // part of the value: "DimSize = 1 2 3 = 4" has five tokens and fails with
    // TooManyDimSizeValues rather than being read as (1, 2, 3).
    //
    // Throws (all derived from MetadataError):
    //   MissingDimSizeValues  - fewer than three values on the DimSize line
    //   TooManyDimSizeValues  - more than three values
    //   InvalidDimSizeValue   - a value that is not a base-10 size_t
    //   DuplicateKey          - a second DimSize line after a valid one
    //   DimSizeNotFound       - no valid DimSize line at all
    static VolumeMetadata parse(const std::string& text);

    size_t xdim() const { return xdim_; }
    size_t ydim() const { return ydim_; }
    size_t zdim() const { return zdim_; }

    // Voxel count of one frame orthogonal to the named axis.
    size_t xframe_len() const { return ydim_ * zdim_; }
    size_t yframe_len() const { return xdim_ * zdim_; }
    size_t zframe_len() const { return xdim_ * ydim_; }

    bool operator==(const VolumeMetadata& o) const {
        return xdim_ == o.xdim_ && ydim_ == o.ydim_ && zdim_ == o.zdim_;
    }
    bool operator!=(const VolumeMetadata& o) const { return !(*this == o); }

private:
    size_t xdim_;
    size_t ydim_;
    size_t zdim_;
};

} // namespace medslice
