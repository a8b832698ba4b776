#include "volume/errors.hpp"

#include <utility>

namespace medslice {

MissingDimSizeValues::MissingDimSizeValues(size_t line_number)
    : MetadataError("Metadata Line " + std::to_string(line_number) +
                        ": Expecting values for `DimSize` key",
                    line_number) {}

InvalidDimSizeValue::InvalidDimSizeValue(size_t line_number, std::string value)
    : MetadataError("Metadata Line " + std::to_string(line_number) + ": Invalid value " + value +
                        " for dimension size",
                    line_number),
      value_(std::move(value)) {}

DuplicateKey::DuplicateKey(size_t line_number)
    : MetadataError("Metadata Line " + std::to_string(line_number) + ": Duplicated `DimSize` key",
                    line_number) {}

DimSizeNotFound::DimSizeNotFound()
    : MetadataError("Invalid metadata, `DimSize` key not found", 0) {}

TooManyDimSizeValues::TooManyDimSizeValues(size_t line_number)
    : MetadataError("Metadata Line " + std::to_string(line_number) +
                        ": Too many values for `DimSize` key",
                    line_number) {}

DataSizeMismatch::DataSizeMismatch(size_t actual, size_t expected)
    : VolumeError("Data size of " + std::to_string(actual) +
                  " bytes does not match metadata: expecting " + std::to_string(expected) +
                  " bytes"),
      actual_(actual),
      expected_(expected) {}

DataSizeUneven::DataSizeUneven(size_t size)
    : VolumeError("Data size of " + std::to_string(size) + " bytes is uneven"),
      size_(size) {}

VoxelValueOutOfRange::VoxelValueOutOfRange(uint16_t value)
    : Error("Voxel value " + std::to_string(value) + " is out of the 0-4095 range."),
      value_(value) {}

} // namespace medslice
