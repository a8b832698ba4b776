#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace medslice {

// Base of every recoverable error raised by the volume library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// Metadata errors
// ---------------------------------------------------------------------------

class MetadataError : public Error {
public:
    MetadataError(const std::string& what, size_t line_number)
        : Error(what), line_number_(line_number) {}

    // 1-based line of the offending entry, 0 when no line applies.
    size_t line_number() const { return line_number_; }

private:
    size_t line_number_;
};

class MissingDimSizeValues : public MetadataError {
public:
    explicit MissingDimSizeValues(size_t line_number);
};

class InvalidDimSizeValue : public MetadataError {
public:
    InvalidDimSizeValue(size_t line_number, std::string value);
    const std::string& value() const { return value_; }

private:
    std::string value_;
};

class DuplicateKey : public MetadataError {
public:
    explicit DuplicateKey(size_t line_number);
};

class DimSizeNotFound : public MetadataError {
public:
    DimSizeNotFound();
};

class TooManyDimSizeValues : public MetadataError {
public:
    explicit TooManyDimSizeValues(size_t line_number);
};

// ---------------------------------------------------------------------------
// Volume construction errors
// ---------------------------------------------------------------------------

class VolumeError : public Error {
public:
    explicit VolumeError(const std::string& what) : Error(what) {}
};

class DataSizeMismatch : public VolumeError {
public:
    DataSizeMismatch(size_t actual, size_t expected);
    size_t actual() const { return actual_; }
    size_t expected() const { return expected_; }

private:
    size_t actual_;
    size_t expected_;
};

class DataSizeUneven : public VolumeError {
public:
    explicit DataSizeUneven(size_t size);
    size_t size() const { return size_; }

private:
    size_t size_;
};

// ---------------------------------------------------------------------------
// Per-voxel errors (raised lazily while decoding)
// ---------------------------------------------------------------------------

class VoxelValueOutOfRange : public Error {
public:
    explicit VoxelValueOutOfRange(uint16_t value);
    uint16_t value() const { return value_; }

private:
    uint16_t value_;
};

} // namespace medslice
