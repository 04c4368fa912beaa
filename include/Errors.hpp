#pragma once

#include <stdexcept>
#include <string>

namespace PlateTrace {

// Base of every recoverable localization failure. Invalid arguments
// (negative sizes, wrong channel counts) throw std::invalid_argument instead.
class PlateTraceError : public std::runtime_error {
public:
    explicit PlateTraceError(const std::string& what) : std::runtime_error(what) {}
};

// Image file missing, unreadable or in an unsupported format
class ImageLoadError : public PlateTraceError {
public:
    explicit ImageLoadError(const std::string& what) : PlateTraceError(what) {}
};

// Raster with zero area
class EmptyInputError : public PlateTraceError {
public:
    explicit EmptyInputError(const std::string& what) : PlateTraceError(what) {}
};

// Every ranked candidate was rejected by the selector
class NoCandidateFoundError : public PlateTraceError {
public:
    explicit NoCandidateFoundError(const std::string& what) : PlateTraceError(what) {}
};

// Mask without a single 255 pixel
class EmptyMaskError : public PlateTraceError {
public:
    explicit EmptyMaskError(const std::string& what) : PlateTraceError(what) {}
};

// Crop box outside the source raster
class OutOfBoundsError : public PlateTraceError {
public:
    explicit OutOfBoundsError(const std::string& what) : PlateTraceError(what) {}
};

} // namespace PlateTrace
