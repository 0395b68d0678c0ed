#pragma once

#include <stdexcept>
#include <string>

namespace fa {

// A discovery pattern matched no files, or a file name carries no year.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raster file missing, unreadable or unwritable, or a spatial window that
// selects no pixels of the source.
class RasterIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rasters or collections that cannot be lined up: mismatched years or
// dimensions, or a bounding box without any data pixels.
class AlignmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace fa
