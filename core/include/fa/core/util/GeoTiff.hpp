#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fa {

// GDAL ordering: origin x, pixel width, row rotation, origin y, column rotation,
// pixel height (negative for north-up rasters).
using GeoTransform = std::array<double, 6>;

// Fill value for derived rasters whose source declares no nodata (float32 lowest).
inline constexpr double kDefaultNodata = -3.4028234663852886e38;

// Box in projected units, ordered like gdal_translate -projwin: yMin is the y of
// the first (top) row, so yMin > yMax for north-up rasters.
struct GeoBounds {
    double xMin{0};
    double yMin{0};
    double xMax{0};
    double yMax{0};
};

// Pixel box; all bounds are column/row offsets and may extend past the raster.
struct PixelBounds {
    int xMin{0};
    int xMax{0};
    int yMin{0};
    int yMax{0};

    bool operator==(const PixelBounds& o) const
    {
        return xMin == o.xMin && xMax == o.xMax && yMin == o.yMin && yMax == o.yMax;
    }
};

// CRS description copied verbatim between files; never interpreted.
struct GeoKeys {
    std::vector<uint16_t> directory;
    std::vector<double> doubleParams;
    std::string asciiParams;

    [[nodiscard]] bool empty() const { return directory.empty(); }
};

struct RasterInfo {
    int width{0};
    int height{0};
    GeoTransform transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::optional<double> nodata;
    int depth{CV_32F};  // OpenCV depth the samples are written back as
    GeoKeys geoKeys;
};

// Single-band raster held as doubles regardless of the on-disk sample type.
struct Raster {
    RasterInfo info;
    cv::Mat_<double> values;
};

// Options for writing rasters
struct TiffWriteOptions {
    enum class Compression { LZW, DEFLATE };

    bool forceBigTiff = false;
    int  tileSize = 256;                  // square tiles, multiple of 16
    Compression compression = Compression::LZW;

    // BIGTIFF=YES, COMPRESS=DEFLATE
    static TiffWriteOptions bigTiffDeflate()
    {
        TiffWriteOptions opts;
        opts.forceBigTiff = true;
        opts.compression = Compression::DEFLATE;
        return opts;
    }
};

inline bool isNodata(double value, const std::optional<double>& nodata)
{
    if (!nodata) return false;
    if (std::isnan(*nodata)) return std::isnan(value);
    return value == *nodata;
}

// Header-only read: size, georeferencing, nodata. Throws RasterIOError.
RasterInfo readRasterInfo(const std::filesystem::path& path);

// Reads the first band of a stripped or tiled GeoTIFF. Throws RasterIOError.
Raster readRaster(const std::filesystem::path& path);

// Source pixel window selected by bounds, using gdal_translate -projwin rounding.
// Throws RasterIOError for rotated transforms or an empty window.
cv::Rect pixelWindow(const GeoTransform& transform, const GeoBounds& bounds);

// Reads the part of a raster inside bounds. Pixels of the window that fall
// outside the source are set to the source nodata (0 if it has none). Throws
// RasterIOError if the window lies completely outside the source.
Raster readRasterWindow(const std::filesystem::path& path, const GeoBounds& bounds);

// Writes a tiled single-band GeoTIFF, converting values to info.depth.
void writeRaster(const std::filesystem::path& path,
                 const Raster& raster,
                 const TiffWriteOptions& opts = {});

// Window src to bounds and write the result to dst.
void translateRaster(const std::filesystem::path& src,
                     const std::filesystem::path& dst,
                     const GeoBounds& bounds,
                     const TiffWriteOptions& opts = {});

} // namespace fa
