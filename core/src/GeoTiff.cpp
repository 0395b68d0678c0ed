#include "fa/core/util/GeoTiff.hpp"

#include "fa/core/util/Errors.hpp"
#include "fa/core/util/Logging.hpp"

#include <tiffio.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace fa {

namespace {

// GeoTIFF and GDAL private tags
constexpr uint32_t TAG_MODEL_PIXEL_SCALE    = 33550;
constexpr uint32_t TAG_MODEL_TIEPOINT       = 33922;
constexpr uint32_t TAG_MODEL_TRANSFORMATION = 34264;
constexpr uint32_t TAG_GEO_KEY_DIRECTORY    = 34735;
constexpr uint32_t TAG_GEO_DOUBLE_PARAMS    = 34736;
constexpr uint32_t TAG_GEO_ASCII_PARAMS     = 34737;
constexpr uint32_t TAG_GDAL_NODATA          = 42113;

const TIFFFieldInfo geoFieldInfo[] = {
    {TAG_MODEL_PIXEL_SCALE,    -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char*>("ModelPixelScaleTag")},
    {TAG_MODEL_TIEPOINT,       -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char*>("ModelTiepointTag")},
    {TAG_MODEL_TRANSFORMATION, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char*>("ModelTransformationTag")},
    {TAG_GEO_KEY_DIRECTORY,    -1, -1, TIFF_SHORT,  FIELD_CUSTOM, 1, 1, const_cast<char*>("GeoKeyDirectoryTag")},
    {TAG_GEO_DOUBLE_PARAMS,    -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char*>("GeoDoubleParamsTag")},
    {TAG_GEO_ASCII_PARAMS,     -1, -1, TIFF_ASCII,  FIELD_CUSTOM, 1, 0, const_cast<char*>("GeoAsciiParamsTag")},
    {TAG_GDAL_NODATA,          -1, -1, TIFF_ASCII,  FIELD_CUSTOM, 1, 0, const_cast<char*>("GDALNoDataValue")},
};

TIFFExtendProc parentExtender = nullptr;
thread_local std::string lastTiffError;

void geoTagExtender(TIFF* tif)
{
    TIFFMergeFieldInfo(tif, geoFieldInfo, sizeof(geoFieldInfo) / sizeof(geoFieldInfo[0]));
    if (parentExtender) {
        parentExtender(tif);
    }
}

void tiffErrorHandler(const char* module, const char* fmt, va_list ap)
{
    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    lastTiffError = buf;
    Logger()->debug("libtiff error {}: {}", module ? module : "", buf);
}

void tiffWarningHandler(const char* module, const char* fmt, va_list ap)
{
    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    Logger()->debug("libtiff warning {}: {}", module ? module : "", buf);
}

void registerGeoTags()
{
    static std::once_flag once;
    std::call_once(once, [] {
        parentExtender = TIFFSetTagExtender(geoTagExtender);
        TIFFSetErrorHandler(tiffErrorHandler);
        TIFFSetWarningHandler(tiffWarningHandler);
    });
}

struct TiffCloser {
    void operator()(TIFF* tf) const
    {
        if (tf) TIFFClose(tf);
    }
};
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

std::string withTiffError(const std::string& msg)
{
    if (lastTiffError.empty()) return msg;
    return msg + " (" + lastTiffError + ")";
}

TiffHandle openTiff(const fs::path& path, const char* mode)
{
    registerGeoTags();
    lastTiffError.clear();

    if (mode[0] == 'r' && !fs::exists(path)) {
        throw RasterIOError("raster not found: " + path.string());
    }

    TiffHandle tf(TIFFOpen(path.string().c_str(), mode));
    if (!tf) {
        throw RasterIOError(withTiffError("failed to open TIFF " + path.string()));
    }
    return tf;
}

struct SampleLayout {
    uint16_t bits{0};
    uint16_t format{SAMPLEFORMAT_UINT};
    uint16_t samples{1};
};

SampleLayout sampleLayout(TIFF* tf)
{
    SampleLayout layout;
    TIFFGetFieldDefaulted(tf, TIFFTAG_BITSPERSAMPLE, &layout.bits);
    TIFFGetFieldDefaulted(tf, TIFFTAG_SAMPLEFORMAT, &layout.format);
    TIFFGetFieldDefaulted(tf, TIFFTAG_SAMPLESPERPIXEL, &layout.samples);
    return layout;
}

int depthFor(const SampleLayout& layout, const fs::path& path)
{
    switch (layout.format) {
        case SAMPLEFORMAT_UINT:
            if (layout.bits == 8)  return CV_8U;
            if (layout.bits == 16) return CV_16U;
            if (layout.bits == 32) return CV_64F;  // no uint32 depth in OpenCV
            break;
        case SAMPLEFORMAT_INT:
            if (layout.bits == 8)  return CV_8S;
            if (layout.bits == 16) return CV_16S;
            if (layout.bits == 32) return CV_32S;
            break;
        case SAMPLEFORMAT_IEEEFP:
            if (layout.bits == 32) return CV_32F;
            if (layout.bits == 64) return CV_64F;
            break;
        default:
            break;
    }
    throw RasterIOError("unsupported sample type (" + std::to_string(layout.bits) +
                        " bits, format " + std::to_string(layout.format) + ") in " + path.string());
}

template<typename T>
void widen(const uint8_t* src, double* dst, size_t n)
{
    for (size_t i = 0; i < n; ++i) {
        T v;
        std::memcpy(&v, src + i * sizeof(T), sizeof(T));
        dst[i] = static_cast<double>(v);
    }
}

void convertSamples(const uint8_t* src, double* dst, size_t n, const SampleLayout& layout)
{
    switch (layout.format) {
        case SAMPLEFORMAT_UINT:
            if (layout.bits == 8)  return widen<uint8_t>(src, dst, n);
            if (layout.bits == 16) return widen<uint16_t>(src, dst, n);
            if (layout.bits == 32) return widen<uint32_t>(src, dst, n);
            break;
        case SAMPLEFORMAT_INT:
            if (layout.bits == 8)  return widen<int8_t>(src, dst, n);
            if (layout.bits == 16) return widen<int16_t>(src, dst, n);
            if (layout.bits == 32) return widen<int32_t>(src, dst, n);
            break;
        case SAMPLEFORMAT_IEEEFP:
            if (layout.bits == 32) return widen<float>(src, dst, n);
            if (layout.bits == 64) return widen<double>(src, dst, n);
            break;
        default:
            break;
    }
}

std::optional<double> parseNodata(const char* text, const fs::path& path)
{
    std::string s(text);
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str()) {
        Logger()->warn("ignoring unparseable nodata value '{}' in {}", s, path);
        return std::nullopt;
    }
    return v;
}

std::string formatNodata(double v)
{
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

RasterInfo readInfo(TIFF* tf, const fs::path& path)
{
    RasterInfo info;

    uint32_t w = 0, h = 0;
    TIFFGetField(tf, TIFFTAG_IMAGEWIDTH, &w);
    TIFFGetField(tf, TIFFTAG_IMAGELENGTH, &h);
    info.width = static_cast<int>(w);
    info.height = static_cast<int>(h);
    if (info.width <= 0 || info.height <= 0) {
        throw RasterIOError("raster has no pixels: " + path.string());
    }

    const SampleLayout layout = sampleLayout(tf);
    if (layout.samples != 1) {
        throw RasterIOError("expected a single-band raster, found " +
                            std::to_string(layout.samples) + " bands in " + path.string());
    }
    info.depth = depthFor(layout, path);

    uint16_t count = 0;
    double* data = nullptr;
    uint16_t scaleCount = 0, tieCount = 0;
    double* scale = nullptr;
    double* tie = nullptr;
    if (TIFFGetField(tf, TAG_MODEL_TRANSFORMATION, &count, &data) && count >= 16) {
        info.transform = {data[3], data[0], data[1], data[7], data[4], data[5]};
    } else if (TIFFGetField(tf, TAG_MODEL_PIXEL_SCALE, &scaleCount, &scale) && scaleCount >= 2 &&
               TIFFGetField(tf, TAG_MODEL_TIEPOINT, &tieCount, &tie) && tieCount >= 6) {
        info.transform = {tie[3] - tie[0] * scale[0], scale[0], 0.0,
                          tie[4] + tie[1] * scale[1], 0.0, -scale[1]};
    } else {
        Logger()->warn("{} is not georeferenced, using pixel coordinates", path);
        info.transform = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    }

    char* nodataText = nullptr;
    if (TIFFGetField(tf, TAG_GDAL_NODATA, &nodataText) && nodataText) {
        info.nodata = parseNodata(nodataText, path);
    }

    uint16_t* keys = nullptr;
    if (TIFFGetField(tf, TAG_GEO_KEY_DIRECTORY, &count, &keys) && keys) {
        info.geoKeys.directory.assign(keys, keys + count);
    }
    double* params = nullptr;
    if (TIFFGetField(tf, TAG_GEO_DOUBLE_PARAMS, &count, &params) && params) {
        info.geoKeys.doubleParams.assign(params, params + count);
    }
    char* ascii = nullptr;
    if (TIFFGetField(tf, TAG_GEO_ASCII_PARAMS, &ascii) && ascii) {
        info.geoKeys.asciiParams = ascii;
    }

    return info;
}

struct TiffSampleFormat {
    int bits;
    int format;
};

TiffSampleFormat tiffFormatFor(int depth, const fs::path& path)
{
    switch (depth) {
        case CV_8U:  return {8, SAMPLEFORMAT_UINT};
        case CV_8S:  return {8, SAMPLEFORMAT_INT};
        case CV_16U: return {16, SAMPLEFORMAT_UINT};
        case CV_16S: return {16, SAMPLEFORMAT_INT};
        case CV_32S: return {32, SAMPLEFORMAT_INT};
        case CV_32F: return {32, SAMPLEFORMAT_IEEEFP};
        case CV_64F: return {64, SAMPLEFORMAT_IEEEFP};
        default:
            throw RasterIOError("unsupported depth " + std::to_string(depth) + " for " + path.string());
    }
}

} // namespace

RasterInfo readRasterInfo(const fs::path& path)
{
    auto tf = openTiff(path, "r");
    return readInfo(tf.get(), path);
}

Raster readRaster(const fs::path& path)
{
    auto tf = openTiff(path, "r");

    Raster raster;
    raster.info = readInfo(tf.get(), path);
    const SampleLayout layout = sampleLayout(tf.get());

    const uint32_t w = static_cast<uint32_t>(raster.info.width);
    const uint32_t h = static_cast<uint32_t>(raster.info.height);
    const size_t elem = layout.bits / 8;
    raster.values.create(raster.info.height, raster.info.width);

    if (TIFFIsTiled(tf.get())) {
        uint32_t tileW = 0, tileH = 0;
        TIFFGetField(tf.get(), TIFFTAG_TILEWIDTH, &tileW);
        TIFFGetField(tf.get(), TIFFTAG_TILELENGTH, &tileH);
        if (tileW == 0 || tileH == 0) {
            throw RasterIOError("invalid tile size in " + path.string());
        }

        std::vector<uint8_t> buf(static_cast<size_t>(TIFFTileSize(tf.get())));
        for (uint32_t y = 0; y < h; y += tileH) {
            for (uint32_t x = 0; x < w; x += tileW) {
                if (TIFFReadTile(tf.get(), buf.data(), x, y, 0, 0) < 0) {
                    throw RasterIOError(withTiffError("TIFFReadTile failed at tile (" +
                                                      std::to_string(x) + "," + std::to_string(y) +
                                                      ") in " + path.string()));
                }
                const uint32_t copyW = std::min(tileW, w - x);
                const uint32_t copyH = std::min(tileH, h - y);
                for (uint32_t row = 0; row < copyH; ++row) {
                    convertSamples(buf.data() + static_cast<size_t>(row) * tileW * elem,
                                   raster.values[static_cast<int>(y + row)] + x,
                                   copyW, layout);
                }
            }
        }
    } else {
        std::vector<uint8_t> buf(static_cast<size_t>(TIFFScanlineSize(tf.get())));
        for (uint32_t row = 0; row < h; ++row) {
            if (TIFFReadScanline(tf.get(), buf.data(), row, 0) < 0) {
                throw RasterIOError(withTiffError("TIFFReadScanline failed at row " +
                                                  std::to_string(row) + " in " + path.string()));
            }
            convertSamples(buf.data(), raster.values[static_cast<int>(row)], w, layout);
        }
    }

    return raster;
}

cv::Rect pixelWindow(const GeoTransform& t, const GeoBounds& b)
{
    if (t[2] != 0.0 || t[4] != 0.0) {
        throw RasterIOError("windowing rotated rasters is not supported");
    }

    const int x = static_cast<int>(std::floor((b.xMin - t[0]) / t[1] + 0.001));
    const int y = static_cast<int>(std::floor((b.yMin - t[3]) / t[5] + 0.001));
    const int w = static_cast<int>(std::floor((b.xMax - b.xMin) / t[1] + 0.5));
    const int h = static_cast<int>(std::floor((b.yMax - b.yMin) / t[5] + 0.5));
    if (w <= 0 || h <= 0) {
        throw RasterIOError("window selects no pixels (" + std::to_string(w) + "x" +
                            std::to_string(h) + ")");
    }
    return {x, y, w, h};
}

Raster readRasterWindow(const fs::path& path, const GeoBounds& bounds)
{
    Raster src = readRaster(path);

    const cv::Rect window = pixelWindow(src.info.transform, bounds);
    const cv::Rect full(0, 0, src.values.cols, src.values.rows);
    const cv::Rect overlap = window & full;
    if (overlap.empty()) {
        throw RasterIOError("window [" + std::to_string(bounds.xMin) + ", " + std::to_string(bounds.yMin) +
                            ", " + std::to_string(bounds.xMax) + ", " + std::to_string(bounds.yMax) +
                            "] falls completely outside " + path.string());
    }
    if (overlap != window) {
        Logger()->warn("window extends beyond {}, padding with nodata", path);
    }

    Raster out;
    out.info = src.info;
    out.info.width = window.width;
    out.info.height = window.height;
    out.info.transform[0] = src.info.transform[0] + window.x * src.info.transform[1];
    out.info.transform[3] = src.info.transform[3] + window.y * src.info.transform[5];
    out.values = cv::Mat_<double>(window.height, window.width, src.info.nodata.value_or(0.0));
    src.values(overlap).copyTo(out.values(overlap - window.tl()));
    return out;
}

void writeRaster(const fs::path& path, const Raster& raster, const TiffWriteOptions& opts)
{
    if (raster.values.empty())
        throw RasterIOError("empty raster for " + path.string());
    if (opts.tileSize <= 0 || opts.tileSize % 16 != 0)
        throw RasterIOError("tile size must be a positive multiple of 16 for " + path.string());

    const TiffSampleFormat sampleFormat = tiffFormatFor(raster.info.depth, path);
    cv::Mat img;
    raster.values.convertTo(img, raster.info.depth);

    auto tf = openTiff(path, opts.forceBigTiff ? "w8" : "w");

    const uint32_t W = static_cast<uint32_t>(img.cols);
    const uint32_t H = static_cast<uint32_t>(img.rows);
    const uint32_t tileW = static_cast<uint32_t>(opts.tileSize);
    const uint32_t tileH = static_cast<uint32_t>(opts.tileSize);
    const size_t elem = img.elemSize();

    TIFFSetField(tf.get(), TIFFTAG_IMAGEWIDTH,      W);
    TIFFSetField(tf.get(), TIFFTAG_IMAGELENGTH,     H);
    TIFFSetField(tf.get(), TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tf.get(), TIFFTAG_BITSPERSAMPLE,   sampleFormat.bits);
    TIFFSetField(tf.get(), TIFFTAG_SAMPLEFORMAT,    sampleFormat.format);
    TIFFSetField(tf.get(), TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
    TIFFSetField(tf.get(), TIFFTAG_PHOTOMETRIC,     PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tf.get(), TIFFTAG_ORIENTATION,     ORIENTATION_TOPLEFT);
    TIFFSetField(tf.get(), TIFFTAG_TILEWIDTH,       tileW);
    TIFFSetField(tf.get(), TIFFTAG_TILELENGTH,      tileH);

    TIFFSetField(tf.get(), TIFFTAG_COMPRESSION,
                 opts.compression == TiffWriteOptions::Compression::DEFLATE ? COMPRESSION_ADOBE_DEFLATE
                                                                            : COMPRESSION_LZW);

    // Georeferencing
    const GeoTransform& t = raster.info.transform;
    if (t[2] == 0.0 && t[4] == 0.0) {
        double scale[3] = {t[1], -t[5], 0.0};
        double tie[6] = {0.0, 0.0, 0.0, t[0], t[3], 0.0};
        TIFFSetField(tf.get(), TAG_MODEL_PIXEL_SCALE, 3, scale);
        TIFFSetField(tf.get(), TAG_MODEL_TIEPOINT, 6, tie);
    } else {
        double matrix[16] = {t[1], t[2], 0.0, t[0],
                             t[4], t[5], 0.0, t[3],
                             0.0,  0.0,  0.0, 0.0,
                             0.0,  0.0,  0.0, 1.0};
        TIFFSetField(tf.get(), TAG_MODEL_TRANSFORMATION, 16, matrix);
    }

    const GeoKeys& keys = raster.info.geoKeys;
    if (!keys.empty()) {
        TIFFSetField(tf.get(), TAG_GEO_KEY_DIRECTORY, static_cast<int>(keys.directory.size()),
                     const_cast<uint16_t*>(keys.directory.data()));
        if (!keys.doubleParams.empty()) {
            TIFFSetField(tf.get(), TAG_GEO_DOUBLE_PARAMS, static_cast<int>(keys.doubleParams.size()),
                         const_cast<double*>(keys.doubleParams.data()));
        }
        if (!keys.asciiParams.empty()) {
            TIFFSetField(tf.get(), TAG_GEO_ASCII_PARAMS, keys.asciiParams.c_str());
        }
    }

    if (raster.info.nodata) {
        const std::string nodataText = formatNodata(*raster.info.nodata);
        TIFFSetField(tf.get(), TAG_GDAL_NODATA, nodataText.c_str());
    }

    const tmsize_t tileBytes = static_cast<tmsize_t>(tileW) *
                               static_cast<tmsize_t>(tileH) *
                               static_cast<tmsize_t>(elem);
    std::vector<uint8_t> tileBuf(static_cast<size_t>(tileBytes), 0);

    for (uint32_t y0 = 0; y0 < H; y0 += tileH) {
        const uint32_t dy = std::min(tileH, H - y0);
        for (uint32_t x0 = 0; x0 < W; x0 += tileW) {
            const uint32_t dx = std::min(tileW, W - x0);

            // Fill tile (pad with zeros)
            std::fill(tileBuf.begin(), tileBuf.end(), 0);
            for (uint32_t ty = 0; ty < dy; ++ty) {
                const uint8_t* src = img.ptr<uint8_t>(static_cast<int>(y0 + ty)) + x0 * elem;
                std::memcpy(tileBuf.data() + (static_cast<size_t>(ty) * tileW * elem),
                            src,
                            static_cast<size_t>(dx) * elem);
            }

            const ttile_t tileIndex = TIFFComputeTile(tf.get(), x0, y0, 0, 0);
            if (TIFFWriteEncodedTile(tf.get(), tileIndex, tileBuf.data(), tileBytes) < 0) {
                throw RasterIOError(withTiffError("TIFFWriteEncodedTile failed at tile (" +
                                                  std::to_string(x0) + "," + std::to_string(y0) +
                                                  ") in " + path.string()));
            }
        }
    }

    if (!TIFFWriteDirectory(tf.get())) {
        throw RasterIOError(withTiffError("TIFFWriteDirectory failed for " + path.string()));
    }
}

void translateRaster(const fs::path& src,
                     const fs::path& dst,
                     const GeoBounds& bounds,
                     const TiffWriteOptions& opts)
{
    Raster windowed = readRasterWindow(src, bounds);
    writeRaster(dst, windowed, opts);
    Logger()->debug("translated {} to {} ({}x{})", src, dst, windowed.info.width, windowed.info.height);
}

} // namespace fa
