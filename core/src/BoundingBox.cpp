#include "fa/core/types/BoundingBox.hpp"

#include "fa/core/util/Errors.hpp"
#include "fa/core/util/Logging.hpp"
#include "fa/core/util/TempFile.hpp"

#include <algorithm>

namespace fa {

BoundingBox::BoundingBox(std::filesystem::path path) : RasterLayer(std::move(path), 0)
{
}

BoundingBox::State BoundingBox::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

PixelBounds BoundingBox::minPixelBounds()
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    computeBoundsLocked();
    return *pixelBounds_;
}

GeoBounds BoundingBox::minGeographicBounds()
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    computeBoundsLocked();
    return *geoBounds_;
}

void BoundingBox::computeBoundsLocked()
{
    if (state_ != State::Uninitialized) {
        return;
    }

    const Raster raster = open();
    const auto& nodata = raster.info.nodata;

    int xMin = raster.values.cols;
    int xMax = 0;
    int yMin = -1;
    int yMax = -1;
    for (int y = 0; y < raster.values.rows; ++y) {
        const double* row = raster.values[y];
        int first = -1;
        int last = -1;
        for (int x = 0; x < raster.values.cols; ++x) {
            if (isNodata(row[x], nodata)) continue;
            if (first < 0) first = x;
            last = x;
        }
        if (first < 0) continue;

        if (yMin < 0) yMin = y;
        yMax = y;
        xMin = std::min(xMin, first);
        xMax = std::max(xMax, last);
    }

    if (yMin < 0) {
        throw AlignmentError("bounding box " + path().string() + " contains only nodata pixels");
    }

    pixelBounds_ = PixelBounds{xMin - 1, xMax + 1, yMin - 1, yMax + 1};

    const GeoTransform& t = raster.info.transform;
    geoBounds_ = GeoBounds{t[0] + pixelBounds_->xMin * t[1],
                           t[3] + pixelBounds_->yMin * t[5],
                           t[0] + pixelBounds_->xMax * t[1],
                           t[3] + pixelBounds_->yMax * t[5]};

    Logger()->debug("bounding box {} pixel bounds [{}, {}, {}, {}]", path(),
                    pixelBounds_->xMin, pixelBounds_->xMax, pixelBounds_->yMin, pixelBounds_->yMax);
    state_ = State::BoundsComputed;
}

void BoundingBox::selfCropLocked()
{
    if (state_ == State::SelfCropped) {
        return;
    }

    const auto croppedPath = TempFileManager::mktmp(".tif");
    translateRaster(path(), croppedPath, *geoBounds_);
    setPath(croppedPath);

    const Raster cropped = open();
    dataMask_.create(cropped.values.rows, cropped.values.cols);
    for (int y = 0; y < cropped.values.rows; ++y) {
        for (int x = 0; x < cropped.values.cols; ++x) {
            dataMask_(y, x) = isNodata(cropped.values(y, x), cropped.info.nodata) ? 0 : 1;
        }
    }

    Logger()->info("cropped bounding box to {}x{} pixels", cropped.values.cols, cropped.values.rows);
    state_ = State::SelfCropped;
}

RasterLayerPtr BoundingBox::crop(const RasterLayer& layer)
{
    GeoBounds bounds;
    cv::Mat_<uint8_t> mask;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        computeBoundsLocked();
        selfCropLocked();
        bounds = *geoBounds_;
        mask = dataMask_;
    }

    const auto layerPath = layer.path();
    Raster windowed = readRasterWindow(layerPath, bounds);
    if (windowed.values.size() != mask.size()) {
        throw AlignmentError("cropped " + layerPath.string() + " is " +
                             std::to_string(windowed.values.cols) + "x" + std::to_string(windowed.values.rows) +
                             " but the bounding box is " +
                             std::to_string(mask.cols) + "x" + std::to_string(mask.rows));
    }

    const auto layerNodata = layer.nodataValue();
    const double fill = layerNodata.value_or(kDefaultNodata);
    if (!layerNodata && windowed.info.depth != CV_32F && windowed.info.depth != CV_64F) {
        windowed.info.depth = CV_32F;
    }

    for (int y = 0; y < windowed.values.rows; ++y) {
        double* row = windowed.values[y];
        const uint8_t* m = mask[y];
        for (int x = 0; x < windowed.values.cols; ++x) {
            if (!m[x]) row[x] = fill;
        }
    }
    windowed.info.nodata = fill;

    const auto outputPath = TempFileManager::mktmp(".tif");
    writeRaster(outputPath, windowed, TiffWriteOptions::bigTiffDeflate());
    Logger()->debug("cropped {} to {}", layerPath, outputPath);

    return std::make_shared<RasterLayer>(outputPath, layer.year(), layer.interpretation());
}

} // namespace fa
