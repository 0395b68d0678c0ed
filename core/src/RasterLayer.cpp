#include "fa/core/types/RasterLayer.hpp"

namespace fa {

RasterLayer::RasterLayer(std::filesystem::path path,
                         std::optional<int> year,
                         Interpretation interpretation)
    : path_(std::move(path)), year_(year), interpretation_(std::move(interpretation))
{
}

std::filesystem::path RasterLayer::path() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

void RasterLayer::setPath(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = std::move(path);
}

std::optional<double> RasterLayer::nodataValue() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!nodataRead_) {
        nodata_ = readRasterInfo(path_).nodata;
        nodataRead_ = true;
    }
    return nodata_;
}

Raster RasterLayer::open() const
{
    return readRaster(path());
}

RasterInfo RasterLayer::info() const
{
    return readRasterInfo(path());
}

} // namespace fa
