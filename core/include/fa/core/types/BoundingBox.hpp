#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include <opencv2/core.hpp>

#include "fa/core/types/RasterLayer.hpp"
#include "fa/core/util/GeoTiff.hpp"

namespace fa {

// A layer whose data pixels define the area of interest: other layers are
// cropped to its minimum extent and masked with its nodata pixels.
//
// Uninitialized -> BoundsComputed on the first bounds query,
// BoundsComputed -> SelfCropped on the first crop(), when the box's own raster
// is rewritten to its minimum extent and the backing path switches to the
// cropped copy. Both transitions happen once.
class BoundingBox : public RasterLayer
{
public:
    enum class State { Uninitialized, BoundsComputed, SelfCropped };

    explicit BoundingBox(std::filesystem::path path);

    // Smallest box around the non-nodata pixels, widened by one pixel on each
    // side. Throws AlignmentError if the raster has no data pixels.
    [[nodiscard]] PixelBounds minPixelBounds();

    // minPixelBounds() through the raster's geotransform.
    [[nodiscard]] GeoBounds minGeographicBounds();

    // New layer holding `layer` windowed to minGeographicBounds(), with every
    // pixel that is nodata in this box set to the layer's own nodata.
    [[nodiscard]] RasterLayerPtr crop(const RasterLayer& layer);

    [[nodiscard]] State state() const;

private:
    void computeBoundsLocked();
    void selfCropLocked();

    mutable std::mutex stateMutex_;
    State state_{State::Uninitialized};
    std::optional<PixelBounds> pixelBounds_;
    std::optional<GeoBounds> geoBounds_;
    cv::Mat_<uint8_t> dataMask_;  // 1 where the self-cropped box has data
};

} // namespace fa
