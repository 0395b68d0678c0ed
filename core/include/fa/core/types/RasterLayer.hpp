#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "fa/core/util/GeoTiff.hpp"

namespace fa {

// One raster file on disk, usually one year of model output.
class RasterLayer
{
public:
    // Pixel value -> class label for classified layers; empty for absolute values.
    using Interpretation = std::map<int, std::string>;

    explicit RasterLayer(std::filesystem::path path,
                         std::optional<int> year = std::nullopt,
                         Interpretation interpretation = {});
    virtual ~RasterLayer() = default;

    RasterLayer(const RasterLayer&) = delete;
    RasterLayer& operator=(const RasterLayer&) = delete;

    [[nodiscard]] std::filesystem::path path() const;
    [[nodiscard]] std::optional<int> year() const { return year_; }
    [[nodiscard]] const Interpretation& interpretation() const { return interpretation_; }
    [[nodiscard]] bool isClassified() const { return !interpretation_.empty(); }

    // Read from the file on first use and cached; empty if the file declares none.
    [[nodiscard]] std::optional<double> nodataValue() const;

    // Full read of the backing file. Throws RasterIOError.
    [[nodiscard]] Raster open() const;
    [[nodiscard]] RasterInfo info() const;

protected:
    void setPath(std::filesystem::path path);

private:
    mutable std::mutex mutex_;
    std::filesystem::path path_;
    std::optional<int> year_;
    Interpretation interpretation_;

    mutable bool nodataRead_{false};
    mutable std::optional<double> nodata_;
};

using RasterLayerPtr = std::shared_ptr<RasterLayer>;

} // namespace fa
