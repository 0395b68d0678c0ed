#include "fa/core/types/LayerCollection.hpp"

#include "fa/core/render/LayerColorizer.hpp"
#include "fa/core/types/BoundingBox.hpp"
#include "fa/core/util/Errors.hpp"
#include "fa/core/util/Logging.hpp"
#include "fa/core/util/TempFile.hpp"

#include <algorithm>
#include <sstream>

namespace fa {

namespace {

std::string joinYears(const std::vector<int>& years)
{
    std::ostringstream oss;
    for (size_t i = 0; i < years.size(); ++i) {
        if (i != 0) oss << ", ";
        oss << years[i];
    }
    return oss.str();
}

RasterLayerPtr blendLayers(const RasterLayer& base, const RasterLayer& other, BlendFunction apply)
{
    Raster a = base.open();
    const Raster b = other.open();
    if (a.values.size() != b.values.size()) {
        throw AlignmentError("cannot blend " + other.path().string() + " (" +
                             std::to_string(b.values.cols) + "x" + std::to_string(b.values.rows) +
                             ") into " + base.path().string() + " (" +
                             std::to_string(a.values.cols) + "x" + std::to_string(a.values.rows) + ")");
    }

    const auto nodataA = a.info.nodata;
    const double outNodata = nodataA.value_or(kDefaultNodata);
    for (int y = 0; y < a.values.rows; ++y) {
        double* dst = a.values[y];
        const double* src = b.values[y];
        for (int x = 0; x < a.values.cols; ++x) {
            dst[x] = blendPixel(apply, dst[x], nodataA, src[x], b.info.nodata, outNodata);
        }
    }

    a.info.nodata = outNodata;
    a.info.depth = (a.info.depth == CV_64F || b.info.depth == CV_64F) ? CV_64F : CV_32F;

    const auto outputPath = TempFileManager::mktmp(".tif");
    writeRaster(outputPath, a, TiffWriteOptions::bigTiffDeflate());

    return std::make_shared<RasterLayer>(outputPath, base.year(), base.interpretation());
}

} // namespace

LayerCollection::LayerCollection(std::string palette, Color background)
    : palette_(std::move(palette)), background_(background)
{
}

LayerCollection::LayerCollection(std::vector<RasterLayerPtr> layers, std::string palette, Color background)
    : layers_(std::move(layers)), palette_(std::move(palette)), background_(background)
{
}

void LayerCollection::append(RasterLayerPtr layer)
{
    layers_.push_back(std::move(layer));
}

RasterLayerPtr LayerCollection::layer(int year) const
{
    auto it = std::find_if(layers_.begin(), layers_.end(), [year](const auto& l) {
        return l->year() == year;
    });
    return it == layers_.end() ? nullptr : *it;
}

std::vector<int> LayerCollection::years() const
{
    std::vector<int> result;
    for (const auto& l : layers_) {
        if (l->year()) result.push_back(*l->year());
    }
    return result;
}

LayerCollection LayerCollection::blend(const LayerCollection& other, BlendMode mode) const
{
    if (empty()) {
        Logger()->debug("blend into empty series, taking {} layers as the base", other.size());
        return LayerCollection(other.layers_, palette_, background_);
    }

    std::vector<int> unmatched;
    for (const auto& l : layers_) {
        if (!l->year() || !other.layer(*l->year())) unmatched.push_back(l->year().value_or(-1));
    }
    for (const auto& l : other.layers_) {
        if (!l->year() || !layer(*l->year())) unmatched.push_back(l->year().value_or(-1));
    }
    if (!unmatched.empty()) {
        std::sort(unmatched.begin(), unmatched.end());
        throw AlignmentError("cannot blend series with different years; unmatched: " + joinYears(unmatched));
    }

    const BlendFunction apply = blendFunction(mode);
    LayerCollection result(palette_, background_);
    for (const auto& l : layers_) {
        const auto otherLayer = other.layer(*l->year());
        result.append(blendLayers(*l, *otherLayer, apply));
        Logger()->debug("blended {} ({}) into year {}", otherLayer->path(), toString(mode), *l->year());
    }

    Logger()->info("blended {} years with mode {}", result.size(), toString(mode));
    return result;
}

RenderResult LayerCollection::render(const LayerColorizer& colorizer,
                                     BoundingBox* boundingBox,
                                     int startYear,
                                     int endYear) const
{
    std::vector<LayerSlot> slots;
    for (int year = startYear; year <= endYear; ++year) {
        RasterLayerPtr l = layer(year);
        if (!l) {
            Logger()->warn("no layer for year {}", year);
        } else if (boundingBox) {
            l = boundingBox->crop(*l);
        }
        slots.push_back({year, std::move(l)});
    }

    Logger()->info("rendering {} frames ({}-{})", slots.size(), startYear, endYear);
    return colorizer.colorize(slots, palette_, background_);
}

} // namespace fa
