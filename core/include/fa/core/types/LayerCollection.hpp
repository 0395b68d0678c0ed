#pragma once

#include <string>
#include <vector>

#include "fa/core/render/Frame.hpp"
#include "fa/core/types/BlendMode.hpp"
#include "fa/core/types/RasterLayer.hpp"

namespace fa {

class BoundingBox;
class LayerColorizer;

// Ordered series of layers, one per year, plus the styling used to render it.
class LayerCollection
{
public:
    explicit LayerCollection(std::string palette = "Greens",
                             Color background = Color(255, 255, 255));
    LayerCollection(std::vector<RasterLayerPtr> layers,
                    std::string palette = "Greens",
                    Color background = Color(255, 255, 255));

    void append(RasterLayerPtr layer);

    [[nodiscard]] const std::vector<RasterLayerPtr>& layers() const { return layers_; }
    [[nodiscard]] RasterLayerPtr layer(int year) const;
    [[nodiscard]] std::vector<int> years() const;
    [[nodiscard]] size_t size() const { return layers_.size(); }
    [[nodiscard]] bool empty() const { return layers_.empty(); }
    explicit operator bool() const { return !layers_.empty(); }

    [[nodiscard]] const std::string& palette() const { return palette_; }
    [[nodiscard]] const Color& backgroundColor() const { return background_; }

    // Combines this series with `other` year by year into new rasters. An empty
    // series blends to a copy of `other`. Throws AlignmentError when the year
    // sets differ or same-year rasters differ in size.
    [[nodiscard]] LayerCollection blend(const LayerCollection& other, BlendMode mode) const;

    // Frames for every year in [startYear, endYear] in ascending order, each
    // layer cropped to boundingBox when one is given.
    RenderResult render(const LayerColorizer& colorizer,
                        BoundingBox* boundingBox,
                        int startYear,
                        int endYear) const;

private:
    std::vector<RasterLayerPtr> layers_;
    std::string palette_;
    Color background_;
};

} // namespace fa
