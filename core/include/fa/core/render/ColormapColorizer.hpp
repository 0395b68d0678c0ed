#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

#include "fa/core/render/LayerColorizer.hpp"

namespace fa {

struct ColormapSpec
{
    std::string id;
    int opencvCode;
};

const std::vector<ColormapSpec>& colormapSpecs();

// Case-insensitive lookup; unknown ids resolve to the first spec.
const ColormapSpec& resolveColormap(const std::string& id);

// 256 colors (R, G, B) sampled from the colormap, index 0 = lowest value.
std::vector<Color> colormapColors(const ColormapSpec& spec);

// Colors layers with an OpenCV colormap and writes one PNG per year.
// Absolute layers are binned into `bins` equal ranges over the value range of
// the whole series; classified layers get one entry per class. Nodata pixels
// and years without a layer are painted with the background color.
class ColormapColorizer : public LayerColorizer
{
public:
    explicit ColormapColorizer(int bins = 8);

    RenderResult colorize(const std::vector<LayerSlot>& slots,
                          const std::string& palette,
                          const Color& background) const override;

private:
    int bins_;
};

} // namespace fa
