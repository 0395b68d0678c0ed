#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "fa/core/types/RasterLayer.hpp"

namespace fa {

using Color = cv::Vec3b;  // R, G, B

// One rendered image of an animation.
struct Frame {
    int year{0};
    std::filesystem::path path;
    cv::Size size;
};

struct LegendEntry {
    std::string label;
    double minValue{0};
    double maxValue{0};
    Color color;
};

using Legend = std::vector<LegendEntry>;

struct RenderResult {
    std::vector<Frame> frames;
    Legend legend;
};

// Input to colorization: the (possibly cropped) layer for a year, or null when
// the series has no layer for that year.
struct LayerSlot {
    int year{0};
    RasterLayerPtr layer;
};

} // namespace fa
