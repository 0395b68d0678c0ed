#include "fa/core/render/ColormapColorizer.hpp"

#include "fa/core/util/Logging.hpp"
#include "fa/core/util/TempFile.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace fa {

namespace
{
std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

cv::Vec3b toBgr(const Color& rgb)
{
    return {rgb[2], rgb[1], rgb[0]};
}

std::string rangeLabel(double lo, double hi)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << lo << " - " << hi;
    return oss.str();
}

struct ValueRange {
    double min = std::numeric_limits<double>::max();
    double max = std::numeric_limits<double>::lowest();

    [[nodiscard]] bool valid() const { return min <= max; }
};
} // namespace

const std::vector<ColormapSpec>& colormapSpecs()
{
    static const std::vector<ColormapSpec> specs = {
        {"viridis", cv::COLORMAP_VIRIDIS},
        {"greens", cv::COLORMAP_SUMMER},
        {"magma", cv::COLORMAP_MAGMA},
        {"inferno", cv::COLORMAP_INFERNO},
        {"plasma", cv::COLORMAP_PLASMA},
        {"hot", cv::COLORMAP_HOT},
        {"jet", cv::COLORMAP_JET},
        {"summer", cv::COLORMAP_SUMMER},
        {"ocean", cv::COLORMAP_OCEAN},
        {"bone", cv::COLORMAP_BONE}
    };
    return specs;
}

const ColormapSpec& resolveColormap(const std::string& id)
{
    const auto& allSpecs = colormapSpecs();
    const std::string key = toLower(id);
    auto it = std::find_if(allSpecs.begin(), allSpecs.end(), [&key](const auto& spec) {
        return spec.id == key;
    });
    if (it != allSpecs.end()) {
        return *it;
    }
    Logger()->warn("unknown palette '{}', using {}", id, allSpecs.front().id);
    return allSpecs.front();
}

std::vector<Color> colormapColors(const ColormapSpec& spec)
{
    cv::Mat_<uint8_t> ramp(256, 1);
    for (int i = 0; i < 256; ++i) {
        ramp(i, 0) = static_cast<uint8_t>(i);
    }

    cv::Mat colored;
    cv::applyColorMap(ramp, colored, spec.opencvCode);

    std::vector<Color> colors(256);
    for (int i = 0; i < 256; ++i) {
        const auto& bgr = colored.at<cv::Vec3b>(i, 0);
        colors[i] = Color(bgr[2], bgr[1], bgr[0]);
    }
    return colors;
}

ColormapColorizer::ColormapColorizer(int bins) : bins_(bins)
{
    if (bins_ < 1) {
        throw std::invalid_argument("colorizer needs at least one bin");
    }
}

RenderResult ColormapColorizer::colorize(const std::vector<LayerSlot>& slots,
                                         const std::string& palette,
                                         const Color& background) const
{
    std::vector<std::optional<Raster>> rasters(slots.size());
    bool classified = false;
    RasterLayer::Interpretation classes;
    std::optional<cv::Size> referenceSize;
    ValueRange range;

    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].layer) continue;

        rasters[i] = slots[i].layer->open();
        const Raster& r = *rasters[i];
        if (!referenceSize) referenceSize = r.values.size();
        if (slots[i].layer->isClassified()) {
            classified = true;
            classes.insert(slots[i].layer->interpretation().begin(),
                           slots[i].layer->interpretation().end());
        }

        for (int y = 0; y < r.values.rows; ++y) {
            const double* row = r.values[y];
            for (int x = 0; x < r.values.cols; ++x) {
                if (isNodata(row[x], r.info.nodata) || !std::isfinite(row[x])) continue;
                range.min = std::min(range.min, row[x]);
                range.max = std::max(range.max, row[x]);
            }
        }
    }

    const auto colors = colormapColors(resolveColormap(palette));
    RenderResult result;

    // Legend
    std::map<int, Color> classColors;
    double step = 0.0;
    int bins = bins_;
    if (classified) {
        const size_t n = classes.size();
        size_t i = 0;
        for (const auto& [value, label] : classes) {
            const size_t index = n == 1 ? 255 : i * 255 / (n - 1);
            classColors[value] = colors[index];
            result.legend.push_back({label, double(value), double(value), colors[index]});
            ++i;
        }
    } else if (range.valid()) {
        if (range.min == range.max) {
            bins = 1;
        }
        step = (range.max - range.min) / bins;
        for (int i = 0; i < bins; ++i) {
            const double lo = range.min + i * step;
            const double hi = (i == bins - 1) ? range.max : lo + step;
            const Color& c = colors[static_cast<size_t>((i + 0.5) * 255.0 / bins)];
            result.legend.push_back({rangeLabel(lo, hi), lo, hi, c});
        }
    } else {
        Logger()->warn("no data pixels in any of {} layers", slots.size());
    }

    // Frames
    const cv::Vec3b backgroundBgr = toBgr(background);
    for (size_t i = 0; i < slots.size(); ++i) {
        cv::Mat_<cv::Vec3b> img;
        if (!rasters[i]) {
            img = cv::Mat_<cv::Vec3b>(referenceSize.value_or(cv::Size(1, 1)), backgroundBgr);
        } else {
            const Raster& r = *rasters[i];
            img = cv::Mat_<cv::Vec3b>(r.values.size(), backgroundBgr);
            for (int y = 0; y < r.values.rows; ++y) {
                const double* row = r.values[y];
                for (int x = 0; x < r.values.cols; ++x) {
                    const double v = row[x];
                    if (isNodata(v, r.info.nodata) || !std::isfinite(v)) continue;

                    if (classified) {
                        auto it = classColors.find(static_cast<int>(std::lround(v)));
                        if (it != classColors.end()) img(y, x) = toBgr(it->second);
                    } else if (!result.legend.empty()) {
                        int bin = step > 0.0 ? static_cast<int>(std::floor((v - range.min) / step)) : 0;
                        bin = std::clamp(bin, 0, bins - 1);
                        img(y, x) = toBgr(result.legend[bin].color);
                    }
                }
            }
        }

        const auto framePath = TempFileManager::mktmp(".png");
        if (!cv::imwrite(framePath.string(), img)) {
            throw std::runtime_error("failed to write frame " + framePath.string());
        }
        result.frames.push_back({slots[i].year, framePath, img.size()});
    }

    return result;
}

} // namespace fa
