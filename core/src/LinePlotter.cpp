#include "fa/core/render/LinePlotter.hpp"

#include "fa/core/indicator/ResultsProvider.hpp"
#include "fa/core/util/Logging.hpp"
#include "fa/core/util/TempFile.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fa {

namespace {

const cv::Scalar kAxisColor(0, 0, 0);
const cv::Scalar kSeriesColor(180, 180, 180);
const cv::Scalar kHighlightColor(60, 140, 30);
constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
constexpr int kMargin = 50;

std::string formatValue(double v)
{
    std::ostringstream oss;
    oss << std::setprecision(4) << v;
    return oss.str();
}

} // namespace

LinePlotter::LinePlotter(cv::Size size) : size_(size)
{
    if (size_.width <= 2 * kMargin || size_.height <= 2 * kMargin) {
        throw std::invalid_argument("graph size too small");
    }
}

std::vector<Frame> LinePlotter::render(const std::string& indicator,
                                       const std::string& title,
                                       const ResultsProvider& provider,
                                       Units units,
                                       const GraphOptions& options) const
{
    const auto [firstYear, lastYear] = provider.simulationYears();
    const int startYear = options.startYear.value_or(firstYear);
    const int endYear = options.endYear.value_or(lastYear);
    const auto results = provider.annualResults(units, startYear, endYear);

    std::vector<Frame> frames;
    if (results.empty()) {
        Logger()->warn("no results for {} in {}-{}", indicator, startYear, endYear);
        return frames;
    }

    double minValue = 0.0;
    double maxValue = 0.0;
    for (const auto& [year, value] : results) {
        minValue = std::min(minValue, value);
        maxValue = std::max(maxValue, value);
    }
    if (maxValue == minValue) {
        maxValue = minValue + 1.0;
    }

    const int plotW = size_.width - 2 * kMargin;
    const int plotH = size_.height - 2 * kMargin;
    const int yearSpan = std::max(1, endYear - startYear);
    auto toPixel = [&](int year, double value) {
        const int px = kMargin + (year - startYear) * plotW / yearSpan;
        const int py = kMargin + static_cast<int>((maxValue - value) / (maxValue - minValue) * plotH);
        return cv::Point(px, py);
    };

    std::vector<cv::Point> series;
    for (const auto& [year, value] : results) {
        series.push_back(toPixel(year, value));
    }

    const std::string unitsText = unitsLabel(units);
    const std::string heading = unitsText.empty() ? title : title + " (" + unitsText + ")";

    cv::Mat base(size_, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::putText(base, heading, cv::Point(kMargin, kMargin / 2), kFont, 0.6, kAxisColor, 1);
    cv::line(base, cv::Point(kMargin, kMargin), cv::Point(kMargin, kMargin + plotH), kAxisColor, 1);
    const cv::Point zero = toPixel(startYear, 0.0);
    cv::line(base, zero, cv::Point(kMargin + plotW, zero.y), kAxisColor, 1);
    cv::putText(base, formatValue(maxValue), cv::Point(2, kMargin + 4), kFont, 0.35, kAxisColor, 1);
    cv::putText(base, formatValue(minValue), cv::Point(2, kMargin + plotH + 4), kFont, 0.35, kAxisColor, 1);
    cv::putText(base, std::to_string(startYear), cv::Point(kMargin - 15, size_.height - kMargin / 3),
                kFont, 0.4, kAxisColor, 1);
    cv::putText(base, std::to_string(endYear), cv::Point(kMargin + plotW - 15, size_.height - kMargin / 3),
                kFont, 0.4, kAxisColor, 1);
    cv::polylines(base, series, false, kSeriesColor, 1, cv::LINE_AA);

    size_t i = 0;
    for (const auto& [year, value] : results) {
        cv::Mat img = base.clone();
        std::vector<cv::Point> done(series.begin(), series.begin() + i + 1);
        cv::polylines(img, done, false, kHighlightColor, 2, cv::LINE_AA);
        cv::circle(img, series[i], 4, kHighlightColor, -1);
        cv::putText(img, std::to_string(year) + ": " + formatValue(value),
                    series[i] + cv::Point(6, -6), kFont, 0.4, kAxisColor, 1);

        const auto framePath = TempFileManager::mktmp(".png");
        if (!cv::imwrite(framePath.string(), img)) {
            throw std::runtime_error("failed to write graph frame " + framePath.string());
        }
        frames.push_back({year, framePath, img.size()});
        ++i;
    }

    Logger()->info("plotted {} graph frames for {}", frames.size(), indicator);
    return frames;
}

} // namespace fa
