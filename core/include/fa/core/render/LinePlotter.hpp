#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "fa/core/render/GraphPlotter.hpp"

namespace fa {

// Draws the annual totals as a line graph with OpenCV, one PNG per year with
// the series up to that year highlighted and a marker on the current year.
class LinePlotter : public GraphPlotter
{
public:
    explicit LinePlotter(cv::Size size = cv::Size(640, 360));

    std::vector<Frame> render(const std::string& indicator,
                              const std::string& title,
                              const ResultsProvider& provider,
                              Units units,
                              const GraphOptions& options) const override;

private:
    cv::Size size_;
};

} // namespace fa
