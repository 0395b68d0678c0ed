#pragma once

#include <string>
#include <vector>

#include "fa/core/indicator/Units.hpp"
#include "fa/core/render/Frame.hpp"
#include "fa/core/render/GraphPlotter.hpp"

namespace fa {

class BoundingBox;

// A named model output that can be animated as maps and as a graph.
class Indicator
{
public:
    Indicator(std::string name,
              std::string title = {},
              Units graphUnits = Units::Tc,
              Units mapUnits = Units::TcPerHa,
              std::string palette = "Greens",
              Color background = Color(255, 255, 255));
    virtual ~Indicator() = default;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] Units graphUnits() const { return graphUnits_; }
    [[nodiscard]] Units mapUnits() const { return mapUnits_; }
    [[nodiscard]] const std::string& palette() const { return palette_; }
    [[nodiscard]] const Color& backgroundColor() const { return background_; }

    // One colorized frame per simulation year plus the legend for the series,
    // cropped to boundingBox when given.
    virtual RenderResult renderMapFrames(BoundingBox* boundingBox = nullptr) = 0;

    virtual std::vector<Frame> renderGraphFrames(const GraphPlotter& plotter,
                                                 const GraphOptions& options = {}) = 0;

private:
    std::string name_;
    std::string title_;
    Units graphUnits_;
    Units mapUnits_;
    std::string palette_;
    Color background_;
};

} // namespace fa
