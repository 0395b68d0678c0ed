#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fa/core/indicator/Indicator.hpp"
#include "fa/core/indicator/ResultsProvider.hpp"
#include "fa/core/render/LayerColorizer.hpp"
#include "fa/core/types/BlendMode.hpp"
#include "fa/core/types/LayerCollection.hpp"

namespace fa {

// Glob pattern for one component's spatial output and how it joins the composite.
struct BlendPattern {
    std::string pattern;
    BlendMode mode{BlendMode::Add};
};

// Spatial-only indicator combining several outputs into one, e.g. the
// production and loss components of NBP. Components are discovered and folded
// together in pattern order the first time frames are requested.
class CompositeIndicator : public Indicator
{
public:
    CompositeIndicator(std::string name,
                       std::vector<BlendPattern> patterns,
                       std::string title = {},
                       Units graphUnits = Units::Tc,
                       Units mapUnits = Units::TcPerHa,
                       std::string palette = "Greens",
                       Color background = Color(255, 255, 255),
                       std::shared_ptr<const LayerColorizer> colorizer = nullptr);

    [[nodiscard]] const std::vector<BlendPattern>& patterns() const { return patterns_; }

    // Throws DiscoveryError if a pattern matches nothing and AlignmentError if
    // the components do not line up.
    RenderResult renderMapFrames(BoundingBox* boundingBox = nullptr) override;

    std::vector<Frame> renderGraphFrames(const GraphPlotter& plotter,
                                         const GraphOptions& options = {}) override;

    // The blended series, built on first call.
    const LayerCollection& compositeLayers();

private:
    const SpatialResultsProvider& init();

    std::vector<BlendPattern> patterns_;
    std::shared_ptr<const LayerColorizer> colorizer_;

    std::mutex initMutex_;
    std::optional<SpatialResultsProvider> resultsProvider_;
};

} // namespace fa
