#include "fa/core/indicator/CompositeIndicator.hpp"

#include "fa/core/render/ColormapColorizer.hpp"
#include "fa/core/util/Discovery.hpp"
#include "fa/core/util/Logging.hpp"

namespace fa {

CompositeIndicator::CompositeIndicator(std::string name,
                                       std::vector<BlendPattern> patterns,
                                       std::string title,
                                       Units graphUnits,
                                       Units mapUnits,
                                       std::string palette,
                                       Color background,
                                       std::shared_ptr<const LayerColorizer> colorizer)
    : Indicator(std::move(name), std::move(title), graphUnits, mapUnits, std::move(palette), background),
      patterns_(std::move(patterns)),
      colorizer_(std::move(colorizer))
{
    if (!colorizer_) {
        colorizer_ = std::make_shared<ColormapColorizer>();
    }
}

const SpatialResultsProvider& CompositeIndicator::init()
{
    std::lock_guard<std::mutex> lock(initMutex_);
    if (resultsProvider_) {
        return *resultsProvider_;
    }

    LayerCollection composite(palette(), backgroundColor());
    for (const auto& [pattern, mode] : patterns_) {
        const LayerCollection layers = findLayers(pattern, palette(), backgroundColor());
        Logger()->info("{}: {} {} layers from {}", name(), toString(mode), layers.size(), pattern);
        composite = composite.blend(layers, mode);
    }

    resultsProvider_.emplace(std::move(composite), mapUnits() == Units::TcPerHa);
    return *resultsProvider_;
}

const LayerCollection& CompositeIndicator::compositeLayers()
{
    return init().layers();
}

RenderResult CompositeIndicator::renderMapFrames(BoundingBox* boundingBox)
{
    const auto& provider = init();
    const auto [startYear, endYear] = provider.simulationYears();
    return provider.layers().render(*colorizer_, boundingBox, startYear, endYear);
}

std::vector<Frame> CompositeIndicator::renderGraphFrames(const GraphPlotter& plotter,
                                                         const GraphOptions& options)
{
    const auto& provider = init();
    return plotter.render(name(), title(), provider, graphUnits(), options);
}

} // namespace fa
