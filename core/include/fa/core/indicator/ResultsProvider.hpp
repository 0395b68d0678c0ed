#pragma once

#include <map>
#include <optional>
#include <utility>

#include "fa/core/indicator/Units.hpp"
#include "fa/core/types/LayerCollection.hpp"

namespace fa {

// Source of indicator values for graphs and of the year range to animate.
class ResultsProvider
{
public:
    virtual ~ResultsProvider() = default;

    // (first year, last year), inclusive.
    [[nodiscard]] virtual std::pair<int, int> simulationYears() const = 0;

    // Indicator total per year in `units`, limited to [startYear, endYear]
    // where given.
    [[nodiscard]] virtual std::map<int, double> annualResults(
        Units units,
        std::optional<int> startYear = std::nullopt,
        std::optional<int> endYear = std::nullopt) const = 0;
};

// Results read straight from a series of spatial output layers.
class SpatialResultsProvider : public ResultsProvider
{
public:
    SpatialResultsProvider(LayerCollection layers, bool perHectare);

    [[nodiscard]] const LayerCollection& layers() const { return layers_; }
    [[nodiscard]] bool perHectare() const { return perHectare_; }

    // Throws std::runtime_error if no layer carries a year.
    [[nodiscard]] std::pair<int, int> simulationYears() const override;

    // Sum of the data pixels of each layer. Per-hectare layers are scaled by
    // the pixel area (map units assumed to be metres) before summing.
    [[nodiscard]] std::map<int, double> annualResults(
        Units units,
        std::optional<int> startYear = std::nullopt,
        std::optional<int> endYear = std::nullopt) const override;

private:
    LayerCollection layers_;
    bool perHectare_;
};

} // namespace fa
