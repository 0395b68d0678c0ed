#include "fa/core/indicator/ResultsProvider.hpp"

#include "fa/core/util/Logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fa {

namespace {

constexpr double kSquareMetresPerHectare = 10000.0;

double layerTotal(const RasterLayer& layer, bool perHectare)
{
    const Raster r = layer.open();
    double total = 0.0;
    for (int y = 0; y < r.values.rows; ++y) {
        const double* row = r.values[y];
        for (int x = 0; x < r.values.cols; ++x) {
            if (isNodata(row[x], r.info.nodata) || !std::isfinite(row[x])) continue;
            total += row[x];
        }
    }

    if (perHectare) {
        const auto& gt = r.info.transform;
        total *= std::abs(gt[1] * gt[5]) / kSquareMetresPerHectare;
    }
    return total;
}

} // namespace

SpatialResultsProvider::SpatialResultsProvider(LayerCollection layers, bool perHectare)
    : layers_(std::move(layers)), perHectare_(perHectare)
{
}

std::pair<int, int> SpatialResultsProvider::simulationYears() const
{
    const auto years = layers_.years();
    if (years.empty()) {
        throw std::runtime_error("no dated layers to take simulation years from");
    }
    const auto [first, last] = std::minmax_element(years.begin(), years.end());
    return {*first, *last};
}

std::map<int, double> SpatialResultsProvider::annualResults(Units units,
                                                            std::optional<int> startYear,
                                                            std::optional<int> endYear) const
{
    const double divisor = unitsDivisor(units);
    std::map<int, double> results;
    for (const auto& layer : layers_.layers()) {
        if (!layer->year()) continue;
        const int year = *layer->year();
        if ((startYear && year < *startYear) || (endYear && year > *endYear)) continue;
        results[year] = layerTotal(*layer, perHectare_) / divisor;
    }

    Logger()->debug("summed {} annual results", results.size());
    return results;
}

} // namespace fa
