#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fa/core/indicator/Units.hpp"
#include "fa/core/render/Frame.hpp"

namespace fa {

class ResultsProvider;

struct GraphOptions {
    std::optional<int> startYear;
    std::optional<int> endYear;
};

// Renders the time series behind an indicator as one graph frame per year.
class GraphPlotter
{
public:
    virtual ~GraphPlotter() = default;

    virtual std::vector<Frame> render(const std::string& indicator,
                                      const std::string& title,
                                      const ResultsProvider& provider,
                                      Units units,
                                      const GraphOptions& options) const = 0;
};

} // namespace fa
