#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fa {

// Pixel-wise rule for combining two aligned rasters of the same year.
enum class BlendMode { Add, Subtract };

using BlendFunction = double (*)(double a, double b);

struct BlendModeSpec {
    BlendMode mode;
    const char* id;
    BlendFunction apply;
};

const std::vector<BlendModeSpec>& blendModeSpecs();

BlendFunction blendFunction(BlendMode mode);

std::string toString(BlendMode mode);

// Case-insensitive; throws std::invalid_argument for unknown names.
BlendMode blendModeFromString(const std::string& name);

// Nodata on either side counts as 0; when both sides are nodata the result is outNodata.
double blendPixel(BlendFunction apply,
                  double a, const std::optional<double>& nodataA,
                  double b, const std::optional<double>& nodataB,
                  double outNodata);

double blendPixel(BlendMode mode,
                  double a, const std::optional<double>& nodataA,
                  double b, const std::optional<double>& nodataB,
                  double outNodata);

} // namespace fa
