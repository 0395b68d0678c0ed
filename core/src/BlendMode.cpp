#include "fa/core/types/BlendMode.hpp"

#include "fa/core/util/GeoTiff.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fa {

namespace {

double add(double a, double b) { return a + b; }
double subtract(double a, double b) { return a - b; }

const BlendModeSpec& specFor(BlendMode mode)
{
    const auto& specs = blendModeSpecs();
    auto it = std::find_if(specs.begin(), specs.end(), [mode](const auto& spec) {
        return spec.mode == mode;
    });
    if (it == specs.end()) {
        throw std::invalid_argument("unregistered blend mode " + std::to_string(static_cast<int>(mode)));
    }
    return *it;
}

} // namespace

const std::vector<BlendModeSpec>& blendModeSpecs()
{
    static const std::vector<BlendModeSpec> specs = {
        {BlendMode::Add, "add", &add},
        {BlendMode::Subtract, "subtract", &subtract},
    };
    return specs;
}

BlendFunction blendFunction(BlendMode mode)
{
    return specFor(mode).apply;
}

std::string toString(BlendMode mode)
{
    return specFor(mode).id;
}

BlendMode blendModeFromString(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& spec : blendModeSpecs()) {
        if (lower == spec.id) return spec.mode;
    }
    throw std::invalid_argument("unknown blend mode '" + name + "'");
}

double blendPixel(BlendFunction apply,
                  double a, const std::optional<double>& nodataA,
                  double b, const std::optional<double>& nodataB,
                  double outNodata)
{
    const bool aMissing = isNodata(a, nodataA);
    const bool bMissing = isNodata(b, nodataB);
    if (aMissing && bMissing) {
        return outNodata;
    }
    return apply(aMissing ? 0.0 : a, bMissing ? 0.0 : b);
}

double blendPixel(BlendMode mode,
                  double a, const std::optional<double>& nodataA,
                  double b, const std::optional<double>& nodataB,
                  double outNodata)
{
    return blendPixel(blendFunction(mode), a, nodataA, b, nodataB, outNodata);
}

} // namespace fa
