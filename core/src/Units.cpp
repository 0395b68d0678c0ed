#include "fa/core/indicator/Units.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace fa {

namespace {

struct UnitsSpec {
    Units units;
    const char* id;
    const char* label;
    double divisor;
};

constexpr std::array<UnitsSpec, 5> kUnits = {{
    {Units::Blank, "blank", "", 1.0},
    {Units::Tc, "tc", "tC", 1.0},
    {Units::Ktc, "ktc", "KtC", 1e3},
    {Units::Mtc, "mtc", "MtC", 1e6},
    {Units::TcPerHa, "tcperha", "tC/ha", 1.0},
}};

const UnitsSpec& specFor(Units units)
{
    for (const auto& spec : kUnits) {
        if (spec.units == units) return spec;
    }
    throw std::invalid_argument("unhandled units value");
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string unitsLabel(Units units)
{
    return specFor(units).label;
}

double unitsDivisor(Units units)
{
    return specFor(units).divisor;
}

Units unitsFromString(const std::string& name)
{
    const std::string key = toLower(name);
    for (const auto& spec : kUnits) {
        if (key == spec.id || key == toLower(spec.label)) return spec.units;
    }
    throw std::invalid_argument("unknown units: " + name);
}

} // namespace fa
