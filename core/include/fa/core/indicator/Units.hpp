#pragma once

#include <string>

namespace fa {

// Display units for indicator values. Graphs divide raw tonnes of carbon by
// unitsDivisor(); map values are per-hectare densities for TcPerHa.
enum class Units { Blank, Tc, Ktc, Mtc, TcPerHa };

[[nodiscard]] std::string unitsLabel(Units units);
[[nodiscard]] double unitsDivisor(Units units);

// Accepts the enum name ("Tc", "TcPerHa") or the label ("tC/ha"), any case.
// Throws std::invalid_argument for unknown names.
Units unitsFromString(const std::string& name);

} // namespace fa
