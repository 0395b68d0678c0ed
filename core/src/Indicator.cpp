#include "fa/core/indicator/Indicator.hpp"

namespace fa {

Indicator::Indicator(std::string name,
                     std::string title,
                     Units graphUnits,
                     Units mapUnits,
                     std::string palette,
                     Color background)
    : name_(std::move(name)),
      title_(title.empty() ? name_ : std::move(title)),
      graphUnits_(graphUnits),
      mapUnits_(mapUnits),
      palette_(std::move(palette)),
      background_(background)
{
}

} // namespace fa
