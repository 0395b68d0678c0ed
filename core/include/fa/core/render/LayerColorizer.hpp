#pragma once

#include <string>
#include <vector>

#include "fa/core/render/Frame.hpp"

namespace fa {

// Turns a year-ordered series of layers into frames plus one legend. The color
// scale must be computed over the whole series so frames stay comparable.
class LayerColorizer
{
public:
    virtual ~LayerColorizer() = default;

    virtual RenderResult colorize(const std::vector<LayerSlot>& slots,
                                  const std::string& palette,
                                  const Color& background) const = 0;
};

} // namespace fa
