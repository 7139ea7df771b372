#pragma once

#include "plant.hpp"

#include <string_view>

namespace draw {
class Surface;
}

namespace plant {

// Paints the plant at its current age onto a width x height canvas, growing up from the bottom center.
// The plant is sized for the smaller of the two dimensions. Surface state is left as it was found.
void draw_plant(const Plant& plant, draw::Surface& surface, double width, double height);

bool export_svg(const Plant& plant, std::string_view file, double width, double height);

} // namespace plant
