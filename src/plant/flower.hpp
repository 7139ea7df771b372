#pragma once

#include "draw/path.hpp"
#include "plant.hpp"

namespace draw {
class Surface;
}

namespace plant {

// Closed petal outlines anchored at the flower center, sized by the petal size.
draw::Path triangle_petal(double size);
draw::Path circular_petal(double size);
draw::Path round_petal(double size);
draw::Path dip_petal(double size);
draw::Path petal_path(PetalShape shape, double size);

// Returns the top of the stem, where the flower head sits.
glm::dvec2 draw_flower(const Plant& plant, const FlowerTraits& flower, draw::Surface& surface, double width, double height);
void draw_circular_flower(const Plant& plant, const CircularFlowerTraits& circular, draw::Surface& surface, double width, double height);

} // namespace plant
