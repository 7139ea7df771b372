#pragma once

#include "plant.hpp"

namespace draw {
class Surface;
}

namespace plant {

// Every function expects the surface already flipped so that +y points up, origin at the trunk base.
void draw_tree(const Plant& plant, const TreeTraits& tree, draw::Surface& surface, double width, double height);
void draw_orange_tree(const Plant& plant, const OrangeTreeTraits& orange, draw::Surface& surface, double width, double height);
void draw_green_tree(const Plant& plant, const GreenTreeTraits& green, draw::Surface& surface, double width, double height);
void draw_double_green_tree(const Plant& plant, const DoubleGreenTreeTraits& green, draw::Surface& surface, double width, double height);

} // namespace plant
