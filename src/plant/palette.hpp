#pragma once

#include "draw/color.hpp"

#include <array>

namespace plant::palette {

static constexpr inline draw::Color BLACK{0, 0, 0};
static constexpr inline draw::Color GREEN{0, 119, 0};
static constexpr inline draw::Color WHITE{255, 255, 255};
static constexpr inline draw::Color BROWN{77, 51, 0};
static constexpr inline draw::Color ORANGE{243, 148, 30};

// petal colors, same as the ones in the logo
static constexpr inline std::array<draw::Color, 5> PETALS = {
    draw::Color{139, 139, 255},
    draw::Color{72, 178, 173},
    draw::Color{255, 85, 85},
    draw::Color{238, 168, 43},
    draw::Color{226, 104, 155},
};

} // namespace plant::palette
