#pragma once

#include <cstdint>

namespace draw {

struct Color final {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Color&) const = default;
};

struct Stroke final {
    Color color;
    double width;

    bool operator==(const Stroke&) const = default;
};

} // namespace draw
