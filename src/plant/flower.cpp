#include "flower.hpp"

#include "draw/surface.hpp"
#include "helpers.hpp"
#include "palette.hpp"

#include <cmath>

namespace plant {

// control point distance for a quarter circle made of a cubic
static constexpr double KAPPA = 0.5522847498307936;

struct FlowerSizes final {
    double d;
    double lean;

    double center_x(double width) const {
        return width / 9. * lean;
    }

    double center_y(double height) const {
        return height / 2.5 * d;
    }

    double leaf_size(double width) const {
        return width / 7. * d;
    }

    double petal_size(double width) const {
        return width / 9. * d;
    }
};

draw::Path triangle_petal(double size) {
    size *= 1.5;

    draw::Path p;
    p.quad_to({0.9 * size, 0.5 * size}, {0.0, size});
    p.quad_to({-0.5 * size, 0.4 * size}, {0.0, 0.0});
    return p;
}

draw::Path circular_petal(double size) {
    // inscribed in the (0, 0, size, size) square
    const double r = size / 2.;
    const glm::dvec2 c{r, r};
    const double k = KAPPA * r;

    draw::Path p;
    p.move_to(c + glm::dvec2{r, 0.0});
    p.cubic_to(c + glm::dvec2{r, k}, c + glm::dvec2{k, r}, c + glm::dvec2{0.0, r});
    p.cubic_to(c + glm::dvec2{-k, r}, c + glm::dvec2{-r, k}, c + glm::dvec2{-r, 0.0});
    p.cubic_to(c + glm::dvec2{-r, -k}, c + glm::dvec2{-k, -r}, c + glm::dvec2{0.0, -r});
    p.cubic_to(c + glm::dvec2{k, -r}, c + glm::dvec2{r, -k}, c + glm::dvec2{r, 0.0});
    return p;
}

draw::Path round_petal(double size) {
    size *= 1.3;

    draw::Path p;
    p.quad_to({0.8 * size, 0.9 * size}, {0.0, size});
    p.quad_to({-0.8 * size, 0.9 * size}, {0.0, 0.0});
    return p;
}

draw::Path dip_petal(double size) {
    size *= 1.2;

    // control points above the tip pull the middle in
    draw::Path p;
    p.quad_to({size, 1.4 * size}, {0.0, size});
    p.quad_to({-size, 1.4 * size}, {0.0, 0.0});
    return p;
}

draw::Path petal_path(PetalShape shape, double size) {
    switch (shape) {
    case PetalShape::circular:
        return circular_petal(size);
    case PetalShape::triangle:
        return triangle_petal(size);
    case PetalShape::dip:
        return dip_petal(size);
    case PetalShape::round:
        return round_petal(size);
    }
    return circular_petal(size);
}

glm::dvec2 draw_flower(const Plant& plant, const FlowerTraits& flower, draw::Surface& surface, double width, double height) {
    const FlowerSizes sz{plant.deficit(), flower.lean};
    const double s = smoothen_curve(plant.growth());

    const double x = sz.center_x(width) * s;
    const double y = sz.center_y(height) * s;

    surface.set_fill(std::nullopt);
    surface.set_stroke(draw::Stroke{palette::GREEN, flower.stem_width * s});

    draw::Path stem;
    stem.quad_to({0.0, y * 0.6}, {x, y});
    surface.draw_path(stem);

    for (const Leaf& leaf : flower.leaves) {
        surface.save();

        surface.translate(stem.point_at_percent(leaf.position));
        surface.rotate(degrees(leaf.side));

        // follow the lean of the stem; a stem with no height has nothing to lean
        if (y != 0.0) {
            surface.rotate(-degrees(std::sin(x / y)));
        }

        // both leaves face the same way
        if (leaf.side < 0.0) {
            surface.scale({-1.0, 1.0});
        }

        surface.set_fill(palette::GREEN);
        surface.set_stroke(std::nullopt);

        const double ls = sz.leaf_size(width) * s * s * leaf.size;

        draw::Path shape;
        shape.quad_to({0.4 * ls, 0.5 * ls}, {0.0, ls});
        shape.cubic_to({0.0, 0.5 * ls}, {-0.4 * ls, 0.4 * ls}, {0.0, 0.0});
        surface.draw_path(shape);

        surface.restore();
    }

    return {x, y};
}

void draw_circular_flower(const Plant& plant, const CircularFlowerTraits& circular, draw::Surface& surface, double width, double height) {
    const glm::dvec2 head = draw_flower(plant, circular.flower, surface, width, height);

    const FlowerSizes sz{plant.deficit(), circular.flower.lean};
    double petal = sz.petal_size(width) * smoothen_curve(plant.growth());

    surface.save();
    surface.translate(head);

    surface.set_stroke(std::nullopt);
    surface.set_fill(circular.color);

    const draw::Path outline = petal_path(circular.shape, petal);
    for (uint32_t i = 0; i < circular.petal_count; ++i) {
        surface.draw_path(outline);
        surface.rotate(360.0 / circular.petal_count);
    }

    // covers the spot where the petals meet
    surface.set_fill(palette::WHITE);
    petal *= circular.center_ratio;
    surface.draw_ellipse({0.0, 0.0}, petal / 2., petal / 2.);

    surface.restore();
}

} // namespace plant
