#include "tree.hpp"

#include "draw/surface.hpp"
#include "helpers.hpp"
#include "palette.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace plant {

static constexpr double TREE_OUTLINE_WIDTH = 1.0;

struct TreeSizes final {
    double d;

    double base_width(double width) const {
        return width / 15. * d;
    }

    double base_height(double height) const {
        return height / 1.7 * d;
    }

    double branch_width(double width) const {
        return width / 18. * d;
    }

    double branch_height(double height) const {
        return height / 2.7 * d;
    }

    double green_width(double width) const {
        return width / 3.2 * d;
    }

    double green_height(double height) const {
        return height / 1.5 * d;
    }

    double second_green_width(double width) const {
        return width / 3.5 * d;
    }

    double second_green_height(double height) const {
        return height / 2.4 * d;
    }
};

// moves to where the branch leaves the trunk and turns along it
static void enter_branch(draw::Surface& surface, const TreeSizes& sz, const Branch& branch, double height, double s) {
    surface.translate({0.0, sz.base_height(height * branch.height * s)});
    surface.rotate(degrees(branch.rotation));
}

// keeps whatever stroke the caller set
static void draw_trunk(const Plant& plant, const TreeTraits& tree, draw::Surface& surface, double width, double height) {
    const TreeSizes sz{plant.deficit()};
    const double s = smoothen_curve(plant.growth());
    const double ss = smoothen_curve(plant.slow_growth());

    surface.set_fill(palette::BROWN);

    const std::array<glm::dvec2, 3> trunk = {
        glm::dvec2{-sz.base_width(width) * s, 0.0},
        glm::dvec2{sz.base_width(width) * s, 0.0},
        glm::dvec2{0.0, sz.base_height(height) * s},
    };
    surface.draw_polygon(trunk);

    for (const Branch& branch : tree.branches) {
        surface.save();
        enter_branch(surface, sz, branch, height, s);

        const double shrink = ss * (1.0 - branch.height);
        const std::array<glm::dvec2, 3> b = {
            glm::dvec2{-sz.branch_width(width) * shrink, 0.0},
            glm::dvec2{sz.branch_width(width) * shrink, 0.0},
            glm::dvec2{0.0, sz.branch_height(height) * shrink},
        };
        surface.draw_polygon(b);

        surface.restore();
    }
}

void draw_tree(const Plant& plant, const TreeTraits& tree, draw::Surface& surface, double width, double height) {
    // only the plain tree is outlined
    surface.set_stroke(draw::Stroke{palette::BLACK, TREE_OUTLINE_WIDTH});
    draw_trunk(plant, tree, surface, width, height);
}

void draw_orange_tree(const Plant& plant, const OrangeTreeTraits& orange, draw::Surface& surface, double width, double height) {
    static constexpr double MAIN_CIRCLE_SCALE = 1.3;

    const TreeSizes sz{plant.deficit()};
    const double g = plant.growth();
    const double slow = plant.slow_growth();
    const double s = smoothen_curve(g);
    const double ss = smoothen_curve(slow);

    surface.set_stroke(std::nullopt);
    surface.set_fill(palette::ORANGE);

    const std::vector<Branch>& branches = orange.tree.branches;
    for (std::size_t i = 0; i < branches.size() && i < orange.circles.size(); ++i) {
        const Branch& branch = branches[i];
        const BranchCircle& circle = orange.circles[i];

        surface.save();
        enter_branch(surface, sz, branch, height, s);

        const double top_of_branch = sz.branch_height(height) * ss * (1.0 - branch.height);
        const double r = ((width + height) / 2.0) * circle.size * slow * (1.0 - branch.height) * g;
        surface.draw_ellipse({0.0, top_of_branch * circle.position}, r, r);

        surface.restore();
    }

    if (!orange.circles.empty() && !branches.empty()) {
        const BranchCircle& main = orange.circles.back();

        const double top_of_trunk = sz.base_height(height) * s;
        const double r = ((width + height) / 2.0) * main.size * g * (1.0 - branches.back().height) * MAIN_CIRCLE_SCALE;
        surface.draw_ellipse({0.0, top_of_trunk * main.position}, r, r);
    }

    draw_trunk(plant, orange.tree, surface, width, height);
}

static void draw_green_canopy(const Plant& plant, draw::Surface& surface, double width, double height) {
    const TreeSizes sz{plant.deficit()};
    const double s = smoothen_curve(plant.growth());

    const double offset = std::min(height * 0.95, sz.base_height(height * 0.3 * s));

    surface.set_stroke(std::nullopt);
    surface.set_fill(palette::GREEN);

    const std::array<glm::dvec2, 3> canopy = {
        glm::dvec2{-sz.green_width(width) * s, offset},
        glm::dvec2{sz.green_width(width) * s, offset},
        glm::dvec2{0.0, sz.green_height(height) * s + offset},
    };
    surface.draw_polygon(canopy);
}

void draw_green_tree(const Plant& plant, const GreenTreeTraits& green, draw::Surface& surface, double width, double height) {
    draw_green_canopy(plant, surface, width, height);
    draw_trunk(plant, green.tree, surface, width, height);
}

void draw_double_green_tree(const Plant& plant, const DoubleGreenTreeTraits& green, draw::Surface& surface, double width, double height) {
    const TreeSizes sz{plant.deficit()};
    const double s = smoothen_curve(plant.growth());

    surface.set_stroke(std::nullopt);
    surface.set_fill(palette::GREEN);

    const double offset = sz.base_height(height * 0.3 * s);
    const double second_offset = (sz.green_height(height) - sz.second_green_height(height)) * s;
    const double base = offset + second_offset;

    // the inner canopy grows in width slower than the outer one
    const std::array<glm::dvec2, 3> inner = {
        glm::dvec2{-sz.second_green_width(width) * s * s, base},
        glm::dvec2{sz.second_green_width(width) * s * s, base},
        glm::dvec2{0.0, std::min(sz.second_green_height(height) * s + base, height * 0.95)},
    };
    surface.draw_polygon(inner);

    draw_green_canopy(plant, surface, width, height);
    draw_trunk(plant, green.tree, surface, width, height);
}

} // namespace plant
