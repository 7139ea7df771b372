#include "render.hpp"

#include "draw/surface.hpp"
#include "draw/svg_surface.hpp"
#include "flower.hpp"
#include "tree.hpp"

#include <algorithm>
#include <variant>
#include <spdlog/spdlog.h>

namespace plant {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

void draw_plant(const Plant& plant, draw::Surface& surface, double width, double height) {
    const double w = std::min(width, height);
    const double h = std::min(width, height);

    surface.save();

    surface.translate({width / 2., height});
    surface.scale({1.0, -1.0});

    std::visit(overloaded{
                   [&](const TreeTraits& t) { draw_tree(plant, t, surface, w, h); },
                   [&](const OrangeTreeTraits& t) { draw_orange_tree(plant, t, surface, w, h); },
                   [&](const GreenTreeTraits& t) { draw_green_tree(plant, t, surface, w, h); },
                   [&](const DoubleGreenTreeTraits& t) { draw_double_green_tree(plant, t, surface, w, h); },
                   [&](const FlowerTraits& t) { draw_flower(plant, t, surface, w, h); },
                   [&](const CircularFlowerTraits& t) { draw_circular_flower(plant, t, surface, w, h); },
               },
               plant.traits());

    surface.restore();
}

bool export_svg(const Plant& plant, std::string_view file, double width, double height) {
    draw::SvgSurface svg{width, height};
    draw_plant(plant, svg, width, height);

    spdlog::debug("exporting {} at age {:.2f} to {}", kind_name(plant.kind()), plant.age(), file);
    return svg.write(file);
}

} // namespace plant
