#include "surface.hpp"

#include "helpers.hpp"

#include <spdlog/spdlog.h>
#include <glm/gtx/matrix_transform_2d.hpp>

namespace draw {

void Surface::save() {
    stack.push_back(current);
}

void Surface::restore() {
    if (stack.empty()) {
        spdlog::warn("surface restore without a matching save");
        return;
    }

    current = stack.back();
    stack.pop_back();
}

void Surface::translate(glm::dvec2 offset) {
    current.transform = glm::translate(current.transform, offset);
}

void Surface::rotate(double angle) {
    current.transform = glm::rotate(current.transform, radians(angle));
}

void Surface::scale(glm::dvec2 factor) {
    current.transform = glm::scale(current.transform, factor);
}

void Surface::set_fill(std::optional<Color> color) {
    current.fill = color;
}

void Surface::set_stroke(std::optional<Stroke> stroke) {
    current.stroke = stroke;
}

glm::dvec2 apply(const glm::dmat3& m, glm::dvec2 p) {
    const glm::dvec3 r = m * glm::dvec3{p, 1.0};
    return glm::dvec2{r.x, r.y};
}

} // namespace draw
