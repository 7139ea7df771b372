#pragma once

#include "color.hpp"
#include "path.hpp"

#include <optional>
#include <span>
#include <vector>
#include <glm/mat3x3.hpp>
#include <glm/vec2.hpp>

namespace draw {

struct PaintState final {
    glm::dmat3 transform{1.0};
    std::optional<Color> fill;
    std::optional<Stroke> stroke;
};

// Anything plants can be painted onto. Transform and brush state follow painter semantics:
// save() pushes the current state, restore() pops it. Backends that keep their own painter
// state may override the state calls, but must still call into the base to keep state() valid.
class Surface {
  public:
    virtual ~Surface() = default;

    virtual void save();
    virtual void restore();

    virtual void translate(glm::dvec2 offset);
    // degrees, counter-clockwise in the current coordinate system
    virtual void rotate(double angle);
    virtual void scale(glm::dvec2 factor);

    virtual void set_fill(std::optional<Color> color);
    virtual void set_stroke(std::optional<Stroke> stroke);

    virtual void draw_polygon(std::span<const glm::dvec2> points) = 0;
    virtual void draw_ellipse(glm::dvec2 center, double rx, double ry) = 0;
    virtual void draw_path(const Path& path) = 0;

    const PaintState& state() const noexcept {
        return current;
    }

    std::size_t depth() const noexcept {
        return stack.size();
    }

  private:
    PaintState current;
    std::vector<PaintState> stack;
};

glm::dvec2 apply(const glm::dmat3& m, glm::dvec2 p);

} // namespace draw
