#pragma once

#include "surface.hpp"

#include <cstdint>
#include <vector>

namespace draw {

enum class DrawOp : uint8_t {
    save,
    restore,
    translate,
    rotate,
    scale,
    polygon,
    ellipse,
    path
};

struct DrawCommand final {
    DrawOp op;
    // polygon vertices, ellipse center, or the translate/scale argument; local coordinates
    std::vector<glm::dvec2> points;
    glm::dvec2 radii{0.0};
    double angle = 0.0;
    Path path;

    PaintState state;

    bool operator==(const DrawCommand& rhs) const;
};

// Keeps every call made on it, in order, together with the paint state it was made under.
class RecordingSurface final : public Surface {
  public:
    void save() override;
    void restore() override;
    void translate(glm::dvec2 offset) override;
    void rotate(double angle) override;
    void scale(glm::dvec2 factor) override;

    void draw_polygon(std::span<const glm::dvec2> points) override;
    void draw_ellipse(glm::dvec2 center, double rx, double ry) override;
    void draw_path(const Path& path) override;

    const std::vector<DrawCommand>& commands() const noexcept {
        return cmds;
    }

    std::vector<const DrawCommand*> filter(DrawOp op) const;

    void clear();

  private:
    void record(DrawCommand cmd);

    std::vector<DrawCommand> cmds;
};

} // namespace draw
