#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <glm/vec2.hpp>

namespace draw {

// Painter-style path. Starts at the origin, like a fresh QPainterPath would.
class Path final {
  public:
    enum class SegmentType : uint8_t {
        move,
        line,
        quad,
        cubic
    };

    struct Segment final {
        SegmentType type;
        glm::dvec2 from;
        std::array<glm::dvec2, 3> points;

        glm::dvec2 end() const;
        glm::dvec2 eval(double t) const;

        bool operator==(const Segment&) const = default;
    };

    void move_to(glm::dvec2 p);
    void line_to(glm::dvec2 p);
    void quad_to(glm::dvec2 c, glm::dvec2 p);
    void cubic_to(glm::dvec2 c1, glm::dvec2 c2, glm::dvec2 p);

    glm::dvec2 current() const noexcept {
        return cursor;
    }

    const std::vector<Segment>& segments() const noexcept {
        return segs;
    }

    bool empty() const noexcept {
        return segs.empty();
    }

    double length() const;

    // Like QPainterPath::pointAtPercent: t (clamped to [0, 1]) selects the segment by length,
    // then the remainder is used as that segment's curve parameter.
    glm::dvec2 point_at_percent(double t) const;

    bool operator==(const Path&) const = default;

  private:
    glm::dvec2 cursor{0.0, 0.0};
    std::vector<Segment> segs;
};

} // namespace draw
