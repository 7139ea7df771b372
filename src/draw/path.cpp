#include "path.hpp"

#include <algorithm>
#include <glm/geometric.hpp>

namespace draw {

static constexpr uint32_t CURVE_STEPS = 64;

glm::dvec2 Path::Segment::end() const {
    switch (type) {
    case SegmentType::move:
    case SegmentType::line:
        return points[0];
    case SegmentType::quad:
        return points[1];
    case SegmentType::cubic:
        return points[2];
    }
    return points[0];
}

glm::dvec2 Path::Segment::eval(double t) const {
    const double u = 1.0 - t;
    switch (type) {
    case SegmentType::move:
        return points[0];
    case SegmentType::line:
        return from * u + points[0] * t;
    case SegmentType::quad:
        return from * (u * u) + points[0] * (2.0 * u * t) + points[1] * (t * t);
    case SegmentType::cubic:
        return from * (u * u * u) + points[0] * (3.0 * u * u * t) + points[1] * (3.0 * u * t * t) + points[2] * (t * t * t);
    }
    return from;
}

static double segment_length(const Path::Segment& seg) {
    switch (seg.type) {
    case Path::SegmentType::move:
        return 0.0;
    case Path::SegmentType::line:
        return glm::distance(seg.from, seg.points[0]);
    default:
        break;
    }

    double len = 0.0;
    glm::dvec2 prev = seg.from;
    for (uint32_t i = 1; i <= CURVE_STEPS; ++i) {
        const glm::dvec2 p = seg.eval(static_cast<double>(i) / CURVE_STEPS);
        len += glm::distance(prev, p);
        prev = p;
    }
    return len;
}

void Path::move_to(glm::dvec2 p) {
    segs.push_back(Segment{SegmentType::move, cursor, {p, p, p}});
    cursor = p;
}

void Path::line_to(glm::dvec2 p) {
    segs.push_back(Segment{SegmentType::line, cursor, {p, p, p}});
    cursor = p;
}

void Path::quad_to(glm::dvec2 c, glm::dvec2 p) {
    segs.push_back(Segment{SegmentType::quad, cursor, {c, p, p}});
    cursor = p;
}

void Path::cubic_to(glm::dvec2 c1, glm::dvec2 c2, glm::dvec2 p) {
    segs.push_back(Segment{SegmentType::cubic, cursor, {c1, c2, p}});
    cursor = p;
}

double Path::length() const {
    double len = 0.0;
    for (const Segment& seg : segs) {
        len += segment_length(seg);
    }
    return len;
}

// The segment is picked by length, the point inside it by the curve parameter.
glm::dvec2 Path::point_at_percent(double t) const {
    if (segs.empty()) {
        return cursor;
    }

    t = std::clamp(t, 0.0, 1.0);

    const double target = length() * t;
    double covered = 0.0;
    for (const Segment& seg : segs) {
        if (seg.type == SegmentType::move)
            continue;

        const double len = segment_length(seg);
        if (covered + len >= target) {
            if (len <= 0.0)
                return seg.from;
            return seg.eval(std::clamp((target - covered) / len, 0.0, 1.0));
        }
        covered += len;
    }
    return cursor;
}

} // namespace draw
