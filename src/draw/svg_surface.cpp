#include "svg_surface.hpp"

#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace draw {

static std::string svg_color(Color c) {
    return fmt::format("#{:02x}{:02x}{:02x}", c.r, c.g, c.b);
}

static std::string svg_matrix(const glm::dmat3& m) {
    return fmt::format("matrix({} {} {} {} {} {})", m[0][0], m[0][1], m[1][0], m[1][1], m[2][0], m[2][1]);
}

SvgSurface::SvgSurface(double width, double height) : width{width}, height{height} {
}

std::string SvgSurface::style() const {
    const PaintState& st = state();

    std::string s = fmt::format(R"(transform="{}" fill="{}")", svg_matrix(st.transform), st.fill ? svg_color(*st.fill) : "none");
    if (st.stroke) {
        fmt::format_to(std::back_inserter(s), R"( stroke="{}" stroke-width="{}")", svg_color(st.stroke->color), st.stroke->width);
    } else {
        s += R"( stroke="none")";
    }
    return s;
}

void SvgSurface::draw_polygon(std::span<const glm::dvec2> points) {
    std::string pts;
    for (const glm::dvec2& p : points) {
        if (!pts.empty()) {
            pts += ' ';
        }
        fmt::format_to(std::back_inserter(pts), "{},{}", p.x, p.y);
    }

    fmt::format_to(std::back_inserter(body), R"(<polygon points="{}" {}/>)" "\n", pts, style());
    elements++;
}

void SvgSurface::draw_ellipse(glm::dvec2 center, double rx, double ry) {
    fmt::format_to(std::back_inserter(body), R"(<ellipse cx="{}" cy="{}" rx="{}" ry="{}" {}/>)" "\n", center.x, center.y, rx, ry, style());
    elements++;
}

void SvgSurface::draw_path(const Path& path) {
    auto out = std::back_inserter(body);

    // painter paths implicitly begin at the origin
    fmt::format_to(out, R"(<path d="M0,0)");
    for (const Path::Segment& seg : path.segments()) {
        switch (seg.type) {
        case Path::SegmentType::move:
            fmt::format_to(out, " M{},{}", seg.points[0].x, seg.points[0].y);
            break;
        case Path::SegmentType::line:
            fmt::format_to(out, " L{},{}", seg.points[0].x, seg.points[0].y);
            break;
        case Path::SegmentType::quad:
            fmt::format_to(out, " Q{},{} {},{}", seg.points[0].x, seg.points[0].y, seg.points[1].x, seg.points[1].y);
            break;
        case Path::SegmentType::cubic:
            fmt::format_to(out, " C{},{} {},{} {},{}", seg.points[0].x, seg.points[0].y, seg.points[1].x, seg.points[1].y,
                           seg.points[2].x, seg.points[2].y);
            break;
        }
    }
    fmt::format_to(out, R"(" fill-rule="nonzero" {}/>)" "\n", style());
    elements++;
}

std::string SvgSurface::document() const {
    std::string doc = fmt::format(R"(<?xml version="1.0" encoding="UTF-8"?>)" "\n"
                                  R"(<svg xmlns="http://www.w3.org/2000/svg" width="{0}" height="{1}" viewBox="0 0 {0} {1}">)" "\n",
                                  width, height);
    doc += body;
    doc += "</svg>\n";
    return doc;
}

bool SvgSurface::write(std::string_view file) const {
    std::ofstream f{std::string{file}, std::ios::out | std::ios::trunc};
    if (!f) {
        spdlog::error("failed to open {} for writing", file);
        return false;
    }

    f << document();
    f.close();

    if (!f) {
        spdlog::error("failed to write svg to {}", file);
        return false;
    }

    spdlog::debug("wrote {} svg elements to {}", elements, file);
    return true;
}

} // namespace draw
