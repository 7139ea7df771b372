#include "recording_surface.hpp"

namespace draw {

bool DrawCommand::operator==(const DrawCommand& rhs) const {
    return op == rhs.op && points == rhs.points && radii == rhs.radii && angle == rhs.angle && path == rhs.path &&
           state.transform == rhs.state.transform && state.fill == rhs.state.fill && state.stroke == rhs.state.stroke;
}

void RecordingSurface::save() {
    record(DrawCommand{DrawOp::save});
    Surface::save();
}

void RecordingSurface::restore() {
    Surface::restore();
    record(DrawCommand{DrawOp::restore});
}

void RecordingSurface::translate(glm::dvec2 offset) {
    Surface::translate(offset);
    record(DrawCommand{DrawOp::translate, {offset}});
}

void RecordingSurface::rotate(double angle) {
    Surface::rotate(angle);

    DrawCommand cmd{DrawOp::rotate};
    cmd.angle = angle;
    record(std::move(cmd));
}

void RecordingSurface::scale(glm::dvec2 factor) {
    Surface::scale(factor);
    record(DrawCommand{DrawOp::scale, {factor}});
}

void RecordingSurface::draw_polygon(std::span<const glm::dvec2> points) {
    record(DrawCommand{DrawOp::polygon, std::vector<glm::dvec2>(points.begin(), points.end())});
}

void RecordingSurface::draw_ellipse(glm::dvec2 center, double rx, double ry) {
    DrawCommand cmd{DrawOp::ellipse, {center}};
    cmd.radii = {rx, ry};
    record(std::move(cmd));
}

void RecordingSurface::draw_path(const Path& path) {
    DrawCommand cmd{DrawOp::path};
    cmd.path = path;
    record(std::move(cmd));
}

std::vector<const DrawCommand*> RecordingSurface::filter(DrawOp op) const {
    std::vector<const DrawCommand*> out;
    for (const DrawCommand& cmd : cmds) {
        if (cmd.op == op) {
            out.push_back(&cmd);
        }
    }
    return out;
}

void RecordingSurface::clear() {
    cmds.clear();
}

void RecordingSurface::record(DrawCommand cmd) {
    cmd.state = state();
    cmds.push_back(std::move(cmd));
}

} // namespace draw
