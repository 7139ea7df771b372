#include <gtest/gtest.h>

#include "draw/recording_surface.hpp"
#include "draw/svg_surface.hpp"

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace draw;

static std::size_t count_of(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        n++;
    }
    return n;
}

TEST(SurfaceTest, SaveRestoreRoundTripsState) {
    const Color brown{1, 2, 3};

    RecordingSurface s;
    s.set_fill(brown);

    s.save();
    s.translate({5.0, 6.0});
    s.rotate(90.0);
    s.set_fill(std::nullopt);
    s.set_stroke(Stroke{Color{9, 9, 9}, 2.0});
    EXPECT_EQ(s.depth(), 1u);

    s.restore();
    EXPECT_EQ(s.depth(), 0u);
    EXPECT_EQ(s.state().transform, glm::dmat3{1.0});
    EXPECT_EQ(s.state().fill, brown);
    EXPECT_FALSE(s.state().stroke.has_value());
}

TEST(SurfaceTest, UnbalancedRestoreIsIgnored) {
    RecordingSurface s;
    s.translate({1.0, 1.0});
    s.restore();

    EXPECT_EQ(s.depth(), 0u);
    const glm::dvec2 p = apply(s.state().transform, {0.0, 0.0});
    EXPECT_DOUBLE_EQ(p.x, 1.0);
    EXPECT_DOUBLE_EQ(p.y, 1.0);
}

TEST(SurfaceTest, TransformsComposeInPainterOrder) {
    RecordingSurface s;
    s.translate({100.0, 50.0});
    s.scale({1.0, -1.0});
    s.rotate(90.0);

    // local +x turns into +y, is flipped to -y, then moved
    const glm::dvec2 p = apply(s.state().transform, {10.0, 0.0});
    EXPECT_NEAR(p.x, 100.0, 1e-9);
    EXPECT_NEAR(p.y, 40.0, 1e-9);
}

TEST(RecordingSurfaceTest, RecordsCallsInOrder) {
    const Color black{0, 0, 0};

    RecordingSurface s;
    const std::array<glm::dvec2, 3> tri = {glm::dvec2{0.0, 0.0}, glm::dvec2{1.0, 0.0}, glm::dvec2{0.0, 1.0}};

    s.save();
    s.set_fill(black);
    s.draw_polygon(tri);
    s.rotate(72.0);
    s.draw_ellipse({1.0, 2.0}, 3.0, 4.0);
    s.restore();

    const std::vector<DrawCommand>& cmds = s.commands();
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(cmds[0].op, DrawOp::save);
    EXPECT_EQ(cmds[1].op, DrawOp::polygon);
    EXPECT_EQ(cmds[1].points.size(), 3u);
    EXPECT_EQ(cmds[1].state.fill, black);
    EXPECT_EQ(cmds[2].op, DrawOp::rotate);
    EXPECT_DOUBLE_EQ(cmds[2].angle, 72.0);
    EXPECT_EQ(cmds[3].op, DrawOp::ellipse);
    EXPECT_EQ(cmds[3].radii, glm::dvec2(3.0, 4.0));
    EXPECT_EQ(cmds[4].op, DrawOp::restore);

    EXPECT_EQ(s.filter(DrawOp::ellipse).size(), 1u);
}

TEST(SvgSurfaceTest, EmitsOneElementPerPrimitive) {
    SvgSurface svg{300.0, 200.0};
    const std::array<glm::dvec2, 3> tri = {glm::dvec2{0.0, 0.0}, glm::dvec2{1.0, 0.0}, glm::dvec2{0.0, 1.0}};

    svg.set_fill(Color{255, 0, 16});
    svg.draw_polygon(tri);
    svg.draw_ellipse({0.0, 0.0}, 2.0, 2.0);

    Path p;
    p.quad_to({1.0, 1.0}, {2.0, 0.0});
    svg.set_fill(std::nullopt);
    svg.set_stroke(Stroke{Color{0, 119, 0}, 3.5});
    svg.draw_path(p);

    const std::string doc = svg.document();
    EXPECT_EQ(svg.element_count(), 3u);
    EXPECT_NE(doc.find(R"(<svg xmlns="http://www.w3.org/2000/svg" width="300" height="200" viewBox="0 0 300 200">)"), std::string::npos);
    EXPECT_EQ(count_of(doc, "<polygon"), 1u);
    EXPECT_EQ(count_of(doc, "<ellipse"), 1u);
    EXPECT_EQ(count_of(doc, "<path"), 1u);
    EXPECT_EQ(count_of(doc, "#ff0010"), 2u);
    EXPECT_NE(doc.find(R"(stroke="#007700" stroke-width="3.5")"), std::string::npos);
    EXPECT_NE(doc.find("Q1,1 2,0"), std::string::npos);
    EXPECT_EQ(doc.substr(doc.size() - 7), "</svg>\n");
}

TEST(SvgSurfaceTest, WritesToDisk) {
    const std::filesystem::path file = std::filesystem::temp_directory_path() / "florabox_surface_test.svg";

    SvgSurface svg{10.0, 10.0};
    svg.draw_ellipse({5.0, 5.0}, 1.0, 1.0);
    ASSERT_TRUE(svg.write(file.string()));

    std::ifstream f{file};
    const std::string text{std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
    EXPECT_EQ(text, svg.document());

    std::filesystem::remove(file);
}

TEST(SvgSurfaceTest, WriteFailureIsReported) {
    SvgSurface svg{10.0, 10.0};
    EXPECT_FALSE(svg.write("/nonexistent-directory/plant.svg"));
}
