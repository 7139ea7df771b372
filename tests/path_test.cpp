#include <gtest/gtest.h>

#include "draw/path.hpp"

#include <cmath>

using draw::Path;

TEST(PathTest, StartsAtOrigin) {
    Path p;
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.current(), glm::dvec2(0.0, 0.0));
    EXPECT_EQ(p.point_at_percent(0.5), glm::dvec2(0.0, 0.0));
}

TEST(PathTest, LinePercentIsByLength) {
    Path p;
    p.line_to({10.0, 0.0});
    p.line_to({10.0, 30.0});

    EXPECT_DOUBLE_EQ(p.length(), 40.0);

    const glm::dvec2 quarter = p.point_at_percent(0.25);
    EXPECT_NEAR(quarter.x, 10.0, 1e-9);
    EXPECT_NEAR(quarter.y, 0.0, 1e-9);

    const glm::dvec2 half = p.point_at_percent(0.5);
    EXPECT_NEAR(half.x, 10.0, 1e-9);
    EXPECT_NEAR(half.y, 10.0, 1e-9);
}

TEST(PathTest, PercentIsClamped) {
    Path p;
    p.line_to({4.0, 3.0});

    EXPECT_EQ(p.point_at_percent(-1.0), glm::dvec2(0.0, 0.0));
    const glm::dvec2 end = p.point_at_percent(2.0);
    EXPECT_NEAR(end.x, 4.0, 1e-9);
    EXPECT_NEAR(end.y, 3.0, 1e-9);
}

TEST(PathTest, QuadEndpointsAndLength) {
    Path p;
    p.quad_to({0.0, 6.0}, {4.0, 10.0});

    EXPECT_EQ(p.current(), glm::dvec2(4.0, 10.0));

    const glm::dvec2 end = p.point_at_percent(1.0);
    EXPECT_NEAR(end.x, 4.0, 1e-9);
    EXPECT_NEAR(end.y, 10.0, 1e-9);

    // longer than the chord, shorter than the control polygon
    EXPECT_GT(p.length(), std::sqrt(116.0));
    EXPECT_LT(p.length(), 6.0 + std::sqrt(32.0));
}

TEST(PathTest, DegenerateCurveHasNoNan) {
    Path p;
    p.quad_to({0.0, 0.0}, {0.0, 0.0});

    const glm::dvec2 q = p.point_at_percent(0.3);
    EXPECT_FALSE(std::isnan(q.x));
    EXPECT_FALSE(std::isnan(q.y));
    EXPECT_EQ(q, glm::dvec2(0.0, 0.0));
}

TEST(PathTest, CurvePercentIsParametric) {
    // the shape of a flower stem: 25 across, 120 up
    Path stem;
    stem.quad_to({0.0, 72.0}, {25.0, 120.0});

    const glm::dvec2 p = stem.point_at_percent(0.3);
    EXPECT_NEAR(p.x, 2.25, 1e-9);
    EXPECT_NEAR(p.y, 41.04, 1e-9);

    const glm::dvec2 q = stem.point_at_percent(0.4);
    EXPECT_NEAR(q.x, 4.0, 1e-9);
    EXPECT_NEAR(q.y, 53.76, 1e-9);
}

TEST(PathTest, SegmentIsPickedByLength) {
    Path p;
    p.line_to({0.0, 10.0});
    p.quad_to({0.0, 20.0}, {10.0, 20.0});

    const double line = 10.0;
    const double curve = p.length() - line;
    ASSERT_GT(curve, 10.0);

    // the first 10 units are the line
    const glm::dvec2 on_line = p.point_at_percent(5.0 / p.length());
    EXPECT_NEAR(on_line.x, 0.0, 1e-9);
    EXPECT_NEAR(on_line.y, 5.0, 1e-9);

    // halfway into the curve's length is its parameter 0.5
    const glm::dvec2 on_curve = p.point_at_percent((line + curve / 2.0) / p.length());
    EXPECT_NEAR(on_curve.x, 2.5, 1e-9);
    EXPECT_NEAR(on_curve.y, 17.5, 1e-9);
}
