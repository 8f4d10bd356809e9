/**
 * @file test_spline.cpp
 * @brief Unit tests for Internal/Spline
 */

#include <QiLandscape/Internal/Spline.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace Qi::Landscape::Internal {
namespace {

constexpr double kTol = 1e-9;

bool PointNearEqual(const Point2d& a, const Point2d& b, double tol = kTol) {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol;
}

// =============================================================================
// Single Segment
// =============================================================================

class CatmullRomSegmentTest : public ::testing::Test {};

TEST_F(CatmullRomSegmentTest, InterpolatesInnerPoints) {
    BezierSegment seg = CatmullRomSegment({0, 0}, {1, 2}, {3, 3}, {5, 1});
    EXPECT_TRUE(PointNearEqual(seg.PointAt(0.0), {1, 2}));
    EXPECT_TRUE(PointNearEqual(seg.PointAt(1.0), {3, 3}));
}

TEST_F(CatmullRomSegmentTest, EvenlySpacedLineStaysOnLine) {
    BezierSegment seg = CatmullRomSegment({0, 0}, {1, 0}, {2, 0}, {3, 0});
    for (double t = 0.0; t <= 1.0; t += 0.125) {
        EXPECT_NEAR(seg.PointAt(t).y, 0.0, kTol);
    }
    EXPECT_NEAR(seg.c1.x, 1.0 + 1.0 / 3.0, kTol);
    EXPECT_NEAR(seg.c2.x, 2.0 - 1.0 / 3.0, kTol);
}

TEST_F(CatmullRomSegmentTest, ZeroLengthSpanIsPoint) {
    BezierSegment seg = CatmullRomSegment({0, 0}, {1, 1}, {1, 1}, {2, 0});
    EXPECT_TRUE(PointNearEqual(seg.PointAt(0.5), {1, 1}));
}

// =============================================================================
// Closed Spline
// =============================================================================

class CatmullRomClosedTest : public ::testing::Test {};

TEST_F(CatmullRomClosedTest, TooFewVertices) {
    EXPECT_TRUE(CatmullRomClosed({}).empty());
    EXPECT_TRUE(CatmullRomClosed({{0, 0}, {1, 0}}).empty());
}

TEST_F(CatmullRomClosedTest, OneSegmentPerVertexAndClosed) {
    std::vector<Point2d> verts = {{0, 0}, {10, 0}, {12, 8}, {3, 11}};
    std::vector<BezierSegment> segs = CatmullRomClosed(verts);

    ASSERT_EQ(segs.size(), verts.size());
    for (size_t i = 0; i < verts.size(); ++i) {
        EXPECT_EQ(segs[i].p0, verts[i]);
        EXPECT_EQ(segs[i].p3, verts[(i + 1) % verts.size()]);
    }
}

TEST_F(CatmullRomClosedTest, TangentContinuousAtVertices) {
    std::vector<Point2d> verts = {{0, 0}, {10, 0}, {12, 8}, {3, 11}, {-2, 5}};
    for (double alpha : {0.0, 0.5, 1.0}) {
        std::vector<BezierSegment> segs = CatmullRomClosed(verts, alpha);
        size_t n = segs.size();
        for (size_t i = 0; i < n; ++i) {
            Point2d in = segs[i].TangentAt(1.0);
            Point2d out = segs[(i + 1) % n].TangentAt(0.0);
            ASSERT_GT(in.Norm(), 0.0);
            ASSERT_GT(out.Norm(), 0.0);
            // Same direction: parallel and not opposed
            EXPECT_NEAR(in.Cross(out) / (in.Norm() * out.Norm()), 0.0, 1e-9);
            EXPECT_GT(in.Dot(out), 0.0);
        }
    }
}

TEST_F(CatmullRomClosedTest, UniformSquareIsSymmetric) {
    std::vector<Point2d> verts = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    std::vector<BezierSegment> segs = CatmullRomClosed(verts, 0.0);
    ASSERT_EQ(segs.size(), 4u);

    // Midpoint of the bottom edge bulges outward (below y = 0) by symmetry
    Point2d mid = segs[0].PointAt(0.5);
    EXPECT_NEAR(mid.x, 0.5, kTol);
    EXPECT_LT(mid.y, 0.0);
}

} // namespace
} // namespace Qi::Landscape::Internal
