/**
 * @file test_curve.cpp
 * @brief Unit tests for Core/QCurve
 */

#include <QiLandscape/Core/QCurve.h>
#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace Qi::Landscape {
namespace {

constexpr double kTol = 1e-9;

// Straight-line Bezier from a to b (controls at thirds)
BezierSegment Line(const Point2d& a, const Point2d& b) {
    return BezierSegment(a, a + (b - a) * (1.0 / 3.0), a + (b - a) * (2.0 / 3.0), b);
}

QCurve UnitSquare() {
    Point2d p0(0, 0), p1(1, 0), p2(1, 1), p3(0, 1);
    return QCurve({Line(p0, p1), Line(p1, p2), Line(p2, p3), Line(p3, p0)}, true);
}

// =============================================================================
// BezierSegment
// =============================================================================

class BezierSegmentTest : public ::testing::Test {};

TEST_F(BezierSegmentTest, EndpointsInterpolated) {
    BezierSegment seg({0, 0}, {1, 2}, {3, 2}, {4, 0});
    Point2d start = seg.PointAt(0.0);
    Point2d end = seg.PointAt(1.0);
    EXPECT_NEAR(start.x, 0.0, kTol);
    EXPECT_NEAR(start.y, 0.0, kTol);
    EXPECT_NEAR(end.x, 4.0, kTol);
    EXPECT_NEAR(end.y, 0.0, kTol);
}

TEST_F(BezierSegmentTest, MidpointOfSymmetricArc) {
    BezierSegment seg({0, 0}, {1, 2}, {3, 2}, {4, 0});
    Point2d mid = seg.PointAt(0.5);
    EXPECT_NEAR(mid.x, 2.0, kTol);
    EXPECT_NEAR(mid.y, 1.5, kTol);
}

TEST_F(BezierSegmentTest, TangentAtEndsFollowsControls) {
    BezierSegment seg({0, 0}, {1, 2}, {3, 2}, {4, 0});
    Point2d t0 = seg.TangentAt(0.0);
    Point2d t1 = seg.TangentAt(1.0);
    EXPECT_NEAR(t0.x, 3.0, kTol);
    EXPECT_NEAR(t0.y, 6.0, kTol);
    EXPECT_NEAR(t1.x, 3.0, kTol);
    EXPECT_NEAR(t1.y, -6.0, kTol);
}

// =============================================================================
// QCurve
// =============================================================================

class QCurveTest : public ::testing::Test {};

TEST_F(QCurveTest, EmptyCurve) {
    QCurve curve;
    EXPECT_TRUE(curve.Empty());
    EXPECT_EQ(curve.Size(), 0u);
    EXPECT_TRUE(curve.Sample().empty());
    EXPECT_DOUBLE_EQ(curve.Length(), 0.0);
    EXPECT_EQ(curve.ToSvgPath(), "");
}

TEST_F(QCurveTest, AccessAndKnots) {
    QCurve curve = UnitSquare();
    EXPECT_EQ(curve.Size(), 4u);
    EXPECT_TRUE(curve.IsClosed());
    EXPECT_EQ(curve.StartPoint(), Point2d(0, 0));

    std::vector<Point2d> knots = curve.Knots();
    ASSERT_EQ(knots.size(), 4u);
    EXPECT_EQ(knots[2], Point2d(1, 1));

    EXPECT_THROW(curve.At(4), std::out_of_range);
}

TEST_F(QCurveTest, OpenCurveKnotsIncludeEnd) {
    QCurve curve({Line({0, 0}, {2, 0})}, false);
    std::vector<Point2d> knots = curve.Knots();
    ASSERT_EQ(knots.size(), 2u);
    EXPECT_EQ(knots.back(), Point2d(2, 0));
}

TEST_F(QCurveTest, SampleClosedDoesNotRepeatStart) {
    QCurve curve = UnitSquare();
    std::vector<Point2d> samples = curve.Sample(4);
    EXPECT_EQ(samples.size(), 16u);
    EXPECT_EQ(samples.front(), Point2d(0, 0));
}

TEST_F(QCurveTest, LengthOfSquare) {
    EXPECT_NEAR(UnitSquare().Length(8), 4.0, 1e-9);
}

TEST_F(QCurveTest, ControlBoundingBox) {
    QCurve curve({BezierSegment({0, 0}, {1, 2}, {3, -1}, {4, 0})}, false);
    Rect2d box = curve.ControlBoundingBox();
    EXPECT_DOUBLE_EQ(box.x, 0.0);
    EXPECT_DOUBLE_EQ(box.y, -1.0);
    EXPECT_DOUBLE_EQ(box.width, 4.0);
    EXPECT_DOUBLE_EQ(box.height, 3.0);
}

TEST_F(QCurveTest, SvgPathFormat) {
    QCurve curve({BezierSegment({0, 0}, {1, 2}, {3, 2.5}, {4, 0}),
                  BezierSegment({4, 0}, {3, -1}, {1, -1}, {0, 0})}, true);
    EXPECT_EQ(curve.ToSvgPath(), "M0,0C1,2,3,2.5,4,0C3,-1,1,-1,0,0Z");
}

TEST_F(QCurveTest, SvgPathPrecisionAndNegativeZero) {
    QCurve curve({BezierSegment({-0.0001, 1.23456}, {1, 1}, {2, 2}, {3, 3})}, false);
    EXPECT_EQ(curve.ToSvgPath(2), "M0,1.23C1,1,2,2,3,3");
}

} // namespace
} // namespace Qi::Landscape
