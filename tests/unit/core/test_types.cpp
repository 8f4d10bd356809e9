#include <gtest/gtest.h>
#include <QiLandscape/Core/Types.h>
#include <QiLandscape/Core/Exception.h>
#include <QiLandscape/Core/Validate.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace Qi::Landscape;

// =============================================================================
// Point2d Tests
// =============================================================================

TEST(Point2dTest, DefaultConstructor) {
    Point2d p;
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

TEST(Point2dTest, ParameterizedConstructor) {
    Point2d p(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p.x, 3.0);
    EXPECT_DOUBLE_EQ(p.y, 4.0);
}

TEST(Point2dTest, Norm) {
    Point2d p(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p.Norm(), 5.0);
    EXPECT_DOUBLE_EQ(p.SquaredNorm(), 25.0);
}

TEST(Point2dTest, Arithmetic) {
    Point2d a(1.0, 2.0);
    Point2d b(3.0, 5.0);
    EXPECT_EQ(a + b, Point2d(4.0, 7.0));
    EXPECT_EQ(b - a, Point2d(2.0, 3.0));
    EXPECT_EQ(a * 2.0, Point2d(2.0, 4.0));
    EXPECT_NE(a, b);
}

TEST(Point2dTest, DotProduct) {
    Point2d a(1.0, 2.0);
    Point2d b(3.0, 4.0);
    EXPECT_DOUBLE_EQ(a.Dot(b), 11.0);
}

TEST(Point2dTest, CrossProduct) {
    Point2d a(1.0, 0.0);
    Point2d b(0.0, 1.0);
    EXPECT_DOUBLE_EQ(a.Cross(b), 1.0);
    EXPECT_DOUBLE_EQ(b.Cross(a), -1.0);
}

TEST(Point2dTest, Distance) {
    Point2d a(0.0, 0.0);
    Point2d b(3.0, 4.0);
    EXPECT_DOUBLE_EQ(a.DistanceTo(b), 5.0);
}

TEST(Point2dTest, Validity) {
    EXPECT_TRUE(Point2d(1.0, -1.0).IsValid());
    EXPECT_FALSE(Point2d(std::nan(""), 0.0).IsValid());
    EXPECT_FALSE(Point2d(0.0, std::numeric_limits<double>::infinity()).IsValid());
}

// =============================================================================
// Size2d / Rect2d Tests
// =============================================================================

TEST(Size2dTest, Validity) {
    EXPECT_TRUE(Size2d(800, 600).IsValid());
    EXPECT_FALSE(Size2d(0, 600).IsValid());
    EXPECT_FALSE(Size2d(800, -1).IsValid());
    EXPECT_DOUBLE_EQ(Size2d(800, 600).Area(), 480000.0);
}

TEST(Rect2dTest, BasicProperties) {
    Rect2d r(10, 20, 100, 50);
    EXPECT_DOUBLE_EQ(r.Right(), 110.0);
    EXPECT_DOUBLE_EQ(r.Bottom(), 70.0);
    EXPECT_DOUBLE_EQ(r.Area(), 5000.0);
    EXPECT_EQ(r.Center(), Point2d(60.0, 45.0));
}

TEST(Rect2dTest, Contains) {
    Rect2d r(10, 20, 100, 50);
    EXPECT_TRUE(r.Contains({50, 40}));
    EXPECT_TRUE(r.Contains({10, 20}));
    EXPECT_FALSE(r.Contains({5, 40}));
    EXPECT_FALSE(r.Contains({50, 100}));
}

// =============================================================================
// Circle2d Tests
// =============================================================================

TEST(Circle2dTest, AreaAndCircumference) {
    Circle2d c(0.0, 0.0, 2.0);
    EXPECT_NEAR(c.Area(), 4.0 * PI, 1e-12);
    EXPECT_NEAR(c.Circumference(), 4.0 * PI, 1e-12);
}

TEST(Circle2dTest, Contains) {
    Circle2d c({5.0, 5.0}, 1.0);
    EXPECT_TRUE(c.Contains({5.5, 5.5}));
    EXPECT_TRUE(c.Contains({6.0, 5.0}));
    EXPECT_FALSE(c.Contains({6.5, 5.0}));
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ValidateTest, FiniteValue) {
    double ok = 1.0;
    EXPECT_NO_THROW(QILANDSCAPE_REQUIRE_FINITE(ok));

    double bad = std::numeric_limits<double>::infinity();
    EXPECT_THROW(QILANDSCAPE_REQUIRE_FINITE(bad), InvalidArgumentException);
}

TEST(ValidateTest, MessageNamesFunctionAndParameter) {
    try {
        Validate::RequireRange(1.5, 0.0, 1.0, "alpha", "SmoothHullPath");
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Invalid argument: "), std::string::npos);
        EXPECT_NE(msg.find("SmoothHullPath: alpha must be in [0, 1], got 1.5"), std::string::npos);
    }
}

TEST(ValidateTest, FinitePointsReportsIndex) {
    std::vector<Point2d> pts = {{0, 0}, {1, 1}, {std::nan(""), 2}};
    try {
        Validate::RequireFinitePoints(pts, "points", "ComputeConvexHull");
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_NE(std::string(e.what()).find("points[2]"), std::string::npos);
    }
}

TEST(ValidateTest, NonNegative) {
    EXPECT_NO_THROW(Validate::RequireNonNegative<int32_t>(0, "n", "f"));
    EXPECT_THROW(Validate::RequireNonNegative<int32_t>(-1, "n", "f"), InvalidArgumentException);
}

TEST(ValidateTest, ExceptionHierarchy) {
    try {
        Validate::RequireValidSize(Size2d(0, 0), "canvas", "ProjectToCanvas");
        FAIL() << "expected InvalidArgumentException";
    } catch (const Exception& e) {
        EXPECT_NE(std::string(e.what()).find("canvas must be finite and > 0"), std::string::npos);
    }
}
