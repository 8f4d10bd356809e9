/**
 * @file Boundary.cpp
 * @brief Cluster boundary implementation
 */

#include <QiLandscape/Boundary/Boundary.h>
#include <QiLandscape/Core/Validate.h>
#include <QiLandscape/Internal/GeomConstruct.h>
#include <QiLandscape/Internal/Spline.h>

#include <algorithm>
#include <utility>

namespace Qi::Landscape::Boundary {

// =============================================================================
// Hull
// =============================================================================

bool IsCounterClockwise(const Point2d& a, const Point2d& b, const Point2d& c) {
    return Internal::IsCounterClockwise(a, b, c);
}

std::vector<Point2d> ComputeConvexHull(const std::vector<Point2d>& points) {
    QILANDSCAPE_REQUIRE_FINITE_POINTS(points);
    return Internal::ConvexHull(points);
}

// =============================================================================
// Smoothing
// =============================================================================

QCurve SmoothHullPath(const std::vector<Point2d>& hull, double alpha) {
    QILANDSCAPE_REQUIRE_FINITE_POINTS(hull);
    QILANDSCAPE_REQUIRE_RANGE(alpha, 0.0, 1.0);

    if (hull.size() < Internal::MIN_POINTS_FOR_CONVEX_HULL) {
        return QCurve();
    }
    return QCurve(Internal::CatmullRomClosed(hull, alpha), true);
}

std::optional<SmoothedBoundary> ComputeSmoothedHull(const std::vector<Point2d>& points,
                                                    double alpha) {
    QILANDSCAPE_REQUIRE_RANGE(alpha, 0.0, 1.0);

    std::vector<Point2d> hull = ComputeConvexHull(points);
    if (hull.size() < Internal::MIN_POINTS_FOR_CONVEX_HULL) {
        return std::nullopt;
    }

    QCurve path = SmoothHullPath(hull, alpha);
    if (path.Empty()) {
        return std::nullopt;
    }

    SmoothedBoundary result;
    result.hull = std::move(hull);
    result.path = std::move(path);
    return result;
}

// =============================================================================
// Fallback Radius
// =============================================================================

double EstimateRadius(const std::vector<Point2d>& points) {
    QILANDSCAPE_REQUIRE_FINITE_POINTS(points);

    switch (points.size()) {
        case 0:
            return EMPTY_CLUSTER_RADIUS;
        case 1:
            return SINGLE_POINT_RADIUS;
        case 2:
            return std::max(POINT_PAIR_MIN_RADIUS,
                            points[0].DistanceTo(points[1]) / 2.0 + RADIUS_PADDING);
        default:
            break;
    }

    Point2d centroid = Internal::PointCentroid(points);
    double maxDist = Internal::MaxDistanceFrom(centroid, points);
    return std::max(CLUSTER_MIN_RADIUS, maxDist + RADIUS_PADDING);
}

} // namespace Qi::Landscape::Boundary
