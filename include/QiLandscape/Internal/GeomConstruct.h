#pragma once

/**
 * @file GeomConstruct.h
 * @brief Point-set geometry: orientation tests, Graham scan hull, centroids
 *
 * Used by:
 * - Boundary: cluster hulls and fallback radii
 * - Landscape: view bounds, label anchors, region areas
 *
 * Design principles:
 * - All functions are pure (input not modified)
 * - Orientation tests are strict (collinear is not counter-clockwise)
 * - Sums are recomputed per call, nothing is cached
 */

#include <QiLandscape/Core/Types.h>

#include <cstddef>
#include <vector>

namespace Qi::Landscape::Internal {

/// Minimum points for a drawable hull
constexpr size_t MIN_POINTS_FOR_CONVEX_HULL = 3;

/**
 * @brief Cross product (a - o) x (b - o)
 *
 * Positive for a counter-clockwise turn o -> a -> b, negative for clockwise,
 * zero for collinear points.
 */
inline double CrossProduct(const Point2d& o, const Point2d& a, const Point2d& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

/**
 * @brief Strict counter-clockwise test: (b - a) x (c - a) > 0
 */
inline bool IsCounterClockwise(const Point2d& a, const Point2d& b, const Point2d& c) {
    return CrossProduct(a, b, c) > 0.0;
}

/**
 * @brief Check whether a point set encloses zero area
 *
 * Fewer than 3 points are collinear by definition. The first point and the
 * first point distinct from it define the reference line; the set is
 * collinear iff no other point makes a strict turn with them in either
 * order.
 */
bool AreAllPointsCollinear(const std::vector<Point2d>& points);

/**
 * @brief Index of the Graham scan anchor: minimum y, ties broken by minimum x
 *
 * The first such point wins on exact duplicates. Returns 0 for empty input.
 */
size_t FindAnchorIndex(const std::vector<Point2d>& points);

/**
 * @brief Sort points by polar angle around anchor
 *
 * Ascending atan2 angle; equal angles ordered by ascending squared distance
 * from the anchor. The sort is stable, so exact ties keep input order.
 */
std::vector<Point2d> SortByPolarAngle(const std::vector<Point2d>& points, const Point2d& anchor);

/**
 * @brief Convex hull by Graham scan
 *
 * Output is counter-clockwise, starts at the anchor (minimum y, then
 * minimum x), contains only input points, and keeps no collinear or
 * repeated vertices. Degenerate input (fewer than 3 points or zero area)
 * gives an empty hull.
 */
std::vector<Point2d> ConvexHull(const std::vector<Point2d>& points);

/**
 * @brief Check polygon convexity (consistent turn direction)
 */
bool IsConvex(const std::vector<Point2d>& polygon);

/**
 * @brief Signed polygon area (positive for counter-clockwise)
 */
double SignedPolygonArea(const std::vector<Point2d>& polygon);

inline double PolygonArea(const std::vector<Point2d>& polygon) {
    double area = SignedPolygonArea(polygon);
    return area < 0.0 ? -area : area;
}

/**
 * @brief Arithmetic mean of the points ({0,0} for empty input)
 */
Point2d PointCentroid(const std::vector<Point2d>& points);

/**
 * @brief Largest Euclidean distance from center to any point (0 if empty)
 */
double MaxDistanceFrom(const Point2d& center, const std::vector<Point2d>& points);

/**
 * @brief Axis-aligned bounding box ({0,0,0,0} if empty)
 */
Rect2d PointBoundingBox(const std::vector<Point2d>& points);

} // namespace Qi::Landscape::Internal
