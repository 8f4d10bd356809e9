#pragma once

#include <QiLandscape/Core/Export.h>

/**
 * @file Boundary.h
 * @brief Cluster boundary geometry: convex hulls, smoothed outlines, fallback radii
 *
 * Typical flow for one opinion cluster:
 * @code
 * auto boundary = ComputeSmoothedHull(memberPoints);
 * if (boundary) {
 *     DrawPath(boundary->path.ToSvgPath());
 * } else {
 *     DrawCircle(centroid, EstimateRadius(memberPoints));
 * }
 * @endcode
 *
 * Degenerate input (fewer than 3 points, all points collinear) is a normal
 * result: an empty hull, an empty curve, or no smoothed hull. Only
 * non-finite coordinates throw InvalidArgumentException.
 */

#include <QiLandscape/Core/QCurve.h>
#include <QiLandscape/Core/Types.h>

#include <optional>
#include <vector>

namespace Qi::Landscape::Boundary {

// =============================================================================
// Constants
// =============================================================================

/// Fallback radius for an empty cluster
constexpr double EMPTY_CLUSTER_RADIUS = 30.0;

/// Fallback radius for a single-member cluster
constexpr double SINGLE_POINT_RADIUS = 40.0;

/// Minimum fallback radius for a two-member cluster
constexpr double POINT_PAIR_MIN_RADIUS = 50.0;

/// Minimum fallback radius for three or more members
constexpr double CLUSTER_MIN_RADIUS = 60.0;

/// Padding added to the measured spread
constexpr double RADIUS_PADDING = 20.0;

/// Default Catmull-Rom knot exponent (centripetal)
constexpr double DEFAULT_SPLINE_ALPHA = 0.5;

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Hull vertices together with their smoothed outline
 *
 * path is empty iff hull has fewer than 3 vertices.
 */
struct SmoothedBoundary {
    std::vector<Point2d> hull;  ///< Counter-clockwise hull vertices
    QCurve path;                ///< Closed curve through every hull vertex
};

// =============================================================================
// Hull
// =============================================================================

/**
 * @brief Strict counter-clockwise turn test
 *
 * @return (b.x-a.x)*(c.y-a.y) - (b.y-a.y)*(c.x-a.x) > 0
 */
QILANDSCAPE_API bool IsCounterClockwise(const Point2d& a, const Point2d& b, const Point2d& c);

/**
 * @brief Convex hull of a point set (Graham scan)
 *
 * @param points Input points (may be empty)
 * @return Counter-clockwise hull starting at the lowest (then leftmost)
 *         point; empty for fewer than 3 points or collinear input
 * @throws InvalidArgumentException if any coordinate is not finite
 */
QILANDSCAPE_API std::vector<Point2d> ComputeConvexHull(const std::vector<Point2d>& points);

// =============================================================================
// Smoothing
// =============================================================================

/**
 * @brief Closed smooth curve through hull vertices
 *
 * Catmull-Rom spline (centripetal by default) closed from the last vertex
 * back to the first.
 *
 * @param hull Hull vertices in order
 * @param alpha Knot exponent in [0, 1]
 * @return Curve with one segment per vertex; empty for fewer than 3 vertices
 * @throws InvalidArgumentException for non-finite vertices or alpha outside [0, 1]
 */
QILANDSCAPE_API QCurve SmoothHullPath(const std::vector<Point2d>& hull,
                                      double alpha = DEFAULT_SPLINE_ALPHA);

/**
 * @brief Hull and smoothed outline in one call
 *
 * @return std::nullopt if no hull can be drawn or smoothing gives no curve
 */
QILANDSCAPE_API std::optional<SmoothedBoundary> ComputeSmoothedHull(
    const std::vector<Point2d>& points,
    double alpha = DEFAULT_SPLINE_ALPHA);

// =============================================================================
// Fallback Radius
// =============================================================================

/**
 * @brief Radius of the fallback circle drawn when no hull is available
 *
 * - 0 points: 30
 * - 1 point:  40
 * - 2 points: max(50, distance / 2 + 20)
 * - 3+ points: max(60, max distance from centroid + 20)
 *
 * @throws InvalidArgumentException if any coordinate is not finite
 */
QILANDSCAPE_API double EstimateRadius(const std::vector<Point2d>& points);

} // namespace Qi::Landscape::Boundary
