#pragma once

/**
 * @file Spline.h
 * @brief Catmull-Rom spline construction as cubic Bezier segments
 *
 * Knot spacing follows |P(i+1) - P(i)|^alpha:
 * - alpha = 0.0: uniform
 * - alpha = 0.5: centripetal (no cusps or self-intersections within a segment)
 * - alpha = 1.0: chordal
 *
 * The tangent at vertex P1 with neighbours P0, P2 is
 *   m1 = (P1-P0)/d01 - (P2-P0)/(d01+d12) + (P2-P1)/d12
 * and the segment P1 -> P2 has Bezier controls
 *   P1 + m1*d12/3 and P2 - m2*d12/3.
 * Both segments meeting at a vertex share its tangent direction.
 */

#include <QiLandscape/Core/QCurve.h>
#include <QiLandscape/Core/Types.h>

#include <vector>

namespace Qi::Landscape::Internal {

/// Centripetal parameterization
constexpr double CATMULL_ROM_CENTRIPETAL = 0.5;

/// Knot intervals below this are treated as coincident points
constexpr double CATMULL_ROM_EPSILON = 1e-12;

/**
 * @brief Bezier segment for the Catmull-Rom span P1 -> P2
 *
 * @param p0 Vertex before the span
 * @param p1 Span start
 * @param p2 Span end
 * @param p3 Vertex after the span
 * @param alpha Knot exponent in [0, 1]
 */
BezierSegment CatmullRomSegment(const Point2d& p0, const Point2d& p1,
                                const Point2d& p2, const Point2d& p3,
                                double alpha = CATMULL_ROM_CENTRIPETAL);

/**
 * @brief Closed Catmull-Rom spline through all vertices
 *
 * Produces one segment per vertex: segment i runs from vertex i to vertex
 * (i+1) mod n. Fewer than 3 vertices give no segments.
 */
std::vector<BezierSegment> CatmullRomClosed(const std::vector<Point2d>& vertices,
                                            double alpha = CATMULL_ROM_CENTRIPETAL);

} // namespace Qi::Landscape::Internal
