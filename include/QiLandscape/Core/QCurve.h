#pragma once

/**
 * @file QCurve.h
 * @brief Piecewise cubic Bezier curve for QiLandscape
 *
 * QCurve is the smooth boundary descriptor handed to the rendering layer:
 * - One cubic segment per pair of consecutive vertices
 * - Segment i ends where segment i+1 starts
 * - Closed curves end where they started
 * - Serializes to SVG path data ("M x,y C ... Z")
 */

#include <QiLandscape/Core/Export.h>
#include <QiLandscape/Core/Types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Qi::Landscape {

/**
 * @brief Cubic Bezier segment: start, two control points, end
 */
struct QILANDSCAPE_API BezierSegment {
    Point2d p0;     ///< Start point (curve passes through)
    Point2d c1;     ///< First control point
    Point2d c2;     ///< Second control point
    Point2d p3;     ///< End point (curve passes through)

    BezierSegment() = default;
    BezierSegment(const Point2d& start, const Point2d& ctrl1,
                  const Point2d& ctrl2, const Point2d& end)
        : p0(start), c1(ctrl1), c2(ctrl2), p3(end) {}

    /// Point at parameter t in [0, 1]
    Point2d PointAt(double t) const;

    /// First derivative at parameter t in [0, 1]
    Point2d TangentAt(double t) const;
};

/**
 * @brief Smooth curve made of cubic Bezier segments
 */
class QILANDSCAPE_API QCurve {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty curve)
    QCurve();

    /// Construct from segments
    explicit QCurve(std::vector<BezierSegment> segments, bool closed = true);

    // =========================================================================
    // Segment Access
    // =========================================================================

    /// Number of segments
    size_t Size() const { return segments_.size(); }

    /// Check if curve is empty
    bool Empty() const { return segments_.empty(); }

    /// Access segment by index (bounds checked)
    const BezierSegment& At(size_t index) const;

    /// Operator[] for unchecked access
    const BezierSegment& operator[](size_t index) const { return segments_[index]; }

    /// All segments
    const std::vector<BezierSegment>& Segments() const { return segments_; }

    /// Is the curve closed?
    bool IsClosed() const { return closed_; }

    /// First point of the curve ({0,0} if empty)
    Point2d StartPoint() const;

    /// Segment endpoints in order (the interpolated vertices)
    std::vector<Point2d> Knots() const;

    // =========================================================================
    // Evaluation
    // =========================================================================

    /**
     * @brief Point on segment at parameter t
     * @throws std::out_of_range if segment index is invalid
     */
    Point2d PointAt(size_t segment, double t) const;

    /**
     * @brief Polyline approximation of the curve
     *
     * Emits samplesPerSegment points per segment starting at each segment's
     * start point. The closing point is not repeated for closed curves.
     *
     * @param samplesPerSegment Points per segment (>= 1)
     */
    std::vector<Point2d> Sample(int32_t samplesPerSegment = 16) const;

    /// Approximate arc length from sampling
    double Length(int32_t samplesPerSegment = 16) const;

    /**
     * @brief Bounding box of all segment and control points
     *
     * Bezier curves lie in the convex hull of their control points, so the
     * box always contains the curve.
     */
    Rect2d ControlBoundingBox() const;

    // =========================================================================
    // Serialization
    // =========================================================================

    /**
     * @brief SVG path data
     *
     * Format: "M x0,y0C c1x,c1y,c2x,c2y,x1,y1C ...Z". Empty curve gives "".
     *
     * @param precision Maximum number of decimals per coordinate
     */
    std::string ToSvgPath(int32_t precision = 3) const;

private:
    std::vector<BezierSegment> segments_;
    bool closed_ = false;
};

} // namespace Qi::Landscape
