#pragma once

#include <QiLandscape/Core/Export.h>

/**
 * @file OpinionMap.h
 * @brief Opinion landscape composition: per-group boundaries plus coalition analysis
 *
 * Composes the two independent engines for one poll snapshot:
 * - Boundary: one region per opinion group (smoothed hull, or fallback circle)
 * - Coalition: one pairwise alignment table over all statements
 *
 * Points arrive in the plane of the upstream projection. By default they are
 * mapped into an 800x600 canvas (y axis pointing down) framed by the padded
 * bounds of all participants, so boundaries, radii and label anchors are in
 * canvas units.
 *
 * @code
 * OpinionMapInput input;
 * input.clusters = {{0, "Group A", pointsA}, {1, "Group B", pointsB}};
 * input.statements = scores;
 * OpinionMapResult map = ComposeOpinionMap(input);
 * for (const auto& b : map.boundaries) {
 *     if (b.kind == BoundaryKind::Hull) DrawPath(b.svgPath);
 *     else DrawCircle(b.circle);
 * }
 * @endcode
 */

#include <QiLandscape/Coalition/Coalition.h>
#include <QiLandscape/Core/QCurve.h>
#include <QiLandscape/Core/Types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Qi::Landscape::OpinionMap {

// =============================================================================
// Constants
// =============================================================================

/// Default canvas width
constexpr double DEFAULT_CANVAS_WIDTH = 800.0;

/// Default canvas height
constexpr double DEFAULT_CANVAS_HEIGHT = 600.0;

/// Horizontal padding as a fraction of the x-span (each side)
constexpr double DEFAULT_PADDING_RATIO_X = 0.15;

/// Vertical padding as a fraction of the y-span (each side)
constexpr double DEFAULT_PADDING_RATIO_Y = 0.20;

/// Gap between a region's top edge and its label
constexpr double DEFAULT_LABEL_OFFSET = 10.0;

/// Decimals in generated SVG path data
constexpr int32_t DEFAULT_SVG_PRECISION = 3;

// =============================================================================
// Types
// =============================================================================

/**
 * @brief How a group region is drawn
 */
enum class BoundaryKind {
    Hull,       ///< Smoothed convex hull
    Circle      ///< Fallback circle (too few or collinear members)
};

/**
 * @brief Composition parameters
 */
struct OpinionMapParams {
    bool projectToCanvas = true;                        ///< Map points into the canvas
    Size2d canvasSize{DEFAULT_CANVAS_WIDTH, DEFAULT_CANVAS_HEIGHT};
    double paddingRatioX = DEFAULT_PADDING_RATIO_X;
    double paddingRatioY = DEFAULT_PADDING_RATIO_Y;
    double labelOffset = DEFAULT_LABEL_OFFSET;
    double splineAlpha = 0.5;                           ///< Catmull-Rom knot exponent
    int32_t svgPrecision = DEFAULT_SVG_PRECISION;
    Coalition::CoalitionParams coalition;
    bool enableProfile = false;                         ///< Print timing line (also QILANDSCAPE_PROFILE=1)

    OpinionMapParams& SetProjectToCanvas(bool p) { projectToCanvas = p; return *this; }
    OpinionMapParams& SetCanvasSize(double w, double h) { canvasSize = Size2d(w, h); return *this; }
    OpinionMapParams& SetPadding(double rx, double ry) {
        paddingRatioX = rx; paddingRatioY = ry; return *this;
    }
    OpinionMapParams& SetLabelOffset(double o) { labelOffset = o; return *this; }
    OpinionMapParams& SetSplineAlpha(double a) { splineAlpha = a; return *this; }
    OpinionMapParams& SetCoalitionParams(const Coalition::CoalitionParams& c) {
        coalition = c; return *this;
    }
    OpinionMapParams& SetProfile(bool enable) { enableProfile = enable; return *this; }
};

/**
 * @brief One opinion group as produced by the clustering stage
 */
struct ClusterInput {
    int32_t groupId = 0;                    ///< Dense id, 0..numGroups-1
    std::string label;                      ///< Display label (may be empty)
    std::vector<Point2d> points;            ///< Member positions in the projection plane
    std::optional<Point2d> centroid;        ///< Upstream centroid, if known

    ClusterInput() = default;
    ClusterInput(int32_t id, std::string name, std::vector<Point2d> members,
                 std::optional<Point2d> center = std::nullopt)
        : groupId(id), label(std::move(name)), points(std::move(members)),
          centroid(center) {}
};

/**
 * @brief Full snapshot handed to the composer
 */
struct OpinionMapInput {
    std::vector<ClusterInput> clusters;
    std::vector<Coalition::StatementScores> statements;
    std::optional<int32_t> numGroups;       ///< Default: highest cluster id + 1
    std::vector<std::string> groupLabels;   ///< Default: cluster labels, then "Group N"
};

/**
 * @brief Drawable region of one group
 */
struct GroupBoundary {
    int32_t groupId = 0;
    std::string label;
    BoundaryKind kind = BoundaryKind::Circle;
    size_t memberCount = 0;

    std::vector<Point2d> hull;      ///< Hull vertices (Hull only)
    QCurve path;                    ///< Smoothed outline (Hull only)
    std::string svgPath;            ///< path.ToSvgPath() (Hull only)

    Circle2d circle;                ///< Fallback circle (Circle only)

    Point2d center;                 ///< Group centre (supplied, mean, or frame centre)
    Point2d labelAnchor;            ///< Where the label is drawn (above the region)
    double area = 0.0;              ///< Enclosed area of the drawn region

    bool IsHull() const { return kind == BoundaryKind::Hull; }
};

/**
 * @brief Composition result
 */
struct OpinionMapResult {
    Rect2d viewBounds;                          ///< Padded bounds in the projection plane
    std::vector<GroupBoundary> boundaries;      ///< In cluster input order
    Coalition::CoalitionAnalysis coalitions;
    int32_t polarizationLevel = 0;              ///< 0-100
    Coalition::PolarizationCategory polarizationCategory = Coalition::PolarizationCategory::Low;

    /// Boundary of a group, if present
    std::optional<GroupBoundary> FindBoundary(int32_t groupId) const;

    size_t HullCount() const;
    size_t CircleCount() const;
};

// =============================================================================
// Framing
// =============================================================================

/**
 * @brief Padded bounding box of all participant positions
 *
 * Each side is padded by paddingRatioX (resp. Y) times the span. An empty
 * set gives [-1, 1] x [-1, 1]; a zero span is widened to 2 (value +/- 1).
 *
 * @throws InvalidArgumentException for non-finite points or negative ratios
 */
QILANDSCAPE_API Rect2d ComputeViewBounds(const std::vector<Point2d>& points,
                                         double paddingRatioX = DEFAULT_PADDING_RATIO_X,
                                         double paddingRatioY = DEFAULT_PADDING_RATIO_Y);

/**
 * @brief Map a plane point into the canvas (y axis inverted)
 *
 * x' = (x - bounds.x) / bounds.width * canvas.width
 * y' = canvas.height - (y - bounds.y) / bounds.height * canvas.height
 *
 * @throws InvalidArgumentException for empty bounds or an invalid canvas
 */
QILANDSCAPE_API Point2d ProjectToCanvas(const Point2d& point, const Rect2d& bounds,
                                        const Size2d& canvas);

QILANDSCAPE_API std::vector<Point2d> ProjectToCanvas(const std::vector<Point2d>& points,
                                                     const Rect2d& bounds,
                                                     const Size2d& canvas);

// =============================================================================
// Composition
// =============================================================================

/**
 * @brief Region for one group from points already in the output frame
 *
 * Smoothed hull when one can be drawn, otherwise a circle of
 * Boundary::EstimateRadius around center.
 *
 * @param groupId Group id
 * @param label Display label
 * @param points Member points (output frame)
 * @param center Group centre (output frame)
 * @param params Label offset, spline alpha, SVG precision
 */
QILANDSCAPE_API GroupBoundary BuildGroupBoundary(int32_t groupId,
                                                 const std::string& label,
                                                 const std::vector<Point2d>& points,
                                                 const Point2d& center,
                                                 const OpinionMapParams& params = OpinionMapParams());

/**
 * @brief Compose boundaries and coalition analysis for one snapshot
 *
 * @throws InvalidArgumentException for duplicate or negative cluster ids,
 *         non-finite coordinates, an invalid canvas, or any coalition
 *         contract violation
 */
QILANDSCAPE_API OpinionMapResult ComposeOpinionMap(const OpinionMapInput& input,
                                                   const OpinionMapParams& params = OpinionMapParams());

} // namespace Qi::Landscape::OpinionMap
