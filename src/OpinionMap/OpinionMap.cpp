/**
 * @file OpinionMap.cpp
 * @brief Opinion landscape composition implementation
 */

#include <QiLandscape/OpinionMap/OpinionMap.h>
#include <QiLandscape/Boundary/Boundary.h>
#include <QiLandscape/Core/Exception.h>
#include <QiLandscape/Core/Validate.h>
#include <QiLandscape/Internal/GeomConstruct.h>
#include <QiLandscape/Platform/Timer.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <utility>

namespace Qi::Landscape::OpinionMap {

namespace {

// Read once; the static initializer is thread-safe
inline bool IsProfileEnabled() {
    static const bool enabled = [] {
        const char* env = std::getenv("QILANDSCAPE_PROFILE");
        return env != nullptr && env[0] != '\0' && env[0] != '0';
    }();
    return enabled;
}

void ValidateClusters(const std::vector<ClusterInput>& clusters) {
    std::set<int32_t> seen;
    for (const auto& cluster : clusters) {
        if (cluster.groupId < 0) {
            throw InvalidArgumentException(
                "ComposeOpinionMap: cluster groupId must be >= 0, got " +
                std::to_string(cluster.groupId));
        }
        if (!seen.insert(cluster.groupId).second) {
            throw InvalidArgumentException(
                "ComposeOpinionMap: duplicate cluster groupId " +
                std::to_string(cluster.groupId));
        }
        Validate::RequireFinitePoints(cluster.points, "cluster.points", "ComposeOpinionMap");
        if (cluster.centroid) {
            Validate::RequireFinitePoint(*cluster.centroid, "cluster.centroid", "ComposeOpinionMap");
        }
    }
}

// Labels by group id: explicit list, else the cluster's own label, else "Group N"
std::vector<std::string> ResolveGroupLabels(const OpinionMapInput& input, int32_t numGroups) {
    if (!input.groupLabels.empty()) {
        return input.groupLabels;
    }

    std::vector<std::string> labels;
    labels.reserve(static_cast<size_t>(std::max(numGroups, 0)));
    for (int32_t id = 0; id < numGroups; ++id) {
        auto it = std::find_if(input.clusters.begin(), input.clusters.end(),
            [id](const ClusterInput& c) { return c.groupId == id; });
        if (it != input.clusters.end() && !it->label.empty()) {
            labels.push_back(it->label);
        } else {
            labels.push_back(Coalition::DefaultGroupLabel(id));
        }
    }
    return labels;
}

int32_t DefaultGroupCount(const std::vector<ClusterInput>& clusters) {
    int32_t maxId = -1;
    for (const auto& cluster : clusters) {
        maxId = std::max(maxId, cluster.groupId);
    }
    return maxId + 1;
}

} // anonymous namespace

// =============================================================================
// OpinionMapResult
// =============================================================================

std::optional<GroupBoundary> OpinionMapResult::FindBoundary(int32_t groupId) const {
    for (const auto& boundary : boundaries) {
        if (boundary.groupId == groupId) {
            return boundary;
        }
    }
    return std::nullopt;
}

size_t OpinionMapResult::HullCount() const {
    return static_cast<size_t>(std::count_if(boundaries.begin(), boundaries.end(),
        [](const GroupBoundary& b) { return b.IsHull(); }));
}

size_t OpinionMapResult::CircleCount() const {
    return boundaries.size() - HullCount();
}

// =============================================================================
// Framing
// =============================================================================

Rect2d ComputeViewBounds(const std::vector<Point2d>& points,
                         double paddingRatioX, double paddingRatioY) {
    QILANDSCAPE_REQUIRE_FINITE_POINTS(points);
    QILANDSCAPE_REQUIRE_FINITE(paddingRatioX);
    QILANDSCAPE_REQUIRE_FINITE(paddingRatioY);
    QILANDSCAPE_REQUIRE_NON_NEGATIVE(paddingRatioX);
    QILANDSCAPE_REQUIRE_NON_NEGATIVE(paddingRatioY);

    if (points.empty()) {
        return Rect2d(-1.0, -1.0, 2.0, 2.0);
    }

    Rect2d box = Internal::PointBoundingBox(points);
    double minX = box.x, maxX = box.Right();
    double minY = box.y, maxY = box.Bottom();
    if (maxX - minX < EPSILON) {
        minX -= 1.0;
        maxX += 1.0;
    }
    if (maxY - minY < EPSILON) {
        minY -= 1.0;
        maxY += 1.0;
    }

    double padX = (maxX - minX) * paddingRatioX;
    double padY = (maxY - minY) * paddingRatioY;
    minX -= padX; maxX += padX;
    minY -= padY; maxY += padY;
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

Point2d ProjectToCanvas(const Point2d& point, const Rect2d& bounds, const Size2d& canvas) {
    QILANDSCAPE_REQUIRE_FINITE_POINT(point);
    Validate::RequireValidSize(canvas, "canvas", __func__);
    if (!bounds.IsValid() || bounds.width <= 0.0 || bounds.height <= 0.0) {
        throw InvalidArgumentException(
            "ProjectToCanvas: bounds must be finite with positive extent, got " +
            Validate::Detail::FormatValue(bounds.width) + "x" +
            Validate::Detail::FormatValue(bounds.height));
    }

    double u = (point.x - bounds.x) / bounds.width;
    double v = (point.y - bounds.y) / bounds.height;
    return {u * canvas.width, canvas.height - v * canvas.height};
}

std::vector<Point2d> ProjectToCanvas(const std::vector<Point2d>& points,
                                     const Rect2d& bounds, const Size2d& canvas) {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(ProjectToCanvas(p, bounds, canvas));
    }
    return result;
}

// =============================================================================
// Composition
// =============================================================================

GroupBoundary BuildGroupBoundary(int32_t groupId, const std::string& label,
                                 const std::vector<Point2d>& points,
                                 const Point2d& center,
                                 const OpinionMapParams& params) {
    QILANDSCAPE_REQUIRE_FINITE_POINTS(points);
    QILANDSCAPE_REQUIRE_FINITE_POINT(center);
    QILANDSCAPE_REQUIRE_FINITE(params.labelOffset);

    GroupBoundary boundary;
    boundary.groupId = groupId;
    boundary.label = label;
    boundary.memberCount = points.size();
    boundary.center = center;

    auto smoothed = Boundary::ComputeSmoothedHull(points, params.splineAlpha);
    if (smoothed) {
        boundary.kind = BoundaryKind::Hull;
        boundary.hull = std::move(smoothed->hull);
        boundary.path = std::move(smoothed->path);
        boundary.svgPath = boundary.path.ToSvgPath(params.svgPrecision);
        boundary.area = Internal::PolygonArea(boundary.hull);

        double top = boundary.hull.front().y;
        for (const auto& v : boundary.hull) {
            top = std::min(top, v.y);
        }
        boundary.labelAnchor = {center.x, top - params.labelOffset};
        return boundary;
    }

    boundary.kind = BoundaryKind::Circle;
    boundary.circle = Circle2d(center, Boundary::EstimateRadius(points));
    boundary.area = boundary.circle.Area();
    boundary.labelAnchor = {center.x, center.y - boundary.circle.radius - params.labelOffset};
    return boundary;
}

OpinionMapResult ComposeOpinionMap(const OpinionMapInput& input, const OpinionMapParams& params) {
    const bool enableProfile = params.enableProfile || IsProfileEnabled();
    Platform::Timer totalTimer(true);
    double geometryMs = 0.0;
    double coalitionMs = 0.0;
    OpinionMapResult result;

    auto printTiming = [&](const char* status) {
        if (!enableProfile) {
            return;
        }
        std::printf("[LandscapeTiming] status=%s clusters=%zu hulls=%zu circles=%zu pairs=%zu "
                    "geometry=%.3fms coalition=%.3fms total=%.3fms\n",
                    status, input.clusters.size(), result.HullCount(), result.CircleCount(),
                    result.coalitions.pairwiseAlignment.size(),
                    geometryMs, coalitionMs, totalTimer.ElapsedMs());
    };

    try {
        if (params.projectToCanvas) {
            Validate::RequireValidSize(params.canvasSize, "canvasSize", __func__);
        }
        ValidateClusters(input.clusters);

        Platform::Timer geometryTimer(true);
        std::vector<Point2d> allPoints;
        for (const auto& cluster : input.clusters) {
            allPoints.insert(allPoints.end(), cluster.points.begin(), cluster.points.end());
        }
        result.viewBounds = ComputeViewBounds(allPoints, params.paddingRatioX, params.paddingRatioY);

        const Point2d frameCenter = params.projectToCanvas
            ? Point2d(params.canvasSize.width / 2.0, params.canvasSize.height / 2.0)
            : result.viewBounds.Center();

        result.boundaries.reserve(input.clusters.size());
        for (const auto& cluster : input.clusters) {
            std::vector<Point2d> points = params.projectToCanvas
                ? ProjectToCanvas(cluster.points, result.viewBounds, params.canvasSize)
                : cluster.points;

            Point2d center = frameCenter;
            if (cluster.centroid) {
                center = params.projectToCanvas
                    ? ProjectToCanvas(*cluster.centroid, result.viewBounds, params.canvasSize)
                    : *cluster.centroid;
            } else if (!points.empty()) {
                center = Internal::PointCentroid(points);
            }

            result.boundaries.push_back(
                BuildGroupBoundary(cluster.groupId, cluster.label, points, center, params));
        }
        geometryMs = geometryTimer.ElapsedMs();

        Platform::Timer coalitionTimer(true);
        int32_t numGroups = input.numGroups.value_or(DefaultGroupCount(input.clusters));
        result.coalitions = Coalition::AnalyzeCoalitions(
            input.statements, numGroups, ResolveGroupLabels(input, numGroups), params.coalition);
        result.polarizationLevel = Coalition::CalculatePolarizationLevel(result.coalitions);
        result.polarizationCategory = Coalition::ClassifyPolarization(result.coalitions,
                                                                      params.coalition);
        coalitionMs = coalitionTimer.ElapsedMs();
    } catch (const Exception&) {
        printTiming("invalid");
        throw;
    }

    printTiming("ok");
    return result;
}

} // namespace Qi::Landscape::OpinionMap
