/**
 * @file GeomConstruct.cpp
 * @brief Implementation of point-set geometry
 */

#include <QiLandscape/Internal/GeomConstruct.h>

#include <algorithm>
#include <cmath>

namespace Qi::Landscape::Internal {

// =============================================================================
// Orientation
// =============================================================================

bool AreAllPointsCollinear(const std::vector<Point2d>& points) {
    if (points.size() < MIN_POINTS_FOR_CONVEX_HULL) {
        return true;
    }

    const Point2d& first = points[0];
    size_t secondIdx = 1;
    while (secondIdx < points.size() && points[secondIdx] == first) {
        ++secondIdx;
    }
    // All points identical
    if (secondIdx >= points.size()) {
        return true;
    }
    const Point2d& second = points[secondIdx];

    for (size_t i = secondIdx + 1; i < points.size(); ++i) {
        if (IsCounterClockwise(first, second, points[i]) ||
            IsCounterClockwise(first, points[i], second)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Convex Hull (Graham scan)
// =============================================================================

size_t FindAnchorIndex(const std::vector<Point2d>& points) {
    size_t anchor = 0;
    for (size_t i = 1; i < points.size(); ++i) {
        const Point2d& p = points[i];
        const Point2d& a = points[anchor];
        if (p.y < a.y || (p.y == a.y && p.x < a.x)) {
            anchor = i;
        }
    }
    return anchor;
}

std::vector<Point2d> SortByPolarAngle(const std::vector<Point2d>& points, const Point2d& anchor) {
    struct Keyed {
        Point2d p;
        double angle;
        double dist2;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(points.size());
    for (const auto& p : points) {
        Point2d d = p - anchor;
        keyed.push_back({p, std::atan2(d.y, d.x), d.SquaredNorm()});
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (a.angle != b.angle) return a.angle < b.angle;
        return a.dist2 < b.dist2;
    });

    std::vector<Point2d> sorted;
    sorted.reserve(keyed.size());
    for (const auto& k : keyed) {
        sorted.push_back(k.p);
    }
    return sorted;
}

std::vector<Point2d> ConvexHull(const std::vector<Point2d>& points) {
    if (points.size() < MIN_POINTS_FOR_CONVEX_HULL) {
        return {};
    }
    if (AreAllPointsCollinear(points)) {
        return {};
    }

    size_t anchorIdx = FindAnchorIndex(points);
    const Point2d anchor = points[anchorIdx];

    std::vector<Point2d> others;
    others.reserve(points.size() - 1);
    for (size_t i = 0; i < points.size(); ++i) {
        if (i != anchorIdx) others.push_back(points[i]);
    }
    std::vector<Point2d> sorted = SortByPolarAngle(others, anchor);

    // Stack scan: pop while the top two and the candidate do not turn left
    std::vector<Point2d> hull;
    hull.reserve(points.size());
    hull.push_back(anchor);
    for (const auto& p : sorted) {
        while (hull.size() >= 2 &&
               !IsCounterClockwise(hull[hull.size() - 2], hull[hull.size() - 1], p)) {
            hull.pop_back();
        }
        // Duplicates of the anchor survive the turn test against a lone anchor
        if (hull.size() == 1 && p == anchor) {
            continue;
        }
        hull.push_back(p);
    }

    if (hull.size() < MIN_POINTS_FOR_CONVEX_HULL) {
        return {};
    }
    return hull;
}

bool IsConvex(const std::vector<Point2d>& polygon) {
    size_t n = polygon.size();
    if (n < 3) return true;
    bool hasPositive = false;
    bool hasNegative = false;
    for (size_t i = 0; i < n; ++i) {
        double cross = CrossProduct(polygon[i],
                                    polygon[(i + 1) % n],
                                    polygon[(i + 2) % n]);
        if (cross > 0.0) hasPositive = true;
        if (cross < 0.0) hasNegative = true;
        if (hasPositive && hasNegative) return false;
    }
    return true;
}

// =============================================================================
// Polygon Area and Centroid
// =============================================================================

double SignedPolygonArea(const std::vector<Point2d>& polygon) {
    if (polygon.size() < 3) return 0.0;
    double twiceArea = 0.0;
    size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        const Point2d& a = polygon[i];
        const Point2d& b = polygon[(i + 1) % n];
        twiceArea += a.x * b.y - b.x * a.y;
    }
    return twiceArea * 0.5;
}

Point2d PointCentroid(const std::vector<Point2d>& points) {
    if (points.empty()) return {0.0, 0.0};

    double sumX = 0.0;
    double sumY = 0.0;
    for (const auto& p : points) {
        sumX += p.x;
        sumY += p.y;
    }
    double n = static_cast<double>(points.size());
    return {sumX / n, sumY / n};
}

double MaxDistanceFrom(const Point2d& center, const std::vector<Point2d>& points) {
    double maxDist = 0.0;
    for (const auto& p : points) {
        maxDist = std::max(maxDist, center.DistanceTo(p));
    }
    return maxDist;
}

Rect2d PointBoundingBox(const std::vector<Point2d>& points) {
    if (points.empty()) {
        return Rect2d(0, 0, 0, 0);
    }

    double minX = points[0].x, maxX = points[0].x;
    double minY = points[0].y, maxY = points[0].y;
    for (size_t i = 1; i < points.size(); ++i) {
        minX = std::min(minX, points[i].x);
        maxX = std::max(maxX, points[i].x);
        minY = std::min(minY, points[i].y);
        maxY = std::max(maxY, points[i].y);
    }
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

} // namespace Qi::Landscape::Internal
