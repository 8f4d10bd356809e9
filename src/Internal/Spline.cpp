/**
 * @file Spline.cpp
 * @brief Catmull-Rom to Bezier conversion
 */

#include <QiLandscape/Internal/Spline.h>

#include <cmath>

namespace Qi::Landscape::Internal {

namespace {

// |b - a|^alpha, computed from the squared length
double KnotInterval(const Point2d& a, const Point2d& b, double alpha) {
    return std::pow((b - a).SquaredNorm(), alpha * 0.5);
}

// Tangent at p1 (w.r.t. knot parameter) given neighbours p0 and p2.
// Falls back to one-sided differences when a neighbour coincides.
Point2d VertexTangent(const Point2d& p0, const Point2d& p1, const Point2d& p2,
                      double d01, double d12) {
    bool hasPrev = d01 > CATMULL_ROM_EPSILON;
    bool hasNext = d12 > CATMULL_ROM_EPSILON;
    if (hasPrev && hasNext) {
        return (p1 - p0) * (1.0 / d01) - (p2 - p0) * (1.0 / (d01 + d12)) +
               (p2 - p1) * (1.0 / d12);
    }
    if (hasNext) {
        return (p2 - p1) * (1.0 / d12);
    }
    if (hasPrev) {
        return (p1 - p0) * (1.0 / d01);
    }
    return {0.0, 0.0};
}

} // anonymous namespace

BezierSegment CatmullRomSegment(const Point2d& p0, const Point2d& p1,
                                const Point2d& p2, const Point2d& p3,
                                double alpha) {
    double d01 = KnotInterval(p0, p1, alpha);
    double d12 = KnotInterval(p1, p2, alpha);
    double d23 = KnotInterval(p2, p3, alpha);

    // Zero-length span degenerates to a point
    if (d12 <= CATMULL_ROM_EPSILON) {
        return BezierSegment(p1, p1, p2, p2);
    }

    Point2d m1 = VertexTangent(p0, p1, p2, d01, d12);
    Point2d m2 = VertexTangent(p1, p2, p3, d12, d23);

    double scale = d12 / 3.0;
    return BezierSegment(p1, p1 + m1 * scale, p2 - m2 * scale, p2);
}

std::vector<BezierSegment> CatmullRomClosed(const std::vector<Point2d>& vertices, double alpha) {
    std::vector<BezierSegment> segments;
    size_t n = vertices.size();
    if (n < 3) return segments;

    segments.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const Point2d& p0 = vertices[(i + n - 1) % n];
        const Point2d& p1 = vertices[i];
        const Point2d& p2 = vertices[(i + 1) % n];
        const Point2d& p3 = vertices[(i + 2) % n];
        segments.push_back(CatmullRomSegment(p0, p1, p2, p3, alpha));
    }
    return segments;
}

} // namespace Qi::Landscape::Internal
