#include <QiLandscape/Core/QCurve.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace Qi::Landscape {

// =============================================================================
// BezierSegment
// =============================================================================

Point2d BezierSegment::PointAt(double t) const {
    double u = 1.0 - t;
    double b0 = u * u * u;
    double b1 = 3.0 * u * u * t;
    double b2 = 3.0 * u * t * t;
    double b3 = t * t * t;
    return {b0 * p0.x + b1 * c1.x + b2 * c2.x + b3 * p3.x,
            b0 * p0.y + b1 * c1.y + b2 * c2.y + b3 * p3.y};
}

Point2d BezierSegment::TangentAt(double t) const {
    double u = 1.0 - t;
    Point2d d0 = (c1 - p0) * (3.0 * u * u);
    Point2d d1 = (c2 - c1) * (6.0 * u * t);
    Point2d d2 = (p3 - c2) * (3.0 * t * t);
    return d0 + d1 + d2;
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

// Fixed-point formatting with trailing zeros stripped ("12.500" -> "12.5")
std::string FormatCoord(double value, int32_t precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    std::string s(buf);
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

void AppendPoint(std::string& out, const Point2d& p, int32_t precision) {
    out += FormatCoord(p.x, precision);
    out += ',';
    out += FormatCoord(p.y, precision);
}

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

QCurve::QCurve() = default;

QCurve::QCurve(std::vector<BezierSegment> segments, bool closed)
    : segments_(std::move(segments)), closed_(closed) {}

// =============================================================================
// Segment Access
// =============================================================================

const BezierSegment& QCurve::At(size_t index) const {
    if (index >= segments_.size()) {
        throw std::out_of_range("Curve segment index out of range");
    }
    return segments_[index];
}

Point2d QCurve::StartPoint() const {
    if (segments_.empty()) return {};
    return segments_.front().p0;
}

std::vector<Point2d> QCurve::Knots() const {
    std::vector<Point2d> knots;
    knots.reserve(segments_.size() + 1);
    for (const auto& seg : segments_) {
        knots.push_back(seg.p0);
    }
    if (!closed_ && !segments_.empty()) {
        knots.push_back(segments_.back().p3);
    }
    return knots;
}

// =============================================================================
// Evaluation
// =============================================================================

Point2d QCurve::PointAt(size_t segment, double t) const {
    return At(segment).PointAt(t);
}

std::vector<Point2d> QCurve::Sample(int32_t samplesPerSegment) const {
    std::vector<Point2d> result;
    if (segments_.empty()) return result;

    int32_t n = std::max<int32_t>(1, samplesPerSegment);
    result.reserve(segments_.size() * static_cast<size_t>(n) + 1);
    for (const auto& seg : segments_) {
        for (int32_t i = 0; i < n; ++i) {
            result.push_back(seg.PointAt(static_cast<double>(i) / n));
        }
    }
    if (!closed_) {
        result.push_back(segments_.back().p3);
    }
    return result;
}

double QCurve::Length(int32_t samplesPerSegment) const {
    std::vector<Point2d> pts = Sample(samplesPerSegment);
    if (pts.size() < 2) return 0.0;

    double length = 0.0;
    for (size_t i = 1; i < pts.size(); ++i) {
        length += pts[i - 1].DistanceTo(pts[i]);
    }
    if (closed_) {
        length += pts.back().DistanceTo(pts.front());
    }
    return length;
}

Rect2d QCurve::ControlBoundingBox() const {
    if (segments_.empty()) {
        return Rect2d(0, 0, 0, 0);
    }

    double minX = segments_[0].p0.x, maxX = minX;
    double minY = segments_[0].p0.y, maxY = minY;
    auto extend = [&](const Point2d& p) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    };
    for (const auto& seg : segments_) {
        extend(seg.p0);
        extend(seg.c1);
        extend(seg.c2);
        extend(seg.p3);
    }
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

// =============================================================================
// Serialization
// =============================================================================

std::string QCurve::ToSvgPath(int32_t precision) const {
    if (segments_.empty()) return {};

    int32_t digits = std::clamp<int32_t>(precision, 0, 12);
    std::string path;
    path.reserve(segments_.size() * 48);

    path += 'M';
    AppendPoint(path, segments_.front().p0, digits);
    for (const auto& seg : segments_) {
        path += 'C';
        AppendPoint(path, seg.c1, digits);
        path += ',';
        AppendPoint(path, seg.c2, digits);
        path += ',';
        AppendPoint(path, seg.p3, digits);
    }
    if (closed_) {
        path += 'Z';
    }
    return path;
}

} // namespace Qi::Landscape
