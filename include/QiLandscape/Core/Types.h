#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for QiLandscape
 */

#include <QiLandscape/Core/Export.h>

#include <cmath>
#include <vector>

namespace Qi::Landscape {

// =============================================================================
// Constants
// =============================================================================

/// Generic floating point tolerance
constexpr double EPSILON = 1e-12;

/// Pi
constexpr double PI = 3.14159265358979323846;

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point in the opinion plane (or canvas) with double precision
 */
struct QILANDSCAPE_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Squared norm
    double SquaredNorm() const {
        return x * x + y * y;
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Size Type
// =============================================================================

/**
 * @brief 2D size with double dimensions (canvas extent)
 */
struct QILANDSCAPE_API Size2d {
    double width = 0.0;
    double height = 0.0;

    Size2d() = default;
    Size2d(double w, double h) : width(w), height(h) {}

    double Area() const { return width * height; }
    bool IsValid() const {
        return std::isfinite(width) && std::isfinite(height) &&
               width > 0.0 && height > 0.0;
    }
};

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct QILANDSCAPE_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Right() const { return x + width; }
    double Bottom() const { return y + height; }
    double Area() const { return width * height; }
    Point2d Center() const { return {x + width / 2.0, y + height / 2.0}; }

    bool Contains(const Point2d& p) const {
        return p.x >= x && p.x <= Right() && p.y >= y && p.y <= Bottom();
    }

    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }
};

// =============================================================================
// Circle2d
// =============================================================================

/**
 * @brief 2D circle (fallback footprint of a cluster)
 */
struct QILANDSCAPE_API Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}
    Circle2d(double cx, double cy, double r) : center(cx, cy), radius(r) {}

    double Area() const;
    double Circumference() const;

    /// Check if point is inside circle
    bool Contains(const Point2d& p) const {
        return center.DistanceTo(p) <= radius;
    }

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) && radius >= 0.0;
    }
};

/// Point sequence (cluster members, hull vertices)
using PointList = std::vector<Point2d>;

} // namespace Qi::Landscape
