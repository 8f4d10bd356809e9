#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for QiLandscape
 *
 * Design principles:
 * - Degenerate input (too few points, collinear points) is NOT validated
 *   here; algorithms degrade it to a fallback result
 * - Contract violations (non-finite values, negative counts) throw
 * - Consistent error message format: "<func>: <param> must be ..., got <value>"
 */

#include <QiLandscape/Core/Export.h>
#include <QiLandscape/Core/Exception.h>
#include <QiLandscape/Core/Types.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace Qi::Landscape::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline std::string FormatPoint(const Point2d& p) {
    return "(" + FormatValue(p.x) + ", " + FormatValue(p.y) + ")";
}

} // namespace Detail

// =============================================================================
// Scalar Validation
// =============================================================================

/**
 * @brief Validate value is finite (not NaN, not infinity)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is in range [minVal, maxVal]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Geometry Validation
// =============================================================================

/**
 * @brief Validate point has finite coordinates
 */
inline void RequireFinitePoint(const Point2d& p, const char* paramName, const char* funcName) {
    if (!p.IsValid()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must have finite coordinates, got " +
            Detail::FormatPoint(p));
    }
}

/**
 * @brief Validate every point of a sequence has finite coordinates
 *
 * Empty sequences are valid.
 */
inline void RequireFinitePoints(const std::vector<Point2d>& points,
                                const char* paramName, const char* funcName) {
    for (size_t i = 0; i < points.size(); ++i) {
        if (!points[i].IsValid()) {
            throw InvalidArgumentException(
                std::string(funcName) + ": " + paramName + "[" + std::to_string(i) +
                "] must have finite coordinates, got " + Detail::FormatPoint(points[i]));
        }
    }
}

/**
 * @brief Validate size has finite, strictly positive extent
 */
inline void RequireValidSize(const Size2d& size, const char* paramName, const char* funcName) {
    if (!size.IsValid()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite and > 0, got " +
            Detail::FormatValue(size.width) + "x" + Detail::FormatValue(size.height));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define QILANDSCAPE_REQUIRE_FINITE(val) \
    ::Qi::Landscape::Validate::RequireFinite(val, #val, __func__)

#define QILANDSCAPE_REQUIRE_FINITE_POINT(pt) \
    ::Qi::Landscape::Validate::RequireFinitePoint(pt, #pt, __func__)

#define QILANDSCAPE_REQUIRE_FINITE_POINTS(points) \
    ::Qi::Landscape::Validate::RequireFinitePoints(points, #points, __func__)

#define QILANDSCAPE_REQUIRE_RANGE(val, min, max) \
    ::Qi::Landscape::Validate::RequireRange(val, min, max, #val, __func__)

#define QILANDSCAPE_REQUIRE_NON_NEGATIVE(val) \
    ::Qi::Landscape::Validate::RequireNonNegative(val, #val, __func__)

} // namespace Qi::Landscape::Validate
