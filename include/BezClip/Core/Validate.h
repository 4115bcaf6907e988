#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for BezClip
 *
 * Design principles:
 * - Invalid input throws, it never propagates as NaN/Inf
 * - Consistent error message format: "<function>: <param> must ..., got ..."
 */

#include <BezClip/Core/Export.h>
#include <BezClip/Core/Exception.h>
#include <BezClip/Core/Types.h>
#include <BezClip/Core/CubicBezier.h>

#include <cstdio>
#include <string>

namespace Bez::Clip::Validate {

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

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatPoint(const Point2d& p) {
    return "(" + FormatValue(p.x) + ", " + FormatValue(p.y) + ")";
}

} // namespace Detail

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    // Negated form so that NaN fails as well
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
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
inline void RequireFinite(const Point2d& p, const char* paramName, const char* funcName) {
    if (!p.IsValid()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatPoint(p));
    }
}

/**
 * @brief Validate all four control points are finite
 */
inline void RequireFinite(const CubicBezier& curve, const char* paramName,
                          const char* funcName) {
    const auto& points = curve.Points();
    for (size_t i = 0; i < points.size(); ++i) {
        if (!points[i].IsValid()) {
            throw InvalidArgumentException(
                std::string(funcName) + ": " + paramName + " control point " +
                std::to_string(i) + " must be finite, got " +
                Detail::FormatPoint(points[i]));
        }
    }
}

/**
 * @brief Validate 0 <= low <= high <= 1
 */
inline void RequireParamInterval(double low, double high, const char* funcName) {
    RequireRange(low, 0.0, 1.0, "low", funcName);
    RequireRange(high, 0.0, 1.0, "high", funcName);
    if (low > high) {
        throw InvalidArgumentException(
            std::string(funcName) + ": low must be <= high, got [" +
            Detail::FormatValue(low) + ", " + Detail::FormatValue(high) + "]");
    }
}

} // namespace Bez::Clip::Validate
