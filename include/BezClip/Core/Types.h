#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for BezClip
 */

#include <BezClip/Core/Export.h>

#include <cmath>
#include <utility>

namespace Bez::Clip {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point / vector with double precision
 */
struct BEZCLIP_API Point2d {
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

    /// Linear interpolation: t=0 gives *this, t=1 gives other
    Point2d Lerp(const Point2d& other, double t) const {
        return {(1.0 - t) * x + t * other.x, (1.0 - t) * y + t * other.y};
    }
};

// =============================================================================
// Rect2d
// =============================================================================

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct BEZCLIP_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Right() const { return x + width; }
    double Bottom() const { return y + height; }

    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }
};

// =============================================================================
// Line2d
// =============================================================================

/**
 * @brief 2D line in normalized form: ax + by + c = 0
 * @note Normalized such that a² + b² = 1, so SignedDistance() is a true
 *       Euclidean distance. The sign selects the side of the line.
 */
struct BEZCLIP_API Line2d {
    double a = 0.0;
    double b = 1.0;
    double c = 0.0;

    /// The x-axis (y = 0)
    Line2d() = default;

    /**
     * @brief Construct and normalize
     * @throws DegenerateGeometryException if a = b = 0 or a coefficient is not finite
     */
    Line2d(double a_, double b_, double c_);

    /**
     * @brief Line through two points
     *
     * For p1.x == p2.x the result is the vertical line x = p1.x (b = 0).
     *
     * @throws DegenerateGeometryException if the points coincide
     */
    static Line2d FromPoints(const Point2d& p1, const Point2d& p2);

    /// Unit direction vector
    Point2d Direction() const { return {b, -a}; }

    /// Unit normal vector
    Point2d Normal() const { return {a, b}; }

    bool IsVertical() const { return b == 0.0; }
    bool IsHorizontal() const { return a == 0.0; }

    /**
     * @brief y-coordinate of the line at x
     * @throws DegenerateGeometryException for a vertical line
     */
    double YAt(double x) const;

    /**
     * @brief x where the line crosses y = 0, i.e. -c / a
     * @throws DegenerateGeometryException for a horizontal line
     */
    double XIntercept() const;

    /// Signed distance from point to line
    double SignedDistance(const Point2d& p) const {
        return a * p.x + b * p.y + c;
    }

    /// Absolute distance from point to line
    double Distance(const Point2d& p) const {
        return std::abs(SignedDistance(p));
    }

    /// Same line with the accepted (non-negative) side flipped
    Line2d Negate() const {
        Line2d line = *this;
        line.a = -a;
        line.b = -b;
        line.c = -c;
        return line;
    }

    /// Same normal, different offset
    Line2d WithC(double c_) const {
        Line2d line = *this;
        line.c = c_;
        return line;
    }

    /// Parallel line (same a, b) through point
    Line2d ParallelThrough(const Point2d& p) const {
        return WithC(-(a * p.x) - (b * p.y));
    }

    /// Line through point whose normal is this line's direction
    Line2d PerpendicularThrough(const Point2d& p) const {
        Line2d line = *this;
        line.a = b;
        line.b = -a;
        line.c = -(line.a * p.x) - (line.b * p.y);
        return line;
    }

    bool IsValid() const {
        return std::isfinite(a) && std::isfinite(b) && std::isfinite(c) &&
               (std::abs(a) + std::abs(b) > 0.0);
    }
};

// =============================================================================
// ParamInterval
// =============================================================================

/**
 * @brief Sub-range [low, high] of a curve's parameter domain [0, 1]
 */
struct BEZCLIP_API ParamInterval {
    double low = 0.0;
    double high = 1.0;

    ParamInterval() = default;
    ParamInterval(double low_, double high_) : low(low_), high(high_) {}

    /// The whole domain [0, 1]
    static ParamInterval Unit() { return ParamInterval(0.0, 1.0); }

    double Width() const { return high - low; }
    double Midpoint() const { return 0.5 * (low + high); }

    bool Contains(double t, double tolerance = 0.0) const {
        return t >= low - tolerance && t <= high + tolerance;
    }

    /**
     * @brief Map an interval expressed in the local [0, 1] parameterization
     *        of the sub-curve covering *this back into the enclosing domain
     */
    ParamInterval Compose(const ParamInterval& local) const;

    /// Map a local parameter of the sub-curve covering *this to the enclosing domain
    double MapToOuter(double t) const { return low + t * (high - low); }

    /// Halves [low, mid] and [mid, high]
    std::pair<ParamInterval, ParamInterval> Bisect() const {
        double mid = Midpoint();
        return {ParamInterval(low, mid), ParamInterval(mid, high)};
    }

    bool IsValid() const {
        return std::isfinite(low) && std::isfinite(high) &&
               low >= 0.0 && low <= high && high <= 1.0;
    }
};

} // namespace Bez::Clip
