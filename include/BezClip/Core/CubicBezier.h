#pragma once

/**
 * @file CubicBezier.h
 * @brief Cubic Bézier curve value type
 *
 * A cubic Bézier curve is defined by four control points p0..p3 and
 * evaluated over the parameter domain [0, 1]. p0 and p3 are the endpoints,
 * p1 and p2 shape the curve. The curve always lies inside the convex hull
 * of its control polygon, which is what the fat-line clipping relies on.
 *
 * All operations are pure: subdivision returns new curves.
 */

#include <BezClip/Core/Types.h>

#include <array>
#include <optional>
#include <utility>

namespace Bez::Clip {

/**
 * @brief Strip bounded by two parallel lines containing a curve's control polygon
 *
 * All three lines share (a, b). Points inside the strip have a non-negative
 * distance to both maxLine and minLine.Negate().
 */
struct BEZCLIP_API FatLine {
    Line2d baseline;    ///< Chord line the strip is built around
    Line2d minLine;     ///< Edge with the smallest c
    Line2d maxLine;     ///< Edge with the largest c

    FatLine() = default;
    FatLine(const Line2d& base, const Line2d& minL, const Line2d& maxL)
        : baseline(base), minLine(minL), maxLine(maxL) {}

    /// Distance between the two bounding edges
    double Width() const { return maxLine.c - minLine.c; }

    /// Check whether a point lies inside the strip
    bool Contains(const Point2d& p, double tolerance = 0.0) const {
        return maxLine.SignedDistance(p) >= -tolerance &&
               minLine.Negate().SignedDistance(p) >= -tolerance;
    }
};

/**
 * @brief Cubic Bézier curve
 */
class BEZCLIP_API CubicBezier {
public:
    /// Curve collapsed to the origin
    CubicBezier() = default;

    CubicBezier(const Point2d& p0, const Point2d& p1, const Point2d& p2, const Point2d& p3)
        : points_{p0, p1, p2, p3} {}

    explicit CubicBezier(const std::array<Point2d, 4>& points) : points_(points) {}

    /// Curve with all four control points at p (result of splitting at an end)
    static CubicBezier Degenerate(const Point2d& p) { return CubicBezier(p, p, p, p); }

    // =========================================================================
    // Control Points
    // =========================================================================

    const Point2d& P0() const { return points_[0]; }
    const Point2d& P1() const { return points_[1]; }
    const Point2d& P2() const { return points_[2]; }
    const Point2d& P3() const { return points_[3]; }

    /**
     * @brief Control point by index
     * @throws InvalidArgumentException if index > 3
     */
    const Point2d& Point(size_t index) const;

    const std::array<Point2d, 4>& Points() const { return points_; }

    bool IsValid() const {
        return points_[0].IsValid() && points_[1].IsValid() &&
               points_[2].IsValid() && points_[3].IsValid();
    }

    /// True if all control points coincide
    bool IsPoint() const {
        return points_[0] == points_[1] && points_[1] == points_[2] &&
               points_[2] == points_[3];
    }

    bool operator==(const CubicBezier& other) const { return points_ == other.points_; }
    bool operator!=(const CubicBezier& other) const { return !(*this == other); }

    // =========================================================================
    // Evaluation
    // =========================================================================

    /**
     * @brief Evaluate the curve with the cubic Bernstein blend
     * @param t Parameter, normally in [0, 1]
     */
    Point2d PointAt(double t) const;

    /// Axis-aligned bounds of the control polygon (contains the curve)
    Rect2d BoundingBox() const;

    // =========================================================================
    // Subdivision
    // =========================================================================

    /**
     * @brief de Casteljau split into [0, t] and [t, 1], both re-parameterized to [0, 1]
     *
     * t = 0 returns (Degenerate(p0), *this), t = 1 returns (*this, Degenerate(p3)).
     *
     * @throws InvalidArgumentException if t is not in [0, 1]
     */
    std::pair<CubicBezier, CubicBezier> SplitAt(double t) const;

    /**
     * @brief Split into [0, low], [low, high], [high, 1]
     *
     * Two chained SplitAt() calls; the second uses (high - low) / (1 - low).
     * low = 1 collapses the middle and right pieces to p3.
     *
     * @throws InvalidArgumentException unless 0 <= low <= high <= 1
     */
    std::array<CubicBezier, 3> Split2(double low, double high) const;

    /// The piece of the curve covering interval, re-parameterized to [0, 1]
    CubicBezier Subcurve(const ParamInterval& interval) const {
        return Split2(interval.low, interval.high)[1];
    }

    /// Same curve traversed from p3 to p0
    CubicBezier Reversed() const {
        return CubicBezier(points_[3], points_[2], points_[1], points_[0]);
    }

    // =========================================================================
    // Clipping Support
    // =========================================================================

    /**
     * @brief Fat line along the chord p0 -> p3 bounding the control polygon
     * @see Internal::ComputeFatLine
     */
    FatLine GetFatLine() const;

    /**
     * @brief Fat line perpendicular to the chord
     * @see Internal::ComputeFatLinePerpendicular
     */
    FatLine GetFatLinePerpendicular() const;

    /**
     * @brief Parameter range where the curve may lie on the non-negative side of line
     * @return std::nullopt if the whole control polygon is on the negative side
     * @see Internal::ClipToLine
     */
    std::optional<ParamInterval> ClipAgainst(const Line2d& line) const;

private:
    std::array<Point2d, 4> points_{};
};

} // namespace Bez::Clip
