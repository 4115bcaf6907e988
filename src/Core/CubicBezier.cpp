#include <BezClip/Core/CubicBezier.h>
#include <BezClip/Core/Constants.h>
#include <BezClip/Core/Validate.h>
#include <BezClip/Internal/BezierClip.h>

#include <algorithm>

namespace Bez::Clip {

// =============================================================================
// Control Points
// =============================================================================

const Point2d& CubicBezier::Point(size_t index) const {
    if (index > 3) {
        throw InvalidArgumentException(
            "CubicBezier::Point: index must be in [0, 3], got " + std::to_string(index));
    }
    return points_[index];
}

// =============================================================================
// Evaluation
// =============================================================================

Point2d CubicBezier::PointAt(double t) const {
    double u = 1.0 - t;
    double b0 = u * u * u;
    double b1 = 3.0 * u * u * t;
    double b2 = 3.0 * u * t * t;
    double b3 = t * t * t;
    return {
        b0 * points_[0].x + b1 * points_[1].x + b2 * points_[2].x + b3 * points_[3].x,
        b0 * points_[0].y + b1 * points_[1].y + b2 * points_[2].y + b3 * points_[3].y
    };
}

Rect2d CubicBezier::BoundingBox() const {
    double minX = points_[0].x, maxX = points_[0].x;
    double minY = points_[0].y, maxY = points_[0].y;

    for (int i = 1; i < 4; ++i) {
        minX = std::min(minX, points_[i].x);
        maxX = std::max(maxX, points_[i].x);
        minY = std::min(minY, points_[i].y);
        maxY = std::max(maxY, points_[i].y);
    }

    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

// =============================================================================
// Subdivision
// =============================================================================

std::pair<CubicBezier, CubicBezier> CubicBezier::SplitAt(double t) const {
    Validate::RequireRange(t, 0.0, 1.0, "t", "CubicBezier::SplitAt");

    // Exact identity splits at the ends
    if (t == 0.0) {
        return {Degenerate(points_[0]), *this};
    }
    if (t == 1.0) {
        return {*this, Degenerate(points_[3])};
    }

    Point2d mid01 = points_[0].Lerp(points_[1], t);
    Point2d mid12 = points_[1].Lerp(points_[2], t);
    Point2d mid23 = points_[2].Lerp(points_[3], t);

    Point2d mid012 = mid01.Lerp(mid12, t);
    Point2d mid123 = mid12.Lerp(mid23, t);

    Point2d split = mid012.Lerp(mid123, t);

    return {
        CubicBezier(points_[0], mid01, mid012, split),
        CubicBezier(split, mid123, mid23, points_[3])
    };
}

std::array<CubicBezier, 3> CubicBezier::Split2(double low, double high) const {
    Validate::RequireParamInterval(low, high, "CubicBezier::Split2");

    // (high - low) / (1 - low) is undefined here; everything past low is p3
    if (low >= 1.0) {
        return {*this, Degenerate(points_[3]), Degenerate(points_[3])};
    }

    auto [left, rest] = SplitAt(low);
    double ratio = Clamp((high - low) / (1.0 - low), 0.0, 1.0);
    auto [middle, right] = rest.SplitAt(ratio);

    return {left, middle, right};
}

// =============================================================================
// Clipping Support
// =============================================================================

FatLine CubicBezier::GetFatLine() const {
    return Internal::ComputeFatLine(*this);
}

FatLine CubicBezier::GetFatLinePerpendicular() const {
    return Internal::ComputeFatLinePerpendicular(*this);
}

std::optional<ParamInterval> CubicBezier::ClipAgainst(const Line2d& line) const {
    return Internal::ClipToLine(*this, line);
}

} // namespace Bez::Clip
