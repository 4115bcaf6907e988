#include <BezClip/Core/Types.h>
#include <BezClip/Core/Constants.h>
#include <BezClip/Core/Exception.h>

#include <string>

namespace Bez::Clip {

// =============================================================================
// Line2d Implementation
// =============================================================================

Line2d::Line2d(double a_, double b_, double c_) {
    if (!std::isfinite(a_) || !std::isfinite(b_) || !std::isfinite(c_)) {
        throw DegenerateGeometryException("Line2d: coefficients must be finite");
    }
    double norm = std::sqrt(a_ * a_ + b_ * b_);
    if (norm == 0.0) {
        throw DegenerateGeometryException("Line2d: a and b are both zero");
    }
    a = a_ / norm;
    b = b_ / norm;
    c = c_ / norm;
}

Line2d Line2d::FromPoints(const Point2d& p1, const Point2d& p2) {
    if (p1 == p2) {
        throw DegenerateGeometryException("Line2d::FromPoints: points coincide");
    }
    double dx = p2.x - p1.x;
    double dy = p2.y - p1.y;
    // Line equation: -dy * x + dx * y + (dy * p1.x - dx * p1.y) = 0
    // dx == 0 yields b == 0 exactly, i.e. the vertical line x = p1.x
    return Line2d(-dy, dx, dy * p1.x - dx * p1.y);
}

double Line2d::YAt(double x) const {
    if (IsVertical()) {
        throw DegenerateGeometryException(
            "Line2d::YAt: vertical line has no y for x = " + std::to_string(x));
    }
    return -(a * x + c) / b;
}

double Line2d::XIntercept() const {
    if (IsHorizontal()) {
        throw DegenerateGeometryException("Line2d::XIntercept: horizontal line");
    }
    return -c / a;
}

// =============================================================================
// ParamInterval Implementation
// =============================================================================

ParamInterval ParamInterval::Compose(const ParamInterval& local) const {
    double lo = MapToOuter(local.low);
    double hi = MapToOuter(local.high);
    // Rounding can push the mapped ends a hair outside the parent range
    lo = Clamp(lo, low, high);
    hi = Clamp(hi, lo, high);
    return ParamInterval(lo, hi);
}

} // namespace Bez::Clip
