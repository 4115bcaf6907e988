/**
 * @file BezierClip.cpp
 * @brief Implementation of fat lines and convex-hull clipping
 */

#include <BezClip/Internal/BezierClip.h>
#include <BezClip/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Bez::Clip::Internal {

namespace {

// Largest absolute control point coordinate
double CoordinateScale(const CubicBezier& curve) {
    double scale = 0.0;
    for (const Point2d& p : curve.Points()) {
        scale = std::max({scale, std::abs(p.x), std::abs(p.y)});
    }
    return scale;
}

// Tolerance proportional to the curve's coordinates, never below the smallest normal double
double ScaledTolerance(const CubicBezier& curve, double relative) {
    return std::max(relative * CoordinateScale(curve), std::numeric_limits<double>::min());
}

// Baseline of the fat line, with the degenerate-chord fallback
Line2d ChordLine(const CubicBezier& curve) {
    const Point2d& p0 = curve.P0();
    double tolerance = ScaledTolerance(curve, DEGENERATE_CHORD_TOLERANCE);
    if (p0.DistanceTo(curve.P3()) > tolerance) {
        return Line2d::FromPoints(p0, curve.P3());
    }

    const Point2d& far = p0.DistanceTo(curve.P1()) >= p0.DistanceTo(curve.P2())
                             ? curve.P1() : curve.P2();
    if (p0.DistanceTo(far) > tolerance) {
        return Line2d::FromPoints(p0, far);
    }
    return Line2d(0.0, 1.0, -p0.y);
}

// x where the segment's supporting line crosses y = 0, none if it is horizontal
std::optional<double> ZeroCrossing(const Point2d& p, const Point2d& q) {
    if (p.y == q.y) {
        return std::nullopt;
    }
    Line2d line = Line2d::FromPoints(p, q);
    if (line.IsHorizontal()) {
        return std::nullopt;
    }
    return line.XIntercept();
}

} // namespace

// =============================================================================
// Fat Lines
// =============================================================================

FatLine ComputeFatLine(const CubicBezier& curve) {
    Line2d baseline = ChordLine(curve);

    // p3 is included: with a near-degenerate chord it is not exactly on the baseline
    double minC = baseline.c;
    double maxC = baseline.c;
    for (const Point2d& p : curve.Points()) {
        double c = baseline.ParallelThrough(p).c;
        minC = std::min(minC, c);
        maxC = std::max(maxC, c);
    }

    return FatLine(baseline, baseline.WithC(minC), baseline.WithC(maxC));
}

FatLine ComputeFatLinePerpendicular(const CubicBezier& curve) {
    Line2d across = ChordLine(curve).PerpendicularThrough(curve.P0());

    double minC = across.c;
    double maxC = across.c;
    for (const Point2d& p : curve.Points()) {
        double c = across.ParallelThrough(p).c;
        minC = std::min(minC, c);
        maxC = std::max(maxC, c);
    }

    return FatLine(across, across.WithC(minC), across.WithC(maxC));
}

// =============================================================================
// Clipping
// =============================================================================

std::optional<ParamInterval> ClipToLine(const CubicBezier& curve, const Line2d& line) {
    const Point2d e[4] = {
        {0.0,       line.SignedDistance(curve.P0())},
        {1.0 / 3.0, line.SignedDistance(curve.P1())},
        {2.0 / 3.0, line.SignedDistance(curve.P2())},
        {1.0,       line.SignedDistance(curve.P3())}
    };

    if (e[0].y < 0.0 && e[1].y < 0.0 && e[2].y < 0.0 && e[3].y < 0.0) {
        return std::nullopt;
    }

    // Low end: smallest crossing in (0, 1] of the hull edges leaving e0
    double low = 0.0;
    if (e[0].y < 0.0) {
        low = 1.0;
        for (int i = 1; i < 4; ++i) {
            std::optional<double> x = ZeroCrossing(e[0], e[i]);
            if (x && *x > 0.0) {
                low = std::min(low, *x);
            }
        }
    }

    // High end: largest crossing in [0, 1) of the hull edges entering e3
    double high = 1.0;
    if (e[3].y < 0.0) {
        high = 0.0;
        for (int i = 0; i < 3; ++i) {
            std::optional<double> x = ZeroCrossing(e[i], e[3]);
            if (x && *x < 1.0) {
                high = std::max(high, *x);
            }
        }
    }

    low = Clamp(low, 0.0, 1.0);
    high = Clamp(high, 0.0, 1.0);
    if (low > high) {
        return std::nullopt;
    }
    return ParamInterval(low, high);
}

std::optional<ParamInterval> ClipToFatLine(const CubicBezier& curve, const FatLine& fatLine) {
    double pad = ScaledTolerance(curve, FAT_LINE_PADDING);

    std::optional<ParamInterval> lowSide =
        ClipToLine(curve, fatLine.minLine.WithC(fatLine.minLine.c - pad).Negate());
    if (!lowSide) {
        return std::nullopt;
    }
    std::optional<ParamInterval> highSide =
        ClipToLine(curve, fatLine.maxLine.WithC(fatLine.maxLine.c + pad));
    if (!highSide) {
        return std::nullopt;
    }
    return IntersectIntervals(*lowSide, *highSide);
}

std::optional<ParamInterval> ClipCurve(const CubicBezier& target,
                                       const CubicBezier& reference,
                                       bool usePerpendicular) {
    std::optional<ParamInterval> clip = ClipToFatLine(target, ComputeFatLine(reference));
    if (!clip || !usePerpendicular) {
        return clip;
    }

    std::optional<ParamInterval> across =
        ClipToFatLine(target, ComputeFatLinePerpendicular(reference));
    if (!across) {
        return std::nullopt;
    }
    return IntersectIntervals(*clip, *across);
}

std::optional<ParamInterval> IntersectIntervals(const ParamInterval& first,
                                                const ParamInterval& second) {
    double start = std::max(first.low, second.low);
    double end = std::min(first.high, second.high);
    if (start > end) {
        return std::nullopt;
    }
    return ParamInterval(start, end);
}

} // namespace Bez::Clip::Internal
