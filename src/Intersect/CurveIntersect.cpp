/**
 * @file CurveIntersect.cpp
 * @brief Bézier clipping solvers: single, all intersections, batch
 */

#include <BezClip/Intersect/CurveIntersect.h>
#include <BezClip/Internal/BezierClip.h>
#include <BezClip/Core/Validate.h>
#include <BezClip/Platform/Log.h>
#include <BezClip/Platform/Thread.h>

#include <algorithm>
#include <cmath>
#include <optional>

namespace Bez::Clip {

namespace {

constexpr const char* LOG_MODULE = "CurveIntersect";

// Which curve the next step narrows
enum class ClipTurn {
    ClipB,      ///< Clip curve 2 against the fat line of curve 1
    ClipA       ///< Clip curve 1 against the fat line of curve 2
};

/**
 * @brief Working state of one clip loop
 *
 * curve1/curve2 always equal the original curves restricted to
 * interval1/interval2, re-parameterized to [0, 1].
 */
struct ClipState {
    CubicBezier curve1;
    CubicBezier curve2;
    ParamInterval interval1 = ParamInterval::Unit();
    ParamInterval interval2 = ParamInterval::Unit();
    ClipTurn turn = ClipTurn::ClipB;

    ClipState(const CubicBezier& c1, const CubicBezier& c2) : curve1(c1), curve2(c2) {}

    bool IsConverged(double tolerance) const {
        return interval1.Width() <= tolerance && interval2.Width() <= tolerance;
    }

    /**
     * @brief Perform one clip step and hand the turn to the other curve
     * @return Width of the kept local interval, std::nullopt if the clip was empty
     */
    std::optional<double> Step(bool usePerpendicular) {
        CubicBezier& target = (turn == ClipTurn::ClipB) ? curve2 : curve1;
        const CubicBezier& reference = (turn == ClipTurn::ClipB) ? curve1 : curve2;
        ParamInterval& interval = (turn == ClipTurn::ClipB) ? interval2 : interval1;

        std::optional<ParamInterval> clip =
            Internal::ClipCurve(target, reference, usePerpendicular);
        if (!clip) {
            return std::nullopt;
        }

        target = target.Subcurve(*clip);
        interval = interval.Compose(*clip);
        turn = (turn == ClipTurn::ClipB) ? ClipTurn::ClipA : ClipTurn::ClipB;
        return clip->Width();
    }

    /// Split the curve with the wider interval in half (curve 2 on a tie)
    std::pair<ClipState, ClipState> Bisect() const {
        std::pair<ClipState, ClipState> halves(*this, *this);
        if (interval1.Width() > interval2.Width()) {
            auto [left, right] = curve1.SplitAt(0.5);
            auto [lowHalf, highHalf] = interval1.Bisect();
            halves.first.curve1 = left;
            halves.first.interval1 = lowHalf;
            halves.second.curve1 = right;
            halves.second.interval1 = highHalf;
        } else {
            auto [left, right] = curve2.SplitAt(0.5);
            auto [lowHalf, highHalf] = interval2.Bisect();
            halves.first.curve2 = left;
            halves.first.interval2 = lowHalf;
            halves.second.curve2 = right;
            halves.second.interval2 = highHalf;
        }
        return halves;
    }
};

CurveIntersection MakeIntersection(const CubicBezier& curve1, const CubicBezier& curve2,
                                   const ParamInterval& interval1,
                                   const ParamInterval& interval2) {
    double t1 = interval1.Midpoint();
    double t2 = interval2.Midpoint();
    Point2d point = curve1.PointAt(t1).Lerp(curve2.PointAt(t2), 0.5);
    return CurveIntersection(t1, t2, point);
}

// =============================================================================
// Enumeration
// =============================================================================

class Enumerator {
public:
    Enumerator(const CubicBezier& curve1, const CubicBezier& curve2,
               const CurveIntersectParams& params)
        : curve1_(curve1), curve2_(curve2), params_(params) {}

    CurveIntersectResultN Run() {
        Solve(ClipState(curve1_, curve2_), 0);

        std::sort(result_.intersections.begin(), result_.intersections.end(),
                  [](const CurveIntersection& lhs, const CurveIntersection& rhs) {
                      return lhs.t1 < rhs.t1;
                  });
        return std::move(result_);
    }

private:
    void Solve(ClipState state, int32_t depth) {
        if (result_.inconclusive) {
            return;
        }
        if (depth > params_.maxSubdivisionDepth) {
            MarkInconclusive("subdivision depth limit");
            return;
        }
        if (result_.subproblems >= params_.maxSubproblems) {
            MarkInconclusive("subproblem limit");
            return;
        }
        ++result_.subproblems;

        for (int32_t iter = 0; iter < params_.maxIterations; ++iter) {
            std::optional<double> kept = state.Step(params_.usePerpendicularFatLine);
            ++result_.iterations;
            if (!kept) {
                return;
            }

            if (state.IsConverged(params_.tolerance)) {
                Add(state);
                return;
            }

            // Several roots (or a tangency) share this region, separate them
            if (*kept > params_.stallRatio) {
                auto [first, second] = state.Bisect();
                Solve(first, depth + 1);
                Solve(second, depth + 1);
                return;
            }
        }

        MarkInconclusive("iteration limit");
    }

    void Add(const ClipState& state) {
        CurveIntersection hit =
            MakeIntersection(curve1_, curve2_, state.interval1, state.interval2);

        for (const CurveIntersection& existing : result_.intersections) {
            if (std::abs(existing.t1 - hit.t1) <= params_.duplicateTolerance &&
                std::abs(existing.t2 - hit.t2) <= params_.duplicateTolerance) {
                return;
            }
        }

        // More isolated roots than two cubics can have: the curves overlap
        if (result_.Count() >= params_.maxIntersections) {
            MarkInconclusive("intersection count limit");
            return;
        }

        BEZCLIP_LOG_DEBUG(LOG_MODULE, "intersection t1=%.9g t2=%.9g at (%.6g, %.6g)",
                          hit.t1, hit.t2, hit.point.x, hit.point.y);
        result_.intersections.push_back(hit);
    }

    void MarkInconclusive(const char* reason) {
        result_.inconclusive = true;
        BEZCLIP_LOG_WARNING(LOG_MODULE,
                            "IntersectCurvesAll: %s reached after %d subproblems, "
                            "result is inconclusive",
                            reason, result_.subproblems);
    }

    const CubicBezier& curve1_;
    const CubicBezier& curve2_;
    const CurveIntersectParams& params_;
    CurveIntersectResultN result_;
};

} // namespace

// =============================================================================
// Parameters
// =============================================================================

void ValidateParams(const CurveIntersectParams& params, const char* funcName) {
    Validate::RequirePositive(params.tolerance, "tolerance", funcName);
    Validate::RequireRange(params.tolerance, 0.0, 1.0, "tolerance", funcName);
    Validate::RequirePositive(params.maxIterations, "maxIterations", funcName);
    Validate::RequirePositive(params.stallRatio, "stallRatio", funcName);
    Validate::RequireRange(params.stallRatio, 0.0, 1.0, "stallRatio", funcName);
    Validate::RequirePositive(params.stallIterations, "stallIterations", funcName);
    Validate::RequireNonNegative(params.maxSubdivisionDepth, "maxSubdivisionDepth", funcName);
    Validate::RequirePositive(params.maxSubproblems, "maxSubproblems", funcName);
    Validate::RequirePositive(params.maxIntersections, "maxIntersections", funcName);
    Validate::RequireRange(params.duplicateTolerance, 0.0, 1.0, "duplicateTolerance", funcName);
}

const char* ToString(CurveIntersectStatus status) {
    switch (status) {
        case CurveIntersectStatus::Converged:       return "Converged";
        case CurveIntersectStatus::NoIntersection:  return "NoIntersection";
        case CurveIntersectStatus::IterationLimit:  return "IterationLimit";
        case CurveIntersectStatus::Stalled:         return "Stalled";
    }
    return "Unknown";
}

// =============================================================================
// Single Intersection
// =============================================================================

CurveIntersectResult IntersectCurves(const CubicBezier& curve1,
                                     const CubicBezier& curve2,
                                     const CurveIntersectParams& params) {
    ValidateParams(params, "IntersectCurves");
    Validate::RequireFinite(curve1, "curve1", "IntersectCurves");
    Validate::RequireFinite(curve2, "curve2", "IntersectCurves");

    CurveIntersectResult result;
    ClipState state(curve1, curve2);
    int32_t stalledSteps = 0;

    auto finish = [&](CurveIntersectStatus status) {
        result.status = status;
        result.interval1 = state.interval1;
        result.interval2 = state.interval2;
        if (status == CurveIntersectStatus::Converged) {
            result.intersection =
                MakeIntersection(curve1, curve2, state.interval1, state.interval2);
        } else if (result.IsInconclusive()) {
            BEZCLIP_LOG_WARNING(LOG_MODULE,
                                "IntersectCurves: %s after %d steps, t1 in [%.9g, %.9g], "
                                "t2 in [%.9g, %.9g]",
                                ToString(status), result.iterations,
                                state.interval1.low, state.interval1.high,
                                state.interval2.low, state.interval2.high);
        }
        return result;
    };

    while (result.iterations < params.maxIterations) {
        bool clippingB = state.turn == ClipTurn::ClipB;
        std::optional<double> kept = state.Step(params.usePerpendicularFatLine);
        ++result.iterations;
        if (!kept) {
            return finish(CurveIntersectStatus::NoIntersection);
        }

        BEZCLIP_LOG_DEBUG(LOG_MODULE, "step %d clip %s kept %.6g, t1 in [%.9g, %.9g], "
                          "t2 in [%.9g, %.9g]",
                          result.iterations, clippingB ? "B" : "A", *kept,
                          state.interval1.low, state.interval1.high,
                          state.interval2.low, state.interval2.high);

        if (state.IsConverged(params.tolerance)) {
            return finish(CurveIntersectStatus::Converged);
        }

        stalledSteps = (*kept > params.stallRatio) ? stalledSteps + 1 : 0;
        if (stalledSteps >= params.stallIterations) {
            return finish(CurveIntersectStatus::Stalled);
        }
    }

    return finish(CurveIntersectStatus::IterationLimit);
}

// =============================================================================
// All Intersections
// =============================================================================

CurveIntersectResultN IntersectCurvesAll(const CubicBezier& curve1,
                                         const CubicBezier& curve2,
                                         const CurveIntersectParams& params) {
    ValidateParams(params, "IntersectCurvesAll");
    Validate::RequireFinite(curve1, "curve1", "IntersectCurvesAll");
    Validate::RequireFinite(curve2, "curve2", "IntersectCurvesAll");

    return Enumerator(curve1, curve2, params).Run();
}

// =============================================================================
// Batch
// =============================================================================

std::vector<CurveIntersectResult> IntersectCurvesBatch(
    const std::vector<std::pair<CubicBezier, CubicBezier>>& pairs,
    const CurveIntersectParams& params) {
    ValidateParams(params, "IntersectCurvesBatch");

    std::vector<CurveIntersectResult> results(pairs.size());
    Platform::ParallelFor(0, pairs.size(), [&](size_t i) {
        results[i] = IntersectCurves(pairs[i].first, pairs[i].second, params);
    });
    return results;
}

} // namespace Bez::Clip
