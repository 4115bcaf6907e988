#pragma once

/**
 * @file CurveIntersect.h
 * @brief Cubic Bézier curve-curve intersection by Bézier clipping
 *
 * The solver alternately builds the fat line of one curve and clips the
 * other curve's parameter domain against it, subdividing the clipped curve
 * to the surviving piece. Both parameter intervals shrink until they are
 * narrower than the tolerance.
 *
 * Entry points:
 * - IntersectCurves(): one intersection, reports inconclusive outcomes
 *   (tangency, overlap, several crossings in the same interval) instead of
 *   looping
 * - IntersectCurvesAll(): every intersection, bisecting whenever a clip
 *   step fails to make progress
 * - IntersectCurvesBatch(): many independent pairs on the thread pool
 *
 * Example:
 * @code
 * CubicBezier a({18, 122}, {15, 178}, {247, 173}, {251, 242});
 * CubicBezier b({24, 21}, {189, 40}, {159, 137}, {101, 261});
 *
 * CurveIntersectResult r = IntersectCurves(a, b);
 * if (r.Found()) {
 *     Point2d p = r.intersection.point;   // r.intersection.t1 on a, t2 on b
 * }
 * @endcode
 */

#include <BezClip/Core/Types.h>
#include <BezClip/Core/CubicBezier.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace Bez::Clip {

// =============================================================================
// Constants
// =============================================================================

/// Default width below which both parameter intervals count as converged
constexpr double CURVE_INTERSECT_TOLERANCE = 1e-5;

/// Default clip steps per (sub)problem
constexpr int32_t CURVE_INTERSECT_MAX_ITERATIONS = 64;

/// Upper bound of isolated intersections between two cubics (Bézout)
constexpr int32_t CUBIC_MAX_INTERSECTIONS = 9;

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Solver configuration
 */
struct BEZCLIP_API CurveIntersectParams {
    double tolerance = CURVE_INTERSECT_TOLERANCE;       ///< Converged interval width
    int32_t maxIterations = CURVE_INTERSECT_MAX_ITERATIONS; ///< Clip steps per problem

    // Stall detection
    double stallRatio = 0.8;            ///< Step keeping more than this fraction makes no progress
    int32_t stallIterations = 4;        ///< Consecutive stalled steps before giving up (single solve)

    bool usePerpendicularFatLine = true; ///< Also clip against the strip across the chord

    // Enumeration (IntersectCurvesAll)
    int32_t maxSubdivisionDepth = 24;   ///< Bisection depth limit
    int32_t maxSubproblems = 1024;      ///< Total clip loops allowed
    int32_t maxIntersections = CUBIC_MAX_INTERSECTIONS; ///< More than this means overlap
    double duplicateTolerance = 1e-4;   ///< Results closer than this in both t are merged

    CurveIntersectParams& SetTolerance(double t) { tolerance = t; return *this; }
    CurveIntersectParams& SetMaxIterations(int32_t n) { maxIterations = n; return *this; }
    CurveIntersectParams& SetStall(double ratio, int32_t iterations) {
        stallRatio = ratio; stallIterations = iterations; return *this;
    }
    CurveIntersectParams& SetUsePerpendicularFatLine(bool use) {
        usePerpendicularFatLine = use; return *this;
    }
    CurveIntersectParams& SetMaxSubdivisionDepth(int32_t d) { maxSubdivisionDepth = d; return *this; }
    CurveIntersectParams& SetMaxSubproblems(int32_t n) { maxSubproblems = n; return *this; }
    CurveIntersectParams& SetMaxIntersections(int32_t n) { maxIntersections = n; return *this; }
    CurveIntersectParams& SetDuplicateTolerance(double t) { duplicateTolerance = t; return *this; }
};

/**
 * @brief Validate solver parameters
 * @throws InvalidArgumentException on the first invalid field
 */
BEZCLIP_API void ValidateParams(const CurveIntersectParams& params, const char* funcName);

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Outcome of a single solve
 */
enum class CurveIntersectStatus {
    Converged,          ///< Both intervals narrower than tolerance
    NoIntersection,     ///< A clip step rejected a whole curve
    IterationLimit,     ///< maxIterations reached (inconclusive)
    Stalled             ///< No progress for stallIterations steps (inconclusive)
};

/// Human readable status name
BEZCLIP_API const char* ToString(CurveIntersectStatus status);

/**
 * @brief One intersection between curve 1 and curve 2
 */
struct BEZCLIP_API CurveIntersection {
    double t1 = 0.0;    ///< Parameter on the first curve
    double t2 = 0.0;    ///< Parameter on the second curve
    Point2d point;      ///< Midpoint of the two curves' points at t1 and t2

    CurveIntersection() = default;
    CurveIntersection(double t1_, double t2_, const Point2d& p)
        : t1(t1_), t2(t2_), point(p) {}
};

/**
 * @brief Result of IntersectCurves()
 */
struct BEZCLIP_API CurveIntersectResult {
    CurveIntersectStatus status = CurveIntersectStatus::NoIntersection;
    CurveIntersection intersection;                 ///< Valid when Found()
    ParamInterval interval1 = ParamInterval::Unit(); ///< Final interval on curve 1
    ParamInterval interval2 = ParamInterval::Unit(); ///< Final interval on curve 2
    int32_t iterations = 0;                         ///< Clip steps performed

    bool Found() const { return status == CurveIntersectStatus::Converged; }

    /// Neither an intersection nor a proof of its absence
    bool IsInconclusive() const {
        return status == CurveIntersectStatus::IterationLimit ||
               status == CurveIntersectStatus::Stalled;
    }

    explicit operator bool() const { return Found(); }
};

/**
 * @brief Result of IntersectCurvesAll()
 */
struct BEZCLIP_API CurveIntersectResultN {
    std::vector<CurveIntersection> intersections;   ///< Sorted by t1
    /// Some region could not be resolved (overlap, tangency, a budget hit).
    /// The search stops at that point, so intersections may be partial.
    bool inconclusive = false;
    int32_t subproblems = 0;        ///< Clip loops run
    int32_t iterations = 0;         ///< Clip steps over all subproblems

    int32_t Count() const { return static_cast<int32_t>(intersections.size()); }
    bool HasIntersection() const { return !intersections.empty(); }
};

// =============================================================================
// Solvers
// =============================================================================

/**
 * @brief Find one intersection of two cubic curves
 *
 * Alternates ClipB / ClipA turns starting with clipping curve2 against the
 * fat line of curve1, composing each clipped interval into the cumulative
 * interval of the clipped curve.
 *
 * @param curve1 First curve
 * @param curve2 Second curve
 * @param params Solver configuration
 * @return Converged parameters, NoIntersection, or an inconclusive status
 * @throws InvalidArgumentException for non-finite control points or invalid params
 */
BEZCLIP_API CurveIntersectResult IntersectCurves(const CubicBezier& curve1,
                                                 const CubicBezier& curve2,
                                                 const CurveIntersectParams& params = {});

/**
 * @brief Find all intersections of two cubic curves
 *
 * Runs the same clip loop, and whenever a step keeps more than stallRatio
 * of an interval the curve with the longer interval is bisected and both
 * halves are solved separately.
 *
 * @return Intersections sorted by t1. When inconclusive is set the list holds
 *         only the intersections found before the search stopped.
 * @throws InvalidArgumentException for non-finite control points or invalid params
 */
BEZCLIP_API CurveIntersectResultN IntersectCurvesAll(const CubicBezier& curve1,
                                                     const CubicBezier& curve2,
                                                     const CurveIntersectParams& params = {});

/**
 * @brief Solve many independent pairs with IntersectCurves() in parallel
 * @return One result per pair, in input order
 */
BEZCLIP_API std::vector<CurveIntersectResult> IntersectCurvesBatch(
    const std::vector<std::pair<CubicBezier, CubicBezier>>& pairs,
    const CurveIntersectParams& params = {});

} // namespace Bez::Clip
