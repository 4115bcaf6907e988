#pragma once

/**
 * @file BezierClip.h
 * @brief Fat-line construction and parameter-domain clipping for cubic Béziers
 *
 * This module provides the building blocks of Bézier clipping:
 * - Fat line of a curve (strip along the chord bounding the control polygon)
 * - Perpendicular fat line (strip across the chord)
 * - Clipping a curve's parameter domain against a single line
 * - Clipping against a whole fat line
 *
 * Clipping uses the control-point distances at t = 0, 1/3, 2/3, 1 as a
 * piecewise-linear proxy of the curve's distance function. By the convex
 * hull property the returned interval never excludes a parameter where the
 * curve reaches the accepted side.
 *
 * Used by:
 * - Intersect/CurveIntersect: the alternating clip loop
 * - CubicBezier::GetFatLine / ClipAgainst convenience queries
 */

#include <BezClip/Core/Types.h>
#include <BezClip/Core/CubicBezier.h>

#include <optional>

namespace Bez::Clip::Internal {

// =============================================================================
// Fat Lines
// =============================================================================

/**
 * @brief Fat line parallel to the chord p0 -> p3
 *
 * The baseline runs through p0 and p3. The two edges are the parallels
 * through the extreme control points, so the strip contains the whole
 * control polygon and therefore the curve.
 *
 * When p0 and p3 coincide (closer than DEGENERATE_CHORD_TOLERANCE times the
 * largest absolute coordinate) the
 * baseline runs from p0 towards whichever interior control point is farther
 * away. If all four points coincide the baseline is the horizontal line
 * through p0 and the strip has zero width.
 *
 * @param curve Curve to bound
 * @return (baseline, minLine, maxLine)
 */
FatLine ComputeFatLine(const CubicBezier& curve);

/**
 * @brief Fat line perpendicular to the chord
 *
 * Edges are perpendicular to the baseline of ComputeFatLine() and pass
 * through the extreme projections of all four control points on it.
 */
FatLine ComputeFatLinePerpendicular(const CubicBezier& curve);

// =============================================================================
// Clipping
// =============================================================================

/**
 * @brief Clip the curve's parameter domain to the non-negative side of a line
 *
 * Samples e_i = (i/3, line.SignedDistance(p_i)).
 * - All four distances negative: the curve is entirely rejected.
 * - e_0 negative: low is the smallest positive zero crossing of the lines
 *   e_0 -> e_1, e_0 -> e_2, e_0 -> e_3; otherwise low = 0.
 * - e_3 negative: high is the largest zero crossing below 1 of the lines
 *   e_0 -> e_3, e_1 -> e_3, e_2 -> e_3; otherwise high = 1.
 *
 * @return Interval in the curve's own [0, 1] domain, or std::nullopt if empty
 */
std::optional<ParamInterval> ClipToLine(const CubicBezier& curve, const Line2d& line);

/**
 * @brief Clip the curve's parameter domain to the inside of a fat line
 *
 * Intersection of ClipToLine(curve, minLine.Negate()) and
 * ClipToLine(curve, maxLine), with both edges first moved outwards by
 * FAT_LINE_PADDING times the curve's largest absolute coordinate, so that a zero-width
 * strip still accepts points lying on it up to rounding.
 *
 * @return Surviving interval, or std::nullopt if the curve misses the strip
 */
std::optional<ParamInterval> ClipToFatLine(const CubicBezier& curve, const FatLine& fatLine);

/**
 * @brief One Bézier clipping step: clip target against reference's fat line(s)
 *
 * @param target Curve whose domain is narrowed
 * @param reference Curve providing the bounding strip
 * @param usePerpendicular Also clip against the perpendicular strip and keep
 *                         the intersection of both intervals
 * @return Surviving interval in target's local [0, 1] domain, or std::nullopt
 */
std::optional<ParamInterval> ClipCurve(const CubicBezier& target,
                                       const CubicBezier& reference,
                                       bool usePerpendicular = false);

/**
 * @brief Intersection of two parameter intervals
 * @return std::nullopt if they do not overlap
 */
std::optional<ParamInterval> IntersectIntervals(const ParamInterval& first,
                                                const ParamInterval& second);

} // namespace Bez::Clip::Internal
