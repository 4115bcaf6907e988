#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for BezClip
 *
 * Invalid input throws. A solver that cannot decide (tangency, overlap,
 * exhausted budget) is not an error and reports a status instead.
 */

#include <BezClip/Core/Export.h>

#include <stdexcept>
#include <string>

namespace Bez::Clip {

/**
 * @brief Root of all BezClip exceptions
 */
class BEZCLIP_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Caller supplied a value outside its domain
 *
 * Parameters outside [0, 1], low > high, non-finite control points,
 * invalid CurveIntersectParams fields.
 */
class BEZCLIP_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Geometry that has no well-defined answer
 *
 * Zero-length line normal, coincident points passed to Line2d::FromPoints,
 * YAt() on a vertical line, XIntercept() on a horizontal one.
 */
class BEZCLIP_API DegenerateGeometryException : public Exception {
public:
    explicit DegenerateGeometryException(const std::string& message)
        : Exception("Degenerate geometry: " + message) {}
};

} // namespace Bez::Clip
