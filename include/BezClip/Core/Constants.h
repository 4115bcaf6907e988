#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and small math helpers
 */

#include <algorithm>

namespace Bez::Clip {

// =============================================================================
// Tolerances
// =============================================================================

// Both tolerances are relative: they are multiplied by the largest absolute
// control point coordinate of the curve, so results do not depend on units.

/// Fat line edges are moved outwards by this times the coordinate scale before clipping
constexpr double FAT_LINE_PADDING = 1e-9;

/// Chord length, relative to the coordinate scale, below which p0 and p3 count as coincident
constexpr double DEGENERATE_CHORD_TOLERANCE = 1e-12;

// =============================================================================
// Helpers
// =============================================================================

template<typename T>
inline T Clamp(T value, T lo, T hi) {
    return std::min(std::max(value, lo), hi);
}

} // namespace Bez::Clip
