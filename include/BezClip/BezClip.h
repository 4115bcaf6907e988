#pragma once

/**
 * @file BezClip.h
 * @brief Main header file for BezClip library
 *
 * BezClip computes intersections of cubic Bézier curves by Bézier
 * clipping: fat-line bounding, convex-hull clipping of the parameter
 * domain and de Casteljau subdivision.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <BezClip/BezClipConfig.h>
#include <BezClip/Core/Export.h>

// Core types and utilities
#include <BezClip/Core/Types.h>
#include <BezClip/Core/Constants.h>
#include <BezClip/Core/Exception.h>
#include <BezClip/Core/CubicBezier.h>

// Platform abstraction
#include <BezClip/Platform/Log.h>
#include <BezClip/Platform/Thread.h>

// Feature modules
#include <BezClip/Intersect/CurveIntersect.h>

namespace Bez::Clip {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return BEZCLIP_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = BEZCLIP_VERSION_MAJOR;
    minor = BEZCLIP_VERSION_MINOR;
    patch = BEZCLIP_VERSION_PATCH;
}

} // namespace Bez::Clip
