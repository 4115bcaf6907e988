#pragma once

/**
 * @file Export.h
 * @brief Symbol visibility for the BezClip library target
 *
 * CMake defines BEZCLIP_BUILD_SHARED while compiling a shared BezClip
 * (BEZCLIP_BUILD_SHARED_LIBS=ON) and BEZCLIP_USE_SHARED for its consumers.
 * A static build defines neither and BEZCLIP_API expands to nothing.
 */

#if defined(_WIN32)
    #if defined(BEZCLIP_BUILD_SHARED)
        #define BEZCLIP_API __declspec(dllexport)
    #elif defined(BEZCLIP_USE_SHARED)
        #define BEZCLIP_API __declspec(dllimport)
    #endif
#elif defined(BEZCLIP_BUILD_SHARED)
    #define BEZCLIP_API __attribute__((visibility("default")))
#endif

#ifndef BEZCLIP_API
    #define BEZCLIP_API
#endif
