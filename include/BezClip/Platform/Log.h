#pragma once

/**
 * @file Log.h
 * @brief Leveled diagnostic logging
 *
 * Messages go to stderr as "[Module] W message" unless a sink is installed.
 * The threshold is global and defaults to Warning.
 *
 * Usage:
 * @code
 * BEZCLIP_LOG_WARNING("CurveIntersect", "stalled after %d iterations", n);
 *
 * // Capture instead of printing
 * SetLogSink([](LogLevel level, const char* module, const char* message) { ... });
 * @endcode
 */

#include <BezClip/Core/Export.h>

#include <functional>

namespace Bez::Clip::Platform {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off         ///< Threshold only: disables all output
};

/// Receives every message that passes the threshold
using LogSink = std::function<void(LogLevel level, const char* module, const char* message)>;

BEZCLIP_API void SetLogLevel(LogLevel level);
BEZCLIP_API LogLevel GetLogLevel();

/// Check if a message at this level would be emitted
BEZCLIP_API bool IsLogEnabled(LogLevel level);

/**
 * @brief Replace the output sink
 * @param sink New sink; an empty function restores stderr output
 */
BEZCLIP_API void SetLogSink(LogSink sink);

/// Single-character level tag ('D', 'I', 'W', 'E')
BEZCLIP_API char LogLevelTag(LogLevel level);

/**
 * @brief Format and emit a message (printf-style)
 */
BEZCLIP_API void Log(LogLevel level, const char* module, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace Bez::Clip::Platform

// Arguments are not evaluated when the level is filtered out
#define BEZCLIP_LOG(level, module, ...)                                        \
    do {                                                                       \
        if (::Bez::Clip::Platform::IsLogEnabled(level)) {                      \
            ::Bez::Clip::Platform::Log(level, module, __VA_ARGS__);            \
        }                                                                      \
    } while (0)

#define BEZCLIP_LOG_DEBUG(module, ...) \
    BEZCLIP_LOG(::Bez::Clip::Platform::LogLevel::Debug, module, __VA_ARGS__)
#define BEZCLIP_LOG_INFO(module, ...) \
    BEZCLIP_LOG(::Bez::Clip::Platform::LogLevel::Info, module, __VA_ARGS__)
#define BEZCLIP_LOG_WARNING(module, ...) \
    BEZCLIP_LOG(::Bez::Clip::Platform::LogLevel::Warning, module, __VA_ARGS__)
#define BEZCLIP_LOG_ERROR(module, ...) \
    BEZCLIP_LOG(::Bez::Clip::Platform::LogLevel::Error, module, __VA_ARGS__)
