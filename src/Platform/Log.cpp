/**
 * @file Log.cpp
 * @brief Logging implementation
 */

#include <BezClip/Platform/Log.h>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace Bez::Clip::Platform {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};

std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& Sink() {
    static LogSink sink;
    return sink;
}

} // namespace

void SetLogLevel(LogLevel level) {
    g_level = level;
}

LogLevel GetLogLevel() {
    return g_level;
}

bool IsLogEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(SinkMutex());
    Sink() = std::move(sink);
}

char LogLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return 'D';
        case LogLevel::Info:    return 'I';
        case LogLevel::Warning: return 'W';
        case LogLevel::Error:   return 'E';
        default:                return 'U';
    }
}

void Log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!IsLogEnabled(level)) {
        return;
    }

    char message[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // Called unlocked: a sink may log or replace itself
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(SinkMutex());
        sink = Sink();
    }
    if (sink) {
        sink(level, module, message);
        return;
    }
    std::fprintf(stderr, "[%s] %c %s\n", module, LogLevelTag(level), message);
}

} // namespace Bez::Clip::Platform
