// =============================================================================
// CursorZoom - Log
// =============================================================================

#include "cursorzoom/support/Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace CursorZoom
{
namespace Log
{

static constexpr size_t kLineBufferSize = 512;

static std::atomic<Level> s_minLevel{Level::Info};

// Sink and its user pointer are installed together during startup, before
// any tick thread runs.
static std::atomic<Sink> s_sink{nullptr};
static std::atomic<void*> s_sinkUserData{nullptr};

void setSink(Sink sink, void* userData)
{
    s_sinkUserData.store(userData, std::memory_order_relaxed);
    s_sink.store(sink, std::memory_order_release);
}

void setMinLevel(Level level)
{
    s_minLevel.store(level, std::memory_order_relaxed);
}

Level minLevel()
{
    return s_minLevel.load(std::memory_order_relaxed);
}

bool enabled(Level level)
{
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel());
}

const char* toString(Level level)
{
    switch (level)
    {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    }
    return "?";
}

static void emit(Level level, const char* fmt, va_list args)
{
    if (!enabled(level))
        return;

    char line[kLineBufferSize];
    int n = std::vsnprintf(line, sizeof(line), fmt, args);
    if (n < 0)
        return;

    Sink sink = s_sink.load(std::memory_order_acquire);
    if (sink)
    {
        sink(level, line, s_sinkUserData.load(std::memory_order_relaxed));
        return;
    }

#ifdef _WIN32
    char out[kLineBufferSize + 32];
    std::snprintf(out, sizeof(out), "CursorZoom: [%s] %s\n", toString(level), line);
    OutputDebugStringA(out);
#else
    std::fprintf(stderr, "CursorZoom: [%s] %s\n", toString(level), line);
#endif
}

void debug(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(Level::Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(Level::Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(Level::Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(Level::Error, fmt, args);
    va_end(args);
}

} // namespace Log
} // namespace CursorZoom
