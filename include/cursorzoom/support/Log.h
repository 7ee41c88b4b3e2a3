#pragma once
// =============================================================================
// CursorZoom - Log
// Printf-style diagnostics. Lines are formatted into a stack buffer so the
// tick thread can log without touching the heap. Output goes to
// OutputDebugStringA on Windows and stderr elsewhere, or to a host sink.
// =============================================================================

#include <cstdint>

namespace CursorZoom
{
namespace Log
{

enum class Level : uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

// Host sink (e.g. a video host's script log). Called synchronously with the
// finished line, without prefix or trailing newline. nullptr restores the
// default output.
using Sink = void (*)(Level level, const char* line, void* userData);
void setSink(Sink sink, void* userData);

void setMinLevel(Level level);
Level minLevel();
bool enabled(Level level);

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* toString(Level level);

} // namespace Log
} // namespace CursorZoom
