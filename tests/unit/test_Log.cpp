// =============================================================================
// Unit tests for Log
// Level filtering and the host sink.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "cursorzoom/support/Log.h"

#include <string>
#include <vector>

using namespace CursorZoom;

namespace
{

struct Captured
{
    std::vector<Log::Level> levels;
    std::vector<std::string> lines;
};

void capture(Log::Level level, const char* line, void* userData)
{
    auto* c = static_cast<Captured*>(userData);
    c->levels.push_back(level);
    c->lines.emplace_back(line);
}

// Installs the capturing sink for one test and restores the defaults after.
struct SinkGuard
{
    explicit SinkGuard(Captured& c) { Log::setSink(&capture, &c); }
    ~SinkGuard()
    {
        Log::setSink(nullptr, nullptr);
        Log::setMinLevel(Log::Level::Info);
    }
};

} // namespace

TEST_CASE("Lines are formatted printf-style into the sink", "[Log]")
{
    Captured c;
    SinkGuard guard(c);
    Log::setMinLevel(Log::Level::Debug);

    Log::info("zoom %s at (%.1f, %d)", "in", 12.3, 7);
    Log::error("plain");

    REQUIRE(c.lines.size() == 2);
    REQUIRE(c.lines[0] == "zoom in at (12.3, 7)");
    REQUIRE(c.levels[0] == Log::Level::Info);
    REQUIRE(c.lines[1] == "plain");
    REQUIRE(c.levels[1] == Log::Level::Error);
}

TEST_CASE("Lines below the minimum level are dropped", "[Log]")
{
    Captured c;
    SinkGuard guard(c);
    Log::setMinLevel(Log::Level::Warn);

    Log::debug("d");
    Log::info("i");
    Log::warn("w");
    Log::error("e");

    REQUIRE(c.lines == std::vector<std::string>{"w", "e"});
    REQUIRE_FALSE(Log::enabled(Log::Level::Info));
    REQUIRE(Log::enabled(Log::Level::Error));
}

TEST_CASE("Over-long lines are truncated, not overrun", "[Log]")
{
    Captured c;
    SinkGuard guard(c);

    const std::string longText(2000, 'x');
    Log::warn("%s", longText.c_str());

    REQUIRE(c.lines.size() == 1);
    REQUIRE(c.lines[0].size() < longText.size());
    REQUIRE(c.lines[0].find_first_not_of('x') == std::string::npos);
}

TEST_CASE("Level names", "[Log]")
{
    REQUIRE(std::string(Log::toString(Log::Level::Debug)) == "debug");
    REQUIRE(std::string(Log::toString(Log::Level::Warn)) == "warn");
}
