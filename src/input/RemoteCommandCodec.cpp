// =============================================================================
// CursorZoom - RemoteCommandCodec
// =============================================================================

#include "cursorzoom/input/RemoteCommandCodec.h"
#include "cursorzoom/support/Log.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <string>

namespace CursorZoom
{

using json = nlohmann::json;

static bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && isBlank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isBlank(s.back()))
        s.remove_suffix(1);
    return s;
}

static std::string_view nextToken(std::string_view& s)
{
    while (!s.empty() && isBlank(s.front()))
        s.remove_prefix(1);
    size_t n = 0;
    while (n < s.size() && !isBlank(s[n]))
        ++n;
    std::string_view token = s.substr(0, n);
    s.remove_prefix(n);
    return token;
}

static bool parseInt(std::string_view token, long& out)
{
    if (token.empty())
        return false;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (*first == '+')
        ++first;
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

// ─── Decode ──────────────────────────────────────────────────────────────────

std::optional<ZoomCommand> RemoteCommandCodec::decodeLegacy(std::string_view text)
{
    std::string_view rest = text;
    long x = 0;
    long y = 0;
    if (!parseInt(nextToken(rest), x) || !parseInt(nextToken(rest), y))
        return std::nullopt;
    return ZoomCommand::setMouseOverride(static_cast<float>(x), static_cast<float>(y));
}

static RemoteCommandCodec::Decoded makeResult(RemoteCommandCodec::Status status,
                                              ZoomCommand cmd = {})
{
    RemoteCommandCodec::Decoded d;
    d.status = status;
    d.command = cmd;
    return d;
}

RemoteCommandCodec::Decoded RemoteCommandCodec::decode(std::string_view message)
{
    const std::string_view body = trim(message);
    if (body.empty())
        return makeResult(Status::Malformed);

    if (body.front() != '{')
    {
        if (auto cmd = decodeLegacy(body))
            return makeResult(Status::Command, *cmd);
        Log::debug("remote: unparseable text message (%zu bytes)", body.size());
        return makeResult(Status::Malformed);
    }

    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        Log::debug("remote: invalid JSON message");
        return makeResult(Status::Malformed);
    }

    if (!j.contains("type") || !j["type"].is_string())
        return makeResult(Status::Malformed);
    const std::string type = j["type"].get<std::string>();

    if (type == "toggle_zoom")
        return makeResult(Status::Command, ZoomCommand::toggleZoom());
    if (type == "toggle_follow")
        return makeResult(Status::Command, ZoomCommand::toggleFollow());
    if (type == "clear_mouse")
        return makeResult(Status::Command, ZoomCommand::clearMouseOverride());
    if (type == "ping")
        return makeResult(Status::Ping);

    if (type == "mouse_position")
    {
        if (!j.contains("x") || !j["x"].is_number() || !j.contains("y") || !j["y"].is_number())
            return makeResult(Status::Malformed);
        const float x = j["x"].get<float>();
        const float y = j["y"].get<float>();
        if (!std::isfinite(x) || !std::isfinite(y))
            return makeResult(Status::Malformed);
        return makeResult(Status::Command, ZoomCommand::setMouseOverride(x, y));
    }

    if (type == "set_profile")
    {
        if (!j.contains("profile") || !j["profile"].is_string())
            return makeResult(Status::Malformed);
        const std::string name = j["profile"].get<std::string>();
        if (name.empty())
            return makeResult(Status::Ignored);
        if (name.size() > ZoomCommand::kMaxProfileName)
        {
            Log::warn("remote: profile name too long (%zu chars)", name.size());
            return makeResult(Status::Malformed);
        }
        return makeResult(Status::Command, ZoomCommand::setProfile(name));
    }

    Log::debug("remote: ignoring message type '%s'", type.c_str());
    return makeResult(Status::Ignored);
}

// ─── Encode ──────────────────────────────────────────────────────────────────

std::string RemoteCommandCodec::encodePong()
{
    return json{{"type", "pong"}}.dump();
}

std::string RemoteCommandCodec::encodeStateUpdate(const RemoteStateUpdate& state)
{
    json j;
    j["type"] = "state_update";
    j["mode"] = toString(state.mode);
    j["zoomed"] = state.mode != ZoomController::Mode::Idle;
    j["follow"] = state.followEnabled;
    j["progress"] = state.zoomProgress;
    j["zoom_factor"] = state.zoomFactor;
    j["profile"] = state.profile;
    j["crop"] = {
        {"x", state.crop.x},
        {"y", state.crop.y},
        {"width", state.crop.width},
        {"height", state.crop.height},
    };
    if (state.mouseOverride)
        j["mouse_override"] = {{"x", state.mouseOverride->x}, {"y", state.mouseOverride->y}};
    else
        j["mouse_override"] = nullptr;
    return j.dump();
}

const char* toString(RemoteCommandCodec::Status status)
{
    switch (status)
    {
    case RemoteCommandCodec::Status::Command:   return "command";
    case RemoteCommandCodec::Status::Ping:      return "ping";
    case RemoteCommandCodec::Status::Ignored:   return "ignored";
    case RemoteCommandCodec::Status::Malformed: return "malformed";
    }
    return "unknown";
}

} // namespace CursorZoom
