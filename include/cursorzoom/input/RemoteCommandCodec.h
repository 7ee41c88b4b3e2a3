#pragma once
// =============================================================================
// CursorZoom - RemoteCommandCodec
// Wire format of the remote-control channel. Incoming JSON messages
// ({"type": "toggle_zoom"}, {"type": "mouse_position", "x": .., "y": ..}, ...)
// and the legacy "x y" datagram decode to ZoomCommands; outgoing state is
// encoded as a "state_update" message. Transport is the host's business.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/logic/ZoomController.h"

#include <optional>
#include <string>
#include <string_view>

namespace CursorZoom
{

struct RemoteStateUpdate
{
    ZoomController::Mode mode = ZoomController::Mode::Idle;
    bool followEnabled = false;
    float zoomProgress = 0.0f;
    float zoomFactor = 1.0f;      // effective zoom, 1 at full frame
    CropRect crop{};
    std::string profile;
    std::optional<PointF> mouseOverride;
};

class RemoteCommandCodec
{
public:
    enum class Status : uint8_t
    {
        Command,     // `command` holds a command to post
        Ping,        // reply with encodePong()
        Ignored,     // well-formed but nothing to do (unknown type)
        Malformed,   // not JSON / not "x y" / missing fields
    };

    struct Decoded
    {
        Status status = Status::Malformed;
        ZoomCommand command{};
    };

    // JSON when the first non-blank character is '{', otherwise legacy text.
    static Decoded decode(std::string_view message);

    // "x y" integer pair -> SetMouseOverride. Extra tokens are ignored.
    static std::optional<ZoomCommand> decodeLegacy(std::string_view text);

    static std::string encodePong();
    static std::string encodeStateUpdate(const RemoteStateUpdate& state);
};

const char* toString(RemoteCommandCodec::Status status);

} // namespace CursorZoom
