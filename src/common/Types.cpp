// =============================================================================
// CursorZoom - Common Types
// =============================================================================

#include "cursorzoom/common/Types.h"

namespace CursorZoom
{

const char* toString(CommandType type)
{
    switch (type)
    {
    case CommandType::None:               return "none";
    case CommandType::ToggleZoom:         return "toggle_zoom";
    case CommandType::ToggleFollow:       return "toggle_follow";
    case CommandType::SetProfile:         return "set_profile";
    case CommandType::SetMouseOverride:   return "mouse_position";
    case CommandType::ClearMouseOverride: return "clear_mouse";
    }
    return "unknown";
}

} // namespace CursorZoom
