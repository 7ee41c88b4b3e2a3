#pragma once
// =============================================================================
// CursorZoom - Common Types
// Shared geometry, cursor sample and command structures.
// =============================================================================

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace CursorZoom
{

// Point in some 2D space; the owner documents which one (global logical,
// display-local pixels, source pixels).
struct PointF
{
    float x = 0.0f;
    float y = 0.0f;
};

struct SizeF
{
    float width = 0.0f;
    float height = 0.0f;

    bool isValid() const { return width > 0.0f && height > 0.0f; }
    float area() const { return width * height; }
};

// Edges the host already cuts off the capture source (transform crop or an
// upstream crop filter), in display pixels
struct SourceCrop
{
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    bool isEmpty() const { return left == 0.0f && top == 0.0f && right == 0.0f && bottom == 0.0f; }

    // Size left over once the edges are cut from a display of `size` pixels.
    SizeF apply(SizeF size) const { return {size.width - left - right, size.height - top - bottom}; }
};

// Crop rectangle in source pixel space (top-left + size)
struct CropRect
{
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    PointF center() const { return {x + width * 0.5f, y + height * 0.5f}; }

    bool operator==(const CropRect& o) const
    {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const CropRect& o) const { return !(*this == o); }
};

// Native coordinate convention of a cursor producer or display enumerator
enum class OriginConvention : uint8_t
{
    TopLeftDown,    // Windows, X11, Wayland
    BottomLeftUp,   // Cocoa / Quartz global space
};

// One raw cursor reading, handed to the tick by value
struct CursorSample
{
    float rawX = 0.0f;
    float rawY = 0.0f;
    int64_t timestampMs = 0;
    OriginConvention origin = OriginConvention::TopLeftDown;
};

// Commands posted through the bounded queue (hotkeys, remote control) and
// applied by the tick thread at the start of the next frame.
enum class CommandType : uint8_t
{
    None = 0,
    ToggleZoom,
    ToggleFollow,
    SetProfile,
    SetMouseOverride,
    ClearMouseOverride,
};

// Fixed-size POD so that queue push/pop never allocates on the tick thread.
struct ZoomCommand
{
    static constexpr size_t kMaxProfileName = 63;

    CommandType type = CommandType::None;
    uint32_t sequence = 0;   // arrival order, stamped by SharedState::postCommand
    float x = 0.0f;          // SetMouseOverride, source pixel space
    float y = 0.0f;
    std::array<char, kMaxProfileName + 1> profile{};

    std::string_view profileName() const { return std::string_view(profile.data()); }

    static ZoomCommand toggleZoom() { return make(CommandType::ToggleZoom); }
    static ZoomCommand toggleFollow() { return make(CommandType::ToggleFollow); }
    static ZoomCommand clearMouseOverride() { return make(CommandType::ClearMouseOverride); }

    static ZoomCommand setMouseOverride(float px, float py)
    {
        ZoomCommand cmd = make(CommandType::SetMouseOverride);
        cmd.x = px;
        cmd.y = py;
        return cmd;
    }

    // Names longer than kMaxProfileName are truncated and will then fail lookup.
    static ZoomCommand setProfile(std::string_view name)
    {
        ZoomCommand cmd = make(CommandType::SetProfile);
        const size_t n = std::min(name.size(), kMaxProfileName);
        std::memcpy(cmd.profile.data(), name.data(), n);
        cmd.profile[n] = '\0';
        return cmd;
    }

private:
    static ZoomCommand make(CommandType t)
    {
        ZoomCommand cmd;
        cmd.type = t;
        return cmd;
    }
};

const char* toString(CommandType type);

} // namespace CursorZoom
