#pragma once
// =============================================================================
// CursorZoom - ZoomController
// Zoom/follow state machine for one capture source. Produces the crop
// rectangle for every tick from eased, time-based interpolation.
// Not reentrant: owned and driven by a single tick thread.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/display/CoordinateMapper.h"
#include "cursorzoom/logic/ZoomProfile.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace CursorZoom
{

class ZoomController
{
public:
    enum class Mode : uint8_t
    {
        Idle,         // full-frame crop
        ZoomingIn,    // extent easing from full frame toward source / zoomFactor
        Zoomed,       // steady zoom, following or frozen
        ZoomingOut,   // extent easing back to full frame
    };

    ZoomController();

    // Source geometry changed: store it and snap back to an Idle full frame.
    // A zoom-in toggled while no source size was known starts from the full
    // frame once the first valid size arrives.
    void setSourceSize(SizeF pixelSize);
    SizeF sourceSize() const { return source_; }

    // Swaps the active profile. Mode and the current rectangle are kept;
    // only targets and speeds of future interpolation change.
    // Returns false (profile unchanged) for null or invalid profiles.
    bool setProfile(std::shared_ptr<const ZoomProfile> profile);
    const ZoomProfile& profile() const { return *profile_; }
    const std::shared_ptr<const ZoomProfile>& profilePtr() const { return profile_; }

    // Idle/ZoomingOut -> ZoomingIn toward the given cursor; ZoomingIn/Zoomed -> ZoomingOut.
    // Zooming out also switches following off.
    void toggleZoom(const MappedPoint& cursor);

    // Flips following without touching the mode. Turning it off freezes the
    // centre where it is, abandoning any in-flight follow leg.
    void toggleFollow();

    // While set, the override point (source pixels) replaces the live cursor.
    void setMouseOverride(PointF point);
    void clearMouseOverride();

    // Per-frame update. dt <= 0 leaves the current rectangle untouched.
    CropRect advance(float dtSeconds, const MappedPoint& mapped);

    // Snap to Idle / full frame (source removal, shutdown).
    void reset();

    // Current rectangle clamped into the source. Never negative or inverted.
    CropRect cropRect() const;
    CropRect fullFrame() const;

    // Accessors
    Mode mode() const { return mode_; }
    bool isZoomed() const { return mode_ != Mode::Idle; }
    bool isAnimating() const { return mode_ == Mode::ZoomingIn || mode_ == Mode::ZoomingOut; }
    bool followEnabled() const { return followEnabled_; }
    PointF currentCenter() const { return currentCenter_; }
    SizeF currentExtent() const { return currentExtent_; }
    PointF targetCenter() const { return targetCenter_; }
    SizeF targetExtent() const;
    const std::optional<PointF>& mouseOverride() const { return override_; }
    float zoomProgress() const { return extentProgress_; }
    bool isTrackingCenter() const { return centerLegActive_; }

    // Source width over current extent width; 1 at full frame.
    float effectiveZoom() const;

private:
    PointF sourceCenter() const { return {source_.width * 0.5f, source_.height * 0.5f}; }
    PointF clampToSource(PointF p) const;
    void noteCursor(const MappedPoint& mapped);
    PointF resolveTargetCenter() const;
    PointF zoomInTarget() const;

    void startExtentLeg();
    void advanceExtent(float dt);
    void advanceCenterTracking(float dt);
    bool cursorReversed(PointF target) const;
    void finishZoomIn();
    void finishZoomOut();
    void freezeCenter();

    SizeF source_{};
    std::shared_ptr<const ZoomProfile> profile_;

    Mode mode_ = Mode::Idle;
    bool followEnabled_ = false;

    PointF currentCenter_{};
    SizeF currentExtent_{};
    PointF targetCenter_{};
    PointF frozenCenter_{};
    std::optional<PointF> override_;

    PointF lastCursor_{};
    bool hasCursor_ = false;
    bool cursorOutside_ = false;    // last sample was clipped to the display

    // Extent leg (ZoomingIn, ZoomingOut, or a zoom factor change while Zoomed)
    bool extentLegActive_ = false;
    float extentProgress_ = 0.0f;
    PointF legStartCenter_{};
    SizeF legStartExtent_{};

    // Centre leg while Zoomed
    bool centerLegActive_ = false;
    float centerProgress_ = 0.0f;
    PointF centerLegStart_{};
    PointF centerLegDirection_{};   // target - centre when the leg started
    PointF centerLegLastTarget_{};
};

const char* toString(ZoomController::Mode mode);

} // namespace CursorZoom
