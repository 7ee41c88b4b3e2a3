// =============================================================================
// CursorZoom - ZoomController
// Zoom/follow state machine and per-tick interpolation.
//
// Interpolation runs in legs: a leg remembers where it started and eases
// from there toward its (possibly moving) target as progress goes 0 -> 1.
//   - Extent legs: ZoomingIn, ZoomingOut, zoom factor change while Zoomed.
//     Progress advances by dt * zoomSpeed. Centre rides along in ZoomingIn
//     and ZoomingOut.
//   - Centre legs: Zoomed only. Progress advances by dt * followSpeed and a
//     leg starts only once the target leaves the follow-border dead zone.
//     While the live cursor drives it, a leg also locks early once it is
//     within followSafezoneSensitivity of the cursor, or (autoLockOnReverse)
//     as soon as the cursor turns back against the leg's direction.
// The stored centre/extent may overshoot with back/elastic easing; only the
// emitted rectangle is clamped.
// =============================================================================

#include "cursorzoom/logic/ZoomController.h"
#include "cursorzoom/support/Log.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace CursorZoom
{

// Smallest emitted crop edge, in pixels
static constexpr float kMinCropEdge = 1.0f;

static float lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

static PointF lerp(PointF a, PointF b, float t)
{
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t)};
}

static SizeF lerp(SizeF a, SizeF b, float t)
{
    return {lerp(a.width, b.width, t), lerp(a.height, b.height, t)};
}

// NaN-safe clamp that tolerates lo > hi by preferring lo
static float clampf(float v, float lo, float hi)
{
    if (!(v >= lo))
        return lo;
    if (v > hi)
        return std::max(lo, hi);
    return v;
}

ZoomController::ZoomController()
    : profile_(std::make_shared<const ZoomProfile>())
{
}

void ZoomController::setSourceSize(SizeF pixelSize)
{
    if (pixelSize.width == source_.width && pixelSize.height == source_.height)
        return;

    // A zoom toggled before any source size was known is still owed.
    const bool pendingZoomIn = !source_.isValid() && mode_ == Mode::ZoomingIn;

    source_ = pixelSize;
    if (pendingZoomIn && !source_.isValid())
        return;

    if (hasCursor_)
        lastCursor_ = clampToSource(lastCursor_);
    reset();

    if (!pendingZoomIn)
        return;

    mode_ = Mode::ZoomingIn;
    targetCenter_ = zoomInTarget();
    frozenCenter_ = targetCenter_;
    startExtentLeg();
    Log::debug("zoom: source %.0fx%.0f known, zooming in toward (%.1f, %.1f)",
               source_.width, source_.height, targetCenter_.x, targetCenter_.y);
}

bool ZoomController::setProfile(std::shared_ptr<const ZoomProfile> profile)
{
    if (!profile || !profile->isValid())
        return false;

    const float oldFactor = profile_->effectiveZoomFactor();
    profile_ = std::move(profile);

    // A new factor re-targets the extent from wherever it is now.
    if (profile_->effectiveZoomFactor() != oldFactor &&
        (mode_ == Mode::ZoomingIn || mode_ == Mode::Zoomed))
    {
        startExtentLeg();
    }
    return true;
}

SizeF ZoomController::targetExtent() const
{
    if (mode_ == Mode::Idle || mode_ == Mode::ZoomingOut)
        return source_;

    const float factor = profile_->effectiveZoomFactor();
    return {source_.width / factor, source_.height / factor};
}

float ZoomController::effectiveZoom() const
{
    CropRect rect = cropRect();
    if (rect.width <= 0.0f)
        return 1.0f;
    return source_.width / rect.width;
}

PointF ZoomController::clampToSource(PointF p) const
{
    return {clampf(p.x, 0.0f, source_.width), clampf(p.y, 0.0f, source_.height)};
}

void ZoomController::noteCursor(const MappedPoint& mapped)
{
    if (!mapped.valid)
        return;
    // Without a source there is nothing to clamp against yet; setSourceSize() clamps later.
    lastCursor_ = source_.isValid() ? clampToSource(mapped.point()) : mapped.point();
    cursorOutside_ = mapped.clamped;
    hasCursor_ = true;
}

PointF ZoomController::zoomInTarget() const
{
    if (override_)
        return clampToSource(*override_);
    if (hasCursor_)
        return lastCursor_;
    return sourceCenter();
}

PointF ZoomController::resolveTargetCenter() const
{
    if (override_)
        return clampToSource(*override_);

    const bool live = mode_ == Mode::ZoomingIn || (mode_ == Mode::Zoomed && followEnabled_);
    if (live && hasCursor_)
        return lastCursor_;

    return frozenCenter_;
}

// ─── Commands ────────────────────────────────────────────────────────────────

void ZoomController::toggleZoom(const MappedPoint& cursor)
{
    noteCursor(cursor);

    switch (mode_)
    {
    case Mode::Idle:
    case Mode::ZoomingOut:
        mode_ = Mode::ZoomingIn;
        targetCenter_ = zoomInTarget();
        frozenCenter_ = targetCenter_;
        centerLegActive_ = false;
        startExtentLeg();
        Log::debug("zoom: in toward (%.1f, %.1f) x%.2f", targetCenter_.x, targetCenter_.y,
                   profile_->effectiveZoomFactor());
        break;

    case Mode::ZoomingIn:
    case Mode::Zoomed:
        mode_ = Mode::ZoomingOut;
        followEnabled_ = false;
        freezeCenter();
        targetCenter_ = resolveTargetCenter();
        startExtentLeg();
        Log::debug("zoom: out");
        break;
    }
}

void ZoomController::toggleFollow()
{
    followEnabled_ = !followEnabled_;
    if (!followEnabled_)
        freezeCenter();
    Log::debug("zoom: follow %s", followEnabled_ ? "on" : "off");
}

void ZoomController::setMouseOverride(PointF point)
{
    override_ = point;
    centerLegActive_ = false;
}

void ZoomController::clearMouseOverride()
{
    if (!override_)
        return;
    override_.reset();
    freezeCenter();
}

void ZoomController::freezeCenter()
{
    frozenCenter_ = currentCenter_;
    centerLegActive_ = false;
}

void ZoomController::reset()
{
    mode_ = Mode::Idle;
    currentCenter_ = sourceCenter();
    currentExtent_ = source_;
    targetCenter_ = currentCenter_;
    frozenCenter_ = currentCenter_;
    extentLegActive_ = false;
    extentProgress_ = 0.0f;
    centerLegActive_ = false;
    centerProgress_ = 0.0f;
}

// ─── Tick ────────────────────────────────────────────────────────────────────

CropRect ZoomController::advance(float dtSeconds, const MappedPoint& mapped)
{
    noteCursor(mapped);
    targetCenter_ = resolveTargetCenter();

    if (!(dtSeconds > 0.0f) || !source_.isValid())
        return cropRect();

    switch (mode_)
    {
    case Mode::Idle:
        break;
    case Mode::ZoomingIn:
    case Mode::ZoomingOut:
        advanceExtent(dtSeconds);
        break;
    case Mode::Zoomed:
        if (extentLegActive_)
            advanceExtent(dtSeconds);
        advanceCenterTracking(dtSeconds);
        break;
    }

    return cropRect();
}

void ZoomController::startExtentLeg()
{
    legStartCenter_ = currentCenter_;
    legStartExtent_ = currentExtent_;
    extentProgress_ = 0.0f;
    extentLegActive_ = true;
}

void ZoomController::advanceExtent(float dt)
{
    extentProgress_ = std::min(1.0f, extentProgress_ + dt * profile_->zoomSpeed);
    const float e = Easing::apply(profile_->easing, extentProgress_);

    const SizeF target = targetExtent();
    currentExtent_ = lerp(legStartExtent_, target, e);
    if (mode_ != Mode::Zoomed)
        currentCenter_ = lerp(legStartCenter_, targetCenter_, e);

    if (extentProgress_ < 1.0f)
        return;

    currentExtent_ = target;
    extentLegActive_ = false;

    if (mode_ == Mode::ZoomingIn)
        finishZoomIn();
    else if (mode_ == Mode::ZoomingOut)
        finishZoomOut();
}

void ZoomController::finishZoomIn()
{
    currentCenter_ = targetCenter_;
    mode_ = Mode::Zoomed;
    freezeCenter();
    if (profile_->autoFollow)
        followEnabled_ = true;
    Log::debug("zoom: zoomed at (%.1f, %.1f)", currentCenter_.x, currentCenter_.y);
}

void ZoomController::finishZoomOut()
{
    reset();
    Log::debug("zoom: idle");
}

bool ZoomController::cursorReversed(PointF target) const
{
    const float mx = target.x - centerLegLastTarget_.x;
    const float my = target.y - centerLegLastTarget_.y;
    const PointF dir = centerLegDirection_;

    // Judge on the axis the leg mostly travels along.
    if (std::abs(dir.x) > std::abs(dir.y))
        return (mx < 0.0f && dir.x > 0.0f) || (mx > 0.0f && dir.x < 0.0f);
    return (my < 0.0f && dir.y > 0.0f) || (my > 0.0f && dir.y < 0.0f);
}

void ZoomController::advanceCenterTracking(float dt)
{
    const PointF target = targetCenter_;
    const bool liveCursor = followEnabled_ && !override_;

    // Cursor has left the source: hold still unless the profile follows it out.
    if (liveCursor && cursorOutside_ && !profile_->followOutsideBounds)
        return;

    if (!centerLegActive_)
    {
        const float dx = std::abs(target.x - currentCenter_.x);
        const float dy = std::abs(target.y - currentCenter_.y);
        if (dx == 0.0f && dy == 0.0f)
            return;

        // Hold still until the target leaves the dead zone around the centre.
        const float border = profile_->followBorder;
        if (border > 0.0f && dx <= border && dy <= border)
            return;

        centerLegStart_ = currentCenter_;
        centerLegDirection_ = {target.x - currentCenter_.x, target.y - currentCenter_.y};
        centerProgress_ = 0.0f;
        centerLegActive_ = true;
    }
    else if (liveCursor && profile_->autoLockOnReverse && cursorReversed(target))
    {
        freezeCenter();
        Log::debug("zoom: cursor reversed, centre locked at (%.1f, %.1f)",
                   currentCenter_.x, currentCenter_.y);
        return;
    }
    centerLegLastTarget_ = target;

    centerProgress_ = std::min(1.0f, centerProgress_ + dt * profile_->followSpeed);
    const float e = Easing::apply(profile_->easing, centerProgress_);
    currentCenter_ = lerp(centerLegStart_, target, e);

    if (centerProgress_ >= 1.0f)
    {
        currentCenter_ = target;
        freezeCenter();
        return;
    }

    const float sensitivity = profile_->followSafezoneSensitivity;
    if (liveCursor && sensitivity > 0.0f &&
        std::abs(target.x - currentCenter_.x) <= sensitivity &&
        std::abs(target.y - currentCenter_.y) <= sensitivity)
    {
        freezeCenter();
    }
}

// ─── Output ──────────────────────────────────────────────────────────────────

CropRect ZoomController::fullFrame() const
{
    return {0.0f, 0.0f, source_.width, source_.height};
}

CropRect ZoomController::cropRect() const
{
    if (!source_.isValid())
        return {};

    CropRect rect;
    rect.width = clampf(currentExtent_.width, std::min(kMinCropEdge, source_.width), source_.width);
    rect.height = clampf(currentExtent_.height, std::min(kMinCropEdge, source_.height), source_.height);
    rect.x = clampf(currentCenter_.x - rect.width * 0.5f, 0.0f, source_.width - rect.width);
    rect.y = clampf(currentCenter_.y - rect.height * 0.5f, 0.0f, source_.height - rect.height);
    return rect;
}

const char* toString(ZoomController::Mode mode)
{
    switch (mode)
    {
    case ZoomController::Mode::Idle:       return "idle";
    case ZoomController::Mode::ZoomingIn:  return "zooming_in";
    case ZoomController::Mode::Zoomed:     return "zoomed";
    case ZoomController::Mode::ZoomingOut: return "zooming_out";
    }
    return "?";
}

} // namespace CursorZoom
