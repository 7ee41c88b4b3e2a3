// =============================================================================
// CursorZoom - CoordinateMapper
// Runs on the tick thread: no allocation beyond shared_ptr copies, and log
// lines only when the lookup state changes.
// =============================================================================

#include "cursorzoom/display/CoordinateMapper.h"
#include "cursorzoom/support/Log.h"

#include <cmath>
#include <utility>

namespace CursorZoom
{

const std::string& MappedPoint::displayId() const
{
    static const std::string kNone;
    return display ? display->id : kNone;
}

CoordinateMapper::CoordinateMapper(const DisplayRegistry& registry)
    : registry_(registry)
{
}

void CoordinateMapper::pinDisplay(std::string id)
{
    pinnedId_ = std::move(id);
}

void CoordinateMapper::autoDetect()
{
    pinnedId_.clear();
}

static bool validEdge(float v)
{
    return std::isfinite(v) && v >= 0.0f;
}

bool CoordinateMapper::setSourceCrop(const SourceCrop& crop)
{
    if (!validEdge(crop.left) || !validEdge(crop.top) ||
        !validEdge(crop.right) || !validEdge(crop.bottom))
    {
        Log::warn("mapper: rejecting source crop %g,%g,%g,%g",
                  crop.left, crop.top, crop.right, crop.bottom);
        return false;
    }
    sourceCrop_ = crop;
    return true;
}

SizeF CoordinateMapper::sourceSizeFor(const DisplayRecord& display) const
{
    const SizeF cropped = sourceCrop_.apply(display.pixelSize);
    return cropped.isValid() ? cropped : display.pixelSize;
}

PointF CoordinateMapper::normalizeOrigin(const CursorSample& sample, const DisplayRecord* primary)
{
    if (sample.origin != OriginConvention::BottomLeftUp || primary == nullptr)
        return {sample.rawX, sample.rawY};

    const float primaryHeight = primary->pixelSize.height / primary->scaleY;
    return {sample.rawX, primaryHeight - sample.rawY};
}

PointF CoordinateMapper::toLocal(PointF global, const DisplayRecord& display)
{
    return {global.x - display.origin.x, global.y - display.origin.y};
}

PointF CoordinateMapper::toPixels(PointF local, const DisplayRecord& display)
{
    return {local.x * display.scaleX, local.y * display.scaleY};
}

static bool clampAxis(float& v, float extent)
{
    if (!(v >= 0.0f)) // negative or NaN
    {
        v = 0.0f;
        return true;
    }
    if (v >= extent)
    {
        // Largest representable value below the exclusive upper edge
        v = std::nextafter(extent, 0.0f);
        return true;
    }
    return false;
}

PointF CoordinateMapper::toSource(PointF pixel, const SourceCrop& crop)
{
    return {pixel.x - crop.left, pixel.y - crop.top};
}

bool CoordinateMapper::clampToExtent(PointF& pixel, SizeF extent)
{
    bool cx = clampAxis(pixel.x, extent.width);
    bool cy = clampAxis(pixel.y, extent.height);
    return cx || cy;
}

bool CoordinateMapper::clampToDisplay(PointF& pixel, const DisplayRecord& display)
{
    return clampToExtent(pixel, display.pixelSize);
}

std::shared_ptr<const DisplayRecord> CoordinateMapper::resolve(PointF normalized, bool& fallback)
{
    fallback = false;

    std::shared_ptr<const DisplayRecord> found = isAutoDetect()
        ? registry_.findContaining(normalized)
        : registry_.get(pinnedId_);

    if (found)
    {
        if (missLogged_)
        {
            Log::info("mapper: cursor back on display '%s'", found->id.c_str());
            missLogged_ = false;
        }
        return found;
    }

    fallback = true;
    if (!missLogged_)
    {
        if (isAutoDetect())
            Log::warn("mapper: no display contains (%.1f, %.1f), reusing last display",
                      normalized.x, normalized.y);
        else
            Log::warn("mapper: pinned display '%s' not registered, reusing last display",
                      pinnedId_.c_str());
        missLogged_ = true;
    }

    if (!lastDisplay_)
        return nullptr;

    // Pick up a replacement record for the same display if there is one.
    if (auto refreshed = registry_.get(lastDisplay_->id))
        return refreshed;
    return lastDisplay_;
}

MappedPoint CoordinateMapper::map(const CursorSample& sample)
{
    MappedPoint out;

    auto primary = registry_.primary();
    const PointF normalized = normalizeOrigin(sample, primary.get());

    bool fallback = false;
    auto display = resolve(normalized, fallback);
    if (!display)
        return out;

    PointF pixel = toPixels(toLocal(normalized, *display), *display);
    if (sourceCrop_.apply(display->pixelSize).isValid())
    {
        pixel = toSource(pixel, sourceCrop_);
        out.clamped = clampToExtent(pixel, sourceSizeFor(*display));
    }
    else
    {
        // Crop would leave nothing of this display; map against all of it.
        out.clamped = clampToDisplay(pixel, *display);
    }
    out.px = pixel.x;
    out.py = pixel.y;
    out.fallback = fallback;
    out.valid = true;
    out.display = display;

    lastDisplay_ = std::move(display);
    return out;
}

} // namespace CursorZoom
