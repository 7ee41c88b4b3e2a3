#pragma once
// =============================================================================
// CursorZoom - CoordinateMapper
// Raw cursor sample -> pixel position inside one display's capture source.
// Steps, in order: origin normalization, display resolution, global->local
// offset, scale, source crop offset, clamp. Each step is also exposed as a
// pure function.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/display/DisplayRegistry.h"

#include <memory>
#include <string>

namespace CursorZoom
{

struct MappedPoint
{
    std::shared_ptr<const DisplayRecord> display;   // null when !valid
    float px = 0.0f;          // relative to the capture source's top-left (after its crop)
    float py = 0.0f;
    bool clamped = false;     // fell outside the display and was clipped
    bool fallback = false;    // no display contained the point; last display reused
    bool valid = false;       // false only if no display was ever resolved

    PointF point() const { return {px, py}; }
    const std::string& displayId() const;
};

class CoordinateMapper
{
public:
    explicit CoordinateMapper(const DisplayRegistry& registry);

    // Map against one display regardless of where the cursor is.
    void pinDisplay(std::string id);
    // Map against whichever display contains the cursor (default).
    void autoDetect();
    bool isAutoDetect() const { return pinnedId_.empty(); }

    // Edges the host crops off the source before it reaches us. Points are
    // shifted by (left, top) and clamped to the remaining area. Returns false
    // (crop unchanged) for negative or non-finite edges.
    bool setSourceCrop(const SourceCrop& crop);
    const SourceCrop& sourceCrop() const { return sourceCrop_; }

    // Pixel size of the capture source showing `display`: its pixels minus
    // the source crop, or all of its pixels if the crop leaves nothing.
    SizeF sourceSizeFor(const DisplayRecord& display) const;

    MappedPoint map(const CursorSample& sample);

    // True once any display has been resolved.
    bool hasResolvedDisplay() const { return lastDisplay_ != nullptr; }

    // Flips bottom-left/up samples into top-left/down global space using the
    // primary display's logical height. Top-left samples pass through, as do
    // all samples when no primary display is known.
    static PointF normalizeOrigin(const CursorSample& sample, const DisplayRecord* primary);

    static PointF toLocal(PointF global, const DisplayRecord& display);
    static PointF toPixels(PointF local, const DisplayRecord& display);
    static PointF toSource(PointF pixel, const SourceCrop& crop);

    // Clips to [0, pixelSize). Returns true if any axis was out of range.
    static bool clampToDisplay(PointF& pixel, const DisplayRecord& display);
    static bool clampToExtent(PointF& pixel, SizeF extent);

private:
    std::shared_ptr<const DisplayRecord> resolve(PointF normalized, bool& fallback);

    const DisplayRegistry& registry_;
    std::string pinnedId_;
    SourceCrop sourceCrop_{};
    std::shared_ptr<const DisplayRecord> lastDisplay_;
    bool missLogged_ = false;
};

} // namespace CursorZoom
