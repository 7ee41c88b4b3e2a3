#pragma once
// =============================================================================
// CursorZoom - ZoomProfile
// One named set of zoom/follow tuning values. Shared as
// shared_ptr<const ZoomProfile> and never modified once published.
// =============================================================================

#include "cursorzoom/logic/Easing.h"

#include <cmath>
#include <string>

namespace CursorZoom
{

struct ZoomProfile
{
    std::string name = "standard";
    float zoomFactor = 2.0f;      // source size / zoomed extent
    float zoomSpeed = 3.6f;       // extent animation progress per second
    float followSpeed = 6.0f;     // centre animation progress per second
    float followBorder = 8.0f;    // dead-zone radius in source pixels, 0 = off
    float followSafezoneSensitivity = 4.0f;   // a centre leg locks this close to its target, px
    Easing::Kind easing = Easing::Kind::EaseInOut;
    bool autoFollow = true;       // switch following on when a zoom-in completes
    bool followOutsideBounds = false;   // keep following while the cursor is off the source
    bool autoLockOnReverse = false;     // lock the centre when the cursor turns back

    // Factors below 1 would make the crop larger than the source.
    float effectiveZoomFactor() const { return zoomFactor < 1.0f ? 1.0f : zoomFactor; }

    bool isValid() const
    {
        return std::isfinite(zoomFactor) && zoomFactor > 0.0f &&
               std::isfinite(zoomSpeed) && zoomSpeed > 0.0f &&
               std::isfinite(followSpeed) && followSpeed > 0.0f &&
               std::isfinite(followBorder) && followBorder >= 0.0f &&
               std::isfinite(followSafezoneSensitivity) && followSafezoneSensitivity >= 0.0f;
    }
};

} // namespace CursorZoom
