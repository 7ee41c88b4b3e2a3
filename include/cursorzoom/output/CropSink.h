#pragma once
// =============================================================================
// CursorZoom - CropSink
// Receives the crop rectangle (source pixel space) for the capture host's
// crop/scale filter. Called on the tick thread only when the rectangle changed.
// =============================================================================

#include "cursorzoom/common/Types.h"

namespace CursorZoom
{

class CropSink
{
public:
    virtual ~CropSink() = default;
    virtual void applyCrop(const CropRect& rect) = 0;
};

} // namespace CursorZoom
