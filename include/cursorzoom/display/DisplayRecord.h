#pragma once
// =============================================================================
// CursorZoom - DisplayRecord
// One classified display. Built once per display/capture-source pairing and
// never modified afterwards; geometry changes produce a new record.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/display/CoordinateClassifier.h"

#include <optional>
#include <string>

namespace CursorZoom
{

// What the display enumerator reports for one display
struct DisplayDescriptor
{
    std::string id;
    std::string name;
    PointF origin;                          // global cursor space, producer convention
    SizeF reportedSize;                     // raw size as enumerated
    std::optional<float> backingScaleHint;
    OriginConvention originConvention = OriginConvention::TopLeftDown;
    bool isPrimary = false;
};

struct DisplayRecord
{
    std::string id;
    std::string name;

    // Top-left corner in the normalized (top-left, y-down) global cursor space
    PointF origin;

    SizeF logicalSize;      // extent in global cursor space, used for containment
    SizeF pixelSize;        // capture-source pixels, authoritative for cropping
    float scaleX = 1.0f;    // logical -> pixel
    float scaleY = 1.0f;

    SizeUnits units = SizeUnits::Points;
    ScaleBasis basis = ScaleBasis::Default;
    bool isPrimary = false;

    // Half-open: [origin, origin + logicalSize)
    bool contains(PointF globalPoint) const
    {
        return globalPoint.x >= origin.x && globalPoint.x < origin.x + logicalSize.width &&
               globalPoint.y >= origin.y && globalPoint.y < origin.y + logicalSize.height;
    }

    PointF logicalCenter() const
    {
        return {origin.x + logicalSize.width * 0.5f, origin.y + logicalSize.height * 0.5f};
    }
};

// Sizes positive and finite, scales positive.
bool hasValidGeometry(const DisplayRecord& record);

// Classifies the descriptor against the capture source's pixel size and
// builds the record. Returns nullopt for degenerate geometry (zero or
// negative sizes), which must never reach the registry.
//
// primaryLogicalHeight is needed to flip bottom-left origins; pass 0 when the
// descriptor is the primary display itself or uses top-left coordinates.
std::optional<DisplayRecord> buildDisplayRecord(const DisplayDescriptor& descriptor,
                                                std::optional<SizeF> sourcePixelSize,
                                                std::optional<ScaleOverride> manualScale = std::nullopt,
                                                float primaryLogicalHeight = 0.0f);

} // namespace CursorZoom
