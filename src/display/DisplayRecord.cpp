// =============================================================================
// CursorZoom - DisplayRecord
// =============================================================================

#include "cursorzoom/display/DisplayRecord.h"
#include "cursorzoom/support/Log.h"

#include <cmath>

namespace CursorZoom
{

static bool validSize(const SizeF& s)
{
    return std::isfinite(s.width) && std::isfinite(s.height) && s.isValid();
}

bool hasValidGeometry(const DisplayRecord& record)
{
    return validSize(record.logicalSize) && validSize(record.pixelSize) &&
           record.scaleX > 0.0f && record.scaleY > 0.0f &&
           std::isfinite(record.origin.x) && std::isfinite(record.origin.y);
}

std::optional<DisplayRecord> buildDisplayRecord(const DisplayDescriptor& descriptor,
                                                std::optional<SizeF> sourcePixelSize,
                                                std::optional<ScaleOverride> manualScale,
                                                float primaryLogicalHeight)
{
    if (!validSize(descriptor.reportedSize))
    {
        Log::warn("display '%s': degenerate reported size %.1fx%.1f, record not built",
                  descriptor.id.c_str(), descriptor.reportedSize.width,
                  descriptor.reportedSize.height);
        return std::nullopt;
    }
    if (sourcePixelSize && !validSize(*sourcePixelSize))
    {
        Log::warn("display '%s': degenerate source size %.1fx%.1f, record not built",
                  descriptor.id.c_str(), sourcePixelSize->width, sourcePixelSize->height);
        return std::nullopt;
    }

    ClassifierInput input;
    input.reportedSize = descriptor.reportedSize;
    input.pixelSize = sourcePixelSize;
    input.backingScaleHint = descriptor.backingScaleHint;
    input.manualScale = manualScale;
    const Classification c = CoordinateClassifier::classify(input);

    if (c.ambiguous)
    {
        Log::debug("display '%s': ambiguous scale, using derived %.2fx%.2f",
                   descriptor.id.c_str(), c.scaleX, c.scaleY);
    }

    DisplayRecord record;
    record.id = descriptor.id;
    record.name = descriptor.name;
    record.scaleX = c.scaleX;
    record.scaleY = c.scaleY;
    record.units = c.units;
    record.basis = c.basis;
    record.isPrimary = descriptor.isPrimary;

    if (c.units == SizeUnits::Pixels)
    {
        record.logicalSize = {descriptor.reportedSize.width / c.scaleX,
                              descriptor.reportedSize.height / c.scaleY};
        record.pixelSize = sourcePixelSize ? *sourcePixelSize : descriptor.reportedSize;
    }
    else
    {
        record.logicalSize = descriptor.reportedSize;
        record.pixelSize = sourcePixelSize
            ? *sourcePixelSize
            : SizeF{std::round(descriptor.reportedSize.width * c.scaleX),
                    std::round(descriptor.reportedSize.height * c.scaleY)};
    }

    record.origin = descriptor.origin;
    if (descriptor.originConvention == OriginConvention::BottomLeftUp)
    {
        // Origin names the bottom-left corner, measured up from the bottom
        // edge of the primary display.
        float reference = primaryLogicalHeight > 0.0f ? primaryLogicalHeight
                                                      : record.logicalSize.height;
        record.origin.y = reference - (descriptor.origin.y + record.logicalSize.height);
    }

    if (!hasValidGeometry(record))
    {
        Log::warn("display '%s': classification produced invalid geometry", descriptor.id.c_str());
        return std::nullopt;
    }

    Log::debug("display '%s': %s (%s) logical %.0fx%.0f pixels %.0fx%.0f scale %.2fx%.2f",
               record.id.c_str(), toString(record.units), toString(record.basis),
               record.logicalSize.width, record.logicalSize.height,
               record.pixelSize.width, record.pixelSize.height, record.scaleX, record.scaleY);
    return record;
}

} // namespace CursorZoom
