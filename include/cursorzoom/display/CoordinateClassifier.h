#pragma once
// =============================================================================
// CursorZoom - CoordinateClassifier
// Decides whether a display's reported size is in logical points or already
// in pixels, and yields the per-axis scale that maps logical -> pixel.
// Pure functions only; re-run whenever geometry changes.
// =============================================================================

#include "cursorzoom/common/Types.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace CursorZoom
{

// How the reported size of a display should be read
enum class SizeUnits : uint8_t
{
    Points,     // reported size is logical; pixels = reported * scale
    Pixels,     // reported size is already pixels; logical = reported / scale
};

// Which rule produced the classification
enum class ScaleBasis : uint8_t
{
    BackingHint,    // pixel/logical ratio agreed with the OS backing scale
    UnitRatio,      // ratio ~1, reported size is pixels
    Derived,        // ratio rounded to the nearest 0.5
    Manual,         // explicit override from configuration
    Default,        // nothing to compare against, scale 1
};

struct ScaleOverride
{
    float scaleX = 1.0f;
    float scaleY = 1.0f;
};

struct ClassifierInput
{
    SizeF reportedSize;                      // from display enumeration
    std::optional<SizeF> pixelSize;          // from the capture source, if known
    std::optional<float> backingScaleHint;   // OS-reported, may be absent or unreliable
    std::optional<ScaleOverride> manualScale;
};

struct Classification
{
    SizeUnits units = SizeUnits::Points;
    ScaleBasis basis = ScaleBasis::Default;
    float scaleX = 1.0f;
    float scaleY = 1.0f;

    // Derived result whose rounded scale does not reproduce the pixel size
    // within tolerance. Diagnostic only.
    bool ambiguous = false;
};

// Size and origin parsed out of a capture source's display label
struct ReportedGeometry
{
    SizeF size;
    PointF origin;
    bool hasOrigin = false;
};

class CoordinateClassifier
{
public:
    static Classification classify(const ClassifierInput& input);

    // Parses labels such as "Monitor 2: 2560x1440 @ -2560,0". Returns
    // nullopt when no "<w>x<h>" pair is present or a dimension is zero.
    static std::optional<ReportedGeometry> parseReportedGeometry(std::string_view label);

    // Relative tolerance when comparing the pixel/logical ratio to a candidate
    static constexpr float kRatioTolerance = 0.05f;

    // Relative residual above which a derived classification is ambiguous
    static constexpr float kDerivedResidualTolerance = 0.02f;

    // Derived scales outside this range are treated as noise and fall back to 1
    static constexpr float kMinDerivedScale = 0.5f;
    static constexpr float kMaxDerivedScale = 4.0f;
};

const char* toString(SizeUnits units);
const char* toString(ScaleBasis basis);

} // namespace CursorZoom
