// =============================================================================
// CursorZoom - CoordinateClassifier
// Rule order: manual override, backing hint match, unit ratio, derived
// rounding. The first rule that applies wins.
// =============================================================================

#include "cursorzoom/display/CoordinateClassifier.h"

#include <cmath>
#include <regex>
#include <string>

namespace CursorZoom
{

static bool nearlyEqual(float value, float reference, float relTolerance)
{
    return std::abs(value - reference) <= relTolerance * std::abs(reference);
}

static float roundToHalf(float v)
{
    return std::round(v * 2.0f) / 2.0f;
}

static std::optional<float> usableHint(const std::optional<float>& hint)
{
    if (hint && std::isfinite(*hint) && *hint > 0.0f)
        return hint;
    return std::nullopt;
}

// Residual of "pixels = reported * scale", relative to the pixel size
static float residual(const SizeF& reported, const SizeF& pixels, float sx, float sy)
{
    float err = std::abs(reported.width * sx - pixels.width) +
                std::abs(reported.height * sy - pixels.height);
    return err / (pixels.width + pixels.height);
}

Classification CoordinateClassifier::classify(const ClassifierInput& input)
{
    Classification result;

    if (input.manualScale && input.manualScale->scaleX > 0.0f && input.manualScale->scaleY > 0.0f)
    {
        result.units = SizeUnits::Points;
        result.basis = ScaleBasis::Manual;
        result.scaleX = input.manualScale->scaleX;
        result.scaleY = input.manualScale->scaleY;
        return result;
    }

    const std::optional<float> hint = usableHint(input.backingScaleHint);
    const bool havePixels = input.pixelSize && input.pixelSize->isValid();

    // Nothing to compare: trust the hint if there is one, else assume 1:1.
    if (!havePixels || !input.reportedSize.isValid())
    {
        result.units = SizeUnits::Points;
        result.basis = hint ? ScaleBasis::BackingHint : ScaleBasis::Default;
        result.scaleX = result.scaleY = hint ? *hint : 1.0f;
        return result;
    }

    const SizeF& reported = input.reportedSize;
    const SizeF& pixels = *input.pixelSize;
    const float rx = pixels.width / reported.width;
    const float ry = pixels.height / reported.height;
    const float ratio = (rx + ry) / 2.0f;

    // 1. Reported size is in points and the OS hint explains the ratio
    if (hint && *hint > 1.0f && nearlyEqual(ratio, *hint, kRatioTolerance))
    {
        result.units = SizeUnits::Points;
        result.basis = ScaleBasis::BackingHint;
        result.scaleX = result.scaleY = *hint;
        return result;
    }

    // 2. Reported size already matches the capture: it is in pixels
    if (nearlyEqual(ratio, 1.0f, kRatioTolerance))
    {
        result.units = SizeUnits::Pixels;
        result.basis = ScaleBasis::UnitRatio;
        result.scaleX = result.scaleY = (hint && *hint > 1.0f) ? *hint : 1.0f;
        return result;
    }

    // 3. Derive a scale from the ratio and keep whichever reading fits best
    float sx = roundToHalf(rx);
    float sy = roundToHalf(ry);
    bool outOfRange = false;
    if (sx < kMinDerivedScale || sx > kMaxDerivedScale)
    {
        sx = 1.0f;
        outOfRange = true;
    }
    if (sy < kMinDerivedScale || sy > kMaxDerivedScale)
    {
        sy = 1.0f;
        outOfRange = true;
    }

    result.basis = ScaleBasis::Derived;
    result.units = SizeUnits::Points;
    result.scaleX = sx;
    result.scaleY = sy;
    float best = residual(reported, pixels, sx, sy);

    const float unity = residual(reported, pixels, 1.0f, 1.0f);
    if (unity < best)
    {
        result.units = SizeUnits::Pixels;
        result.scaleX = result.scaleY = 1.0f;
        best = unity;
    }

    if (hint)
    {
        const float hinted = residual(reported, pixels, *hint, *hint);
        if (hinted < best)
        {
            result.units = SizeUnits::Points;
            result.scaleX = result.scaleY = *hint;
            best = hinted;
        }
    }

    result.ambiguous = outOfRange || best > kDerivedResidualTolerance;
    return result;
}

std::optional<ReportedGeometry> CoordinateClassifier::parseReportedGeometry(std::string_view label)
{
    static const std::regex kSizePattern(R"((\d{1,6})\s*x\s*(\d{1,6}))");
    static const std::regex kOriginPattern(R"(@\s*(-?\d{1,6})\s*,\s*(-?\d{1,6}))");

    const std::string text(label);
    std::smatch size;
    if (!std::regex_search(text, size, kSizePattern))
        return std::nullopt;

    ReportedGeometry geometry;
    geometry.size.width = std::stof(size[1].str());
    geometry.size.height = std::stof(size[2].str());
    if (!geometry.size.isValid())
        return std::nullopt;

    std::smatch origin;
    if (std::regex_search(text, origin, kOriginPattern))
    {
        geometry.origin.x = std::stof(origin[1].str());
        geometry.origin.y = std::stof(origin[2].str());
        geometry.hasOrigin = true;
    }
    return geometry;
}

const char* toString(SizeUnits units)
{
    switch (units)
    {
    case SizeUnits::Points: return "points";
    case SizeUnits::Pixels: return "pixels";
    }
    return "?";
}

const char* toString(ScaleBasis basis)
{
    switch (basis)
    {
    case ScaleBasis::BackingHint: return "backing-hint";
    case ScaleBasis::UnitRatio:   return "unit-ratio";
    case ScaleBasis::Derived:     return "derived";
    case ScaleBasis::Manual:      return "manual";
    case ScaleBasis::Default:     return "default";
    }
    return "?";
}

} // namespace CursorZoom
