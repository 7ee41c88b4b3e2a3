#pragma once
// =============================================================================
// CursorZoom - Easing
// Pure progress remapping functions: t in [0,1] -> eased progress.
// Every function satisfies f(0) = 0 and f(1) = 1. The back and elastic
// families overshoot [0,1] in between and the bounce family doubles back;
// callers clamp after interpolating.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string_view>

namespace CursorZoom
{
namespace Easing
{

enum class Kind : uint8_t
{
    Linear,
    EaseIn,         // quadratic
    EaseOut,        // quadratic
    EaseInOut,      // cubic
    EaseInOutQuad,
    EaseInCubic,
    EaseOutCubic,
    EaseInQuart,
    EaseOutQuart,
    EaseInOutQuart,
    EaseInQuint,
    EaseOutQuint,
    EaseInOutQuint,
    EaseInSine,
    EaseOutSine,
    EaseInOutSine,
    EaseInExpo,
    EaseOutExpo,
    EaseInOutExpo,
    EaseInCirc,
    EaseOutCirc,
    EaseInOutCirc,
    Elastic,        // elastic ease-out
    EaseInElastic,
    EaseInOutElastic,
    Bounce,         // bounce ease-out
    BounceIn,
    EaseInOutBounce,
    EaseInBack,
    EaseOutBack,
    EaseInOutBack,
};

using Function = float (*)(float t);

float linear(float t);
float easeIn(float t);
float easeOut(float t);
float easeInOut(float t);
float easeInOutQuad(float t);
float easeInCubic(float t);
float easeOutCubic(float t);
float easeInQuart(float t);
float easeOutQuart(float t);
float easeInOutQuart(float t);
float easeInQuint(float t);
float easeOutQuint(float t);
float easeInOutQuint(float t);
float easeInSine(float t);
float easeOutSine(float t);
float easeInOutSine(float t);
float easeInExpo(float t);
float easeOutExpo(float t);
float easeInOutExpo(float t);
float easeInCirc(float t);
float easeOutCirc(float t);
float easeInOutCirc(float t);
float elastic(float t);
float easeInElastic(float t);
float easeInOutElastic(float t);
float bounce(float t);
float bounceIn(float t);
float easeInOutBounce(float t);
float easeInBack(float t);
float easeOutBack(float t);
float easeInOutBack(float t);

Function function(Kind kind);

// Clamps t to [0,1] before evaluating.
float apply(Kind kind, float t);

// True for the variants whose output leaves [0,1] for some t.
bool overshoots(Kind kind);

// False for overshooting and bouncing variants.
bool isMonotonic(Kind kind);

// Config names ("ease_in_out", "ease_out_back", ...). fromName() also
// accepts the aliases "ease_in_quad", "ease_out_quad", "ease_in_out_cubic",
// "ease_out_elastic" and "bounce_out"; name() returns the canonical name.
std::optional<Kind> fromName(std::string_view name);
const char* name(Kind kind);

} // namespace Easing
} // namespace CursorZoom
