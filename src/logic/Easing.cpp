// =============================================================================
// CursorZoom - Easing
// Curves follow the usual Penner formulations.
// =============================================================================

#include "cursorzoom/logic/Easing.h"

#include <algorithm>
#include <cmath>

namespace CursorZoom
{
namespace Easing
{

static constexpr float kPi = 3.14159265358979323846f;

// Back overshoot constants (~10% overshoot)
static constexpr float kBackC1 = 1.70158f;
static constexpr float kBackC2 = kBackC1 * 1.525f;
static constexpr float kBackC3 = kBackC1 + 1.0f;

// Bounce piecewise parabola constants
static constexpr float kBounceN1 = 7.5625f;
static constexpr float kBounceD1 = 2.75f;

float linear(float t)
{
    return t;
}

float easeIn(float t)
{
    return t * t;
}

float easeOut(float t)
{
    return t * (2.0f - t);
}

float easeInOut(float t)
{
    if (t < 0.5f)
        return 4.0f * t * t * t;
    float u = -2.0f * t + 2.0f;
    return 1.0f - u * u * u / 2.0f;
}

float easeInOutQuad(float t)
{
    if (t < 0.5f)
        return 2.0f * t * t;
    return -1.0f + (4.0f - 2.0f * t) * t;
}

float easeInCubic(float t)
{
    return t * t * t;
}

float easeOutCubic(float t)
{
    float u = t - 1.0f;
    return u * u * u + 1.0f;
}

float easeInQuart(float t)
{
    return t * t * t * t;
}

float easeOutQuart(float t)
{
    float u = t - 1.0f;
    return 1.0f - u * u * u * u;
}

float easeInOutQuart(float t)
{
    if (t < 0.5f)
        return 8.0f * t * t * t * t;
    float u = t - 1.0f;
    return 1.0f - 8.0f * u * u * u * u;
}

float easeInQuint(float t)
{
    return t * t * t * t * t;
}

float easeOutQuint(float t)
{
    float u = t - 1.0f;
    return 1.0f + u * u * u * u * u;
}

float easeInOutQuint(float t)
{
    if (t < 0.5f)
        return 16.0f * t * t * t * t * t;
    float u = t - 1.0f;
    return 1.0f + 16.0f * u * u * u * u * u;
}

float easeInSine(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return 1.0f - std::cos(t * kPi / 2.0f);
}

float easeOutSine(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return std::sin(t * kPi / 2.0f);
}

float easeInOutSine(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return -(std::cos(kPi * t) - 1.0f) / 2.0f;
}

float easeInExpo(float t)
{
    if (t <= 0.0f)
        return 0.0f;
    return std::pow(2.0f, 10.0f * (t - 1.0f));
}

float easeOutExpo(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return 1.0f - std::pow(2.0f, -10.0f * t);
}

float easeInOutExpo(float t)
{
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;
    if (t < 0.5f)
        return std::pow(2.0f, 20.0f * t - 10.0f) / 2.0f;
    return (2.0f - std::pow(2.0f, -20.0f * t + 10.0f)) / 2.0f;
}

float easeInCirc(float t)
{
    return 1.0f - std::sqrt(std::max(0.0f, 1.0f - t * t));
}

float easeOutCirc(float t)
{
    float u = t - 1.0f;
    return std::sqrt(std::max(0.0f, 1.0f - u * u));
}

float easeInOutCirc(float t)
{
    if (t < 0.5f)
    {
        float u = 2.0f * t;
        return (1.0f - std::sqrt(std::max(0.0f, 1.0f - u * u))) / 2.0f;
    }
    float u = -2.0f * t + 2.0f;
    return (std::sqrt(std::max(0.0f, 1.0f - u * u)) + 1.0f) / 2.0f;
}

float elastic(float t)
{
    if (t <= 0.0f || t >= 1.0f)
        return t <= 0.0f ? 0.0f : 1.0f;
    const float c4 = (2.0f * kPi) / 3.0f;
    return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * c4) + 1.0f;
}

float easeInElastic(float t)
{
    if (t <= 0.0f || t >= 1.0f)
        return t <= 0.0f ? 0.0f : 1.0f;
    const float c4 = (2.0f * kPi) / 3.0f;
    return -std::pow(2.0f, 10.0f * t - 10.0f) * std::sin((t * 10.0f - 10.75f) * c4);
}

float easeInOutElastic(float t)
{
    if (t <= 0.0f || t >= 1.0f)
        return t <= 0.0f ? 0.0f : 1.0f;
    const float c5 = (2.0f * kPi) / 4.5f;
    const float s = std::sin((20.0f * t - 11.125f) * c5);
    if (t < 0.5f)
        return -(std::pow(2.0f, 20.0f * t - 10.0f) * s) / 2.0f;
    return (std::pow(2.0f, -20.0f * t + 10.0f) * s) / 2.0f + 1.0f;
}

float bounce(float t)
{
    if (t < 1.0f / kBounceD1)
        return kBounceN1 * t * t;
    if (t < 2.0f / kBounceD1)
    {
        t -= 1.5f / kBounceD1;
        return kBounceN1 * t * t + 0.75f;
    }
    if (t < 2.5f / kBounceD1)
    {
        t -= 2.25f / kBounceD1;
        return kBounceN1 * t * t + 0.9375f;
    }
    if (t >= 1.0f)
        return 1.0f;
    t -= 2.625f / kBounceD1;
    return kBounceN1 * t * t + 0.984375f;
}

float bounceIn(float t)
{
    return 1.0f - bounce(1.0f - t);
}

float easeInOutBounce(float t)
{
    if (t < 0.5f)
        return (1.0f - bounce(1.0f - 2.0f * t)) / 2.0f;
    return (1.0f + bounce(2.0f * t - 1.0f)) / 2.0f;
}

float easeInBack(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    return kBackC3 * t * t * t - kBackC1 * t * t;
}

float easeOutBack(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    float u = t - 1.0f;
    return 1.0f + kBackC3 * u * u * u + kBackC1 * u * u;
}

float easeInOutBack(float t)
{
    if (t >= 1.0f)
        return 1.0f;
    if (t < 0.5f)
    {
        float u = 2.0f * t;
        return (u * u * ((kBackC2 + 1.0f) * u - kBackC2)) / 2.0f;
    }
    float u = 2.0f * t - 2.0f;
    return (u * u * ((kBackC2 + 1.0f) * u + kBackC2) + 2.0f) / 2.0f;
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

struct Entry
{
    Kind kind;
    const char* name;
    Function fn;
    bool overshoots;
    bool monotonic;
};

static constexpr Entry kTable[] = {
    {Kind::Linear,           "linear",              &linear,           false, true},
    {Kind::EaseIn,           "ease_in",             &easeIn,           false, true},
    {Kind::EaseOut,          "ease_out",            &easeOut,          false, true},
    {Kind::EaseInOut,        "ease_in_out",         &easeInOut,        false, true},
    {Kind::EaseInOutQuad,    "ease_in_out_quad",    &easeInOutQuad,    false, true},
    {Kind::EaseInCubic,      "ease_in_cubic",       &easeInCubic,      false, true},
    {Kind::EaseOutCubic,     "ease_out_cubic",      &easeOutCubic,     false, true},
    {Kind::EaseInQuart,      "ease_in_quart",       &easeInQuart,      false, true},
    {Kind::EaseOutQuart,     "ease_out_quart",      &easeOutQuart,     false, true},
    {Kind::EaseInOutQuart,   "ease_in_out_quart",   &easeInOutQuart,   false, true},
    {Kind::EaseInQuint,      "ease_in_quint",       &easeInQuint,      false, true},
    {Kind::EaseOutQuint,     "ease_out_quint",      &easeOutQuint,     false, true},
    {Kind::EaseInOutQuint,   "ease_in_out_quint",   &easeInOutQuint,   false, true},
    {Kind::EaseInSine,       "ease_in_sine",        &easeInSine,       false, true},
    {Kind::EaseOutSine,      "ease_out_sine",       &easeOutSine,      false, true},
    {Kind::EaseInOutSine,    "ease_in_out_sine",    &easeInOutSine,    false, true},
    {Kind::EaseInExpo,       "ease_in_expo",        &easeInExpo,       false, true},
    {Kind::EaseOutExpo,      "ease_out_expo",       &easeOutExpo,      false, true},
    {Kind::EaseInOutExpo,    "ease_in_out_expo",    &easeInOutExpo,    false, true},
    {Kind::EaseInCirc,       "ease_in_circ",        &easeInCirc,       false, true},
    {Kind::EaseOutCirc,      "ease_out_circ",       &easeOutCirc,      false, true},
    {Kind::EaseInOutCirc,    "ease_in_out_circ",    &easeInOutCirc,    false, true},
    {Kind::Elastic,          "elastic",             &elastic,          true,  false},
    {Kind::EaseInElastic,    "ease_in_elastic",     &easeInElastic,    true,  false},
    {Kind::EaseInOutElastic, "ease_in_out_elastic", &easeInOutElastic, true,  false},
    {Kind::Bounce,           "bounce",              &bounce,           false, false},
    {Kind::BounceIn,         "bounce_in",           &bounceIn,         false, false},
    {Kind::EaseInOutBounce,  "ease_in_out_bounce",  &easeInOutBounce,  false, false},
    {Kind::EaseInBack,       "ease_in_back",        &easeInBack,       true,  false},
    {Kind::EaseOutBack,      "ease_out_back",       &easeOutBack,      true,  false},
    {Kind::EaseInOutBack,    "ease_in_out_back",    &easeInOutBack,    true,  false},
};

// Alternative config spellings. Never returned by name().
struct Alias
{
    const char* name;
    Kind kind;
};

static constexpr Alias kAliases[] = {
    {"ease_in_quad",      Kind::EaseIn},
    {"ease_out_quad",     Kind::EaseOut},
    {"ease_in_out_cubic", Kind::EaseInOut},
    {"ease_out_elastic",  Kind::Elastic},
    {"bounce_out",        Kind::Bounce},
};

static const Entry& entryFor(Kind kind)
{
    for (const Entry& e : kTable)
    {
        if (e.kind == kind)
            return e;
    }
    return kTable[0];
}

Function function(Kind kind)
{
    return entryFor(kind).fn;
}

float apply(Kind kind, float t)
{
    if (!(t > 0.0f)) // also catches NaN
        t = 0.0f;
    t = std::min(t, 1.0f);
    return entryFor(kind).fn(t);
}

bool overshoots(Kind kind)
{
    return entryFor(kind).overshoots;
}

bool isMonotonic(Kind kind)
{
    return entryFor(kind).monotonic;
}

std::optional<Kind> fromName(std::string_view n)
{
    for (const Entry& e : kTable)
    {
        if (n == e.name)
            return e.kind;
    }
    for (const Alias& a : kAliases)
    {
        if (n == a.name)
            return a.kind;
    }
    return std::nullopt;
}

const char* name(Kind kind)
{
    return entryFor(kind).name;
}

} // namespace Easing
} // namespace CursorZoom
