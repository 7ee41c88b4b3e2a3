#pragma once
// =============================================================================
// CursorZoom - CursorSampler
// Source of raw cursor positions for the tick thread. Platform back-ends
// (GetCursorPos, NSEvent.mouseLocation, XQueryPointer) implement sample();
// SharedCursorSampler reads whatever a producer thread last published.
// =============================================================================

#include "cursorzoom/common/SharedState.h"
#include "cursorzoom/common/Types.h"

#include <optional>

namespace CursorZoom
{

class CursorSampler
{
public:
    virtual ~CursorSampler() = default;

    // nullopt when no reading is available yet.
    virtual std::optional<CursorSample> sample() = 0;
};

class SharedCursorSampler : public CursorSampler
{
public:
    explicit SharedCursorSampler(SharedState& state) : state_(state) {}

    std::optional<CursorSample> sample() override
    {
        if (!state_.cursor.hasValue())
            return std::nullopt;
        return state_.cursor.read();
    }

private:
    SharedState& state_;
};

} // namespace CursorZoom
