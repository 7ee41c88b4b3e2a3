// =============================================================================
// CursorZoom - Shared State
// =============================================================================

#include "cursorzoom/common/SharedState.h"
#include "cursorzoom/support/Log.h"

namespace CursorZoom
{

bool SharedState::postCommand(ZoomCommand cmd)
{
    std::lock_guard<std::mutex> lock(producerMutex_);
    cmd.sequence = nextSequence_++;
    if (commandQueue.push(cmd))
        return true;

    const uint64_t dropped = droppedCommands.fetch_add(1, std::memory_order_relaxed) + 1;
    Log::warn("command queue full, dropped %s (#%u, %llu dropped so far)",
              toString(cmd.type), static_cast<unsigned>(cmd.sequence),
              static_cast<unsigned long long>(dropped));
    return false;
}

} // namespace CursorZoom
