#pragma once
// =============================================================================
// CursorZoom - Shared State
// Inter-thread data for one capture source.
// Written by the cursor producer, hotkey handlers and the remote listener.
// Read by the tick thread without mutexes on the hot path.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/common/SeqLock.h"
#include "cursorzoom/common/LockFreeQueue.h"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace CursorZoom
{

struct SharedState
{
    static constexpr size_t kCommandCapacity = 64;

    // -- Written by the cursor producer --
    SeqLock<CursorSample> cursor;

    // -- Written by the capture host when the source resizes --
    SeqLock<SizeF> sourceSize;

    // -- Any thread → tick thread --
    LockFreeQueue<ZoomCommand, kCommandCapacity> commandQueue;

    // -- Written by the tick thread, read by UI / remote threads --
    std::atomic<uint8_t> zoomMode{0};           // ZoomController::Mode
    std::atomic<float>   currentZoomLevel{1.0f};
    std::atomic<bool>    followEnabled{false};

    std::atomic<uint64_t> droppedCommands{0};

    // Serialises producers so the SPSC queue may be fed from several threads.
    // Returns false (and counts the drop) when the queue is full.
    bool postCommand(ZoomCommand cmd);

private:
    std::mutex producerMutex_;
    uint32_t nextSequence_ = 1;
};

} // namespace CursorZoom
