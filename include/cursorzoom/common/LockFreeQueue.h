#pragma once
// =============================================================================
// CursorZoom - Lock-Free Queue
// Bounded SPSC ring buffer for ZoomCommand.
// Producer: SharedState::postCommand (serialized by its producer mutex).
// Consumer: the tick thread, drained at the start of every frame.
// =============================================================================

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>

namespace CursorZoom
{

template <typename T, size_t Capacity = 64>
class LockFreeQueue
{
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

public:
    // One slot stays empty to tell full from empty.
    static constexpr size_t kUsableCapacity = Capacity - 1;

    // Returns false when full; the item is not enqueued.
    bool push(const T& item)
    {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) & (Capacity - 1);
        if (next == tail_.load(std::memory_order_acquire))
            return false;
        slots_[head] = item;
        head_.store(next, std::memory_order_release);
        return true;
    }

    std::optional<T> pop()
    {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return std::nullopt;
        T item = slots_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return item;
    }

    bool empty() const
    {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    // Snapshot only; may be stale by the time the caller looks at it.
    size_t approxSize() const
    {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & (Capacity - 1);
    }

private:
    std::array<T, Capacity> slots_{};
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace CursorZoom
