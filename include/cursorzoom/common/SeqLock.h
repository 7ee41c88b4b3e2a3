#pragma once
// =============================================================================
// CursorZoom - SeqLock
// Single-writer sequence lock for small trivially-copyable values
// (CursorSample, SizeF). The reader copies the whole value and retries if a
// write overlapped, so x and y are never torn apart.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <type_traits>

namespace CursorZoom
{

template <typename T>
class SeqLock
{
    static_assert(std::is_trivially_copyable<T>::value, "SeqLock needs a trivially copyable T");

public:
    void write(const T& value)
    {
        const uint32_t seq = sequence_.load(std::memory_order_relaxed);
        sequence_.store(seq + 1, std::memory_order_relaxed); // odd = write in progress
        std::atomic_thread_fence(std::memory_order_release);
        data_ = value;
        sequence_.store(seq + 2, std::memory_order_release);
    }

    T read() const
    {
        T result;
        uint32_t seq0, seq1;
        do
        {
            seq0 = sequence_.load(std::memory_order_acquire);
            result = data_;
            std::atomic_thread_fence(std::memory_order_acquire);
            seq1 = sequence_.load(std::memory_order_relaxed);
        } while (seq0 != seq1 || (seq0 & 1));
        return result;
    }

    // Even value that grows by 2 per completed write; 0 = never written.
    uint32_t version() const { return sequence_.load(std::memory_order_acquire) & ~1u; }

    bool hasValue() const { return version() != 0; }

private:
    std::atomic<uint32_t> sequence_{0};
    T data_{};
};

} // namespace CursorZoom
