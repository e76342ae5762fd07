// -----------------------------------------------------------------------------
// Single-producer / single-consumer ring buffer with compile-time capacity.
// Lock-free, cacheline-separated producer/consumer indices, no allocations
// after construction.
//
// Example:
//     spsc_ring<Message, 128> queue;
//     (void)queue.push(std::move(msg));
//     Message out;
//     if (queue.pop(out)) { ... }
//
// Notes:
//   - Capacity must be a power of two; one slot is kept free (Capacity - 1 usable)
//   - A failed push leaves the argument untouched, so callers may retry it
//   - Single Producer, Single Consumer only
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>


namespace lcr::lockfree {

template <typename T, size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");
    static_assert(std::is_nothrow_move_assignable_v<T>,
                  "spsc_ring elements must be nothrow move assignable");

public:
    spsc_ring() = default;

    // Non-copyable / non-movable
    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Push (move)
    [[nodiscard]] inline bool push(T&& item) noexcept {
        const size_t head = head_.index.load(std::memory_order_relaxed);
        const size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Pop (move); the vacated slot is reset so large payloads are released early
    [[nodiscard]] inline bool pop(T& out) noexcept {
        const size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        buffer_[tail] = T{};
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.index.load(std::memory_order_acquire) ==
               head_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool full() const noexcept {
        const size_t next = (head_.index.load(std::memory_order_relaxed) + 1) & MASK;
        return next == tail_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    [[nodiscard]] inline size_t used() const noexcept {
        const size_t h = head_.index.load(std::memory_order_acquire);
        const size_t t = tail_.index.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

private:
    struct alignas(64) PaddedAtomic {
        std::atomic<size_t> index{0};
        char pad[64 - sizeof(std::atomic<size_t>)]{};
    };

    static constexpr size_t MASK = Capacity - 1;
    alignas(64) std::array<T, Capacity> buffer_{};
    alignas(64) PaddedAtomic head_;
    alignas(64) PaddedAtomic tail_;
};

} // namespace lcr::lockfree
