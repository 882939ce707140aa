// -----------------------------------------------------------------------------
// SPSC ring buffer with compile-time capacity
//
// Lock-free, wait-free, cacheline-separated producer/consumer indices.
// Used to hand frames and control events from a transport IO thread to
// the poll thread without locks or callbacks.
//
// Example:
//     spsc_ring<std::string, 64> frames;
//     frames.push(std::move(text));     // producer thread
//     std::string out;
//     while (frames.pop(out)) { ... }   // consumer thread
//
// Notes:
//   - Capacity must be a power of two; usable slots are Capacity - 1
//   - Single Producer, Single Consumer only
//   - All operations O(1), noexcept (T move assignment must not throw)
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>
#include <type_traits>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");
    static_assert(std::is_nothrow_move_assignable_v<T>,
                  "spsc_ring<T> requires a nothrow move-assignable T");

public:
    spsc_ring() noexcept = default;
    ~spsc_ring() noexcept = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side --------------------------------------------------------

    [[nodiscard]] inline bool push(const T& item) noexcept(std::is_nothrow_copy_assignable_v<T>) {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = item;
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool push(T&& item) noexcept {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side --------------------------------------------------------

    [[nodiscard]] inline bool pop(T& out) noexcept {
        const std::size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Observers ------------------------------------------------------------

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.index.load(std::memory_order_acquire) ==
               head_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool full() const noexcept {
        const std::size_t next = (head_.index.load(std::memory_order_relaxed) + 1) & MASK;
        return next == tail_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline constexpr std::size_t capacity() const noexcept { return Capacity; }

    [[nodiscard]] inline std::size_t used() const noexcept {
        const std::size_t h = head_.index.load(std::memory_order_acquire);
        const std::size_t t = tail_.index.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

private:
    struct alignas(64) PaddedAtomic {
        std::atomic<std::size_t> index{0};
        char pad[64 - sizeof(std::atomic<std::size_t>)]{};
    };

    static constexpr std::size_t MASK = Capacity - 1;
    alignas(64) std::array<T, Capacity> buffer_{};
    alignas(64) PaddedAtomic head_;
    alignas(64) PaddedAtomic tail_;
};

} // namespace lcr::lockfree
