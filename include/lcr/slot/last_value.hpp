/*
================================================================================
 last_value<T>
================================================================================

Overwrite-on-write, single-writer / multi-reader storage for state-like data
where freshness matters more than history.

Each store() replaces the previously published value and bumps an epoch.
Readers pull the latest value when the epoch they last observed is stale.
Intermediate values may be skipped; readers must not assume every update is
individually observed.

--------------------------------------------------------------------------------
 Concurrency model
--------------------------------------------------------------------------------

  • Single writer: exactly one thread may call store()
  • Multiple readers: any thread may call load_if_updated() / load()
  • The value is copied under a short critical section, so T may own memory
    (std::string, std::variant of strings, ...)
  • epoch() is lock-free and can be used for cheap change detection

Epoch overflow is permitted; equality comparison is sufficient.

================================================================================
*/
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace lcr {
namespace slot {


template <typename T>
class last_value {
public:
    last_value() = default;
    explicit last_value(T initial) : value_(std::move(initial)) {}

    last_value(const last_value&) = delete;
    last_value& operator=(const last_value&) = delete;

    // -------------------------------------------------------------------------
    // Writer API
    // -------------------------------------------------------------------------

    inline void store(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
        epoch_.fetch_add(1, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Reader API
    // -------------------------------------------------------------------------

    // Copies the stored value into `out` if it changed since `last_epoch`.
    // Returns false (and leaves `out` untouched) when nothing new was published.
    [[nodiscard]]
    inline bool load_if_updated(T& out, std::uint64_t& last_epoch) const {
        if (epoch_.load(std::memory_order_acquire) == last_epoch) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        out = value_;
        // Re-read under the lock so the epoch matches the copied value
        last_epoch = epoch_.load(std::memory_order_acquire);
        return true;
    }

    // Unconditional snapshot of the latest value
    [[nodiscard]]
    inline T load() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    T value_{};
    std::atomic<std::uint64_t> epoch_{0};
};

} // namespace slot
} // namespace lcr
