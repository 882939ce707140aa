#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "lcr/log/logger.hpp"

/*
===============================================================================
 heartbeat::Scheduler
===============================================================================

Fixed-period heartbeat timer with single-outstanding-beat accounting.

  • Inactive until activate(now, interval): no ticks are produced, the
    scheduler is "pending forever".
  • Once active, the first tick is due at activation + interval and later
    ticks follow on a fixed period (missed periods are not replayed).
  • On a due tick:
        ack pending  -> Tick::LivenessFailure, and the scheduler disarms
        otherwise    -> Tick::SendHeartbeat, ack becomes pending
  • acknowledge() clears the pending ack.

After a liveness failure poll() returns Tick::None until the next
activate(): the owner observes exactly one failure per connection.

The Clock is injectable so tests can drive time deterministically.
===============================================================================
*/

namespace remauth::core::heartbeat {

enum class Tick : std::uint8_t {
    None,
    SendHeartbeat,
    LivenessFailure
};

inline constexpr std::string_view to_string(Tick t) noexcept {
    switch (t) {
        case Tick::None:            return "None";
        case Tick::SendHeartbeat:   return "SendHeartbeat";
        case Tick::LivenessFailure: return "LivenessFailure";
    }
    return "Unknown";
}


template <typename Clock = std::chrono::steady_clock>
class Scheduler {
public:
    using time_point = typename Clock::time_point;

    Scheduler() noexcept = default;

    inline void activate(time_point now, std::chrono::milliseconds interval) noexcept {
        interval_ = interval;
        next_due_ = now + interval;
        ack_pending_ = false;
        active_ = interval.count() > 0;
        if (!active_) {
            RA_WARN("[HB] Ignoring non-positive heartbeat interval (" << interval.count() << " ms)");
            return;
        }
        RA_DEBUG("[HB] Heartbeat activated (interval " << interval.count() << " ms)");
    }

    inline void deactivate() noexcept {
        active_ = false;
        ack_pending_ = false;
    }

    [[nodiscard]]
    inline Tick poll(time_point now) noexcept {
        if (!active_ || now < next_due_) {
            return Tick::None;
        }
        if (ack_pending_) {
            RA_WARN("[HB] Heartbeat not acknowledged within " << interval_.count() << " ms");
            active_ = false;
            return Tick::LivenessFailure;
        }
        // Keep a fixed cadence; skip periods missed by a late poll
        do {
            next_due_ += interval_;
        } while (next_due_ <= now);
        ack_pending_ = true;
        ++sent_;
        return Tick::SendHeartbeat;
    }

    inline void acknowledge() noexcept {
        if (!ack_pending_) {
            RA_TRACE("[HB] Unsolicited heartbeat ack");
        }
        ack_pending_ = false;
        ++acked_;
    }

    [[nodiscard]] inline bool active() const noexcept { return active_; }
    [[nodiscard]] inline bool ack_pending() const noexcept { return ack_pending_; }
    [[nodiscard]] inline std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] inline time_point next_due() const noexcept { return next_due_; }
    [[nodiscard]] inline std::uint64_t sent() const noexcept { return sent_; }
    [[nodiscard]] inline std::uint64_t acked() const noexcept { return acked_; }

private:
    bool active_{false};
    bool ack_pending_{false};
    std::chrono::milliseconds interval_{0};
    time_point next_due_{};
    std::uint64_t sent_{0};
    std::uint64_t acked_{0};
};

} // namespace remauth::core::heartbeat
