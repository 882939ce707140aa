/*
===============================================================================
Remote Auth protocol Session
===============================================================================

QR-code login against the remote-auth gateway, driven entirely by poll().

Architecture:
  - transport::*          → WebSocket transport (Boost.Beast, mockable)
  - remote_auth::Attempt  → one connection: keypair, heartbeat and the
                            handshake state machine, returns an Outcome
  - remote_auth::Session  → outer retry loop
                             • owns exactly one Attempt at a time
                             • tears it down and rebuilds it on recoverable
                               failures (fresh transport, fresh keypair)
                             • applies backoff and the retry budget
                             • publishes phases to a last_value<Phase> slot
  - api::*                → ticket exchange used once per successful login

Outcome handling:
  - Reconnect  → attempt destroyed (transport closed), backoff, new attempt
  - Completed  → status Completed, token available through result()
  - Cancelled  → status Cancelled (companion aborted)
  - Fatal      → status Failed, error available through result()

Retry budget:
  config.max_connect_attempts bounds the number of consecutive attempts that
  end before the gateway greeting (0 = unlimited). Any greeted attempt resets
  the budget and the backoff exponent.

Data-plane model:
  - No callbacks: the caller observes phases by pulling from phase_sink()
  - The sink is the only state shared with other threads
===============================================================================
*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "remauth/core/api/ticket_exchange_concept.hpp"
#include "remauth/core/protocol/remote_auth/attempt.hpp"
#include "remauth/core/protocol/remote_auth/config.hpp"
#include "remauth/core/protocol/remote_auth/error.hpp"
#include "remauth/core/protocol/remote_auth/outcome.hpp"
#include "remauth/core/protocol/remote_auth/phase.hpp"
#include "remauth/core/protocol/remote_auth/status.hpp"
#include "remauth/core/transport/parse_url.hpp"
#include "remauth/core/transport/websocket_concept.hpp"
#include "lcr/slot/last_value.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::protocol::remote_auth {

// Exponent clamp for the reconnect backoff
inline constexpr int MAX_BACKOFF_EXPONENT = 6;

template<
    transport::WebSocketConcept WS,
    api::TicketExchangeConcept TX,
    typename Clock = std::chrono::steady_clock
>
class Session {
public:
    using AttemptType = Attempt<WS, TX, Clock>;
    using time_point = typename Clock::time_point;

    explicit Session(TX& tx, Config cfg = {})
        : cfg_(std::move(cfg))
        , tx_(tx)
        , phase_sink_(Phase{phase::Loading{}})
    {
    }

    // The transport is closed on destruction; no retry outlives the Session
    ~Session() {
        attempt_.reset();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Validates the gateway URL, publishes Loading and opens the first attempt.
    //
    // Returns InvalidUrl / InvalidState without side effects. Otherwise the
    // session is Running and the return value is the transport error of the
    // first connect (None on success); a failed first connect is retried by
    // poll() like any other.
    [[nodiscard]]
    inline transport::Error start(std::string_view url) noexcept {
        if (status_ != Status::Idle) {
            RA_WARN("[SESSION] start() called while " << to_string(status_));
            return transport::Error::InvalidState;
        }
        transport::ParsedUrl parsed;
        if (transport::parse_url(url, parsed) != transport::Error::None ||
            parsed.scheme != transport::Scheme::Wss) {
            RA_ERROR("[SESSION] Invalid gateway URL: " << url << " (expected wss://host[:port]/path)");
            return transport::Error::InvalidUrl;
        }
        try {
            url_ = std::string(url);
        } catch (const std::exception& e) {
            RA_ERROR("[SESSION] Failed to store gateway URL: " << e.what());
            return transport::Error::InvalidState;
        }
        parsed_url_ = std::move(parsed);
        status_ = Status::Running;
        RA_INFO("[SESSION] Starting remote auth against " << url_);
        open_attempt_();
        return last_transport_error_;
    }

    // Advances the current attempt, or opens the next one once the backoff
    // delay has elapsed.
    inline Status poll() noexcept {
        if (status_ != Status::Running) {
            return status_;
        }
        if (!attempt_) {
            if (Clock::now() >= next_retry_) {
                open_attempt_();
            }
            return status_;
        }
        Outcome out = attempt_->poll();
        switch (out.kind) {
            case Outcome::Kind::Pending:
                break;
            case Outcome::Kind::Reconnect:
                handle_reconnect_(out.error);
                break;
            case Outcome::Kind::Completed:
                finish_(Status::Completed, std::move(out));
                break;
            case Outcome::Kind::Cancelled:
                finish_(Status::Cancelled, std::move(out));
                break;
            case Outcome::Kind::Fatal:
                finish_(Status::Failed, std::move(out));
                break;
        }
        return status_;
    }

    // Blocking convenience loop. Returns once the session is terminal or the
    // caller raised `stop` (the session is then cancelled).
    inline Status run(const std::atomic<bool>& stop, std::chrono::milliseconds idle = std::chrono::milliseconds(1)) noexcept {
        while (!stop.load(std::memory_order_acquire)) {
            const Status s = poll();
            if (s != Status::Running) {
                return s;
            }
            std::this_thread::sleep_for(idle);
        }
        cancel();
        return status_;
    }

    // Caller cancellation: closes the transport, no further retries.
    // The published phase is left untouched.
    inline void cancel() noexcept {
        if (status_ != Status::Running) {
            return;
        }
        RA_INFO("[SESSION] Cancelled by caller");
        finish_(Status::Cancelled, Outcome{Outcome::Kind::Cancelled, Error::Cancelled, {}});
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]] inline Status status() const noexcept { return status_; }

    // Terminal outcome (Pending while running)
    [[nodiscard]] inline const Outcome& result() const noexcept { return result_; }

    [[nodiscard]] inline Error error() const noexcept { return result_.error; }
    [[nodiscard]] inline const std::string& token() const noexcept { return result_.token; }

    // Latest-value phase slot, safe to read from any thread
    [[nodiscard]] inline const lcr::slot::last_value<Phase>& phase_sink() const noexcept { return phase_sink_; }

    [[nodiscard]] inline Phase phase() const { return phase_sink_.load(); }

    // Attempts opened so far (including failed connects)
    [[nodiscard]] inline std::uint64_t attempts() const noexcept { return attempts_; }

    // Attempts torn down for a recoverable reason
    [[nodiscard]] inline std::uint64_t reconnects() const noexcept { return reconnects_; }

    [[nodiscard]] inline transport::Error last_transport_error() const noexcept { return last_transport_error_; }

    [[nodiscard]] inline const Config& config() const noexcept { return cfg_; }

#ifdef REMAUTH_UNIT_TEST
public:
    AttemptType* attempt() noexcept {
        return attempt_.get();
    }

    WS& ws() {
        return attempt_->ws();
    }

    time_point next_retry() const noexcept {
        return next_retry_;
    }
#endif // REMAUTH_UNIT_TEST

private:
    Config cfg_;
    TX& tx_;

    std::string url_;
    transport::ParsedUrl parsed_url_;

    // Single live attempt (nullptr while waiting for the retry timer)
    std::unique_ptr<AttemptType> attempt_;

    lcr::slot::last_value<Phase> phase_sink_;

    Status status_{Status::Idle};
    Outcome result_{};
    transport::Error last_transport_error_{transport::Error::None};

    std::uint64_t attempts_{0};
    std::uint64_t reconnects_{0};

    // Consecutive attempts that ended before the greeting
    int failed_attempts_{0};
    // 1-based ordinal of the next retry since the last greeted attempt
    int retry_attempts_{0};
    time_point next_retry_{};

private:
    inline void open_attempt_() noexcept {
        ++attempts_;
        RA_DEBUG("[SESSION] Opening attempt #" << attempts_);
        try {
            phase_sink_.store(phase::Loading{});
            attempt_ = std::make_unique<AttemptType>(cfg_, tx_, phase_sink_, attempts_);
        } catch (const std::exception& e) {
            RA_ERROR("[SESSION] Failed to create attempt: " << e.what());
            attempt_.reset();
            handle_reconnect_(Error::ConnectError);
            return;
        }
        const Error err = attempt_->open(parsed_url_);
        last_transport_error_ = attempt_->transport_error();
        if (err != Error::None) {
            handle_reconnect_(err);
        }
    }

    inline void handle_reconnect_(Error error) noexcept {
        const bool greeted = attempt_ && attempt_->greeted();
        // Tear down first: closes the transport and drops the keypair
        attempt_.reset();
        if (!should_retry_(error)) {
            finish_(Status::Failed, Outcome::fatal(error));
            return;
        }
        if (greeted) {
            failed_attempts_ = 0;
            retry_attempts_ = 0;
        } else {
            ++failed_attempts_;
        }
        if (cfg_.max_connect_attempts > 0 && failed_attempts_ >= cfg_.max_connect_attempts) {
            RA_ERROR("[SESSION] Giving up after " << failed_attempts_ << " consecutive failed attempts (last: " << to_string(error) << ")");
            finish_(Status::Failed, Outcome::fatal(Error::ConnectExhausted));
            return;
        }
        ++reconnects_;
        ++retry_attempts_;
        const auto delay = backoff_(error, retry_attempts_);
        next_retry_ = Clock::now() + delay;
        RA_INFO("[SESSION] Reconnecting in " << delay.count() << " ms (reason: " << to_string(error) << ")");
    }

    inline void finish_(Status status, Outcome out) noexcept {
        attempt_.reset();
        status_ = status;
        result_ = std::move(out);
        if (status == Status::Failed) {
            RA_ERROR("[SESSION] Remote auth failed (" << to_string(result_.error) << ")");
        } else {
            RA_INFO("[SESSION] Remote auth finished: " << to_string(status));
        }
    }

    // Recoverable failures go back to the retry loop; everything else is terminal
    [[nodiscard]]
    inline bool should_retry_(Error error) const noexcept {
        switch (error) {
            case Error::ConnectError:
            case Error::CryptoError:
            case Error::ProtocolViolation:
            case Error::FingerprintMismatch:
            case Error::LivenessFailure:
            case Error::SessionTimeout:
                RA_TRACE("[SESSION] should retry after '" << to_string(error) << "'? -> YES");
                return true;
            default:
                RA_TRACE("[SESSION] should retry after '" << to_string(error) << "'? -> NO");
                return false;
        }
    }

    [[nodiscard]]
    inline std::chrono::milliseconds backoff_(Error error, int attempt) const noexcept {
        // Clamp exponent to avoid overflow / long stalls
        const int exponent = std::clamp(attempt - 1, 0, MAX_BACKOFF_EXPONENT);
        auto base = cfg_.retry_base_delay;
        switch (error) {
            // --- Fast retry: the gateway is reachable, only this session died
            case Error::LivenessFailure:
            case Error::SessionTimeout:
                base /= 2;
                break;
            // --- Moderate retry
            case Error::ConnectError:
            case Error::ProtocolViolation:
            case Error::FingerprintMismatch:
                break;
            // --- Conservative retry
            case Error::CryptoError:
                base *= 2;
                break;
            default:
                break;
        }
        return std::min(base * (1 << exponent), cfg_.retry_max_delay);
    }
};

} // namespace remauth::core::protocol::remote_auth
