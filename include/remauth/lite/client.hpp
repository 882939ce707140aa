#pragma once

#include <string>
#include <functional>
#include <chrono>
#include <memory>
#include <thread>

#include "remauth/lite/domain/account.hpp"
#include "remauth/lite/domain/phase.hpp"
#include "remauth/lite/error.hpp"


namespace remauth::lite {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct client_config {
    /// Remote-auth gateway (wss:// only).
    std::string gateway_url = "wss://remote-auth-gateway.discord.gg/?v=2";

    /// REST API base; the ticket exchange endpoint is appended to it.
    std::string api_base = "https://discord.com/api/v9";

    /// Origin header sent to both the gateway and the API.
    std::string origin = "https://discord.com";

    /// Prefix of the QR code payload; the key fingerprint is appended.
    std::string qr_url_prefix = "https://discord.com/ra/";

    /// Consecutive connection attempts allowed to fail (0 = unlimited).
    int max_connect_attempts = 0;

    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds request_timeout{15'000};
};


/*
===============================================================================
remauth Lite Client - v1 Public API (STABLE)
===============================================================================

The Lite Client is the stable, user-facing façade for QR-code login.

Usage:
  1) register callbacks
  2) start()
  3) drive poll() (or run_until()) until is_finished()

Callbacks are invoked from poll() only, on the calling thread:
  - on_phase     every observable phase change (QR code, account preview, ...)
  - on_complete  once, with the session token
  - on_error     once, for terminal failures

Reconnects caused by expired codes, dropped connections or protocol faults
are handled internally and only surface as a new QR code.

Lite v1 guarantees:
  - Stable domain value layouts
  - Stable callback signatures
  - No protocol or Core internals exposed
===============================================================================
*/
class Client {
public:
    using phase_handler    = std::function<void(const domain::Phase&)>;
    using complete_handler = std::function<void(const std::string& token)>;
    using error_handler    = std::function<void(const error&)>;

    // Construct a client using a configuration object.
    explicit Client(client_config cfg = {});
    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    // Destructor
    ~Client();

    // lifecycle
    bool start();
    void poll();
    void cancel();

    // True once the login completed, was cancelled or failed
    [[nodiscard]] bool is_finished() const;

    // -----------------------------------------------------------------------------
    // Run loop until external stop condition becomes true or the login ends
    // -----------------------------------------------------------------------------
    //
    // If tick == 0 the loop busy-waits by continuously calling poll().
    // A stop request cancels the login.
    //
    // -----------------------------------------------------------------------------
    template<class StopFn>
    void run_until(StopFn&& should_stop, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (!is_finished()) [[likely]] {
            if (should_stop()) [[unlikely]] {
                cancel();
                return;
            }
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    void on_phase(phase_handler cb);
    void on_complete(complete_handler cb);
    void on_error(error_handler cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace remauth::lite
