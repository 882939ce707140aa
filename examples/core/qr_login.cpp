// ============================================================================
// Core example: QR-code login
//
// Demonstrates:
// - Driving a remote_auth::Session directly (Beast transport, HTTPS exchange)
// - Observing phases through the last-value phase sink
// - Retry/backoff handled by the session
// - Clean cancellation via Ctrl+C
// ============================================================================
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <thread>
#include <type_traits>
#include <variant>

#include "remauth/core/api/https/ticket_exchange.hpp"
#include "remauth/core/protocol/remote_auth/session.hpp"
#include "remauth/core/token.hpp"
#include "remauth/core/transport/beast/websocket.hpp"

#include "common/cli/minimal.hpp"


// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}


int main(int argc, char** argv) {
    using namespace remauth::core;
    namespace ra = protocol::remote_auth;

    const auto& params = remauth::examples::cli::minimal::configure(argc, argv,
        "remauth Core QR login\n"
        "Runs the gateway handshake and prints the QR payload to scan.\n"
    );
    params.dump("=== Runtime Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------------------
    // Collaborators
    // -------------------------------------------------------------------------
    api::Config api_cfg;
    api_cfg.base_url = params.api_base;
    api_cfg.origin = params.origin;
    api::https::TicketExchange exchange{api_cfg};

    ra::Config cfg;
    cfg.websocket.origin = params.origin;
    cfg.max_connect_attempts = params.max_connect_attempts;

    ra::Session<transport::beast::WebSocket, api::https::TicketExchange> session{exchange, cfg};

    if (session.start(params.gateway_url) == transport::Error::InvalidUrl) {
        std::cerr << "[remauth] Invalid gateway URL\n";
        return -1;
    }

    // -------------------------------------------------------------------------
    // Main polling loop
    // -------------------------------------------------------------------------
    ra::Phase phase{ra::phase::Loading{}};
    std::uint64_t epoch = 0;
    while (running.load(std::memory_order_relaxed)) {
        const ra::Status status = session.poll();

        if (session.phase_sink().load_if_updated(phase, epoch)) {
            std::visit([](const auto& p) {
                using P = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<P, ra::phase::QrCode>) {
                    std::cout << "\n  Scan this QR payload: " << p.display_payload << "\n\n";
                } else if constexpr (std::is_same_v<P, ra::phase::Accepted>) {
                    std::cout << "  Scanned by " << p.identity << ", waiting for confirmation...\n";
                } else {
                    std::cout << "  Phase: " << ra::to_string(ra::kind_of(ra::Phase{p})) << "\n";
                }
            }, phase);
        }

        if (ra::is_terminal(status)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    session.cancel();

    // -------------------------------------------------------------------------
    // Result
    // -------------------------------------------------------------------------
    std::cout << "\n[remauth] Status    : " << ra::to_string(session.status())
              << "\n[remauth] Attempts  : " << session.attempts()
              << "\n[remauth] Reconnects: " << session.reconnects() << "\n";

    switch (session.status()) {
        case ra::Status::Completed:
            std::cout << "[remauth] Token     : " << Token{session.token()} << "\n";
            return 0;
        case ra::Status::Failed:
            std::cerr << "[remauth] Error     : " << ra::to_string(session.error()) << "\n";
            if (exchange.last_status() != 0) {
                std::cerr << "[remauth] HTTP      : " << exchange.last_status() << " " << exchange.last_api_error() << "\n";
            }
            return -1;
        default:
            return 0;
    }
}
