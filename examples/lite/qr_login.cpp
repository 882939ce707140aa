// ============================================================================
// Lite example: QR-code login
//
// Demonstrates:
// - The stable Lite client with phase / completion / error callbacks
// - run_until() with a Ctrl+C stop condition
// ============================================================================
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "remauth.hpp"

#include "common/cli/minimal.hpp"


// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}


int main(int argc, char** argv) {
    using namespace remauth::lite;

    const auto& params = remauth::examples::cli::minimal::configure(argc, argv,
        "remauth Lite QR login\n"
        "Prints the QR payload and reports the session token once confirmed.\n"
    );

    std::signal(SIGINT, on_signal);

    client_config cfg;
    cfg.gateway_url = params.gateway_url;
    cfg.api_base = params.api_base;
    cfg.origin = params.origin;
    cfg.max_connect_attempts = params.max_connect_attempts;

    Client client{cfg};

    client.on_phase([](const Phase& p) {
        std::cout << " -> " << p << std::endl;
    });

    bool ok = false;
    client.on_complete([&](const std::string& token) {
        ok = true;
        // Print only the first segment; the rest is a secret
        const auto dot = token.find('.');
        std::cout << "[remauth-lite] Logged in, token " << token.substr(0, dot) << ".***" << std::endl;
    });

    client.on_error([](const error& e) {
        std::cerr << "[remauth-lite] " << to_string(e.code) << ": " << e.message << std::endl;
    });

    if (!client.start()) {
        std::cerr << "[remauth-lite] Failed to start\n";
        return -1;
    }

    client.run_until([] { return !running.load(std::memory_order_relaxed); });

    std::cout << "\n[remauth-lite] Done.\n";
    return ok ? 0 : -1;
}
