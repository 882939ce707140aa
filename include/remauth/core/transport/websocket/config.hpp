#pragma once

#include <chrono>
#include <string>

#include "remauth/core/config/gateway.hpp"

namespace remauth::core::transport::websocket {

// Per-connection options handed to the transport at construction.
struct Config {
    // Sent as the Origin header of the upgrade request. The remote-auth
    // gateway rejects upgrades without a recognised origin.
    std::string origin = std::string(config::gateway::ORIGIN);

    std::string user_agent = std::string(config::gateway::USER_AGENT);

    // Upper bound for resolve + TCP connect + TLS handshake + upgrade
    std::chrono::milliseconds connect_timeout = config::gateway::CONNECT_TIMEOUT;

    // Upper bound for the closing handshake before the socket is torn down
    std::chrono::milliseconds close_timeout = config::gateway::CLOSE_TIMEOUT;

    // Verify the server certificate chain and host name
    bool verify_peer = true;
};

} // namespace remauth::core::transport::websocket
