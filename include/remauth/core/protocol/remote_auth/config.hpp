#pragma once

#include <chrono>
#include <string>

#include "remauth/core/config/gateway.hpp"
#include "remauth/core/transport/websocket/config.hpp"

namespace remauth::core::protocol::remote_auth {

// Runtime options of a remote-auth Session
struct Config {
    // Prefix of the scannable payload; the fingerprint is appended verbatim
    std::string qr_url_prefix = std::string(config::gateway::QR_URL_PREFIX);

    // Options handed to every transport instance
    transport::websocket::Config websocket{};

    // Maximum wait for the gateway greeting after the upgrade
    std::chrono::milliseconds hello_timeout = config::gateway::HELLO_TIMEOUT;

    // Consecutive attempts allowed to fail before the gateway greeting (0 = unlimited)
    int max_connect_attempts = config::gateway::MAX_CONNECT_ATTEMPTS;

    std::chrono::milliseconds retry_base_delay = config::gateway::RETRY_BASE_DELAY;
    std::chrono::milliseconds retry_max_delay = config::gateway::RETRY_MAX_DELAY;
};

} // namespace remauth::core::protocol::remote_auth
