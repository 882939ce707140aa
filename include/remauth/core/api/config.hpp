#pragma once

#include <chrono>
#include <string>

#include "remauth/core/config/gateway.hpp"

namespace remauth::core::api {

// Runtime options of the REST client
struct Config {
    // https://host[:port]/prefix, endpoints are appended to the prefix
    std::string base_url = std::string(config::api::BASE_URL);

    std::string origin = std::string(config::gateway::ORIGIN);
    std::string user_agent = std::string(config::gateway::USER_AGENT);

    // Upper bound for resolve + connect + TLS + request + response
    std::chrono::milliseconds request_timeout = config::api::REQUEST_TIMEOUT;

    bool verify_peer = true;
};

} // namespace remauth::core::api
