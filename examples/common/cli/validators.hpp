#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace remauth::examples::cli {

// -------------------------------------------------------------
// Gateway URL validator (secure WebSocket only)
// -------------------------------------------------------------
inline auto wss_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "Gateway URL must start with wss://";
    },
    "Secure WebSocket URL validator"
);


// -------------------------------------------------------------
// REST API base validator
// -------------------------------------------------------------
inline auto https_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("https://", 0) == 0) {
            return {};
        }
        return "API base must start with https://";
    },
    "HTTPS URL validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});

} // namespace remauth::examples::cli
