#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

// Compile-time defaults for the remote-auth endpoints.
// Runtime overrides live in remote_auth::Config and lite::client_config.

namespace remauth::core::config {

namespace gateway {

inline constexpr std::string_view URL        = "wss://remote-auth-gateway.discord.gg/?v=2";
inline constexpr std::string_view ORIGIN     = "https://discord.com";
inline constexpr std::string_view USER_AGENT = "remauth/1.0";

// Scannable payload: QR_URL_PREFIX + <fingerprint>
inline constexpr std::string_view QR_URL_PREFIX = "https://discord.com/ra/";

inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT{10'000};
inline constexpr std::chrono::milliseconds CLOSE_TIMEOUT{2'000};

// The gateway greets right after the upgrade; silence beyond this is a dead link
inline constexpr std::chrono::milliseconds HELLO_TIMEOUT{10'000};

// Upper bounds accepted for the greeting's heartbeat_interval and timeout_ms
inline constexpr std::chrono::milliseconds MAX_HEARTBEAT_INTERVAL{std::chrono::hours(24)};
inline constexpr std::chrono::milliseconds MAX_SESSION_TIMEOUT{std::chrono::hours(24)};

// Reconnect backoff: base * 2^attempt, capped
inline constexpr std::chrono::milliseconds RETRY_BASE_DELAY{100};
inline constexpr std::chrono::milliseconds RETRY_MAX_DELAY{10'000};

// 0 = unlimited
inline constexpr int MAX_CONNECT_ATTEMPTS = 0;

} // namespace gateway

namespace api {

inline constexpr std::string_view BASE_URL = "https://discord.com/api/v9";
inline constexpr std::string_view REMOTE_AUTH_LOGIN = "/users/@me/remote-auth/login";

inline constexpr std::chrono::milliseconds REQUEST_TIMEOUT{15'000};

// Upper bound for an HTTP response body
inline constexpr std::uint64_t MAX_BODY_SIZE = 64 * 1024;

} // namespace api

namespace crypto {

inline constexpr int RSA_KEY_BITS = 2048;
inline constexpr unsigned long RSA_PUBLIC_EXPONENT = 65537;

} // namespace crypto

} // namespace remauth::core::config
