#pragma once

#include <cstdint>
#include <string_view>

namespace remauth::core::api {

// Failures of a REST call
enum class Error : std::uint8_t {
    None = 0,
    InvalidUrl,       // API base URL is not https://host[:port]/path
    Transport,        // DNS / TCP / TLS / HTTP framing failure or timeout
    HttpStatus,       // Non-2xx status without a recognisable error object
    InvalidResponse,  // 2xx status, neither a token nor an error object
    Rejected          // Body is an application error object (any status)
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:            return "None";
    case Error::InvalidUrl:      return "InvalidUrl";
    case Error::Transport:       return "Transport";
    case Error::HttpStatus:      return "HttpStatus";
    case Error::InvalidResponse: return "InvalidResponse";
    case Error::Rejected:        return "Rejected";
    default:                     return "Unknown";
    }
}

} // namespace remauth::core::api
