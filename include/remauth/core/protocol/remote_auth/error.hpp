#pragma once

#include <cstdint>
#include <string_view>

namespace remauth::core::protocol::remote_auth {

/*
===============================================================================
 remote_auth::Error
===============================================================================

Session-level failure taxonomy.

Recoverable (handled by the session retry loop, only logged):
  ConnectError, CryptoError (before the token step), ProtocolViolation,
  FingerprintMismatch, LivenessFailure, SessionTimeout

Terminal (surfaced to the caller):
  TicketExchange, CryptoError during the token step, ConnectExhausted,
  Cancelled, InvalidUrl, InvalidState
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    ConnectError,       // Transport could not be established
    CryptoError,        // Key generation or OAEP decryption failed
    ProtocolViolation,  // Malformed, unexpected or out-of-phase opcode; link lost mid-handshake
    FingerprintMismatch,// Server fingerprint differs from the local public key digest
    LivenessFailure,    // Heartbeat not acknowledged before the next beat
    SessionTimeout,     // Gateway session lifetime (hello.timeout_ms) elapsed

    TicketExchange,     // REST ticket exchange failed
    ConnectExhausted,   // Retry budget consumed without reaching the gateway greeting
    Cancelled,          // Caller cancelled the login

    InvalidUrl,         // Gateway URL rejected by start()
    InvalidState,       // Operation not allowed in the current session state
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::ConnectError:      return "ConnectError";
    case Error::CryptoError:       return "CryptoError";
    case Error::ProtocolViolation: return "ProtocolViolation";
    case Error::FingerprintMismatch: return "FingerprintMismatch";
    case Error::LivenessFailure:   return "LivenessFailure";
    case Error::SessionTimeout:    return "SessionTimeout";
    case Error::TicketExchange:    return "TicketExchange";
    case Error::ConnectExhausted:  return "ConnectExhausted";
    case Error::Cancelled:         return "Cancelled";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    default:                       return "Unknown";
    }
}

} // namespace remauth::core::protocol::remote_auth
