#pragma once

#include <string_view>

namespace remauth::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Semantic transport failures, abstracted away from Boost.Asio / OpenSSL error
codes. Used by the WebSocket transport and the HTTPS ticket exchange alike.

The remote-auth session maps these onto its own taxonomy (ConnectError for
anything raised while establishing the socket, ProtocolViolation for a
connection lost while a required opcode was still pending).
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Operation aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Resolve / connect / handshake / IO timed out
    ConnectionFailed, // DNS or TCP connect failure
    HandshakeFailed,  // TLS or WebSocket upgrade failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or unexpected message structure

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified failure

    // --- Consumer too slow --------------------------------------------------
    Backpressure,     // Inbound ring full: the poll loop is not draining frames
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace remauth::core
