/*
===============================================================================
WebSocketConcept (Pull-Based)
===============================================================================

Minimal transport contract required by the remote-auth Attempt.

The WebSocket implementation:

  • Is constructed from a websocket::Config (origin header, timeouts)
  • Connects synchronously; failure is reported by the returned Error
  • Owns its IO thread once connected
  • Pushes complete text frames into an internal SPSC ring
  • Pushes control-plane events (Error, then Close) into a second SPSC ring
  • Closes idempotently; close() is also performed by the destructor

No callbacks. No dynamic dispatch. The consumer drains both rings from
its poll loop:

    websocket::Event ev;
    while (ws.poll_event(ev)) { ... }
    std::string frame;
    while (ws.poll_message(frame)) { ... }

Single-producer / single-consumer only: all public methods except the
constructor and destructor are called from the poll thread.
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "remauth/core/transport/error.hpp"
#include "remauth/core/transport/websocket/config.hpp"
#include "remauth/core/transport/websocket/events.hpp"


namespace remauth::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, const websocket::Config&> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view msg,
        std::string& frame,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Sending
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // Receiving (pull-based)
    { ws.poll_message(frame) } noexcept -> std::same_as<bool>;
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace remauth::core::transport
