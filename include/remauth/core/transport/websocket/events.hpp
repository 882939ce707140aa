#pragma once

/*
===============================================================================
 remauth::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport and delivered to the
owning session through a lock-free SPSC ring.

    • Close  -> transport closed (local or remote), emitted exactly once
    • Error  -> transport-level failure, always emitted before Close

Text frames travel on a separate data-plane ring (see WebSocketConcept).
Control-plane events must never be dropped.
===============================================================================
*/

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "remauth/core/transport/error.hpp"

namespace remauth::core::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Close: return "Close";
        case EventType::Error: return "Error";
    }
    return "Unknown";
}

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // meaningful only if type == EventType::Error

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");
static_assert(sizeof(Event) <= 16, "websocket::Event should remain small");

} // namespace remauth::core::transport::websocket
