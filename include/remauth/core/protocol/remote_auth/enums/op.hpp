#pragma once

#include <cstdint>
#include <string_view>


namespace remauth::core::protocol::remote_auth {

// ===============================================================
// OP ENUM (value of the "op" discriminator field)
// ===============================================================
enum class Op : std::uint8_t {
    // client -> server
    Init,
    Heartbeat,
    // both directions (client proof / server challenge)
    NonceProof,
    // server -> client
    Hello,
    HeartbeatAck,
    PendingRemoteInit,
    PendingTicket,
    PendingLogin,
    Cancel,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(Op op) noexcept {
    switch (op) {
        case Op::Init:              return "init";
        case Op::Heartbeat:         return "heartbeat";
        case Op::NonceProof:        return "nonce_proof";
        case Op::Hello:             return "hello";
        case Op::HeartbeatAck:      return "heartbeat_ack";
        case Op::PendingRemoteInit: return "pending_remote_init";
        case Op::PendingTicket:     return "pending_ticket";
        case Op::PendingLogin:      return "pending_login";
        case Op::Cancel:            return "cancel";
        default:                    return "unknown";
    }
}

// ===============================================================
// string -> enum
// Dispatch on length first, then compare the full name.
// ===============================================================
[[nodiscard]] inline constexpr Op to_op_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 4: // init
            if (s == "init") return Op::Init;
            break;
        case 5: // hello
            if (s == "hello") return Op::Hello;
            break;
        case 6: // cancel
            if (s == "cancel") return Op::Cancel;
            break;
        case 9: // heartbeat
            if (s == "heartbeat") return Op::Heartbeat;
            break;
        case 11: // nonce_proof
            if (s == "nonce_proof") return Op::NonceProof;
            break;
        case 13: // heartbeat_ack, pending_login
            if (s[0] == 'h' && s == "heartbeat_ack") return Op::HeartbeatAck;
            if (s[0] == 'p' && s == "pending_login") return Op::PendingLogin;
            break;
        case 14: // pending_ticket
            if (s == "pending_ticket") return Op::PendingTicket;
            break;
        case 19: // pending_remote_init
            if (s == "pending_remote_init") return Op::PendingRemoteInit;
            break;
    }
    return Op::Unknown;
}

} // namespace remauth::core::protocol::remote_auth
