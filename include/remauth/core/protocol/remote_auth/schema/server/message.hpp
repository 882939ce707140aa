#pragma once

#include <variant>

#include "remauth/core/protocol/remote_auth/enums/op.hpp"
#include "remauth/core/protocol/remote_auth/schema/server/handshake.hpp"
#include "remauth/core/protocol/remote_auth/schema/server/pending.hpp"

namespace remauth::core::protocol::remote_auth::schema::server {

// Tagged union of every server -> client opcode.
// The alternative index order matches op_of() below.
using Message = std::variant<
    Hello,
    NonceChallenge,
    HeartbeatAck,
    PendingRemoteInit,
    PendingTicket,
    PendingLogin,
    Cancel
>;

[[nodiscard]]
inline constexpr Op op_of(const Message& msg) noexcept {
    switch (msg.index()) {
        case 0: return Op::Hello;
        case 1: return Op::NonceProof;
        case 2: return Op::HeartbeatAck;
        case 3: return Op::PendingRemoteInit;
        case 4: return Op::PendingTicket;
        case 5: return Op::PendingLogin;
        case 6: return Op::Cancel;
        default: return Op::Unknown;
    }
}

} // namespace remauth::core::protocol::remote_auth::schema::server
