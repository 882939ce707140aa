#pragma once

#include <string_view>
#include <utility>

#include "simdjson.h"

#include "remauth/core/protocol/remote_auth/enums/op.hpp"
#include "remauth/core/protocol/remote_auth/schema/server/message.hpp"
#include "remauth/core/protocol/remote_auth/parser/server/handshake.hpp"
#include "remauth/core/protocol/remote_auth/parser/server/pending.hpp"
#include "remauth/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::protocol::remote_auth::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

/*
================================================================================
Remote Auth Gateway Parsing Architecture
================================================================================

Every gateway frame is a flat JSON object carrying an "op" discriminator.
Parsing is split into three roles:

-------------------------------------------------------------------------------
1) Router (Opcode Dispatch)
-------------------------------------------------------------------------------
  • Parses the raw frame into a simdjson DOM
  • Extracts and classifies the "op" field
  • Selects the opcode parser and stores the typed message

The router performs no field-level validation and has no knowledge of the
handshake phases. Whether an opcode is acceptable right now is decided by the
attempt state machine, not here.

-------------------------------------------------------------------------------
2) Opcode Parsers (parser/server/*.hpp)
-------------------------------------------------------------------------------
  • Validate required fields and reject empty payloads
  • Log actionable diagnostics with the [PARSER] tag
  • Populate schema::server structures

-------------------------------------------------------------------------------
3) Helpers (core/parser/helpers.hpp)
-------------------------------------------------------------------------------
  • Structural checks and primitive extraction
  • Never log, never throw

Result semantics:
  • Parsed         → `out` holds a valid message
  • Ignored        → well-formed frame with an unrecognized opcode
  • InvalidJson    → the frame is not JSON
  • InvalidSchema  → missing fields or wrong types
  • InvalidValue   → fields present but semantically invalid

================================================================================
*/

class Router {
public:
    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, schema::server::Message& out) noexcept {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            RA_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            RA_WARN("[PARSER] Gateway frame is not a JSON object: " << raw_msg);
            return Result::InvalidSchema;
        }
        std::string_view op_str;
        if (helper::parse_string_required(root, "op", op_str) != Result::Parsed) {
            RA_WARN("[PARSER] Field 'op' missing or invalid in message: " << raw_msg);
            return Result::InvalidSchema;
        }
        const Op op = to_op_enum(op_str);
        switch (op) {
            case Op::Hello:
                return parse_as_<schema::server::Hello, server::hello>(root, out);
            case Op::NonceProof:
                return parse_as_<schema::server::NonceChallenge, server::nonce_challenge>(root, out);
            case Op::HeartbeatAck:
                out = schema::server::HeartbeatAck{};
                return Result::Parsed;
            case Op::PendingRemoteInit:
                return parse_as_<schema::server::PendingRemoteInit, server::pending_remote_init>(root, out);
            case Op::PendingTicket:
                return parse_as_<schema::server::PendingTicket, server::pending_ticket>(root, out);
            case Op::PendingLogin:
                return parse_as_<schema::server::PendingLogin, server::pending_login>(root, out);
            case Op::Cancel:
                out = schema::server::Cancel{};
                return Result::Parsed;
            case Op::Init:
            case Op::Heartbeat:
                // Client -> server opcodes are never sent by the gateway
                RA_WARN("[PARSER] Unexpected client opcode '" << op_str << "' received from gateway -> ignore message.");
                return Result::Ignored;
            default:
                RA_DEBUG("[PARSER] Unknown opcode '" << op_str << "' -> ignore message.");
                return Result::Ignored;
        }
    }

private:
    // Underlying simdjson parser (reused buffers)
    simdjson::dom::parser parser_;

private:
    template<class Msg, class MsgParser>
    [[nodiscard]]
    static inline Result parse_as_(const simdjson::dom::element& root, schema::server::Message& out) noexcept {
        Msg msg{};
        const auto r = MsgParser::parse(root, msg);
        if (r == Result::Parsed) {
            out = std::move(msg);
        }
        return r;
    }
};

} // namespace remauth::core::protocol::remote_auth::parser
