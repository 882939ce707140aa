#pragma once

#include <cstdint>
#include <string_view>

#include "remauth/core/protocol/remote_auth/schema/server/handshake.hpp"
#include "remauth/core/config/gateway.hpp"
#include "remauth/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace remauth::core::protocol::remote_auth::parser::server {

using core::parser::Result;
namespace helper = core::parser::helper;

struct hello {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::Hello& out) noexcept {
        // heartbeat_interval (required, 0 < v <= MAX_HEARTBEAT_INTERVAL)
        auto r = helper::parse_uint64_required(root, "heartbeat_interval", out.heartbeat_interval);
        if (r != Result::Parsed) {
            RA_WARN("[PARSER] Field 'heartbeat_interval' missing or invalid in hello message.");
            return r;
        }
        if (out.heartbeat_interval == 0 ||
            out.heartbeat_interval > static_cast<std::uint64_t>(config::gateway::MAX_HEARTBEAT_INTERVAL.count())) {
            RA_WARN("[PARSER] Field 'heartbeat_interval' out of range in hello message: " << out.heartbeat_interval);
            return Result::InvalidValue;
        }
        // timeout_ms (required, 0 < v <= MAX_SESSION_TIMEOUT)
        r = helper::parse_uint64_required(root, "timeout_ms", out.timeout_ms);
        if (r != Result::Parsed) {
            RA_WARN("[PARSER] Field 'timeout_ms' missing or invalid in hello message.");
            return r;
        }
        if (out.timeout_ms == 0 ||
            out.timeout_ms > static_cast<std::uint64_t>(config::gateway::MAX_SESSION_TIMEOUT.count())) {
            RA_WARN("[PARSER] Field 'timeout_ms' out of range in hello message: " << out.timeout_ms);
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }
};

struct nonce_challenge {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::NonceChallenge& out) noexcept {
        auto r = helper::parse_string_required(root, "encrypted_nonce", out.encrypted_nonce);
        if (r != Result::Parsed) {
            RA_WARN("[PARSER] Field 'encrypted_nonce' missing or invalid in nonce_proof message.");
            return r;
        }
        if (out.encrypted_nonce.empty()) {
            RA_WARN("[PARSER] Field 'encrypted_nonce' is empty in nonce_proof message.");
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }
};

} // namespace remauth::core::protocol::remote_auth::parser::server
