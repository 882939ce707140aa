#pragma once

#include <string_view>

#include "remauth/core/protocol/remote_auth/schema/server/pending.hpp"
#include "remauth/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace remauth::core::protocol::remote_auth::parser::server {

using core::parser::Result;
namespace helper = core::parser::helper;

namespace detail {

// Required, non-empty string field
[[nodiscard]]
inline Result parse_payload_field(const simdjson::dom::element& root, const char* key, std::string_view op, std::string& out) noexcept {
    auto r = helper::parse_string_required(root, key, out);
    if (r != Result::Parsed) {
        RA_WARN("[PARSER] Field '" << key << "' missing or invalid in " << op << " message.");
        return r;
    }
    if (out.empty()) {
        RA_WARN("[PARSER] Field '" << key << "' is empty in " << op << " message.");
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

} // namespace detail

struct pending_remote_init {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::PendingRemoteInit& out) noexcept {
        return detail::parse_payload_field(root, "fingerprint", "pending_remote_init", out.fingerprint);
    }
};

struct pending_ticket {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::PendingTicket& out) noexcept {
        return detail::parse_payload_field(root, "encrypted_user_payload", "pending_ticket", out.encrypted_user_payload);
    }
};

struct pending_login {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::server::PendingLogin& out) noexcept {
        return detail::parse_payload_field(root, "ticket", "pending_login", out.ticket);
    }
};

} // namespace remauth::core::protocol::remote_auth::parser::server
