#pragma once

#include <array>
#include <ostream>
#include <string>
#include <string_view>

#include "remauth/core/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::protocol::remote_auth {

// Account preview decrypted from pending_ticket:
//   "<user_id>:<discriminator>:<avatar_hash>:<display_name>"
//
// avatar_hash "0" stands for "no avatar".
struct Identity {
    std::string user_id;
    std::string discriminator;
    std::string avatar_hash;
    std::string display_name;

    [[nodiscard]]
    inline bool has_avatar() const noexcept {
        return !avatar_hash.empty() && avatar_hash != "0";
    }

    bool operator==(const Identity&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Identity& id) {
    return os << id.display_name << "#" << id.discriminator << " (" << id.user_id << ")";
}


namespace detail {

[[nodiscard]]
inline constexpr bool is_decimal(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

} // namespace detail


// Splits the payload into exactly four fields.
//
//   InvalidSchema -> wrong field count
//   InvalidValue  -> user_id / discriminator not decimal, or empty display name
//
// `out` is only written on success.
[[nodiscard]]
inline core::parser::Result parse_identity(std::string_view payload, Identity& out) {
    constexpr std::size_t FIELDS = 4;
    std::array<std::string_view, FIELDS> fields{};
    std::size_t count = 0;
    std::size_t begin = 0;
    while (true) {
        const auto pos = payload.find(':', begin);
        if (count == FIELDS) {
            // A fifth field exists
            RA_WARN("[PARSER] Identity payload has more than " << FIELDS << " fields");
            return core::parser::Result::InvalidSchema;
        }
        fields[count++] = payload.substr(begin, pos == std::string_view::npos ? std::string_view::npos : pos - begin);
        if (pos == std::string_view::npos) {
            break;
        }
        begin = pos + 1;
    }
    if (count != FIELDS) {
        RA_WARN("[PARSER] Identity payload has " << count << " fields (expected " << FIELDS << ")");
        return core::parser::Result::InvalidSchema;
    }
    if (!detail::is_decimal(fields[0])) {
        RA_WARN("[PARSER] Identity user_id is not a snowflake: '" << fields[0] << "'");
        return core::parser::Result::InvalidValue;
    }
    if (!detail::is_decimal(fields[1])) {
        RA_WARN("[PARSER] Identity discriminator is not numeric: '" << fields[1] << "'");
        return core::parser::Result::InvalidValue;
    }
    if (fields[3].empty()) {
        RA_WARN("[PARSER] Identity display name is empty");
        return core::parser::Result::InvalidValue;
    }
    out.user_id.assign(fields[0]);
    out.discriminator.assign(fields[1]);
    out.avatar_hash.assign(fields[2]);
    out.display_name.assign(fields[3]);
    return core::parser::Result::Parsed;
}

} // namespace remauth::core::protocol::remote_auth
