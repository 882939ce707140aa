#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "lcr/json.hpp"


namespace remauth::core::api::schema {

// ===============================================
// REMOTE AUTH TICKET EXCHANGE REQUEST
// POST /users/@me/remote-auth/login
// {"ticket":"..."}
// ===============================================
struct LoginRequest {
    std::string ticket;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(ticket.size() + 16);
        out += '{';
        lcr::json::append_string_field(out, "ticket", ticket);
        out += '}';
        return out;
    }
};

// ===============================================
// REMOTE AUTH TICKET EXCHANGE RESPONSE
// {"encrypted_token":"<base64 OAEP ciphertext>"}
// ===============================================
struct LoginResponse {
    std::string encrypted_token;

    bool operator==(const LoginResponse&) const = default;
};

// ===============================================
// APPLICATION ERROR OBJECT
// {"code":50035,"message":"Invalid Form Body",
//  "errors":{"ticket":{"_errors":[{"code":"BASE_TYPE_REQUIRED","message":"..."}]}}}
//
// Nested form errors are flattened: `path` is the dotted key chain leading to
// each "_errors" array ("ticket", "login.password", ...).
// ===============================================
struct FieldError {
    std::string path;
    std::string code;
    std::string message;

    bool operator==(const FieldError&) const = default;
};

struct ApiError {
    std::int64_t code{0};
    std::string message;
    std::vector<FieldError> errors;

    inline void reset() {
        code = 0;
        message.clear();
        errors.clear();
    }

    bool operator==(const ApiError&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ApiError& e) {
    os << "[" << e.code << "] " << e.message;
    for (const auto& fe : e.errors) {
        os << " {" << fe.path << ": " << fe.code << " " << fe.message << "}";
    }
    return os;
}

} // namespace remauth::core::api::schema
