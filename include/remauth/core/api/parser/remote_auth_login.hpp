#pragma once

#include <new>
#include <string>
#include <string_view>

#include "remauth/core/api/error.hpp"
#include "remauth/core/api/schema/remote_auth_login.hpp"
#include "remauth/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace remauth::core::api::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

// Nesting bound for the form error tree
inline constexpr int MAX_FORM_ERROR_DEPTH = 16;

struct login_response {

    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& json, std::string_view body, schema::LoginResponse& out) noexcept {
        simdjson::dom::element root;
        if (json.parse(body.data(), body.size()).get(root)) {
            RA_WARN("[PARSER] Ticket exchange response is not JSON.");
            return Result::InvalidJson;
        }
        auto r = helper::parse_string_required(root, "encrypted_token", out.encrypted_token);
        if (r != Result::Parsed) {
            RA_WARN("[PARSER] Field 'encrypted_token' missing or invalid in ticket exchange response.");
            return r;
        }
        if (out.encrypted_token.empty()) {
            RA_WARN("[PARSER] Field 'encrypted_token' is empty in ticket exchange response.");
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }
};

struct api_error {

    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& json, std::string_view body, schema::ApiError& out) noexcept {
        out.reset();
        simdjson::dom::element root;
        if (json.parse(body.data(), body.size()).get(root)) {
            return Result::InvalidJson;
        }
        // code (required)
        auto r = helper::parse_int64_required(root, "code", out.code);
        if (r != Result::Parsed) {
            return r;
        }
        // message (required)
        r = helper::parse_string_required(root, "message", out.message);
        if (r != Result::Parsed) {
            return r;
        }
        // errors (optional)
        simdjson::dom::object errors;
        bool present = false;
        r = helper::parse_object_optional(root, "errors", errors, present);
        if (r != Result::Parsed) {
            RA_WARN("[PARSER] Field 'errors' has an invalid type in API error object.");
            return r;
        }
        if (present) {
            try {
                std::string path;
                r = walk_(errors, path, 0, out);
            } catch (const std::bad_alloc&) {
                RA_WARN("[PARSER] Out of memory while flattening the form error tree.");
                out.errors.clear();
                return Result::InvalidValue;
            }
            if (r != Result::Parsed) {
                RA_WARN("[PARSER] Malformed form error tree in API error object.");
                return r;
            }
        }
        return Result::Parsed;
    }

private:
    // Throws std::bad_alloc; parse() maps it to InvalidValue
    [[nodiscard]]
    static inline Result walk_(const simdjson::dom::object& node, std::string& path, int depth, schema::ApiError& out) {
        if (depth > MAX_FORM_ERROR_DEPTH) {
            return Result::InvalidSchema;
        }
        for (auto field : node) {
            if (field.key == "_errors") {
                simdjson::dom::array leaf;
                if (field.value.get(leaf)) {
                    return Result::InvalidSchema;
                }
                for (auto item : leaf) {
                    schema::FieldError fe;
                    fe.path = path;
                    if (helper::parse_string_required(item, "code", fe.code) != Result::Parsed ||
                        helper::parse_string_required(item, "message", fe.message) != Result::Parsed) {
                        return Result::InvalidSchema;
                    }
                    out.errors.push_back(std::move(fe));
                }
                continue;
            }
            simdjson::dom::object child;
            if (field.value.get(child)) {
                return Result::InvalidSchema;
            }
            const auto mark = path.size();
            if (!path.empty()) {
                path += '.';
            }
            path.append(field.key.data(), field.key.size());
            const auto r = walk_(child, path, depth + 1, out);
            path.resize(mark);
            if (r != Result::Parsed) {
                return r;
            }
        }
        return Result::Parsed;
    }
};

// Maps an HTTP status and body to the ticket exchange result.
//   2xx + encrypted_token  -> None (out filled)
//   any + error object     -> Rejected (api_error filled)
//   2xx otherwise          -> InvalidResponse
//   non-2xx otherwise      -> HttpStatus
[[nodiscard]]
inline Error classify_login_response(simdjson::dom::parser& json, unsigned status, std::string_view body,
                                     schema::LoginResponse& out, schema::ApiError& api_error) noexcept {
    api_error.reset();
    const bool success = (status >= 200 && status < 300);
    if (success && login_response::parse(json, body, out) == Result::Parsed) {
        return Error::None;
    }
    if (api_error::parse(json, body, api_error) == Result::Parsed) {
        return Error::Rejected;
    }
    api_error.reset();
    return success ? Error::InvalidResponse : Error::HttpStatus;
}

} // namespace remauth::core::api::parser
