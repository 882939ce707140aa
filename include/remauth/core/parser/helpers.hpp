#pragma once

#include <cstdint>
#include <new>
#include <string>
#include <string_view>

#include "remauth/core/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the gateway opcode parsers and the REST response
parsers to extract primitive values from simdjson DOM elements.

  • Enforce structural rules (object presence, type correctness)
  • Parse primitive field types (integer, string, nested object)
  • Strict optional-field semantics: absent is fine, wrong type is not

IMPORTANT:
  - Helpers MUST NOT interpret values semantically (empty strings pass)
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions (allocation failure is InvalidValue)
================================================================================
*/


namespace remauth::core::parser::helper {

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED FIELDS
// ------------------------------------------------------------

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// Same as above, copies into an owning string
[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    const auto r = parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    try {
        out.assign(sv.data(), sv.size());
    } catch (const std::bad_alloc&) {
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// OPTIONAL FIELDS
// ------------------------------------------------------------

[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& obj, const char* key, simdjson::dom::object& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

} // namespace remauth::core::parser::helper
