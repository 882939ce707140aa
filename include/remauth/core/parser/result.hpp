#pragma once

#include <cstdint>
#include <string_view>


namespace remauth::core::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ignored        = 0,            // Not applicable / unknown op
    InvalidJson    = 1,            // Structural failure (not JSON at all)
    InvalidSchema  = 2,            // Missing required field, type mismatch, etc.
    InvalidValue   = 3,            // Field present but semantically invalid
    Parsed         = 4,            // Parsed successfully
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace remauth::core::parser
