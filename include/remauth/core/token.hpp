#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>


namespace remauth::core {

// Opaque user session token returned by the ticket exchange.
class Token {
public:
    // A well-formed user token is 70 characters long
    static constexpr std::size_t EXPECTED_LENGTH = 70;

    Token() = default;
    explicit Token(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] inline const std::string& value() const noexcept { return value_; }
    [[nodiscard]] inline bool empty() const noexcept { return value_.empty(); }

    // Shape check only; the server remains the authority
    [[nodiscard]]
    inline bool is_valid() const noexcept {
        return value_.size() == EXPECTED_LENGTH;
    }

    // First segment (base64 user id) followed by a mask, safe for logs
    [[nodiscard]]
    inline std::string redacted() const {
        const auto dot = value_.find('.');
        if (dot == std::string::npos || dot == 0) {
            return value_.empty() ? std::string{} : std::string("***");
        }
        return value_.substr(0, dot) + ".***";
    }

    bool operator==(const Token&) const = default;

private:
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const Token& t) {
    return os << t.redacted();
}

} // namespace remauth::core
