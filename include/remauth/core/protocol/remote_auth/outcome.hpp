#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "remauth/core/protocol/remote_auth/error.hpp"


namespace remauth::core::protocol::remote_auth {

// Result of one Attempt::poll() step.
struct Outcome {
    enum class Kind : std::uint8_t {
        Pending,    // keep polling the same attempt
        Reconnect,  // tear down and start a new attempt (error says why)
        Completed,  // token obtained
        Cancelled,  // companion aborted
        Fatal       // terminal failure, no retry
    };

    Kind kind{Kind::Pending};
    Error error{Error::None};
    std::string token;

    [[nodiscard]] static inline Outcome pending() noexcept { return Outcome{}; }
    [[nodiscard]] static inline Outcome reconnect(Error e) noexcept { return Outcome{Kind::Reconnect, e, {}}; }
    [[nodiscard]] static inline Outcome cancelled() noexcept { return Outcome{Kind::Cancelled, Error::None, {}}; }
    [[nodiscard]] static inline Outcome fatal(Error e) noexcept { return Outcome{Kind::Fatal, e, {}}; }

    [[nodiscard]]
    static inline Outcome completed(std::string tok) noexcept {
        return Outcome{Kind::Completed, Error::None, std::move(tok)};
    }

    [[nodiscard]] inline bool is_pending() const noexcept { return kind == Kind::Pending; }
};

inline constexpr std::string_view to_string(Outcome::Kind k) noexcept {
    switch (k) {
        case Outcome::Kind::Pending:   return "Pending";
        case Outcome::Kind::Reconnect: return "Reconnect";
        case Outcome::Kind::Completed: return "Completed";
        case Outcome::Kind::Cancelled: return "Cancelled";
        case Outcome::Kind::Fatal:     return "Fatal";
    }
    return "Unknown";
}

} // namespace remauth::core::protocol::remote_auth
