#pragma once

#include <cstdint>
#include <string_view>

namespace remauth::core::protocol::remote_auth {

// Lifecycle of a Session
enum class Status : std::uint8_t {
    Idle,       // start() not called yet
    Running,    // handshake in progress (possibly between attempts)
    Completed,  // token obtained
    Cancelled,  // cancelled by the companion device or by the caller
    Failed      // terminal error
};

inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Idle:      return "Idle";
        case Status::Running:   return "Running";
        case Status::Completed: return "Completed";
        case Status::Cancelled: return "Cancelled";
        case Status::Failed:    return "Failed";
    }
    return "Unknown";
}

[[nodiscard]]
inline constexpr bool is_terminal(Status s) noexcept {
    return s == Status::Completed || s == Status::Cancelled || s == Status::Failed;
}

} // namespace remauth::core::protocol::remote_auth
