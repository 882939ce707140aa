#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "remauth/core/protocol/remote_auth/identity.hpp"


namespace remauth::core::protocol::remote_auth {

// ===============================================================
// Externally visible handshake phases
// ===============================================================
namespace phase {

// Connecting / handshaking; no fingerprint yet
struct Loading {
    bool operator==(const Loading&) const = default;
};

// Fingerprint verified; display_payload is the URL to render as a QR code
struct QrCode {
    std::string display_payload;

    bool operator==(const QrCode&) const = default;
};

// Companion scanned the code
struct Accepted {
    Identity identity;

    bool operator==(const Accepted&) const = default;
};

// Companion aborted
struct Cancelled {
    bool operator==(const Cancelled&) const = default;
};

// Token obtained and handed to the caller
struct Completed {
    bool operator==(const Completed&) const = default;
};

} // namespace phase

using Phase = std::variant<
    phase::Loading,
    phase::QrCode,
    phase::Accepted,
    phase::Cancelled,
    phase::Completed
>;

enum class PhaseKind : std::uint8_t {
    Loading,
    QrCode,
    Accepted,
    Cancelled,
    Completed
};

[[nodiscard]]
inline PhaseKind kind_of(const Phase& p) noexcept {
    return static_cast<PhaseKind>(p.index());
}

[[nodiscard]]
inline constexpr std::string_view to_string(PhaseKind k) noexcept {
    switch (k) {
        case PhaseKind::Loading:   return "Loading";
        case PhaseKind::QrCode:    return "QrCode";
        case PhaseKind::Accepted:  return "Accepted";
        case PhaseKind::Cancelled: return "Cancelled";
        case PhaseKind::Completed: return "Completed";
    }
    return "Unknown";
}

[[nodiscard]]
inline std::string_view to_string(const Phase& p) noexcept {
    return to_string(kind_of(p));
}

} // namespace remauth::core::protocol::remote_auth
