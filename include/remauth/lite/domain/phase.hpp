// NOTE: This header defines a public domain type.
// Users should include <remauth/lite.hpp> instead of this file directly.

#pragma once

#include <iosfwd>
#include <string>

#include "remauth/lite/domain/account.hpp"


namespace remauth::lite::domain {

enum class PhaseKind {
    Loading,     // connecting to the gateway, no code yet
    QrCode,      // code ready to be scanned
    Accepted,    // code scanned, waiting for confirmation on the device
    Cancelled,   // login aborted on the device
    Completed    // logged in
};

// -----------------------------
// Phase change (API surface)
// -----------------------------
struct Phase {
    PhaseKind kind{PhaseKind::Loading};
    std::string qr_url;   // set when kind == QrCode
    Account account;      // set when kind == Accepted
};


const char* to_string(PhaseKind kind) noexcept;

std::ostream& operator<<(std::ostream&, const Phase&);

} // namespace remauth::lite::domain
