// NOTE: This header defines a public domain type.
// Users should include <remauth/lite.hpp> instead of this file directly.

#pragma once

#include <iosfwd>
#include <string>


namespace remauth::lite::domain {

// -----------------------------
// Account preview (API surface)
// Shown while the companion device is confirming the login.
// -----------------------------
struct Account {
    std::string user_id;
    std::string discriminator;
    std::string avatar_hash;   // "0" when the account has no avatar
    std::string username;

    [[nodiscard]] bool has_avatar() const noexcept;
};


std::ostream& operator<<(std::ostream&, const Account&);

} // namespace remauth::lite::domain
