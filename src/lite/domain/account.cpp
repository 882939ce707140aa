#include "remauth/lite/domain/account.hpp"

#include <ostream>


namespace remauth::lite::domain {

bool Account::has_avatar() const noexcept {
    return !avatar_hash.empty() && avatar_hash != "0";
}

std::ostream& operator<<(std::ostream& os, const Account& a) {
    os << a.username << "#" << a.discriminator << " (id=" << a.user_id;
    if (a.has_avatar()) {
        os << ", avatar=" << a.avatar_hash;
    }
    return os << ")";
}

} // namespace remauth::lite::domain
