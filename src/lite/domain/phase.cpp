#include "remauth/lite/domain/phase.hpp"

#include <ostream>


namespace remauth::lite::domain {

const char* to_string(PhaseKind kind) noexcept {
    switch (kind) {
        case PhaseKind::Loading:   return "loading";
        case PhaseKind::QrCode:    return "qr_code";
        case PhaseKind::Accepted:  return "accepted";
        case PhaseKind::Cancelled: return "cancelled";
        case PhaseKind::Completed: return "completed";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Phase& p) {
    os << "[" << to_string(p.kind) << "]";
    switch (p.kind) {
        case PhaseKind::QrCode:
            os << " " << p.qr_url;
            break;
        case PhaseKind::Accepted:
            os << " " << p.account;
            break;
        default:
            break;
    }
    return os;
}

} // namespace remauth::lite::domain
