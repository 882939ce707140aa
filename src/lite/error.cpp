#include "remauth/lite/error.hpp"


namespace remauth::lite {

const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::transport: return "transport";
        case error_code::protocol:  return "protocol";
        case error_code::rejected:  return "rejected";
        case error_code::cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace remauth::lite
