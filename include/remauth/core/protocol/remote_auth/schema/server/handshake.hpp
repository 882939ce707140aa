#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace remauth::core::protocol::remote_auth::schema::server {

// ===============================================
// GREETING (hello)
// {"op":"hello","heartbeat_interval":41250,"timeout_ms":150000}
// ===============================================
struct Hello {
    std::uint64_t heartbeat_interval{0};  // ms
    std::uint64_t timeout_ms{0};          // gateway session lifetime

    bool operator==(const Hello&) const = default;
};

// ===============================================
// NONCE CHALLENGE (nonce_proof)
// {"op":"nonce_proof","encrypted_nonce":"<base64 OAEP ciphertext>"}
// ===============================================
struct NonceChallenge {
    std::string encrypted_nonce;

    bool operator==(const NonceChallenge&) const = default;
};

// ===============================================
// HEARTBEAT ACK (heartbeat_ack)
// ===============================================
struct HeartbeatAck {
    bool operator==(const HeartbeatAck&) const = default;
};


inline std::ostream& operator<<(std::ostream& os, const Hello& h) {
    return os << "{heartbeat_interval=" << h.heartbeat_interval << "ms, timeout=" << h.timeout_ms << "ms}";
}

} // namespace remauth::core::protocol::remote_auth::schema::server
