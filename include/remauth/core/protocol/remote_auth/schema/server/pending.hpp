#pragma once

#include <string>

namespace remauth::core::protocol::remote_auth::schema::server {

// ===============================================
// PENDING REMOTE INIT (pending_remote_init)
// Nonce proof accepted; fingerprint to embed in the QR code.
// {"op":"pending_remote_init","fingerprint":"<base64url no pad SHA-256>"}
// ===============================================
struct PendingRemoteInit {
    std::string fingerprint;

    bool operator==(const PendingRemoteInit&) const = default;
};

// ===============================================
// PENDING TICKET (pending_ticket)
// Companion scanned the code; identity encrypted to our public key.
// {"op":"pending_ticket","encrypted_user_payload":"<base64 OAEP ciphertext>"}
// ===============================================
struct PendingTicket {
    std::string encrypted_user_payload;

    bool operator==(const PendingTicket&) const = default;
};

// ===============================================
// PENDING LOGIN (pending_login)
// Companion approved; single-use ticket for the REST exchange.
// {"op":"pending_login","ticket":"..."}
// ===============================================
struct PendingLogin {
    std::string ticket;

    bool operator==(const PendingLogin&) const = default;
};

// ===============================================
// CANCEL (cancel)
// Companion aborted the login.
// ===============================================
struct Cancel {
    bool operator==(const Cancel&) const = default;
};

} // namespace remauth::core::protocol::remote_auth::schema::server
