#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <variant>

#include "remauth/core/api/error.hpp"
#include "remauth/core/api/schema/remote_auth_login.hpp"
#include "remauth/core/api/ticket_exchange_concept.hpp"
#include "remauth/core/crypto/base64.hpp"
#include "remauth/core/crypto/key_material.hpp"
#include "remauth/core/heartbeat/scheduler.hpp"
#include "remauth/core/protocol/concept/json_writable.hpp"
#include "remauth/core/protocol/remote_auth/config.hpp"
#include "remauth/core/protocol/remote_auth/error.hpp"
#include "remauth/core/protocol/remote_auth/identity.hpp"
#include "remauth/core/protocol/remote_auth/outcome.hpp"
#include "remauth/core/protocol/remote_auth/phase.hpp"
#include "remauth/core/protocol/remote_auth/parser/router.hpp"
#include "remauth/core/protocol/remote_auth/schema/client/heartbeat.hpp"
#include "remauth/core/protocol/remote_auth/schema/client/init.hpp"
#include "remauth/core/protocol/remote_auth/schema/client/nonce_proof.hpp"
#include "remauth/core/protocol/remote_auth/schema/server/message.hpp"
#include "remauth/core/token.hpp"
#include "remauth/core/transport/parse_url.hpp"
#include "remauth/core/transport/websocket_concept.hpp"
#include "lcr/slot/last_value.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::protocol::remote_auth {

/*
===============================================================================
 remote_auth::Attempt
===============================================================================

One connection attempt of the remote-auth handshake: a single transport, a
single ephemeral keypair and the per-connection protocol state machine.

An Attempt never reconnects. Every poll() returns an Outcome; anything other
than Pending ends the attempt and the owning Session decides what comes next
(a fresh Attempt, or a terminal status).

-------------------------------------------------------------------------------
 Handshake
-------------------------------------------------------------------------------

  phase      inbound               action                              next
  ---------  --------------------  ----------------------------------  --------
  Loading    hello                 arm heartbeat + deadline, send init  Loading
  Loading    nonce_proof           decrypt, send nonce_proof            Loading
  Loading    pending_remote_init   verify fingerprint, build QR URL     QrCode
  QrCode     pending_ticket        decrypt + parse identity             Accepted
  Accepted   pending_login         exchange ticket once, decrypt token  Completed
  any        heartbeat_ack         clear pending ack                    -
  any        cancel                -                                    Cancelled

Any other opcode/phase combination is a protocol violation.

-------------------------------------------------------------------------------
 Poll order
-------------------------------------------------------------------------------

  1) inbound frames
  2) transport control events (a Close triggers one final frame drain)
  3) heartbeat tick (single outstanding beat)
  4) greeting / session deadlines

Phase changes are published to the shared last_value<Phase> slot as they
happen. The transport is closed when the Attempt is destroyed.
===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    api::TicketExchangeConcept TX,
    typename Clock = std::chrono::steady_clock
>
class Attempt {
public:
    using time_point = typename Clock::time_point;

    Attempt(const Config& cfg, TX& tx, lcr::slot::last_value<Phase>& phase_sink, std::uint64_t id) noexcept
        : cfg_(cfg)
        , tx_(tx)
        , phase_sink_(phase_sink)
        , id_(id)
    {
    }

    ~Attempt() {
        close();
    }

    Attempt(const Attempt&) = delete;
    Attempt& operator=(const Attempt&) = delete;

    // Generates the keypair and establishes the transport.
    // Returns ConnectError or CryptoError on failure; the Attempt is then unusable.
    [[nodiscard]]
    inline Error open(const transport::ParsedUrl& url) noexcept {
        RA_DEBUG("[ATTEMPT #" << id_ << "] Generating ephemeral keypair ...");
        const auto ce = key_.generate();
        if (ce != crypto::Error::None) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Key generation failed (" << crypto::to_string(ce) << ")");
            return Error::CryptoError;
        }
        try {
            ws_ = std::make_unique<WS>(cfg_.websocket);
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to create transport: " << e.what());
            return Error::ConnectError;
        }
        transport_error_ = ws_->connect(url.host, url.port, url.path);
        if (transport_error_ != transport::Error::None) {
            RA_WARN("[ATTEMPT #" << id_ << "] Connect failed (" << transport::to_string(transport_error_) << ")");
            ws_.reset();
            return Error::ConnectError;
        }
        hello_deadline_ = Clock::now() + cfg_.hello_timeout;
        RA_DEBUG("[ATTEMPT #" << id_ << "] Connected, waiting for gateway greeting");
        return Error::None;
    }

    [[nodiscard]]
    inline Outcome poll() noexcept {
        if (!ws_) [[unlikely]] {
            return Outcome::reconnect(Error::ConnectError);
        }
        // 1) Inbound frames
        Outcome out = drain_frames_();
        if (!out.is_pending()) {
            return out;
        }
        // 2) Control events
        transport::websocket::Event ev;
        while (ws_->poll_event(ev)) {
            if (ev.type == transport::websocket::EventType::Error) {
                transport_error_ = ev.error;
                RA_WARN("[ATTEMPT #" << id_ << "] Transport error: " << transport::to_string(ev.error));
                continue;
            }
            // Frames received right before the close are still honoured
            out = drain_frames_();
            if (!out.is_pending()) {
                return out;
            }
            RA_WARN("[ATTEMPT #" << id_ << "] Gateway connection lost in phase " << to_string(phase_)
                    << " (" << transport::to_string(transport_error_) << ")");
            return Outcome::reconnect(Error::ProtocolViolation);
        }
        // 3) Heartbeat
        const auto now = Clock::now();
        switch (heartbeat_.poll(now)) {
            case heartbeat::Tick::SendHeartbeat:
                RA_TRACE("[ATTEMPT #" << id_ << "] Sending heartbeat");
                if (!send_(schema::client::Heartbeat{})) {
                    return Outcome::reconnect(Error::ProtocolViolation);
                }
                break;
            case heartbeat::Tick::LivenessFailure:
                RA_WARN("[ATTEMPT #" << id_ << "] Gateway missed a heartbeat ack");
                return Outcome::reconnect(Error::LivenessFailure);
            default:
                break;
        }
        // 4) Deadlines
        if (!greeted_ && now >= hello_deadline_) {
            RA_WARN("[ATTEMPT #" << id_ << "] No greeting within " << cfg_.hello_timeout.count() << " ms");
            return Outcome::reconnect(Error::LivenessFailure);
        }
        if (greeted_ && now >= session_deadline_) {
            RA_INFO("[ATTEMPT #" << id_ << "] Gateway session expired, a new code will be issued");
            return Outcome::reconnect(Error::SessionTimeout);
        }
        return Outcome::pending();
    }

    // Idempotent
    inline void close() noexcept {
        if (ws_) {
            RA_TRACE("[ATTEMPT #" << id_ << "] Closing transport");
            ws_->close();
            ws_.reset();
        }
        heartbeat_.deactivate();
        key_.reset();
    }

    [[nodiscard]] inline std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] inline bool greeted() const noexcept { return greeted_; }
    [[nodiscard]] inline PhaseKind phase() const noexcept { return phase_; }
    [[nodiscard]] inline transport::Error transport_error() const noexcept { return transport_error_; }
    [[nodiscard]] inline const std::string& fingerprint() const noexcept { return key_.fingerprint(); }

#ifdef REMAUTH_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    const crypto::KeyMaterial& key() const noexcept {
        return key_;
    }

    const heartbeat::Scheduler<Clock>& heartbeat() const noexcept {
        return heartbeat_;
    }
#endif // REMAUTH_UNIT_TEST

private:
    const Config& cfg_;
    TX& tx_;
    lcr::slot::last_value<Phase>& phase_sink_;
    const std::uint64_t id_;

    std::unique_ptr<WS> ws_;
    transport::Error transport_error_{transport::Error::None};

    crypto::KeyMaterial key_;
    heartbeat::Scheduler<Clock> heartbeat_;
    parser::Router router_;

    // Handshake progress
    PhaseKind phase_{PhaseKind::Loading};
    bool greeted_{false};
    bool nonce_proved_{false};
    bool ticket_used_{false};
    time_point hello_deadline_{};
    time_point session_deadline_{};

    // Reusable serialization buffer
    std::string tx_buffer_;
    std::string rx_frame_;

private:
    [[nodiscard]]
    inline Outcome drain_frames_() noexcept {
        while (ws_->poll_message(rx_frame_)) {
            RA_TRACE("[ATTEMPT #" << id_ << "] <- " << rx_frame_);
            schema::server::Message msg;
            const auto r = router_.parse(rx_frame_, msg);
            if (r == core::parser::Result::Ignored) {
                continue;
            }
            if (r != core::parser::Result::Parsed) {
                RA_WARN("[ATTEMPT #" << id_ << "] Rejecting malformed gateway frame (" << core::parser::to_string(r) << ")");
                return Outcome::reconnect(Error::ProtocolViolation);
            }
            Outcome out = std::visit([this](auto& m) { return on_message_(m); }, msg);
            if (!out.is_pending()) {
                return out;
            }
        }
        return Outcome::pending();
    }

    template <JsonWritable Msg>
    [[nodiscard]]
    inline bool send_(const Msg& msg) noexcept {
        try {
            tx_buffer_.resize(msg.max_json_size());
        } catch (const std::bad_alloc&) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Out of memory while serializing outbound message");
            return false;
        }
        const std::size_t len = msg.write_json(tx_buffer_.data());
        const std::string_view json(tx_buffer_.data(), len);
        RA_TRACE("[ATTEMPT #" << id_ << "] -> " << json);
        if (!ws_->send(json)) {
            RA_WARN("[ATTEMPT #" << id_ << "] Failed to send message to gateway");
            return false;
        }
        return true;
    }

    inline void publish_(Phase p) {
        phase_ = kind_of(p);
        RA_DEBUG("[ATTEMPT #" << id_ << "] Phase -> " << to_string(phase_));
        phase_sink_.store(std::move(p));
    }

    [[nodiscard]]
    inline Outcome unexpected_(Op op) const noexcept {
        RA_WARN("[ATTEMPT #" << id_ << "] Unexpected '" << to_string(op) << "' in phase " << to_string(phase_));
        return Outcome::reconnect(Error::ProtocolViolation);
    }

    // Base64 (standard) ciphertext -> OAEP plaintext
    [[nodiscard]]
    inline crypto::Error open_sealed_(std::string_view encoded, crypto::Bytes& plain) const noexcept {
        crypto::Bytes cipher;
        try {
            if (!crypto::base64::decode_standard(encoded, cipher)) {
                return crypto::Error::Encoding;
            }
        } catch (const std::bad_alloc&) {
            return crypto::Error::Encoding;
        }
        return key_.decrypt(cipher, plain);
    }

    // ---------------------------------------------------------------------
    // Opcode handlers
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::Hello& msg) noexcept {
        if (phase_ != PhaseKind::Loading || greeted_) {
            return unexpected_(Op::Hello);
        }
        RA_DEBUG("[ATTEMPT #" << id_ << "] Gateway greeting " << msg);
        greeted_ = true;
        const auto now = Clock::now();
        heartbeat_.activate(now, std::chrono::milliseconds(msg.heartbeat_interval));
        session_deadline_ = now + std::chrono::milliseconds(msg.timeout_ms);
        try {
            if (!send_(schema::client::Init{key_.encoded_public_key()})) {
                return Outcome::reconnect(Error::ProtocolViolation);
            }
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to encode public key: " << e.what());
            return Outcome::reconnect(Error::CryptoError);
        }
        return Outcome::pending();
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::NonceChallenge& msg) noexcept {
        if (phase_ != PhaseKind::Loading || !greeted_ || nonce_proved_) {
            return unexpected_(Op::NonceProof);
        }
        crypto::Bytes nonce;
        const auto ce = open_sealed_(msg.encrypted_nonce, nonce);
        if (ce != crypto::Error::None) {
            RA_WARN("[ATTEMPT #" << id_ << "] Unable to decrypt nonce (" << crypto::to_string(ce) << ")");
            return Outcome::reconnect(Error::CryptoError);
        }
        nonce_proved_ = true;
        try {
            if (!send_(schema::client::NonceProof{crypto::base64::encode_url_no_pad(nonce)})) {
                return Outcome::reconnect(Error::ProtocolViolation);
            }
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to encode nonce proof: " << e.what());
            return Outcome::reconnect(Error::CryptoError);
        }
        return Outcome::pending();
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::HeartbeatAck&) noexcept {
        RA_TRACE("[ATTEMPT #" << id_ << "] Heartbeat acknowledged");
        heartbeat_.acknowledge();
        return Outcome::pending();
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::PendingRemoteInit& msg) noexcept {
        if (phase_ != PhaseKind::Loading || !nonce_proved_) {
            return unexpected_(Op::PendingRemoteInit);
        }
        if (msg.fingerprint != key_.fingerprint()) {
            RA_WARN("[ATTEMPT #" << id_ << "] Fingerprint mismatch! gateway: " << msg.fingerprint
                    << " expected: " << key_.fingerprint());
            return Outcome::reconnect(Error::FingerprintMismatch);
        }
        try {
            publish_(phase::QrCode{cfg_.qr_url_prefix + msg.fingerprint});
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to publish QR code: " << e.what());
            return Outcome::reconnect(Error::ProtocolViolation);
        }
        RA_INFO("[ATTEMPT #" << id_ << "] QR code ready: " << cfg_.qr_url_prefix << msg.fingerprint);
        return Outcome::pending();
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::PendingTicket& msg) noexcept {
        if (phase_ != PhaseKind::QrCode) {
            return unexpected_(Op::PendingTicket);
        }
        crypto::Bytes payload;
        const auto ce = open_sealed_(msg.encrypted_user_payload, payload);
        if (ce != crypto::Error::None) {
            RA_WARN("[ATTEMPT #" << id_ << "] Unable to decrypt user payload (" << crypto::to_string(ce) << ")");
            return Outcome::reconnect(Error::CryptoError);
        }
        try {
            Identity identity;
            const std::string text = crypto::to_text(payload);
            if (parse_identity(text, identity) != core::parser::Result::Parsed) {
                return Outcome::reconnect(Error::ProtocolViolation);
            }
            RA_INFO("[ATTEMPT #" << id_ << "] Code scanned by " << identity);
            publish_(phase::Accepted{std::move(identity)});
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to process user payload: " << e.what());
            return Outcome::reconnect(Error::ProtocolViolation);
        }
        return Outcome::pending();
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::PendingLogin& msg) noexcept {
        if (phase_ != PhaseKind::Accepted || ticket_used_) {
            return unexpected_(Op::PendingLogin);
        }
        // A ticket is exchanged once; whatever happens next is terminal
        ticket_used_ = true;
        heartbeat_.deactivate();
        RA_INFO("[ATTEMPT #" << id_ << "] Login approved, exchanging ticket");
        api::schema::LoginResponse response;
        const auto ae = tx_.exchange(msg.ticket, response);
        if (ae != api::Error::None) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Ticket exchange failed (" << api::to_string(ae) << ")");
            return Outcome::fatal(Error::TicketExchange);
        }
        crypto::Bytes plain;
        const auto ce = open_sealed_(response.encrypted_token, plain);
        if (ce != crypto::Error::None) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Unable to decrypt token (" << crypto::to_string(ce) << ")");
            return Outcome::fatal(Error::CryptoError);
        }
        try {
            Token token(crypto::to_text(plain));
            if (!token.is_valid()) {
                RA_WARN("[ATTEMPT #" << id_ << "] Token has an unexpected length (" << token.value().size() << ")");
            }
            publish_(phase::Completed{});
            RA_INFO("[ATTEMPT #" << id_ << "] Logged in, token " << token);
            return Outcome::completed(token.value());
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to hand over token: " << e.what());
            return Outcome::fatal(Error::CryptoError);
        }
    }

    [[nodiscard]]
    inline Outcome on_message_(const schema::server::Cancel&) noexcept {
        RA_INFO("[ATTEMPT #" << id_ << "] Login cancelled from the companion device");
        heartbeat_.deactivate();
        try {
            publish_(phase::Cancelled{});
        } catch (const std::exception& e) {
            RA_ERROR("[ATTEMPT #" << id_ << "] Failed to publish cancellation: " << e.what());
        }
        return Outcome::cancelled();
    }
};

} // namespace remauth::core::protocol::remote_auth
