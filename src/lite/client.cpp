#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "remauth/lite/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "remauth/core/transport/beast/websocket.hpp"
#include "remauth/core/api/https/ticket_exchange.hpp"
#include "remauth/core/protocol/remote_auth/session.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::lite {

namespace remote_auth = remauth::core::protocol::remote_auth;
namespace api = remauth::core::api;

using WS = remauth::core::transport::beast::WebSocket;
using TX = api::https::TicketExchange;

namespace {

api::Config make_api_config(const client_config& cfg) {
    api::Config out;
    out.base_url = cfg.api_base;
    out.origin = cfg.origin;
    out.request_timeout = cfg.request_timeout;
    return out;
}

remote_auth::Config make_session_config(const client_config& cfg) {
    remote_auth::Config out;
    out.qr_url_prefix = cfg.qr_url_prefix;
    out.websocket.origin = cfg.origin;
    out.websocket.connect_timeout = cfg.connect_timeout;
    out.max_connect_attempts = cfg.max_connect_attempts;
    return out;
}

// ---------------------------------------------------------------------
// Mapping: core Phase → Lite domain::Phase
// ---------------------------------------------------------------------
domain::Phase to_domain(const remote_auth::Phase& p) {
    domain::Phase out;
    switch (remote_auth::kind_of(p)) {
        case remote_auth::PhaseKind::Loading:
            out.kind = domain::PhaseKind::Loading;
            break;
        case remote_auth::PhaseKind::QrCode:
            out.kind = domain::PhaseKind::QrCode;
            out.qr_url = std::get<remote_auth::phase::QrCode>(p).display_payload;
            break;
        case remote_auth::PhaseKind::Accepted: {
            const auto& id = std::get<remote_auth::phase::Accepted>(p).identity;
            out.kind = domain::PhaseKind::Accepted;
            out.account = domain::Account{id.user_id, id.discriminator, id.avatar_hash, id.display_name};
            break;
        }
        case remote_auth::PhaseKind::Cancelled:
            out.kind = domain::PhaseKind::Cancelled;
            break;
        case remote_auth::PhaseKind::Completed:
            out.kind = domain::PhaseKind::Completed;
            break;
    }
    return out;
}

} // namespace

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    client_config cfg;

    // Core collaborators (owning). The exchange must outlive the session.
    TX exchange;
    remote_auth::Session<WS, TX> session;

    // Lite state
    phase_handler phase_cb;
    complete_handler complete_cb;
    error_handler error_cb;

    remote_auth::Phase last_phase{remote_auth::phase::Loading{}};
    std::uint64_t phase_epoch{0};
    bool reported{false};

    explicit Impl(client_config c)
        : cfg(std::move(c))
        , exchange(make_api_config(cfg))
        , session(exchange, make_session_config(cfg))
    {
    }

    bool start() {
        const auto err = session.start(cfg.gateway_url);
        if (err == remauth::core::transport::Error::InvalidUrl || err == remauth::core::transport::Error::InvalidState) {
            report_error(error_code::transport, "Cannot start login: " + std::string(remauth::core::transport::to_string(err)));
            return false;
        }
        dispatch();
        return session.status() == remote_auth::Status::Running;
    }

    void poll() {
        (void)session.poll();
        dispatch();
    }

    void cancel() {
        session.cancel();
        dispatch();
    }

    void dispatch() {
        // Phase changes (latest value only)
        if (session.phase_sink().load_if_updated(last_phase, phase_epoch) && phase_cb) {
            phase_cb(to_domain(last_phase));
        }
        if (reported) {
            return;
        }
        switch (session.status()) {
            case remote_auth::Status::Completed:
                reported = true;
                if (complete_cb) {
                    complete_cb(session.token());
                }
                break;
            case remote_auth::Status::Cancelled:
                reported = true;
                // Companion cancellations are reported through on_phase
                if (session.error() == remote_auth::Error::Cancelled) {
                    report_error(error_code::cancelled, "Login cancelled");
                }
                break;
            case remote_auth::Status::Failed:
                reported = true;
                report_failure();
                break;
            default:
                break;
        }
    }

    void report_failure() {
        const auto err = session.error();
        switch (err) {
            case remote_auth::Error::TicketExchange: {
                std::string msg = "Ticket exchange failed";
                if (exchange.last_status() != 0) {
                    msg += " (HTTP " + std::to_string(exchange.last_status()) + ")";
                }
                if (!exchange.last_api_error().message.empty()) {
                    msg += ": " + exchange.last_api_error().message;
                }
                report_error(error_code::rejected, msg);
                break;
            }
            case remote_auth::Error::CryptoError:
                report_error(error_code::protocol, "Unable to decrypt the session token");
                break;
            default:
                report_error(error_code::transport, "Login failed: " + std::string(remote_auth::to_string(err)));
                break;
        }
    }

    void report_error(error_code code, std::string message) {
        RA_DEBUG("[LITE] error (" << to_string(code) << "): " << message);
        if (error_cb) {
            error_cb(error{code, std::move(message)});
        }
    }

    bool is_finished() const {
        return remote_auth::is_terminal(session.status());
    }
};

// -----------------------------
// Client methods
// -----------------------------

Client::Client(client_config cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg))) {}

Client::~Client() = default;

bool Client::start() {
    return impl_->start();
}

void Client::poll() {
    impl_->poll();
}

void Client::cancel() {
    impl_->cancel();
}

bool Client::is_finished() const {
    return impl_->is_finished();
}

void Client::on_phase(phase_handler cb) {
    impl_->phase_cb = std::move(cb);
}

void Client::on_complete(complete_handler cb) {
    impl_->complete_cb = std::move(cb);
}

void Client::on_error(error_handler cb) {
    impl_->error_cb = std::move(cb);
}

} // namespace remauth::lite
