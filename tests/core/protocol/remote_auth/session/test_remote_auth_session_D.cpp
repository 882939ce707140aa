/*
===============================================================================
 remote_auth::Session - Group D Unit Tests
===============================================================================

Scope:
------
Terminal outcomes: completion through the ticket exchange, cancellation from
either side and fatal exchange failures.

Covered Requirements:
---------------------
D1. End-to-end login
    - The ticket is exchanged exactly once
    - The decrypted token is the session result
    - Completed is published, the transport is closed

D2. Ticket exchange failure is fatal
    - Status Failed / TicketExchange, no retry, no second exchange

D3. Undecryptable token is fatal

D4. Companion cancel
    - Status Cancelled, error None, Cancelled published

D5. Caller cancel
    - Transport closed, no further attempts, phase left untouched
===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/session.hpp"

using SessionHarness = remauth::core::protocol::remote_auth::test::harness::Session<>;


// -----------------------------------------------------------------------------
// Group D1: end-to-end login
// -----------------------------------------------------------------------------
void test_end_to_end_login() {
    std::cout << "[TEST] Group D1: end-to-end login\n";

    SessionHarness h;
    h.to_accepted();

    TEST_CHECK(TEST_TOKEN.size() == 70);
    TEST_CHECK(h.login() == Status::Completed);

    TEST_CHECK(h.exchange.calls == 1);
    TEST_CHECK(h.exchange.last_ticket == TEST_TICKET);
    TEST_CHECK(h.session.token() == TEST_TOKEN);
    TEST_CHECK(h.session.error() == Error::None);
    TEST_CHECK(h.session.result().kind == Outcome::Kind::Completed);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Completed);
    TEST_CHECK(h.session.attempt() == nullptr);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);

    // Terminal: polling is a no-op
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(h.session.poll() == Status::Completed);
    }
    TEST_CHECK(WebSocketUnderTest::constructed_count() == 1);
    TEST_CHECK(h.exchange.calls == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D2: ticket exchange failure
// -----------------------------------------------------------------------------
void test_exchange_failure_is_fatal() {
    std::cout << "[TEST] Group D2: ticket exchange failure\n";

    SessionHarness h;
    h.to_accepted();

    h.exchange.error = api::Error::Rejected;
    TEST_CHECK(h.login() == Status::Failed);
    TEST_CHECK(h.session.error() == Error::TicketExchange);
    TEST_CHECK(h.session.token().empty());
    TEST_CHECK(h.exchange.calls == 1);

    // Phase stays at the account preview
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Accepted);

    TEST_CHECK(h.session.poll() == Status::Failed);
    TEST_CHECK(h.session.reconnects() == 0);
    TEST_CHECK(WebSocketUnderTest::constructed_count() == 1);
    TEST_CHECK(h.exchange.calls == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D3: undecryptable token
// -----------------------------------------------------------------------------
void test_undecryptable_token() {
    std::cout << "[TEST] Group D3: undecryptable token\n";

    SessionHarness h;
    h.to_accepted();

    // Sealed for a different key
    SessionHarness other;
    other.to_qr();
    h.exchange.encrypted_token = other.companion.seal(TEST_TOKEN);

    TEST_CHECK(h.deliver(Companion::pending_login(TEST_TICKET)) == Status::Failed);
    TEST_CHECK(h.session.error() == Error::CryptoError);
    TEST_CHECK(h.exchange.calls == 1);
    TEST_CHECK(h.session.token().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D4: companion cancel
// -----------------------------------------------------------------------------
void test_remote_cancel() {
    std::cout << "[TEST] Group D4: companion cancel\n";

    SessionHarness h;
    h.to_accepted();

    TEST_CHECK(h.deliver(Companion::cancel()) == Status::Cancelled);
    TEST_CHECK(h.session.error() == Error::None);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Cancelled);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(h.session.poll() == Status::Cancelled);
    TEST_CHECK(h.exchange.calls == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D5: caller cancel
// -----------------------------------------------------------------------------
void test_caller_cancel() {
    std::cout << "[TEST] Group D5: caller cancel\n";

    SessionHarness h;
    h.to_qr();

    h.session.cancel();
    TEST_CHECK(h.session.status() == Status::Cancelled);
    TEST_CHECK(h.session.error() == Error::Cancelled);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::QrCode);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(h.session.attempt() == nullptr);

    // Idempotent, and nothing reconnects
    h.session.cancel();
    TEST_CHECK(h.session.poll() == Status::Cancelled);
    TEST_CHECK(WebSocketUnderTest::constructed_count() == 1);

    // Cancel before start() is a no-op
    SessionHarness idle;
    idle.session.cancel();
    TEST_CHECK(idle.session.status() == Status::Idle);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_end_to_end_login();
    test_exchange_failure_is_fatal();
    test_undecryptable_token();
    test_remote_cancel();
    test_caller_cancel();

    std::cout << "\n[GROUP D - SESSION OUTCOME TESTS PASSED]\n";
    return 0;
}
