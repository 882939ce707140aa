/*
===============================================================================
 remote_auth::Session - Group C Unit Tests
===============================================================================

Scope:
------
Liveness and deadlines, driven by ManualClock.

Covered Requirements:
---------------------
C1. A missed heartbeat ack is reported exactly once and triggers one reconnect
C2. No greeting within hello_timeout -> reconnect
C3. Gateway session lifetime (timeout_ms) elapsed -> reconnect and a new QR code
C4. Transport errors without a close do not end the attempt

Non-Goals:
----------
- Protocol faults (Group B)
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <variant>

#include "common/harness/session.hpp"

using SessionHarness = remauth::core::protocol::remote_auth::test::harness::Session<>;
using std::chrono::milliseconds;


// -----------------------------------------------------------------------------
// Group C1: missed heartbeat ack
// -----------------------------------------------------------------------------
void test_liveness_failure_once() {
    std::cout << "[TEST] Group C1: liveness failure reported once\n";

    SessionHarness h;
    h.start();
    h.greet(1'000);
    h.prove_nonce();
    h.show_qr();

    // First beat goes out
    ClockUnderTest::advance(milliseconds(1'000));
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.ws().count_sent_containing("\"op\":\"heartbeat\"") == 1);

    // No ack before the next beat is due
    ClockUnderTest::advance(milliseconds(1'000));
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.attempt() == nullptr);
    TEST_CHECK(h.session.reconnects() == 1);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    // init + nonce_proof + exactly one heartbeat
    TEST_CHECK(WebSocketUnderTest::send_count() == 3);

    // The replacement attempt starts from Loading and reports nothing more
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Loading);
    for (int i = 0; i < 10; ++i) {
        TEST_CHECK(h.session.poll() == Status::Running);
    }
    TEST_CHECK(h.session.reconnects() == 1);
    TEST_CHECK(h.session.attempts() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C2: greeting deadline
// -----------------------------------------------------------------------------
void test_hello_timeout() {
    std::cout << "[TEST] Group C2: greeting deadline\n";

    Config cfg = SessionHarness::default_config();
    cfg.hello_timeout = milliseconds(5'000);
    SessionHarness h{cfg};
    h.start();

    ClockUnderTest::advance(milliseconds(4'999));
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.reconnects() == 0);

    ClockUnderTest::advance(milliseconds(1));
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.reconnects() == 1);
    TEST_CHECK(h.session.attempt() == nullptr);

    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.attempts() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C3: gateway session lifetime
// -----------------------------------------------------------------------------
void test_session_timeout() {
    std::cout << "[TEST] Group C3: gateway session lifetime\n";

    SessionHarness h;
    h.start();
    h.greet(60'000, 5'000);
    h.prove_nonce();
    h.show_qr();
    const std::string first_qr = std::get<phase::QrCode>(h.session.phase()).display_payload;

    ClockUnderTest::advance(milliseconds(5'000));
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.reconnects() == 1);

    // A new code is issued on the next connection
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Loading);
    h.greet();
    h.prove_nonce();
    h.show_qr();
    TEST_CHECK(std::get<phase::QrCode>(h.session.phase()).display_payload != first_qr);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C4: transport error without close
// -----------------------------------------------------------------------------
void test_transport_error_without_close() {
    std::cout << "[TEST] Group C4: transport error without close\n";

    SessionHarness h;
    h.to_qr();

    h.ws().emit_error(transport::Error::TransportFailure);
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.attempt() != nullptr);
    TEST_CHECK(h.session.attempt()->transport_error() == transport::Error::TransportFailure);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::QrCode);
    TEST_CHECK(h.session.reconnects() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_liveness_failure_once();
    test_hello_timeout();
    test_session_timeout();
    test_transport_error_without_close();

    std::cout << "\n[GROUP C - SESSION LIVENESS TESTS PASSED]\n";
    return 0;
}
