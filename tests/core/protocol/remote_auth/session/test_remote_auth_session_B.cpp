/*
===============================================================================
 remote_auth::Session - Group B Unit Tests
===============================================================================

Scope:
------
Recoverable protocol faults. Each one must tear down the current attempt
(transport closed, keypair dropped) and restart the handshake on a fresh
connection with a fresh keypair, publishing Loading again.

Covered Requirements:
---------------------
B1. Fingerprint mismatch -> reconnect, new key, Loading republished
B2. Malformed identity payload -> reconnect
B3. Opcode out of phase -> reconnect
B4. Malformed gateway frame -> reconnect
B5. Undecryptable nonce -> reconnect
B6. Remote close -> reconnect; frames queued before the close are honoured
B7. Out-of-range greeting intervals -> reconnect, no init sent, no heartbeat

Non-Goals:
----------
- Retry budget and backoff timing (Group E)
===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/session.hpp"

using SessionHarness = remauth::core::protocol::remote_auth::test::harness::Session<>;


// Shared post-condition: the faulty attempt is gone and a fresh one is open
static void check_fresh_attempt(SessionHarness& h, std::uint64_t reconnects) {
    // Backoff is 0 ms in the harness: the next poll opens the new attempt
    TEST_CHECK(h.session.attempt() == nullptr);
    TEST_CHECK(h.session.poll() == Status::Running);
    TEST_CHECK(h.session.attempt() != nullptr);
    TEST_CHECK(h.session.reconnects() == reconnects);
    TEST_CHECK(h.session.attempts() == reconnects + 1);
    TEST_CHECK(kind_of(h.session.phase()) == PhaseKind::Loading);
    TEST_CHECK(h.ws().sent().empty());
}

// -----------------------------------------------------------------------------
// Group B1: fingerprint mismatch
// -----------------------------------------------------------------------------
void test_fingerprint_mismatch() {
    std::cout << "[TEST] Group B1: fingerprint mismatch\n";

    SessionHarness h;
    h.start();
    h.greet();
    h.prove_nonce();
    const auto first_key = h.companion.public_key_der();

    TEST_CHECK(h.deliver(Companion::pending_remote_init("AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA")) == Status::Running);
    // Transport closed, no QR code ever published for the bad fingerprint
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    check_fresh_attempt(h, 1);
    TEST_CHECK(WebSocketUnderTest::constructed_count() == 2);

    // The retry completes with a different keypair
    h.greet();
    TEST_CHECK(h.companion.public_key_der() != first_key);
    h.prove_nonce();
    h.show_qr();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: malformed identity
// -----------------------------------------------------------------------------
void test_malformed_identity() {
    std::cout << "[TEST] Group B2: malformed identity\n";

    SessionHarness h;
    h.to_qr();

    TEST_CHECK(h.deliver(h.companion.pending_ticket("not-an-identity")) == Status::Running);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    check_fresh_attempt(h, 1);

    // Non-numeric user id is rejected too
    h.greet();
    h.prove_nonce();
    h.show_qr();
    TEST_CHECK(h.deliver(h.companion.pending_ticket("abc:0001:hash:name")) == Status::Running);
    check_fresh_attempt(h, 2);
    TEST_CHECK(h.exchange.calls == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: opcode out of phase
// -----------------------------------------------------------------------------
void test_out_of_phase() {
    std::cout << "[TEST] Group B3: opcode out of phase\n";

    SessionHarness h;
    h.start();

    // pending_remote_init before hello / nonce
    TEST_CHECK(h.deliver(Companion::pending_remote_init("fp")) == Status::Running);
    check_fresh_attempt(h, 1);

    // Second hello on the same connection
    h.greet();
    TEST_CHECK(h.deliver(Companion::hello()) == Status::Running);
    check_fresh_attempt(h, 2);

    // pending_login while only the QR code is shown
    h.greet();
    h.prove_nonce();
    h.show_qr();
    TEST_CHECK(h.deliver(Companion::pending_login(TEST_TICKET)) == Status::Running);
    check_fresh_attempt(h, 3);
    TEST_CHECK(h.exchange.calls == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: malformed frame
// -----------------------------------------------------------------------------
void test_malformed_frame() {
    std::cout << "[TEST] Group B4: malformed frame\n";

    SessionHarness h;
    h.start();
    h.greet();

    TEST_CHECK(h.deliver("{\"op\":\"hello\"") == Status::Running);
    check_fresh_attempt(h, 1);

    h.greet();
    TEST_CHECK(h.deliver("{\"op\":\"nonce_proof\",\"encrypted_nonce\":\"\"}") == Status::Running);
    check_fresh_attempt(h, 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B5: undecryptable nonce
// -----------------------------------------------------------------------------
void test_undecryptable_nonce() {
    std::cout << "[TEST] Group B5: undecryptable nonce\n";

    SessionHarness h;
    h.start();
    h.greet();

    // Valid base64, wrong ciphertext
    TEST_CHECK(h.deliver("{\"op\":\"nonce_proof\",\"encrypted_nonce\":\"AAAA\"}") == Status::Running);
    check_fresh_attempt(h, 1);

    // Not base64 at all
    h.greet();
    TEST_CHECK(h.deliver("{\"op\":\"nonce_proof\",\"encrypted_nonce\":\"***\"}") == Status::Running);
    check_fresh_attempt(h, 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B6: remote close
// -----------------------------------------------------------------------------
void test_remote_close() {
    std::cout << "[TEST] Group B6: remote close\n";

    SessionHarness h;
    h.to_qr();

    h.ws().emit_close();
    TEST_CHECK(h.session.poll() == Status::Running);
    check_fresh_attempt(h, 1);

    // A cancel queued right before the close still ends the login
    h.greet();
    h.prove_nonce();
    h.show_qr();
    h.ws().emit_message(Companion::cancel());
    h.ws().emit_close();
    TEST_CHECK(h.session.poll() == Status::Cancelled);
    TEST_CHECK(h.session.reconnects() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B7: out-of-range greeting
// -----------------------------------------------------------------------------
void test_out_of_range_greeting() {
    std::cout << "[TEST] Group B7: out-of-range greeting\n";

    SessionHarness h;
    h.start();

    // timeout_ms = UINT64_MAX
    TEST_CHECK(h.deliver("{\"op\":\"hello\",\"heartbeat_interval\":41250,\"timeout_ms\":18446744073709551615}") == Status::Running);
    TEST_CHECK(WebSocketUnderTest::send_count() == 0);
    check_fresh_attempt(h, 1);

    // heartbeat_interval far beyond 24 h
    TEST_CHECK(h.deliver("{\"op\":\"hello\",\"heartbeat_interval\":10000000000000,\"timeout_ms\":150000}") == Status::Running);
    TEST_CHECK(WebSocketUnderTest::send_count() == 0);
    check_fresh_attempt(h, 2);

    // The 24 h bound itself is accepted and the handshake proceeds
    h.greet(86'400'000, 86'400'000);
    TEST_CHECK(h.ws().count_sent_containing("\"op\":\"heartbeat\"") == 0);
    h.prove_nonce();
    h.show_qr();

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_fingerprint_mismatch();
    test_malformed_identity();
    test_out_of_phase();
    test_malformed_frame();
    test_undecryptable_nonce();
    test_remote_close();
    test_out_of_range_greeting();

    std::cout << "\n[GROUP B - SESSION RECOVERY TESTS PASSED]\n";
    return 0;
}
