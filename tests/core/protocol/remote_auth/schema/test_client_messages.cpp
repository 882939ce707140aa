/*
===============================================================================
 remote_auth client schema - Unit Tests
===============================================================================

Covered Requirements:
---------------------
- Exact wire form of init, heartbeat and nonce_proof
- write_json() never exceeds max_json_size()
- Output is valid JSON that round-trips through simdjson
===============================================================================
*/

#include <iostream>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "remauth/core/protocol/remote_auth/schema/client/heartbeat.hpp"
#include "remauth/core/protocol/remote_auth/schema/client/init.hpp"
#include "remauth/core/protocol/remote_auth/schema/client/nonce_proof.hpp"
#include "common/test_check.hpp"

using namespace remauth::core::protocol::remote_auth;


static std::string_view field(simdjson::dom::parser& parser, const std::string& json, const char* key) {
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(json).get(root));
    std::string_view value;
    TEST_CHECK(!root[key].get(value));
    return value;
}

void test_init() {
    std::cout << "[TEST] init\n";

    const schema::client::Init msg{"MIIBIjANBgkqhkiG9w0BAQEFAAOCAQ8AMIIBCgKCAQEA+/=="};
    const std::string json = msg.to_json();
    TEST_CHECK(json == "{\"op\":\"init\",\"encoded_public_key\":\"MIIBIjANBgkqhkiG9w0BAQEFAAOCAQ8AMIIBCgKCAQEA+/==\"}");
    TEST_CHECK(json.size() <= msg.max_json_size());

    simdjson::dom::parser parser;
    TEST_CHECK(field(parser, json, "op") == "init");
    TEST_CHECK(field(parser, json, "encoded_public_key") == msg.encoded_public_key);

    std::cout << "[TEST] OK\n";
}

void test_heartbeat() {
    std::cout << "[TEST] heartbeat\n";

    const schema::client::Heartbeat msg{};
    TEST_CHECK(msg.to_json() == "{\"op\":\"heartbeat\"}");

    char buffer[schema::client::Heartbeat::max_json_size()];
    TEST_CHECK(msg.write_json(buffer) == schema::client::Heartbeat::max_json_size());

    std::cout << "[TEST] OK\n";
}

void test_nonce_proof() {
    std::cout << "[TEST] nonce_proof\n";

    const schema::client::NonceProof msg{"bm9uY2UtMDEyMzQ1Njc4OQ"};
    const std::string json = msg.to_json();
    TEST_CHECK(json == "{\"op\":\"nonce_proof\",\"nonce\":\"bm9uY2UtMDEyMzQ1Njc4OQ\"}");
    TEST_CHECK(json.size() <= msg.max_json_size());

    simdjson::dom::parser parser;
    TEST_CHECK(field(parser, json, "nonce") == msg.nonce);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------
int main() {
    test_init();
    test_heartbeat();
    test_nonce_proof();

    std::cout << "\n[CLIENT SCHEMA TESTS PASSED]\n";
    return 0;
}
