/*
===============================================================================
 remote_auth::parse_identity - Unit Tests
===============================================================================

The decrypted pending_ticket payload is "user_id:discriminator:avatar:name".

Covered Requirements:
---------------------
- Well-formed payloads, with and without avatar
- Exactly four fields
- Numeric user id and discriminator, non-empty display name
- Output untouched on failure
===============================================================================
*/

#include <iostream>
#include <sstream>
#include <string>

#include "remauth/core/protocol/remote_auth/identity.hpp"
#include "common/test_check.hpp"

using namespace remauth::core::protocol::remote_auth;
using remauth::core::parser::Result;


void test_valid_payloads() {
    std::cout << "[TEST] valid identity payloads\n";

    Identity id;
    TEST_CHECK(parse_identity("123456789012345678:0001:a_1b2c3d:tester", id) == Result::Parsed);
    TEST_CHECK(id.user_id == "123456789012345678");
    TEST_CHECK(id.discriminator == "0001");
    TEST_CHECK(id.avatar_hash == "a_1b2c3d");
    TEST_CHECK(id.display_name == "tester");
    TEST_CHECK(id.has_avatar());

    // "0" marks a missing avatar
    TEST_CHECK(parse_identity("42:0:0:no avatar", id) == Result::Parsed);
    TEST_CHECK(!id.has_avatar());
    TEST_CHECK(id.display_name == "no avatar");

    std::ostringstream os;
    os << id;
    TEST_CHECK(os.str().find("no avatar") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_field_count() {
    std::cout << "[TEST] field count\n";

    Identity id;
    TEST_CHECK(parse_identity("", id) == Result::InvalidSchema);
    TEST_CHECK(parse_identity("1:2:3", id) == Result::InvalidSchema);
    TEST_CHECK(parse_identity("123:4567", id) == Result::InvalidSchema);
    TEST_CHECK(parse_identity("1:2:3:name:extra", id) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

void test_field_values() {
    std::cout << "[TEST] field values\n";

    Identity id;
    TEST_CHECK(parse_identity("abc:0001:hash:name", id) == Result::InvalidValue);
    TEST_CHECK(parse_identity(":0001:hash:name", id) == Result::InvalidValue);
    TEST_CHECK(parse_identity("1:#1:hash:name", id) == Result::InvalidValue);
    TEST_CHECK(parse_identity("1:0001:hash:", id) == Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

void test_output_untouched() {
    std::cout << "[TEST] output untouched on failure\n";

    Identity id;
    TEST_CHECK(parse_identity("7:0007:h:keep", id) == Result::Parsed);
    const Identity before = id;
    TEST_CHECK(parse_identity("x:0001:hash:name", id) == Result::InvalidValue);
    TEST_CHECK(parse_identity("1:2", id) == Result::InvalidSchema);
    TEST_CHECK(id == before);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------
int main() {
    test_valid_payloads();
    test_field_count();
    test_field_values();
    test_output_untouched();

    std::cout << "\n[IDENTITY TESTS PASSED]\n";
    return 0;
}
