/*
===============================================================================
 crypto::base64 - Unit Tests
===============================================================================

Scope:
------
Both wire alphabets used by the remote-auth handshake.

Covered Requirements:
---------------------
- RFC 4648 test vectors (standard alphabet, padded)
- url-safe alphabet without padding ('-' '_', no '=')
- Strict decoding: foreign characters, bad lengths and misplaced padding
  are rejected and leave the output untouched
===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "remauth/core/crypto/base64.hpp"
#include "common/test_check.hpp"

using namespace remauth::core::crypto;


static std::string as_text(const std::vector<std::uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

void test_standard_vectors() {
    std::cout << "[TEST] RFC 4648 vectors (standard)\n";

    TEST_CHECK(base64::encode_standard(std::string_view{""}) == "");
    TEST_CHECK(base64::encode_standard(std::string_view{"f"}) == "Zg==");
    TEST_CHECK(base64::encode_standard(std::string_view{"fo"}) == "Zm8=");
    TEST_CHECK(base64::encode_standard(std::string_view{"foo"}) == "Zm9v");
    TEST_CHECK(base64::encode_standard(std::string_view{"foob"}) == "Zm9vYg==");
    TEST_CHECK(base64::encode_standard(std::string_view{"fooba"}) == "Zm9vYmE=");
    TEST_CHECK(base64::encode_standard(std::string_view{"foobar"}) == "Zm9vYmFy");

    std::vector<std::uint8_t> out;
    TEST_CHECK(base64::decode_standard("Zm9vYg==", out));
    TEST_CHECK(as_text(out) == "foob");
    TEST_CHECK(base64::decode_standard("Zm9vYmE=", out));
    TEST_CHECK(as_text(out) == "fooba");
    TEST_CHECK(base64::decode_standard("Zm9vYmFy", out));
    TEST_CHECK(as_text(out) == "foobar");

    std::cout << "[TEST] OK\n";
}

void test_url_no_pad() {
    std::cout << "[TEST] url-safe alphabet, no padding\n";

    const std::vector<std::uint8_t> bytes = {0xfb, 0xff, 0xbf};
    TEST_CHECK(base64::encode_standard(bytes) == "+/+/");
    TEST_CHECK(base64::encode_url_no_pad(bytes) == "-_-_");

    TEST_CHECK(base64::encode_url_no_pad(std::string_view{"f"}) == "Zg");
    TEST_CHECK(base64::encode_url_no_pad(std::string_view{"fo"}) == "Zm8");

    std::vector<std::uint8_t> out;
    TEST_CHECK(base64::decode_url_no_pad("-_-_", out));
    TEST_CHECK(out == bytes);
    TEST_CHECK(base64::decode_url_no_pad("Zm8", out));
    TEST_CHECK(as_text(out) == "fo");

    std::cout << "[TEST] OK\n";
}

void test_strict_rejection() {
    std::cout << "[TEST] strict decoding\n";

    std::vector<std::uint8_t> out = {0x42};
    const auto before = out;

    // Wrong length / missing padding for the standard alphabet
    TEST_CHECK(!base64::decode_standard("Zg", out));
    // url-safe characters are foreign to the standard alphabet
    TEST_CHECK(!base64::decode_standard("-_-_", out));
    // Misplaced padding and whitespace
    TEST_CHECK(!base64::decode_standard("Z=g=", out));
    TEST_CHECK(!base64::decode_standard("Zm9v\nYmFy", out));
    // Standard characters and padding are foreign to the url alphabet
    TEST_CHECK(!base64::decode_url_no_pad("+/+/", out));
    TEST_CHECK(!base64::decode_url_no_pad("Zg==", out));
    // A single trailing character cannot encode a byte
    TEST_CHECK(!base64::decode_url_no_pad("Zm9vY", out));

    TEST_CHECK(out == before);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------
int main() {
    test_standard_vectors();
    test_url_no_pad();
    test_strict_rejection();

    std::cout << "\n[BASE64 TESTS PASSED]\n";
    return 0;
}
