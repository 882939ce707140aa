/*
===============================================================================
 api remote-auth login - Unit Tests
===============================================================================

Scope:
------
Request body and response parsing of the ticket exchange, plus the API error
object with its nested form error tree.

Covered Requirements:
---------------------
L1. Request body {"ticket":"..."} with JSON escaping
L2. Response: encrypted_token required and non-empty
L3. Error object: code and message required, errors optional
L4. Form error tree flattened into dotted paths
L5. Malformed trees rejected
L6. Allocation failure while parsing an error object is a typed failure
L7. Status and body classification (token, error object, anything else)
===============================================================================
*/

#include <cstdlib>
#include <iostream>
#include <new>
#include <sstream>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "remauth/core/api/parser/remote_auth_login.hpp"
#include "remauth/core/api/schema/remote_auth_login.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace remauth::core::api;
using remauth::core::parser::Result;


// -----------------------------------------------------------------------------
// Allocation fault injection: the allocation numbered `g_fail_countdown`
// (0 = the next one) throws std::bad_alloc once. -1 disarms.
// -----------------------------------------------------------------------------
static int g_fail_countdown = -1;
static bool g_fail_fired = false;

void* operator new(std::size_t size) {
    if (g_fail_countdown >= 0 && g_fail_countdown-- == 0) {
        g_fail_fired = true;
        throw std::bad_alloc();
    }
    if (void* p = std::malloc(size ? size : 1)) {
        return p;
    }
    throw std::bad_alloc();
}

void operator delete(void* p) noexcept {
    std::free(p);
}

void operator delete(void* p, std::size_t) noexcept {
    std::free(p);
}


// -----------------------------------------------------------------------------
// L1
// -----------------------------------------------------------------------------
void test_request_body() {
    std::cout << "[TEST] L1: request body\n";

    TEST_CHECK(schema::LoginRequest{"abc"}.to_json() == "{\"ticket\":\"abc\"}");
    TEST_CHECK(schema::LoginRequest{"a\"b\\c"}.to_json() == "{\"ticket\":\"a\\\"b\\\\c\"}");

    // Body is valid JSON carrying the original ticket
    simdjson::dom::parser json;
    simdjson::dom::element root;
    const std::string body = schema::LoginRequest{"x\ny"}.to_json();
    TEST_CHECK(!json.parse(body).get(root));
    std::string_view ticket;
    TEST_CHECK(!root["ticket"].get(ticket));
    TEST_CHECK(ticket == "x\ny");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L2
// -----------------------------------------------------------------------------
void test_login_response() {
    std::cout << "[TEST] L2: login response\n";

    simdjson::dom::parser json;
    schema::LoginResponse out;

    TEST_CHECK(parser::login_response::parse(json, R"({"encrypted_token":"QUJD"})", out) == Result::Parsed);
    TEST_CHECK(out.encrypted_token == "QUJD");

    schema::LoginResponse untouched;
    TEST_CHECK(parser::login_response::parse(json, "<html>", untouched) == Result::InvalidJson);
    TEST_CHECK(parser::login_response::parse(json, "{}", untouched) == Result::InvalidSchema);
    TEST_CHECK(parser::login_response::parse(json, R"({"encrypted_token":5})", untouched) == Result::InvalidSchema);
    TEST_CHECK(parser::login_response::parse(json, R"({"encrypted_token":""})", untouched) == Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L3
// -----------------------------------------------------------------------------
void test_error_object() {
    std::cout << "[TEST] L3: error object\n";

    simdjson::dom::parser json;
    schema::ApiError err;

    TEST_CHECK(parser::api_error::parse(json, R"({"code":10012,"message":"Unknown Ticket"})", err) == Result::Parsed);
    TEST_CHECK(err.code == 10012);
    TEST_CHECK(err.message == "Unknown Ticket");
    TEST_CHECK(err.errors.empty());

    TEST_CHECK(parser::api_error::parse(json, R"({"message":"no code"})", err) == Result::InvalidSchema);
    TEST_CHECK(parser::api_error::parse(json, R"({"code":1})", err) == Result::InvalidSchema);
    TEST_CHECK(parser::api_error::parse(json, R"({"code":1,"message":"m","errors":[]})", err) == Result::InvalidSchema);
    TEST_CHECK(parser::api_error::parse(json, "rate limited", err) == Result::InvalidJson);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L4
// -----------------------------------------------------------------------------
void test_form_error_tree() {
    std::cout << "[TEST] L4: form error tree\n";

    constexpr std::string_view body = R"json(
    {
        "code": 50035,
        "message": "Invalid Form Body",
        "errors": {
            "ticket": {
                "_errors": [
                    {"code": "BASE_TYPE_REQUIRED", "message": "This field is required"}
                ]
            },
            "login": {
                "password": {
                    "_errors": [
                        {"code": "A", "message": "first"},
                        {"code": "B", "message": "second"}
                    ]
                }
            }
        }
    }
    )json";

    simdjson::dom::parser json;
    schema::ApiError err;
    TEST_CHECK(parser::api_error::parse(json, body, err) == Result::Parsed);
    TEST_CHECK(err.code == 50035);
    TEST_CHECK(err.errors.size() == 3);
    TEST_CHECK((err.errors[0] == schema::FieldError{"ticket", "BASE_TYPE_REQUIRED", "This field is required"}));
    TEST_CHECK((err.errors[1] == schema::FieldError{"login.password", "A", "first"}));
    TEST_CHECK((err.errors[2] == schema::FieldError{"login.password", "B", "second"}));

    std::ostringstream os;
    os << err;
    TEST_CHECK(os.str().find("login.password: B second") != std::string::npos);

    // A new parse starts from a clean object
    TEST_CHECK(parser::api_error::parse(json, R"({"code":2,"message":"m"})", err) == Result::Parsed);
    TEST_CHECK(err.errors.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L5
// -----------------------------------------------------------------------------
void test_malformed_tree() {
    std::cout << "[TEST] L5: malformed form error tree\n";

    simdjson::dom::parser json;
    schema::ApiError err;

    TEST_CHECK(parser::api_error::parse(json, R"({"code":1,"message":"m","errors":{"a":"b"}})", err) == Result::InvalidSchema);
    TEST_CHECK(parser::api_error::parse(json, R"({"code":1,"message":"m","errors":{"_errors":{}}})", err) == Result::InvalidSchema);
    TEST_CHECK(parser::api_error::parse(json, R"({"code":1,"message":"m","errors":{"_errors":[{"code":"X"}]}})", err) == Result::InvalidSchema);

    // Nesting deeper than the bound
    std::string deep = R"({"code":1,"message":"m","errors":)";
    for (int i = 0; i <= parser::MAX_FORM_ERROR_DEPTH + 1; ++i) {
        deep += "{\"k\":";
    }
    deep += "{}";
    for (int i = 0; i <= parser::MAX_FORM_ERROR_DEPTH + 1; ++i) {
        deep += "}";
    }
    deep += "}";
    TEST_CHECK(parser::api_error::parse(json, deep, err) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L6
// -----------------------------------------------------------------------------
void test_allocation_failure() {
    std::cout << "[TEST] L6: allocation failure\n";

    const std::string body =
        R"({"code":50035,"message":"Invalid Form Body","errors":{)"
        R"("ticket":{"_errors":[{"code":"BASE_TYPE_REQUIRED","message":"This field is required"}]},)"
        R"("login":{"password":{"_errors":[{"code":"A","message":"first"},{"code":"B","message":"second"}]}}}})";

    // Keep log statements from allocating while a failure is armed
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    simdjson::dom::parser json;
    schema::ApiError err;
    TEST_CHECK(parser::api_error::parse(json, body, err) == Result::Parsed);

    // Fail each allocation of the parse in turn until one runs clean
    int injected = 0;
    for (int n = 0; ; ++n) {
        g_fail_fired = false;
        g_fail_countdown = n;
        const Result r = parser::api_error::parse(json, body, err);
        g_fail_countdown = -1;
        if (!g_fail_fired) {
            TEST_CHECK(r == Result::Parsed);
            TEST_CHECK(err.errors.size() == 3);
            break;
        }
        ++injected;
        // Either a typed failure, or a complete result if the allocation was retried
        TEST_CHECK(r != Result::Parsed || err.errors.size() == 3);
    }
    TEST_CHECK(injected > 0);

    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L7
// -----------------------------------------------------------------------------
void test_response_classification() {
    std::cout << "[TEST] L7: response classification\n";

    simdjson::dom::parser json;
    schema::LoginResponse out;
    schema::ApiError err;

    TEST_CHECK(parser::classify_login_response(json, 200, R"({"encrypted_token":"abc"})", out, err) == Error::None);
    TEST_CHECK(out.encrypted_token == "abc");
    TEST_CHECK(err.code == 0);

    // Error object on a 2xx status is still a rejection
    TEST_CHECK(parser::classify_login_response(json, 200, R"({"code":10012,"message":"Unknown ticket"})", out, err) == Error::Rejected);
    TEST_CHECK(err.code == 10012);
    TEST_CHECK(err.message == "Unknown ticket");

    TEST_CHECK(parser::classify_login_response(json, 400, R"({"code":50035,"message":"Invalid Form Body"})", out, err) == Error::Rejected);
    TEST_CHECK(err.code == 50035);

    // Neither a token nor an error object
    TEST_CHECK(parser::classify_login_response(json, 204, "", out, err) == Error::InvalidResponse);
    TEST_CHECK(err.code == 0);
    TEST_CHECK(parser::classify_login_response(json, 200, R"({"encrypted_token":""})", out, err) == Error::InvalidResponse);
    TEST_CHECK(parser::classify_login_response(json, 502, "<html>Bad Gateway</html>", out, err) == Error::HttpStatus);
    TEST_CHECK(err.code == 0);
    TEST_CHECK(parser::classify_login_response(json, 429, R"({"retry_after":1.5})", out, err) == Error::HttpStatus);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------
int main() {
    test_request_body();
    test_login_response();
    test_error_object();
    test_form_error_tree();
    test_malformed_tree();
    test_allocation_failure();
    test_response_classification();

    std::cout << "\n[REMOTE AUTH LOGIN API TESTS PASSED]\n";
    return 0;
}
