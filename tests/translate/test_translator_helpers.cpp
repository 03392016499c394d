#include <catch2/catch_test_macros.hpp>
#include "translate/TranslatorHelpers.hpp"

using namespace translate;
using namespace translate::helpers;

namespace {

HttpResponse status(int code) {
    HttpResponse r;
    r.status_code = code;
    return r;
}

HttpResponse networkError(const std::string& msg) {
    HttpResponse r;
    r.error = msg;
    return r;
}

}  // namespace

TEST_CASE("Failure classification", "[translate][helpers]") {
    SECTION("Success needs no action") {
        REQUIRE(classify_failure(status(200), false, 0) == FailureAction::None);
        REQUIRE(classify_failure(status(200), true, 0) == FailureAction::None);
    }

    SECTION("Stale seed earns exactly one retry") {
        REQUIRE(classify_failure(status(429), true, 0) == FailureAction::RetryWithFreshToken);
        REQUIRE(classify_failure(networkError("reset"), true, 0) == FailureAction::RetryWithFreshToken);
        REQUIRE(classify_failure(status(429), true, 1) == FailureAction::IpBanned);
        REQUIRE(classify_failure(networkError("reset"), true, 1) == FailureAction::Propagate);
    }

    SECTION("Protocol failures are bans, transport failures propagate") {
        REQUIRE(classify_failure(status(403), false, 0) == FailureAction::IpBanned);
        REQUIRE(classify_failure(status(503), false, 0) == FailureAction::IpBanned);
        REQUIRE(classify_failure(networkError("Operation timed out"), false, 0) == FailureAction::Propagate);
    }
}

TEST_CASE("HTTP error descriptions", "[translate][helpers]") {
    REQUIRE(categorize_http_error(0, "Operation timed out") == HttpErrorType::Timeout);
    REQUIRE(categorize_http_error(0, "Could not resolve host") == HttpErrorType::NetworkError);
    REQUIRE(categorize_http_error(429, "") == HttpErrorType::TooManyRequests);
    REQUIRE(categorize_http_error(403, "") == HttpErrorType::ClientError);
    REQUIRE(categorize_http_error(502, "") == HttpErrorType::ServerError);
    REQUIRE(categorize_http_error(204, "") == HttpErrorType::Success);

    REQUIRE(describe_failure(status(503), "down") == "Server error (HTTP 503): down");
    REQUIRE(describe_failure(networkError("Could not resolve host"), "") == "Network error: Could not resolve host");
}

TEST_CASE("Courtesy delay", "[translate][helpers]") {
    SECTION("Disabled when the upper bound is zero") {
        REQUIRE(courtesy_delay_ms(0, 0) == 0);
        REQUIRE(courtesy_delay_ms(200, 0) == 0);
    }

    SECTION("Stays within bounds") {
        for (int i = 0; i < 100; ++i) {
            int d = courtesy_delay_ms(200, 500);
            REQUIRE(d >= 200);
            REQUIRE(d <= 500);
        }
    }

    SECTION("Swapped bounds are tolerated") {
        int d = courtesy_delay_ms(500, 200);
        REQUIRE(d >= 200);
        REQUIRE(d <= 500);
    }
}
