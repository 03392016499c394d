#include <catch2/catch_test_macros.hpp>
#include "translate/TokenGenerator.hpp"
#include "../utils/mock_http.hpp"

using namespace translate;
using test_utils::MockHttpClient;
using test_utils::MockResponses;

TEST_CASE("Token checksum matches known values", "[translate][token]") {
    const TokenSeed seed_a{406398, 2087938574};
    const TokenSeed seed_b{447370, 2234826282};

    SECTION("ASCII") {
        REQUIRE(computeToken(seed_a, "hello") == "338590.203232");
        REQUIRE(computeToken(seed_b, "Hello world") == "402803.63225");
    }

    SECTION("Two and three byte characters") {
        REQUIRE(computeToken(seed_a, "привет") == "251610.386468");
        REQUIRE(computeToken(seed_b, "日本語") == "764404.883326");
    }

    SECTION("Characters outside the BMP") {
        REQUIRE(computeToken(seed_a, "smile 😀") == "449491.59565");
    }

    SECTION("Empty text still yields a token") {
        REQUIRE(computeToken(seed_a, "") == "263193.145255");
    }

    SECTION("Zero seed") {
        REQUIRE(computeToken(TokenSeed{}, "hello") == "29979.29979");
    }

    SECTION("Deterministic") {
        REQUIRE(computeToken(seed_a, "hello") == computeToken(seed_a, "hello"));
        REQUIRE(computeToken(seed_a, "hello") != computeToken(seed_b, "hello"));
    }
}

TEST_CASE("Seed parsing", "[translate][token]") {
    SECTION("Plain assignment") {
        auto seed = parseSeed("var x=1;TKK='406398.2087938574';var y=2;");
        REQUIRE(seed.has_value());
        REQUIRE(seed->hours == 406398);
        REQUIRE(seed->value == 2087938574);
        REQUIRE(seed->toString() == "406398.2087938574");
    }

    SECTION("Object property form") {
        auto seed = parseSeed("{tkk:'447370.2234826282',foo:1}");
        REQUIRE(seed.has_value());
        REQUIRE(*seed == TokenSeed{447370, 2234826282});
    }

    SECTION("Legacy eval form sums the two halves") {
        auto seed = parseSeed(R"(TKK=eval('((function(){var a\x3d-1120089085;var b\x3d-1227012546;return 406398+)");
        REQUIRE(seed.has_value());
        REQUIRE(seed->hours == 406398);
        REQUIRE(seed->value == -1120089085LL + -1227012546LL);
    }

    SECTION("No seed on the page") {
        REQUIRE_FALSE(parseSeed("<html><body>nothing here</body></html>").has_value());
        REQUIRE_FALSE(parseSeed("").has_value());
    }
}

TEST_CASE("Token generator seed lifecycle", "[translate][token]") {
    MockHttpClient http;
    std::int64_t now = 1000;
    TokenGenerator gen(http, TokenGenerator::Options{.seed_url = "https://translate.example/"});
    gen.setClock([&now] { return now; });

    SECTION("Seed is obsolete before the first fetch") {
        REQUIRE(gen.isSeedObsolete());
    }

    SECTION("First use fetches the seed from the landing page") {
        http.setResponse("https://translate.example/", MockResponses::landing_page("406398.2087938574"));

        REQUIRE(gen.generate("hello") == "338590.203232");
        REQUIRE_FALSE(gen.isSeedObsolete());
        REQUIRE(http.requestCount() == 1);

        // Same hour, no second fetch
        REQUIRE(gen.generate("hello") == "338590.203232");
        REQUIRE(http.requestCount() == 1);
    }

    SECTION("Seed goes stale when the hour changes") {
        http.setResponse("https://translate.example/", MockResponses::landing_page("406398.2087938574"));
        gen.generate("hello");
        REQUIRE_FALSE(gen.isSeedObsolete());

        now = 1001;
        REQUIRE(gen.isSeedObsolete());
        gen.generate("hello");
        REQUIRE(http.requestCount() == 2);
        REQUIRE_FALSE(gen.isSeedObsolete());
    }

    SECTION("Failed refresh keeps the previous seed and stays obsolete") {
        http.setResponse("https://translate.example/", MockResponses::landing_page("406398.2087938574"));
        gen.generate("hello");

        now = 1001;
        http.simulateNetworkError("Could not resolve host");
        REQUIRE(gen.generate("hello") == "338590.203232");
        REQUIRE(gen.isSeedObsolete());
        REQUIRE(gen.seed() == TokenSeed{406398, 2087938574});
    }

    SECTION("Page without a seed leaves the generator obsolete") {
        http.setResponse("https://translate.example/", MockResponses::landing_page_without_seed());
        REQUIRE(gen.generate("hello") == "29979.29979");
        REQUIRE(gen.isSeedObsolete());
    }

    SECTION("HTTP error on the landing page") {
        http.setResponse("https://translate.example/", MockResponses::error_503());
        gen.generate("hello");
        REQUIRE(gen.isSeedObsolete());
    }

    SECTION("Injected seed counts as fresh") {
        gen.setSeed(TokenSeed{447370, 2234826282});
        REQUIRE_FALSE(gen.isSeedObsolete());
        REQUIRE(gen.generate("Hello world") == "402803.63225");
        REQUIRE(http.requestCount() == 0);
    }
}

TEST_CASE("Token function is pluggable", "[translate][token]") {
    MockHttpClient http;
    TokenGenerator gen(http, TokenGenerator::Options{},
                       [](const TokenSeed& seed, const std::string& text) {
                           return seed.toString() + ":" + text;
                       });
    gen.setClock([] { return std::int64_t{5}; });
    gen.setSeed(TokenSeed{1, 2});

    REQUIRE(gen.generate("abc") == "1.2:abc");
}
