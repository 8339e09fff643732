#include <catch2/catch.hpp>
#include "csrfguard/utils/url.hpp"

using namespace csrfguard::utils;

TEST_CASE("parse_origin - Well-formed URLs", "[utils][url]") {
    SECTION("Scheme, host and explicit port") {
        auto origin = parse_origin("https://example.com:8443/path?q=1#frag");
        REQUIRE(origin.has_value());
        REQUIRE(origin->scheme == "https");
        REQUIRE(origin->host == "example.com");
        REQUIRE(origin->port == 8443);
    }

    SECTION("Default ports") {
        REQUIRE(parse_origin("http://example.com/")->port == 80);
        REQUIRE(parse_origin("https://example.com")->port == 443);
        REQUIRE_FALSE(parse_origin("ftp://example.com/")->port.has_value());
    }

    SECTION("Case is normalized") {
        auto origin = parse_origin("HTTPS://Example.COM/Path");
        REQUIRE(origin->scheme == "https");
        REQUIRE(origin->host == "example.com");
    }

    SECTION("Userinfo is dropped") {
        auto origin = parse_origin("https://user:pa:ss@example.com:444/");
        REQUIRE(origin->host == "example.com");
        REQUIRE(origin->port == 444);
    }

    SECTION("IPv6 literal") {
        auto origin = parse_origin("http://[::1]:8080/x");
        REQUIRE(origin->host == "[::1]");
        REQUIRE(origin->port == 8080);

        REQUIRE(parse_origin("http://[::1]/")->port == 80);
    }

    SECTION("Empty port means default") {
        REQUIRE(parse_origin("http://example.com:/")->port == 80);
    }

    SECTION("to_string") {
        REQUIRE(parse_origin("https://Example.com/a")->to_string() == "https://example.com:443");
    }
}

TEST_CASE("parse_origin - Malformed input", "[utils][url]") {
    REQUIRE_FALSE(parse_origin("").has_value());
    REQUIRE_FALSE(parse_origin("example.com/path").has_value());
    REQUIRE_FALSE(parse_origin("/relative/path").has_value());
    REQUIRE_FALSE(parse_origin("https:///path").has_value());
    REQUIRE_FALSE(parse_origin("://example.com").has_value());
    REQUIRE_FALSE(parse_origin("1http://example.com").has_value());
    REQUIRE_FALSE(parse_origin("http://example.com:99999/").has_value());
    REQUIRE_FALSE(parse_origin("http://example.com:80a/").has_value());
    REQUIRE_FALSE(parse_origin("http://[::1/").has_value());
    REQUIRE_FALSE(parse_origin("http://[::1]x/").has_value());
}

TEST_CASE("same_origin", "[utils][url]") {
    SECTION("Matching origins") {
        REQUIRE(same_origin("https://example.com/form", "https://example.com/"));
        REQUIRE(same_origin("https://example.com:443/form", "https://example.com/"));
        REQUIRE(same_origin("https://EXAMPLE.com/a", "https://example.com/b"));
    }

    SECTION("Scheme differs") {
        REQUIRE_FALSE(same_origin("http://example.com/", "https://example.com/"));
    }

    SECTION("Host differs") {
        REQUIRE_FALSE(same_origin("https://evil.com/", "https://example.com/"));
        REQUIRE_FALSE(same_origin("https://example.com.evil.com/", "https://example.com/"));
    }

    SECTION("Port differs") {
        REQUIRE_FALSE(same_origin("https://example.com:8443/", "https://example.com/"));
    }

    SECTION("Unparsable side never matches") {
        REQUIRE_FALSE(same_origin("not a url", "https://example.com/"));
        REQUIRE_FALSE(same_origin("not a url", "not a url"));
    }
}
