#include <catch2/catch.hpp>
#include "csrfguard/http/request.hpp"
#include "csrfguard/http/response.hpp"

using namespace csrfguard::http;

TEST_CASE("SimpleRequest - Lookups", "[http][request]") {
    SimpleRequest req("POST", "/transfer");

    SECTION("Defaults") {
        SimpleRequest empty;
        REQUIRE(empty.method() == "GET");
        REQUIRE(empty.path() == "/");
        REQUIRE_FALSE(empty.is_secure());
        REQUIRE(empty.endpoint().empty());
    }

    SECTION("Headers are case-insensitive") {
        req.set_header("X-CSRFToken", "abc");
        REQUIRE(req.header("x-csrftoken").value_or("") == "abc");
        REQUIRE(req.header("X-CSRFTOKEN").value_or("") == "abc");

        req.remove_header("x-csrftoken");
        REQUIRE_FALSE(req.header("X-CSRFToken").has_value());
    }

    SECTION("Form fields and cookies are case-sensitive") {
        req.set_form_field("_csrf_token", "form");
        req.set_cookie("_csrf_token", "cookie");

        REQUIRE(req.form("_csrf_token").value_or("") == "form");
        REQUIRE_FALSE(req.form("_CSRF_TOKEN").has_value());
        REQUIRE(req.cookie("_csrf_token").value_or("") == "cookie");
        REQUIRE_FALSE(req.cookie("missing").has_value());
    }
}

TEST_CASE("SimpleResponse - Cookies", "[http][response]") {
    SimpleResponse res;

    res.set_cookie("_csrf_token", "abc", std::chrono::seconds(60));
    REQUIRE(res.cookies().size() == 1);

    SECTION("Set-Cookie rendering") {
        auto headers = res.set_cookie_headers();
        REQUIRE(headers.size() == 1);
        REQUIRE(headers[0] == "_csrf_token=abc; Max-Age=60; Path=/");
    }

    SECTION("Same name replaces") {
        res.set_cookie("_csrf_token", "def", std::chrono::seconds(120));
        REQUIRE(res.cookies().size() == 1);
        auto cookie = res.find_cookie("_csrf_token");
        REQUIRE(cookie.has_value());
        REQUIRE(cookie->value == "def");
        REQUIRE(cookie->max_age == std::chrono::seconds(120));
    }

    SECTION("Missing cookie") {
        REQUIRE_FALSE(res.find_cookie("session").has_value());
    }
}

TEST_CASE("SimpleResponse - Vary", "[http][response]") {
    SimpleResponse res;
    REQUIRE(res.vary_header().empty());

    res.add_vary("Accept-Encoding");
    res.add_vary("Cookie");
    res.add_vary("cookie");

    REQUIRE(res.vary().size() == 2);
    REQUIRE(res.varies_on("COOKIE"));
    REQUIRE(res.vary_header() == "Accept-Encoding, Cookie");
}

TEST_CASE("SimpleResponse - Status and body", "[http][response]") {
    SimpleResponse res;
    REQUIRE(res.status() == 200);

    res.set_status(403);
    res.set_body("Forbidden");
    REQUIRE(res.status() == 403);
    REQUIRE(res.body() == "Forbidden");
}
