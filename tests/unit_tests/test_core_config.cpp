#include <catch2/catch.hpp>
#include "csrfguard/core/config.hpp"
#include "csrfguard/core/base.hpp"

using namespace csrfguard;

TEST_CASE("GuardConfig - Default Values", "[core][config]") {
    GuardConfig config;

    REQUIRE(config.secret.empty());
    REQUIRE(config.disabled == false);
    REQUIRE(config.cookie_max_age == std::chrono::seconds(432000));
    REQUIRE(config.digest == TokenDigest::SHA256);
    REQUIRE(config.is_valid());
}

TEST_CASE("GuardConfig - Validation", "[core][config]") {
    GuardConfig config;

    SECTION("Zero max age") {
        config.cookie_max_age = std::chrono::seconds(0);
        REQUIRE_FALSE(config.is_valid());
    }

    SECTION("Negative max age") {
        config.cookie_max_age = std::chrono::seconds(-5);
        REQUIRE_FALSE(config.is_valid());
    }

    SECTION("Empty secret is accepted") {
        config.secret = "";
        REQUIRE(config.is_valid());
    }
}

TEST_CASE("GuardConfig - From Settings", "[core][config]") {
    SECTION("Empty settings give defaults") {
        auto config = GuardConfig::from_settings({});
        REQUIRE(config.secret.empty());
        REQUIRE_FALSE(config.disabled);
        REQUIRE(config.cookie_max_age == std::chrono::hours(24 * 5));
    }

    SECTION("All keys") {
        auto config = GuardConfig::from_settings({
            {"SECRET_KEY", "s3cr3t"},
            {"CSRF_DISABLE", "true"},
            {"CSRF_COOKIE_TIMEOUT", "3600"},
            {"CSRF_TOKEN_DIGEST", "SHA1"}
        });

        REQUIRE(config.secret == "s3cr3t");
        REQUIRE(config.disabled);
        REQUIRE(config.cookie_max_age == std::chrono::seconds(3600));
        REQUIRE(config.digest == TokenDigest::SHA1);
    }

    SECTION("TESTING disables validation when CSRF_DISABLE is absent") {
        auto config = GuardConfig::from_settings({{"TESTING", "1"}});
        REQUIRE(config.disabled);
    }

    SECTION("CSRF_DISABLE overrides TESTING") {
        auto config = GuardConfig::from_settings({{"TESTING", "yes"}, {"CSRF_DISABLE", "off"}});
        REQUIRE_FALSE(config.disabled);
    }

    SECTION("Unknown keys are ignored") {
        auto config = GuardConfig::from_settings({{"DATABASE_URL", "postgres://"}});
        REQUIRE(config.is_valid());
    }

    SECTION("Invalid boolean") {
        REQUIRE_THROWS_AS(GuardConfig::from_settings({{"CSRF_DISABLE", "maybe"}}),
                          ConfigurationException);
    }

    SECTION("Invalid timeout") {
        REQUIRE_THROWS_AS(GuardConfig::from_settings({{"CSRF_COOKIE_TIMEOUT", "5 days"}}),
                          ConfigurationException);
        REQUIRE_THROWS_AS(GuardConfig::from_settings({{"CSRF_COOKIE_TIMEOUT", "-1"}}),
                          ConfigurationException);
        REQUIRE_THROWS_AS(GuardConfig::from_settings({{"CSRF_COOKIE_TIMEOUT", ""}}),
                          ConfigurationException);
    }

    SECTION("Invalid digest") {
        REQUIRE_THROWS_AS(GuardConfig::from_settings({{"CSRF_TOKEN_DIGEST", "md5"}}),
                          ConfigurationException);
    }
}

TEST_CASE("parse_bool_setting", "[core][config]") {
    REQUIRE(parse_bool_setting("K", "TRUE"));
    REQUIRE(parse_bool_setting("K", " on "));
    REQUIRE_FALSE(parse_bool_setting("K", "No"));
    REQUIRE_FALSE(parse_bool_setting("K", "0"));

    try {
        parse_bool_setting("CSRF_DISABLE", "2");
        FAIL("expected ConfigurationException");
    } catch (const ConfigurationException& e) {
        REQUIRE(e.error_code() == "CONFIG_ERROR");
        REQUIRE(std::string(e.what()).find("CSRF_DISABLE") != std::string::npos);
    }
}

TEST_CASE("digest_name", "[core][config]") {
    REQUIRE(digest_name(TokenDigest::SHA1) == "sha1");
    REQUIRE(digest_name(TokenDigest::SHA256) == "sha256");
}
