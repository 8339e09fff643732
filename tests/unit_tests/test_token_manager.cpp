#include <catch2/catch.hpp>
#include "csrfguard/security/token_manager.hpp"
#include "csrfguard/utils/logging.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace csrfguard;
using namespace csrfguard::security;
using csrfguard::session::InMemorySession;

namespace {

bool is_lower_hex(const std::string& s) {
    return !s.empty() && s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

} // namespace

TEST_CASE("TokenManager - Token format", "[security][token]") {
    SECTION("SHA-256 tokens") {
        TokenManager manager("s3cr3t");
        std::string token = manager.generate_token();
        REQUIRE(token.size() == 64);
        REQUIRE(is_lower_hex(token));
        REQUIRE(manager.digest() == TokenDigest::SHA256);
    }

    SECTION("SHA-1 tokens") {
        TokenManager manager("s3cr3t", TokenDigest::SHA1);
        std::string token = manager.generate_token();
        REQUIRE(token.size() == 40);
        REQUIRE(is_lower_hex(token));
    }

    SECTION("Empty secret still produces tokens") {
        utils::Logger::get_instance().set_console_output(false);
        TokenManager manager("");
        REQUIRE(manager.generate_token().size() == 64);
        utils::Logger::get_instance().set_console_output(true);
    }
}

TEST_CASE("TokenManager - Tokens are non-deterministic", "[security][token]") {
    TokenManager manager("s3cr3t");

    std::set<std::string> tokens;
    const int trials = 2000;
    for (int i = 0; i < trials; ++i) {
        tokens.insert(manager.generate_token());
    }
    REQUIRE(tokens.size() == static_cast<size_t>(trials));
}

TEST_CASE("TokenManager - Session binding", "[security][token][session]") {
    TokenManager manager("s3cr3t");
    InMemorySession session("sid");

    SECTION("Unbound session") {
        REQUIRE_FALSE(manager.has_session_token(session));
        REQUIRE(manager.session_token(session).empty());
    }

    SECTION("get_or_create is idempotent") {
        std::string first = manager.get_or_create_session_token(session);
        std::string second = manager.get_or_create_session_token(session);

        REQUIRE(first == second);
        REQUIRE(manager.has_session_token(session));
        REQUIRE(manager.session_token(session) == first);
        REQUIRE(session.get(protocol::SESSION_KEY).value_or("") == first);
    }

    SECTION("Existing token is returned unchanged") {
        session.set(protocol::SESSION_KEY, "abc123");
        REQUIRE(manager.get_or_create_session_token(session) == "abc123");
    }

    SECTION("Empty binding is replaced") {
        session.set(protocol::SESSION_KEY, "");
        REQUIRE_FALSE(manager.has_session_token(session));

        std::string token = manager.get_or_create_session_token(session);
        REQUIRE(token.size() == 64);
        REQUIRE(manager.session_token(session) == token);
    }

    SECTION("Explicit reset issues a new token") {
        std::string first = manager.get_or_create_session_token(session);

        REQUIRE(manager.reset_session_token(session));
        REQUIRE_FALSE(manager.has_session_token(session));
        REQUIRE_FALSE(manager.reset_session_token(session));

        std::string second = manager.get_or_create_session_token(session);
        REQUIRE(second != first);
    }

    SECTION("Sessions are independent") {
        InMemorySession other("other");
        REQUIRE(manager.get_or_create_session_token(session) !=
                manager.get_or_create_session_token(other));
    }
}

TEST_CASE("TokenManager - Concurrent first access", "[security][token][thread_safety]") {
    TokenManager manager("s3cr3t");
    InMemorySession session("shared");

    const int num_threads = 8;
    std::vector<std::string> results(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&manager, &session, &results, t]() {
            results[t] = manager.get_or_create_session_token(session);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<std::string> distinct(results.begin(), results.end());
    REQUIRE(distinct.size() == 1);
    REQUIRE(manager.session_token(session) == *distinct.begin());
}
