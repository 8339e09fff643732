#include "csrfguard/csrfguard.hpp"
#include <iostream>
#include <vector>

using namespace csrfguard;

int main() {
    std::cout << "=== csrfguard Example ===" << std::endl;

    try {
        // 1. Startup: configuration and exemptions
        std::cout << "\n=== Startup ===" << std::endl;

        GuardConfig config = GuardConfig::from_settings({
            {"SECRET_KEY", "example-secret"},
            {"CSRF_COOKIE_TIMEOUT", "3600"}
        });

        security::RequestGuard guard(config);
        guard.exempt("webhook");

        security::CsrfMiddleware middleware(&guard);
        session::InMemorySessionStore sessions;

        std::cout << "Guard ready, exempt endpoints: "
                  << guard.get_stats()["exempt_endpoints"] << std::endl;

        // 2. A browser renders a form
        std::cout << "\n=== Render form ===" << std::endl;

        auto session = sessions.get_or_create("");
        http::SimpleRequest get_form("GET", "/transfer");
        get_form.set_endpoint("transfer_form");
        http::SimpleResponse form_page;

        middleware.handle(get_form, *session, form_page,
            [&](const http::Request&, http::Response&) {
                auto render_token = guard.token_accessor(session);
                form_page.set_body("<form method=\"POST\">" + guard.hidden_field(*session) + "</form>");
                std::cout << "Embedded token: " << render_token().substr(0, 12) << "..." << std::endl;
            });

        for (const auto& header : form_page.set_cookie_headers()) {
            std::cout << "Set-Cookie: " << header.substr(0, 40) << "..." << std::endl;
        }
        std::cout << "Vary: " << form_page.vary_header() << std::endl;

        // 3. Form submissions
        std::cout << "\n=== Submissions ===" << std::endl;

        const std::string token = guard.csrf_token(*session);

        struct Attempt {
            std::string label;
            std::string token;
            std::string endpoint;
        };

        std::vector<Attempt> attempts = {
            {"valid token", token, "transfer"},
            {"forged token", "0000", "transfer"},
            {"no token", "", "transfer"},
            {"exempt webhook", "", "webhook"}
        };

        for (const auto& attempt : attempts) {
            http::SimpleRequest post("POST", "/" + attempt.endpoint);
            post.set_endpoint(attempt.endpoint);
            if (!attempt.token.empty()) {
                post.set_form_field(protocol::FORM_FIELD, attempt.token);
            }

            http::SimpleResponse response;
            auto decision = middleware.handle(post, *session, response,
                [](const http::Request&, http::Response& res) { res.set_status(200); });

            std::cout << attempt.label << ": " << response.status();
            if (!decision.allowed()) {
                std::cout << " (" << decision.message << ")";
            }
            std::cout << std::endl;
        }

        // 4. Secure transport requires a same-origin referer
        std::cout << "\n=== HTTPS referer checks ===" << std::endl;

        http::SimpleRequest secure_post("POST", "/transfer");
        secure_post.set_endpoint("transfer");
        secure_post.set_secure(true);
        secure_post.set_url_root("https://bank.example/");
        secure_post.set_header(protocol::HEADER_NAME, token);
        secure_post.set_header("Referer", "https://evil.example/attack");

        auto decision = guard.before_request(secure_post, *session);
        std::cout << "Cross-origin referer: " << decision.status_code()
                  << " (" << decision.message << ")" << std::endl;

        secure_post.set_header("Referer", "https://bank.example/transfer");
        decision = guard.before_request(secure_post, *session);
        std::cout << "Same-origin referer: " << (decision.allowed() ? "allowed" : "denied") << std::endl;

        // 5. Statistics
        std::cout << "\n=== Statistics ===" << std::endl;
        for (const auto& [name, value] : guard.get_stats()) {
            std::cout << name << ": " << value << std::endl;
        }

    } catch (const CsrfGuardException& e) {
        std::cerr << "Error [" << e.error_code() << "]: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
