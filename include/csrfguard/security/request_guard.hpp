#pragma once

#include "csrfguard/core/config.hpp"
#include "csrfguard/http/request.hpp"
#include "csrfguard/http/response.hpp"
#include "csrfguard/session/session.hpp"
#include "csrfguard/security/token_manager.hpp"
#include <string>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <memory>
#include <atomic>

namespace csrfguard {
namespace security {

/**
 * @brief Outcome of pre-request validation
 */
enum class Verdict {
    ALLOW,
    DENY
};

/**
 * @brief Why a request was denied
 */
enum class DenialReason {
    NONE,
    NO_REFERER,
    BAD_REFERER,
    BAD_TOKEN
};

/**
 * @brief Decision returned by the pre-request hook
 */
struct GuardDecision {
    Verdict verdict = Verdict::ALLOW;
    DenialReason reason = DenialReason::NONE;
    std::string message;

    bool allowed() const { return verdict == Verdict::ALLOW; }

    // 403 for denials, 0 to continue the pipeline
    int status_code() const { return allowed() ? 0 : 403; }

    static GuardDecision allow() { return GuardDecision{}; }
    static GuardDecision deny(DenialReason reason, std::string message) {
        return GuardDecision{Verdict::DENY, reason, std::move(message)};
    }
};

std::string to_string(DenialReason reason);

/**
 * @brief Denial messages
 */
namespace reasons {
    inline constexpr const char* NO_REFERER = "Referer checking failed: no referer.";
    inline constexpr const char* BAD_TOKEN = "CSRF token missing or incorrect.";

    std::string bad_referer(const std::string& referer, const std::string& allowed);
}

/**
 * @brief CSRF validation for inbound requests and token cookie issuance
 *
 * One instance is built at startup and shared by all request handlers.
 * Exemptions are single-threaded setup and must be registered before the
 * first request is checked. The serving flag rejects late registration but
 * does not make a registration racing the first request safe.
 */
class RequestGuard {
private:
    GuardConfig config_;
    TokenManager token_manager_;
    std::unordered_set<std::string> exempt_endpoints_;
    std::atomic<bool> serving_{false};

    std::atomic<uint64_t> requests_checked_{0};
    std::atomic<uint64_t> requests_allowed_{0};
    std::atomic<uint64_t> requests_denied_{0};
    std::atomic<uint64_t> denied_no_referer_{0};
    std::atomic<uint64_t> denied_bad_referer_{0};
    std::atomic<uint64_t> denied_bad_token_{0};

    GuardDecision evaluate(const http::Request& request, const session::Session& session) const;
    GuardDecision reject(const http::Request& request, DenialReason reason, const std::string& message);

public:
    /**
     * @brief Build the guard from configuration
     * @throws ConfigurationException if config is invalid
     * @throws RandomSourceException if the CSPRNG is not usable
     */
    explicit RequestGuard(const GuardConfig& config = GuardConfig{});

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

    /**
     * @brief Exclude an endpoint from validation
     * @param endpoint Handler identity as reported by Request::endpoint()
     * @return False if the endpoint was already exempt
     * @throws ConfigurationException if the first request has already been checked
     */
    bool exempt(const std::string& endpoint);
    bool is_exempt(const std::string& endpoint) const;

    /**
     * @brief Pre-request hook
     *
     * Never throws on request content. Denials are logged at WARN level.
     */
    GuardDecision before_request(const http::Request& request, const session::Session& session);

    /**
     * @brief Post-request hook
     *
     * Sets the token cookie and Vary: Cookie when the session holds a token.
     */
    http::Response& after_request(const session::Session& session, http::Response& response) const;

    /**
     * @brief Token for embedding in rendered pages
     */
    std::string csrf_token(session::Session& session) const;

    /**
     * @brief csrf_token bound to one session, for a template context
     *
     * The closure references this guard and must not be called after the
     * guard is destroyed.
     */
    std::function<std::string()> token_accessor(std::shared_ptr<session::Session> session) const;

    /**
     * @brief Hidden form input carrying the session token
     */
    std::string hidden_field(session::Session& session) const;

    const GuardConfig& config() const { return config_; }
    const TokenManager& token_manager() const { return token_manager_; }
    bool is_serving() const { return serving_.load(); }

    std::unordered_map<std::string, std::string> get_stats() const;
};

/**
 * @brief True for GET, HEAD, OPTIONS and TRACE (case-insensitive)
 */
bool is_safe_method(const std::string& method);

} // namespace security
} // namespace csrfguard
