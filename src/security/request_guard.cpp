#include "csrfguard/security/request_guard.hpp"
#include "csrfguard/security/crypto.hpp"
#include "csrfguard/core/base.hpp"
#include "csrfguard/utils/logging.hpp"
#include "csrfguard/utils/url.hpp"
#include <algorithm>
#include <cctype>

namespace csrfguard {
namespace security {

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

const GuardConfig& validated(const GuardConfig& config) {
    if (!config.is_valid()) {
        throw ConfigurationException("CSRF cookie max age must be positive, got " +
                                     std::to_string(config.cookie_max_age.count()) + "s");
    }
    return config;
}

} // namespace

std::string to_string(DenialReason reason) {
    switch (reason) {
        case DenialReason::NONE:        return "none";
        case DenialReason::NO_REFERER:  return "no_referer";
        case DenialReason::BAD_REFERER: return "bad_referer";
        case DenialReason::BAD_TOKEN:   return "bad_token";
        default: return "unknown";
    }
}

std::string reasons::bad_referer(const std::string& referer, const std::string& allowed) {
    return "Referer checking failed: " + referer + " does not match " + allowed + ".";
}

bool is_safe_method(const std::string& method) {
    const std::string m = to_upper(method);
    return m == "GET" || m == "HEAD" || m == "OPTIONS" || m == "TRACE";
}

RequestGuard::RequestGuard(const GuardConfig& config)
    : config_(validated(config)),
      token_manager_(config_.secret, config_.digest) {
    LOG_INFO("CSRF guard initialized (digest=" + digest_name(config_.digest) +
             ", cookie_max_age=" + std::to_string(config_.cookie_max_age.count()) + "s" +
             (config_.disabled ? ", validation disabled" : "") + ")");
}

bool RequestGuard::exempt(const std::string& endpoint) {
    if (serving_.load()) {
        throw ConfigurationException("cannot exempt '" + endpoint +
                                     "': exemptions must be registered before serving requests");
    }

    bool inserted = exempt_endpoints_.insert(endpoint).second;
    if (inserted) {
        LOG_DEBUG("CSRF validation disabled for endpoint " + endpoint);
    }
    return inserted;
}

bool RequestGuard::is_exempt(const std::string& endpoint) const {
    return exempt_endpoints_.find(endpoint) != exempt_endpoints_.end();
}

GuardDecision RequestGuard::evaluate(const http::Request& request,
                                     const session::Session& session) const {
    if (config_.disabled) {
        return GuardDecision::allow();
    }

    if (is_safe_method(request.method())) {
        return GuardDecision::allow();
    }

    if (is_exempt(request.endpoint())) {
        return GuardDecision::allow();
    }

    // Strict referer checking on TLS stops an active attacker who could
    // otherwise strip the header from plaintext traffic.
    if (request.is_secure()) {
        auto referer = request.header(protocol::REFERER_HEADER);
        if (!referer) {
            return GuardDecision::deny(DenialReason::NO_REFERER, reasons::NO_REFERER);
        }

        const std::string allowed_referer = request.url_root();
        if (!utils::same_origin(*referer, allowed_referer)) {
            return GuardDecision::deny(DenialReason::BAD_REFERER,
                                       reasons::bad_referer(*referer, allowed_referer));
        }
    }

    const std::string csrf_token = token_manager_.session_token(session);

    std::string request_csrf_token;
    if (to_upper(request.method()) == "POST") {
        request_csrf_token = request.form(protocol::FORM_FIELD).value_or("");
    }
    if (request_csrf_token.empty()) {
        request_csrf_token = request.header(protocol::HEADER_NAME).value_or("");
    }

    bool match = crypto::constant_time_compare(request_csrf_token, csrf_token);
    if (!match || csrf_token.empty()) {
        return GuardDecision::deny(DenialReason::BAD_TOKEN, reasons::BAD_TOKEN);
    }

    return GuardDecision::allow();
}

GuardDecision RequestGuard::reject(const http::Request& request,
                                   DenialReason reason,
                                   const std::string& message) {
    requests_denied_++;
    switch (reason) {
        case DenialReason::NO_REFERER:  denied_no_referer_++; break;
        case DenialReason::BAD_REFERER: denied_bad_referer_++; break;
        case DenialReason::BAD_TOKEN:   denied_bad_token_++; break;
        default: break;
    }

    LOG_WARN("Forbidden (" + message + "): " + request.path());
    return GuardDecision::deny(reason, message);
}

GuardDecision RequestGuard::before_request(const http::Request& request,
                                           const session::Session& session) {
    serving_.store(true);
    requests_checked_++;

    GuardDecision decision = evaluate(request, session);
    if (!decision.allowed()) {
        return reject(request, decision.reason, decision.message);
    }

    requests_allowed_++;
    return decision;
}

http::Response& RequestGuard::after_request(const session::Session& session,
                                            http::Response& response) const {
    const std::string token = token_manager_.session_token(session);
    if (token.empty()) {
        return response;
    }

    response.set_cookie(protocol::COOKIE_NAME, token, config_.cookie_max_age);
    response.add_vary("Cookie");
    return response;
}

std::string RequestGuard::csrf_token(session::Session& session) const {
    return token_manager_.get_or_create_session_token(session);
}

std::function<std::string()> RequestGuard::token_accessor(std::shared_ptr<session::Session> session) const {
    return [this, session = std::move(session)]() {
        return csrf_token(*session);
    };
}

std::string RequestGuard::hidden_field(session::Session& session) const {
    return std::string("<input type=\"hidden\" name=\"") + protocol::FORM_FIELD +
           "\" value=\"" + csrf_token(session) + "\">";
}

std::unordered_map<std::string, std::string> RequestGuard::get_stats() const {
    std::unordered_map<std::string, std::string> stats;
    stats["requests_checked"] = std::to_string(requests_checked_.load());
    stats["requests_allowed"] = std::to_string(requests_allowed_.load());
    stats["requests_denied"] = std::to_string(requests_denied_.load());
    stats["denied_no_referer"] = std::to_string(denied_no_referer_.load());
    stats["denied_bad_referer"] = std::to_string(denied_bad_referer_.load());
    stats["denied_bad_token"] = std::to_string(denied_bad_token_.load());
    stats["exempt_endpoints"] = std::to_string(exempt_endpoints_.size());
    stats["disabled"] = config_.disabled ? "true" : "false";
    return stats;
}

} // namespace security
} // namespace csrfguard
