#include "csrfguard/security/middleware.hpp"
#include "csrfguard/core/base.hpp"

namespace csrfguard {
namespace security {

CsrfMiddleware::CsrfMiddleware(RequestGuard* guard)
    : guard_(guard) {
    if (guard_ == nullptr) {
        throw ConfigurationException("CsrfMiddleware requires a RequestGuard");
    }
}

GuardDecision CsrfMiddleware::handle(const http::Request& request,
                                     session::Session& session,
                                     http::Response& response,
                                     const Handler& handler) {
    GuardDecision decision = guard_->before_request(request, session);
    if (!decision.allowed()) {
        response.set_status(decision.status_code());
        return decision;
    }

    if (handler) {
        handler(request, response);
    }

    guard_->after_request(session, response);
    return decision;
}

} // namespace security
} // namespace csrfguard
