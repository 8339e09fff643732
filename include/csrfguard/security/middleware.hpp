#pragma once

#include "csrfguard/security/request_guard.hpp"
#include <functional>

namespace csrfguard {
namespace security {

/**
 * @brief Runs a handler between the guard's pre- and post-request hooks
 */
class CsrfMiddleware {
public:
    using Handler = std::function<void(const http::Request&, http::Response&)>;

private:
    RequestGuard* guard_;

public:
    explicit CsrfMiddleware(RequestGuard* guard);

    /**
     * @brief Validate, dispatch and attach the token cookie
     *
     * A denied request gets status 403 and the handler is not called.
     *
     * @return The guard's decision
     */
    GuardDecision handle(const http::Request& request,
                         session::Session& session,
                         http::Response& response,
                         const Handler& handler);
};

} // namespace security
} // namespace csrfguard
