#include "csrfguard/security/token_manager.hpp"
#include "csrfguard/security/crypto.hpp"
#include "csrfguard/core/base.hpp"
#include "csrfguard/utils/logging.hpp"

namespace csrfguard {
namespace security {

TokenManager::TokenManager(std::string secret, TokenDigest digest)
    : secret_(std::move(secret)), digest_(digest) {
    if (!crypto::random_source_available()) {
        LOG_ERROR("Secure random source is not available");
        throw RandomSourceException("secure random source is not seeded");
    }

    // Probe once so a broken RNG fails at startup instead of per request
    crypto::random_u64();

    if (secret_.empty()) {
        LOG_WARN("CSRF secret is empty; tokens are derived from randomness only");
    }
}

std::string TokenManager::generate_token() const {
    std::string salt = std::to_string(crypto::random_u64()) + secret_;
    return crypto::hex_digest(salt, digest_);
}

std::string TokenManager::get_or_create_session_token(session::Session& session) const {
    auto existing = session.get(protocol::SESSION_KEY);
    if (existing && !existing->empty()) {
        return *existing;
    }
    if (existing) {
        // An empty binding never validates; treat it as unset
        session.erase(protocol::SESSION_KEY);
    }

    // Another request may bind first; keep whichever token won
    return session.set_if_absent(protocol::SESSION_KEY, generate_token());
}

std::string TokenManager::session_token(const session::Session& session) const {
    return session.get(protocol::SESSION_KEY).value_or("");
}

bool TokenManager::has_session_token(const session::Session& session) const {
    return session.contains(protocol::SESSION_KEY) && !session_token(session).empty();
}

bool TokenManager::reset_session_token(session::Session& session) const {
    bool removed = session.erase(protocol::SESSION_KEY);
    if (removed) {
        LOG_DEBUG("CSRF token reset for session " + session.id());
    }
    return removed;
}

} // namespace security
} // namespace csrfguard
