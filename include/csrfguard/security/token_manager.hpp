#pragma once

#include "csrfguard/core/config.hpp"
#include "csrfguard/session/session.hpp"
#include <string>

namespace csrfguard {
namespace security {

/**
 * @brief Issues anti-forgery tokens and binds them to sessions
 *
 * A token is the hex digest of a uniform 64-bit CSPRNG draw (in decimal)
 * followed by the application secret. Each session carries at most one
 * canonical token under protocol::SESSION_KEY.
 */
class TokenManager {
private:
    std::string secret_;
    TokenDigest digest_;

public:
    /**
     * @brief Create a token manager
     * @param secret Application secret mixed into every token
     * @param digest Digest used for derivation
     * @throws RandomSourceException if the CSPRNG is not usable
     */
    explicit TokenManager(std::string secret, TokenDigest digest = TokenDigest::SHA256);

    /**
     * @brief Generate a fresh token
     * @return Lowercase hex digest
     * @throws RandomSourceException if the CSPRNG fails
     */
    std::string generate_token() const;

    /**
     * @brief Return the session's token, binding a new one if absent
     *
     * Concurrent first calls for one session return the same token.
     */
    std::string get_or_create_session_token(session::Session& session) const;

    /**
     * @brief Token bound to the session, or an empty string
     */
    std::string session_token(const session::Session& session) const;

    bool has_session_token(const session::Session& session) const;

    /**
     * @brief Drop the session's token; the next access issues a new one
     * @return True if a token was bound
     */
    bool reset_session_token(session::Session& session) const;

    TokenDigest digest() const { return digest_; }
};

} // namespace security
} // namespace csrfguard
