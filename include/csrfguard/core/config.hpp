#pragma once

#include <string>
#include <chrono>
#include <unordered_map>

namespace csrfguard {

/**
 * @brief Digest used to derive tokens
 */
enum class TokenDigest {
    SHA1,
    SHA256
};

/**
 * @brief Fixed protocol names shared by client and server
 */
namespace protocol {
    inline constexpr const char* COOKIE_NAME = "_csrf_token";
    inline constexpr const char* FORM_FIELD = "_csrf_token";
    inline constexpr const char* HEADER_NAME = "X-CSRFToken";
    inline constexpr const char* SESSION_KEY = "_csrf_token";
    inline constexpr const char* REFERER_HEADER = "Referer";
}

/**
 * @brief Configuration for the request guard
 *
 * Loaded once at startup and read-only afterwards.
 */
struct GuardConfig {
    // Mixed into every token before hashing. Empty is accepted but weak.
    std::string secret;

    // Skip all validation (test setups)
    bool disabled = false;

    // Max-Age of the token cookie
    std::chrono::seconds cookie_max_age{std::chrono::hours(24 * 5)};

    TokenDigest digest = TokenDigest::SHA256;

    /**
     * @brief Validate configuration
     * @return True if configuration is valid
     */
    bool is_valid() const {
        return cookie_max_age.count() > 0;
    }

    /**
     * @brief Build a configuration from application settings
     *
     * Recognized keys: SECRET_KEY, CSRF_DISABLE (falls back to TESTING),
     * CSRF_COOKIE_TIMEOUT (seconds) and CSRF_TOKEN_DIGEST (sha256, sha1).
     * Unknown keys are ignored.
     *
     * @param settings Key/value settings
     * @return Parsed configuration
     * @throws ConfigurationException on an unparsable value
     */
    static GuardConfig from_settings(const std::unordered_map<std::string, std::string>& settings);
};

/**
 * @brief Parse a boolean setting (1/0, true/false, yes/no, on/off)
 * @throws ConfigurationException if the value is not a boolean
 */
bool parse_bool_setting(const std::string& key, const std::string& value);

/**
 * @brief Lowercase name of a digest ("sha1", "sha256")
 */
std::string digest_name(TokenDigest digest);

} // namespace csrfguard
