#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace csrfguard::utils {

/**
 * @brief Security boundary of a web resource: (scheme, host, port)
 */
struct Origin {
    std::string scheme;
    std::string host;
    // Explicit port, or the scheme default for http/https
    std::optional<uint16_t> port;

    bool operator==(const Origin& other) const {
        return scheme == other.scheme && host == other.host && port == other.port;
    }

    bool operator!=(const Origin& other) const {
        return !(*this == other);
    }

    /**
     * @brief Render as scheme://host[:port]
     */
    std::string to_string() const;
};

/**
 * @brief Extract the origin of an absolute URL
 *
 * Scheme and host are lowercased, userinfo is dropped and the default
 * port is filled in for http and https. Never throws.
 *
 * @param url Absolute URL such as "https://user@Example.com:8443/path?q"
 * @return Origin, or std::nullopt if the URL has no scheme, no host or a bad port
 */
std::optional<Origin> parse_origin(const std::string& url);

/**
 * @brief True if both URLs parse and share scheme, host and port
 */
bool same_origin(const std::string& url1, const std::string& url2);

} // namespace csrfguard::utils
