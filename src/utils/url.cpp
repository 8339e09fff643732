#include "csrfguard/utils/url.hpp"
#include <algorithm>
#include <cctype>

namespace csrfguard::utils {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool is_valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<uint16_t> default_port(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return std::nullopt;
}

} // namespace

std::string Origin::to_string() const {
    std::string result = scheme + "://" + host;
    if (port) {
        result += ":" + std::to_string(*port);
    }
    return result;
}

std::optional<Origin> parse_origin(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Origin origin;
    origin.scheme = to_lower(url.substr(0, scheme_end));
    if (!is_valid_scheme(origin.scheme)) {
        return std::nullopt;
    }

    auto authority_begin = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(authority_begin,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_begin);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    std::string port_text;
    bool has_port = false;

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return std::nullopt;
            }
            has_port = true;
            port_text = rest.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            has_port = true;
            port_text = authority.substr(colon + 1);
            host = authority.substr(0, colon);
        } else {
            host = authority;
        }
    }

    if (host.empty()) {
        return std::nullopt;
    }
    origin.host = to_lower(host);

    // "http://host:/" means no explicit port
    if (has_port && !port_text.empty()) {
        auto port = parse_port(port_text);
        if (!port) {
            return std::nullopt;
        }
        origin.port = port;
    } else {
        origin.port = default_port(origin.scheme);
    }

    return origin;
}

bool same_origin(const std::string& url1, const std::string& url2) {
    auto o1 = parse_origin(url1);
    auto o2 = parse_origin(url2);
    if (!o1 || !o2) {
        return false;
    }
    return *o1 == *o2;
}

} // namespace csrfguard::utils
