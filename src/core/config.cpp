#include "csrfguard/core/config.hpp"
#include "csrfguard/core/base.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace csrfguard {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

std::chrono::seconds parse_seconds_setting(const std::string& key, const std::string& value) {
    std::string digits = trim(value);
    if (digits.empty()) {
        throw ConfigurationException(key + ": expected a number of seconds, got empty value");
    }

    long long seconds = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigurationException(key + ": expected a number of seconds, got '" + value + "'");
        }
        if (seconds > (std::numeric_limits<long long>::max() - 9) / 10) {
            throw ConfigurationException(key + ": value out of range");
        }
        seconds = seconds * 10 + (c - '0');
    }
    return std::chrono::seconds(seconds);
}

TokenDigest parse_digest_setting(const std::string& key, const std::string& value) {
    std::string name = to_lower(trim(value));
    if (name == "sha256" || name == "sha-256") {
        return TokenDigest::SHA256;
    }
    if (name == "sha1" || name == "sha-1") {
        return TokenDigest::SHA1;
    }
    throw ConfigurationException(key + ": unsupported digest '" + value + "'");
}

} // namespace

bool parse_bool_setting(const std::string& key, const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw ConfigurationException(key + ": expected a boolean, got '" + value + "'");
}

std::string digest_name(TokenDigest digest) {
    switch (digest) {
        case TokenDigest::SHA1:   return "sha1";
        case TokenDigest::SHA256: return "sha256";
        default: return "unknown";
    }
}

GuardConfig GuardConfig::from_settings(const std::unordered_map<std::string, std::string>& settings) {
    GuardConfig config;

    auto it = settings.find("SECRET_KEY");
    if (it != settings.end()) {
        config.secret = it->second;
    }

    // CSRF_DISABLE wins over TESTING
    it = settings.find("CSRF_DISABLE");
    if (it != settings.end()) {
        config.disabled = parse_bool_setting(it->first, it->second);
    } else {
        it = settings.find("TESTING");
        if (it != settings.end()) {
            config.disabled = parse_bool_setting(it->first, it->second);
        }
    }

    it = settings.find("CSRF_COOKIE_TIMEOUT");
    if (it != settings.end()) {
        config.cookie_max_age = parse_seconds_setting(it->first, it->second);
    }

    it = settings.find("CSRF_TOKEN_DIGEST");
    if (it != settings.end()) {
        config.digest = parse_digest_setting(it->first, it->second);
    }

    return config;
}

} // namespace csrfguard
