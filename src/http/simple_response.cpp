#include "csrfguard/http/response.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace csrfguard {
namespace http {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string Cookie::to_header_value() const {
    std::ostringstream oss;
    oss << name << "=" << value << "; Max-Age=" << max_age.count();
    if (!path.empty()) {
        oss << "; Path=" << path;
    }
    return oss.str();
}

void SimpleResponse::set_cookie(const std::string& name,
                                const std::string& value,
                                std::chrono::seconds max_age) {
    auto it = std::find_if(cookies_.begin(), cookies_.end(),
                           [&name](const Cookie& c) { return c.name == name; });
    if (it != cookies_.end()) {
        it->value = value;
        it->max_age = max_age;
        return;
    }

    Cookie cookie;
    cookie.name = name;
    cookie.value = value;
    cookie.max_age = max_age;
    cookies_.push_back(cookie);
}

void SimpleResponse::add_vary(const std::string& header) {
    if (!varies_on(header)) {
        vary_.push_back(header);
    }
}

std::optional<Cookie> SimpleResponse::find_cookie(const std::string& name) const {
    for (const Cookie& cookie : cookies_) {
        if (cookie.name == name) {
            return cookie;
        }
    }
    return std::nullopt;
}

bool SimpleResponse::varies_on(const std::string& header) const {
    return std::any_of(vary_.begin(), vary_.end(),
                       [&header](const std::string& v) { return iequals(v, header); });
}

std::string SimpleResponse::vary_header() const {
    std::string result;
    for (const std::string& header : vary_) {
        if (!result.empty()) {
            result += ", ";
        }
        result += header;
    }
    return result;
}

std::vector<std::string> SimpleResponse::set_cookie_headers() const {
    std::vector<std::string> headers;
    headers.reserve(cookies_.size());
    for (const Cookie& cookie : cookies_) {
        headers.push_back(cookie.to_header_value());
    }
    return headers;
}

} // namespace http
} // namespace csrfguard
