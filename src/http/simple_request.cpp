#include "csrfguard/http/request.hpp"
#include <algorithm>
#include <cctype>

namespace csrfguard {
namespace http {

namespace {

std::string lower_header_name(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::optional<std::string> lookup(const std::unordered_map<std::string, std::string>& values,
                                  const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

SimpleRequest::SimpleRequest(std::string method, std::string path)
    : method_(std::move(method)), path_(std::move(path)) {
}

std::optional<std::string> SimpleRequest::header(const std::string& name) const {
    return lookup(headers_, lower_header_name(name));
}

std::optional<std::string> SimpleRequest::form(const std::string& name) const {
    return lookup(form_, name);
}

std::optional<std::string> SimpleRequest::cookie(const std::string& name) const {
    return lookup(cookies_, name);
}

void SimpleRequest::set_header(const std::string& name, const std::string& value) {
    headers_[lower_header_name(name)] = value;
}

void SimpleRequest::remove_header(const std::string& name) {
    headers_.erase(lower_header_name(name));
}

void SimpleRequest::set_form_field(const std::string& name, const std::string& value) {
    form_[name] = value;
}

void SimpleRequest::set_cookie(const std::string& name, const std::string& value) {
    cookies_[name] = value;
}

} // namespace http
} // namespace csrfguard
