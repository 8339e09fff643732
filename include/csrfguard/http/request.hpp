#pragma once

#include <string>
#include <optional>
#include <unordered_map>

namespace csrfguard {
namespace http {

/**
 * @brief Read-only view of an inbound request
 *
 * Implemented by the host framework. Lookups return std::nullopt when the
 * value is absent or could not be decoded.
 */
class Request {
public:
    virtual ~Request() = default;

    virtual std::string method() const = 0;

    // Identity of the handler the request is routed to
    virtual std::string endpoint() const = 0;

    // True if the request arrived over TLS
    virtual bool is_secure() const = 0;

    virtual std::string path() const = 0;

    // Root URL of the application, e.g. "https://example.com/"
    virtual std::string url_root() const = 0;

    // Header names are case-insensitive
    virtual std::optional<std::string> header(const std::string& name) const = 0;
    virtual std::optional<std::string> form(const std::string& name) const = 0;
    virtual std::optional<std::string> cookie(const std::string& name) const = 0;
};

/**
 * @brief Value-type request with setters
 */
class SimpleRequest : public Request {
private:
    std::string method_ = "GET";
    std::string endpoint_;
    bool secure_ = false;
    std::string path_ = "/";
    std::string url_root_ = "http://localhost/";
    std::unordered_map<std::string, std::string> headers_;  // lowercased keys
    std::unordered_map<std::string, std::string> form_;
    std::unordered_map<std::string, std::string> cookies_;

public:
    SimpleRequest() = default;
    SimpleRequest(std::string method, std::string path);

    std::string method() const override { return method_; }
    std::string endpoint() const override { return endpoint_; }
    bool is_secure() const override { return secure_; }
    std::string path() const override { return path_; }
    std::string url_root() const override { return url_root_; }

    std::optional<std::string> header(const std::string& name) const override;
    std::optional<std::string> form(const std::string& name) const override;
    std::optional<std::string> cookie(const std::string& name) const override;

    void set_method(const std::string& method) { method_ = method; }
    void set_endpoint(const std::string& endpoint) { endpoint_ = endpoint; }
    void set_secure(bool secure) { secure_ = secure; }
    void set_path(const std::string& path) { path_ = path; }
    void set_url_root(const std::string& url_root) { url_root_ = url_root; }

    void set_header(const std::string& name, const std::string& value);
    void remove_header(const std::string& name);
    void set_form_field(const std::string& name, const std::string& value);
    void set_cookie(const std::string& name, const std::string& value);
};

} // namespace http
} // namespace csrfguard
