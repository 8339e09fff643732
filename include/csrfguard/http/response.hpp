#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace csrfguard {
namespace http {

/**
 * @brief Outgoing response operations used by the guard
 */
class Response {
public:
    virtual ~Response() = default;

    virtual void set_status(int status) = 0;
    virtual int status() const = 0;

    virtual void set_cookie(const std::string& name,
                            const std::string& value,
                            std::chrono::seconds max_age) = 0;

    // Add a request header name to the Vary set
    virtual void add_vary(const std::string& header) = 0;
};

/**
 * @brief Cookie as set on a response
 */
struct Cookie {
    std::string name;
    std::string value;
    std::chrono::seconds max_age{0};
    std::string path = "/";

    /**
     * @brief Render as a Set-Cookie header value
     */
    std::string to_header_value() const;
};

/**
 * @brief Value-type response recording status, body, cookies and Vary
 */
class SimpleResponse : public Response {
private:
    int status_ = 200;
    std::string body_;
    std::vector<Cookie> cookies_;
    std::vector<std::string> vary_;

public:
    SimpleResponse() = default;

    void set_status(int status) override { status_ = status; }
    int status() const override { return status_; }

    // Replaces an existing cookie with the same name
    void set_cookie(const std::string& name,
                    const std::string& value,
                    std::chrono::seconds max_age) override;

    // Case-insensitive, duplicates are ignored
    void add_vary(const std::string& header) override;

    void set_body(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    const std::vector<Cookie>& cookies() const { return cookies_; }
    std::optional<Cookie> find_cookie(const std::string& name) const;

    const std::vector<std::string>& vary() const { return vary_; }
    bool varies_on(const std::string& header) const;

    /**
     * @brief Vary header value, e.g. "Accept-Encoding, Cookie"
     */
    std::string vary_header() const;

    /**
     * @brief One Set-Cookie value per cookie
     */
    std::vector<std::string> set_cookie_headers() const;
};

} // namespace http
} // namespace csrfguard
