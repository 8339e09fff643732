#pragma once

#include <string>
#include <exception>

namespace csrfguard {

/**
 * @brief Base exception class for csrfguard
 */
class CsrfGuardException : public std::exception {
private:
    std::string message_;
    std::string error_code_;

public:
    CsrfGuardException(const std::string& message, const std::string& error_code = "")
        : message_(message), error_code_(error_code) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& error_code() const noexcept {
        return error_code_;
    }
};

/**
 * @brief Configuration exception
 *
 * Raised at startup for invalid settings and for exemptions registered
 * after the guard started serving requests.
 */
class ConfigurationException : public CsrfGuardException {
public:
    explicit ConfigurationException(const std::string& message)
        : CsrfGuardException(message, "CONFIG_ERROR") {}
};

/**
 * @brief The secure random source is unavailable
 */
class RandomSourceException : public CsrfGuardException {
public:
    explicit RandomSourceException(const std::string& message)
        : CsrfGuardException(message, "RANDOM_SOURCE_ERROR") {}
};

} // namespace csrfguard
