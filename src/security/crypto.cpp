#include "csrfguard/security/crypto.hpp"
#include "csrfguard/core/base.hpp"
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace csrfguard {
namespace security {
namespace crypto {

namespace {

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

bool random_source_available() {
    return RAND_status() == 1;
}

std::vector<unsigned char> random_bytes(size_t count) {
    std::vector<unsigned char> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        throw RandomSourceException("RAND_bytes failed: " + openssl_error());
    }
    return buffer;
}

uint64_t random_u64() {
    auto bytes = random_bytes(sizeof(uint64_t));
    uint64_t value = 0;
    for (unsigned char b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

std::string to_hex(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0f];
    }
    return result;
}

std::string hex_digest(const std::string& data, TokenDigest digest) {
    const auto* input = reinterpret_cast<const unsigned char*>(data.data());

    switch (digest) {
        case TokenDigest::SHA1: {
            unsigned char hash[SHA_DIGEST_LENGTH];
            SHA1(input, data.size(), hash);
            return to_hex(hash, SHA_DIGEST_LENGTH);
        }
        case TokenDigest::SHA256:
        default: {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256(input, data.size(), hash);
            return to_hex(hash, SHA256_DIGEST_LENGTH);
        }
    }
}

size_t hex_digest_length(TokenDigest digest) {
    return digest == TokenDigest::SHA1 ? SHA_DIGEST_LENGTH * 2 : SHA256_DIGEST_LENGTH * 2;
}

bool constant_time_compare(const std::string& a, const std::string& b) {
    if (a.length() != b.length()) {
        return false;
    }

    unsigned char result = 0;
    for (size_t i = 0; i < a.length(); ++i) {
        result |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
    }
    return result == 0;
}

} // namespace crypto
} // namespace security
} // namespace csrfguard
