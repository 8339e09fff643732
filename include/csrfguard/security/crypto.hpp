#pragma once

#include "csrfguard/core/config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace csrfguard {
namespace security {

/**
 * @brief CSPRNG, digest and comparison primitives backed by OpenSSL
 */
namespace crypto {

/**
 * @brief True if the OpenSSL CSPRNG is seeded and usable
 */
bool random_source_available();

/**
 * @brief Fill a buffer from the CSPRNG
 * @throws RandomSourceException if RAND_bytes fails
 */
std::vector<unsigned char> random_bytes(size_t count);

/**
 * @brief Uniform draw over [0, 2^64)
 * @throws RandomSourceException if RAND_bytes fails
 */
uint64_t random_u64();

/**
 * @brief Lowercase hex digest of data
 */
std::string hex_digest(const std::string& data, TokenDigest digest);

/**
 * @brief Hex digest length for a digest (40 for SHA-1, 64 for SHA-256)
 */
size_t hex_digest_length(TokenDigest digest);

std::string to_hex(const unsigned char* data, size_t length);

/**
 * @brief Compare two byte strings without a mismatch-position timing leak
 *
 * Unequal lengths return false at once. Otherwise every byte pair is
 * XOR-accumulated before the result is inspected. Operates on the raw bytes.
 */
bool constant_time_compare(const std::string& a, const std::string& b);

} // namespace crypto
} // namespace security
} // namespace csrfguard
