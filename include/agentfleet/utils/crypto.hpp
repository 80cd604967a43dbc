#ifndef AGENTFLEET_UTILS_CRYPTO_HPP
#define AGENTFLEET_UTILS_CRYPTO_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace utils {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Lowercase hex SHA-256 digest of the given data.
 *
 * Used as the content hash of remote configuration bodies.
 */
std::string sha256Hex(const std::string& data);

/**
 * @brief HMAC-SHA-256 of data under key.
 * @return The 32 byte MAC, or StorageError if OpenSSL fails
 */
Result<Bytes> hmacSha256(const Bytes& key, const Bytes& data);

/**
 * @brief Cryptographically random bytes from RAND_bytes.
 */
Result<Bytes> randomBytes(std::size_t count);

// Constant-time equality; sizes are compared first.
bool constantTimeEquals(const Bytes& a, const Bytes& b);

std::string toHex(const Bytes& data);
Result<Bytes> fromHex(const std::string& hex);

/**
 * @brief Unpadded base64url (RFC 4648 section 5).
 */
std::string base64UrlEncode(const Bytes& data);

/**
 * @brief Strict inverse of base64UrlEncode.
 *
 * Rejects characters outside the url-safe alphabet, padding, and impossible lengths.
 */
Result<Bytes> base64UrlDecode(const std::string& text);

} // namespace utils
} // namespace agentfleet

#endif // AGENTFLEET_UTILS_CRYPTO_HPP
