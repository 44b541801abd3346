#ifndef RSP_CRYPTO_UTILS_H
#define RSP_CRYPTO_UTILS_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <vector>
#include <string>

namespace rsp {
namespace crypto {

/**
 * Cryptographic utility functions for the provisioning engine
 *
 * High-level helpers that work with any crypto provider, plus the
 * encoding conversions used on the JSON wire (hex and base64).
 */
namespace utils {

// Random utilities
RSP_API Result<std::vector<uint8_t>> random_bytes(CryptoProvider& provider, size_t length);

/**
 * Random bytes rendered as uppercase hex, 2 * byte_count characters.
 */
RSP_API Result<std::string> random_hex(CryptoProvider& provider, size_t byte_count);

// Hash utilities
RSP_API Result<std::vector<uint8_t>> sha256(CryptoProvider& provider, const std::vector<uint8_t>& data);
RSP_API Result<std::string> sha256_hex(CryptoProvider& provider, const std::string& text);

RSP_API Result<std::vector<uint8_t>> hmac_sha256(CryptoProvider& provider,
                                                 const std::vector<uint8_t>& key,
                                                 const std::vector<uint8_t>& data);

// Timing-safe comparison
RSP_API bool constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

// Secure memory utilities
RSP_API void secure_zero(std::vector<uint8_t>& data);
RSP_API void secure_zero(uint8_t* data, size_t length);

// Encoding utilities
RSP_API std::string to_hex(const std::vector<uint8_t>& data, bool uppercase = false);

/**
 * Parse hex in either case. DECODE_ERROR on odd length or non-hex input.
 */
RSP_API Result<std::vector<uint8_t>> from_hex(const std::string& hex);

RSP_API std::string base64_encode(const std::vector<uint8_t>& data);
RSP_API Result<std::vector<uint8_t>> base64_decode(const std::string& encoded);

RSP_API std::vector<uint8_t> to_bytes(const std::string& text);
RSP_API void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& part);
RSP_API void append(std::vector<uint8_t>& out, const std::string& part);
RSP_API void append_be32(std::vector<uint8_t>& out, uint32_t value);

} // namespace utils
} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_UTILS_H
