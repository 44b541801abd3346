#ifndef RSP_PROTOCOL_PSK_CIPHER_H
#define RSP_PROTOCOL_PSK_CIPHER_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rsp {
namespace protocol {
namespace psk_cipher {

constexpr size_t IV_SIZE = 16;
constexpr size_t DERIVED_KEY_SIZE = 32;
constexpr const char* MAC_KEY_SALT_SUFFIX = "mac_key";

/**
 * PSK-protected payload as carried between SM-SR and the eUICC.
 *
 * Wire form: {"iv", "data", "mac", "key_type"} with base64 binary fields;
 * "mac" is absent for unauthenticated payloads.
 */
struct EncryptedPayload {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> data;
    std::vector<uint8_t> mac;
    std::string key_type;

    bool has_mac() const { return !mac.empty(); }

    nlohmann::json to_json() const;
    static Result<EncryptedPayload> from_json(const nlohmann::json& value);
};

/**
 * "AES-128" for a 16-byte PSK, "AES-256" for a 32-byte PSK.
 * @return INVALID_KEY_LENGTH for any other size
 */
RSP_API Result<std::string> key_type_for(const std::vector<uint8_t>& psk);

RSP_API Result<EncryptedPayload> encrypt_bytes(crypto::CryptoProvider& provider,
                                               const std::vector<uint8_t>& plaintext,
                                               const std::vector<uint8_t>& psk,
                                               bool include_mac = true);

/**
 * Serialize value compactly and encrypt it.
 *
 * enc_key = PBKDF2(psk, iv), mac_key = PBKDF2(psk, iv || "mac_key"),
 * AES-256-CBC with PKCS#7, mac = HMAC-SHA256(mac_key, iv || ciphertext).
 */
RSP_API Result<EncryptedPayload> encrypt(crypto::CryptoProvider& provider,
                                         const nlohmann::json& value,
                                         const std::vector<uint8_t>& psk,
                                         bool include_mac = true);

/**
 * Verify the MAC (constant time) and decrypt. A payload without a MAC is
 * rejected with MAC_VERIFICATION_FAILED unless allow_unauthenticated.
 */
RSP_API Result<std::vector<uint8_t>> decrypt_bytes(crypto::CryptoProvider& provider,
                                                   const EncryptedPayload& payload,
                                                   const std::vector<uint8_t>& psk,
                                                   bool allow_unauthenticated = false);

/**
 * decrypt_bytes followed by JSON parsing; DECODE_ERROR for non-JSON plaintext.
 */
RSP_API Result<nlohmann::json> decrypt(crypto::CryptoProvider& provider,
                                       const EncryptedPayload& payload,
                                       const std::vector<uint8_t>& psk,
                                       bool allow_unauthenticated = false);

} // namespace psk_cipher
} // namespace protocol
} // namespace rsp

#endif // RSP_PROTOCOL_PSK_CIPHER_H
