/**
 * @file provider.h
 * @brief RSP cryptographic provider interface
 *
 * Abstract seam between the provisioning engine and the cryptographic
 * backend. Every primitive the engine needs (P-256 ECDH and ECDSA, AES-CBC,
 * AES-CMAC, HMAC-SHA256, PBKDF2, X.509 issuance and chain validation) is
 * exposed here as a Result-returning virtual.
 *
 * @thread_safety Implementations must be safe to call concurrently after
 *                initialize() has returned.
 */

#ifndef RSP_CRYPTO_PROVIDER_H
#define RSP_CRYPTO_PROVIDER_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <memory>
#include <vector>
#include <string>
#include <utility>

namespace rsp {
namespace crypto {

class PrivateKey;
class PublicKey;

enum class HashAlgorithm : uint8_t {
    SHA256 = 0,
    SHA384 = 1,
    SHA512 = 2
};

enum class KeyType : uint8_t {
    EC_P256 = 0,
    RSA_2048 = 1
};

// Random number generation parameters
struct RandomParams {
    size_t length{0};
    bool cryptographically_secure{true};
};

// Hash computation parameters
struct HashParams {
    std::vector<uint8_t> data;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
};

// HMAC computation parameters
struct HMACParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
};

// MAC validation parameters for timing-attack resistant verification
struct MACValidationParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
    std::vector<uint8_t> expected_mac;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
};

// Password-based key derivation parameters
struct KeyDerivationParams {
    std::vector<uint8_t> secret;
    std::vector<uint8_t> salt;
    size_t output_length{0};
    uint32_t iterations{constants::PBKDF2_ITERATIONS};
    HashAlgorithm hash_algorithm{HashAlgorithm::SHA256};
};

// AES-CBC parameters; key size selects AES-128/192/256
struct CipherParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> iv;
    bool pkcs7_padding{true};
};

// AES-CMAC parameters
struct CMACParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
};

// Digital signature parameters (ECDSA or RSA over the given hash)
struct SignatureParams {
    std::vector<uint8_t> data;
    HashAlgorithm hash{HashAlgorithm::SHA256};
    const PrivateKey* private_key{nullptr};
    const PublicKey* public_key{nullptr};
};

// Key exchange parameters, peer key as an uncompressed SEC1 point
struct KeyExchangeParams {
    std::vector<uint8_t> peer_public_key;
    const PrivateKey* private_key{nullptr};
};

// X.509 certificate creation parameters
struct CertificateParams {
    std::string common_name;
    uint32_t validity_days{365};
    bool is_ca{false};
};

// Certificate chain validation parameters; PEM encoded, leaf first
struct CertValidationParams {
    std::vector<std::string> chain;
    std::vector<std::string> trusted_roots;
    bool check_validity_period{true};
};

/**
 * Abstract base class for cryptographic providers.
 *
 * @see OpenSSLProvider for the concrete implementation.
 */
class RSP_API CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    // Provider information
    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual bool is_available() const = 0;
    virtual Result<void> initialize() = 0;
    virtual void cleanup() = 0;

    // Random number generation
    virtual Result<std::vector<uint8_t>> generate_random(const RandomParams& params) = 0;

    // Hashing and MAC
    virtual Result<std::vector<uint8_t>> compute_hash(const HashParams& params) = 0;
    virtual Result<std::vector<uint8_t>> compute_hmac(const HMACParams& params) = 0;
    virtual Result<bool> verify_hmac(const MACValidationParams& params) = 0;
    virtual Result<std::vector<uint8_t>> compute_cmac(const CMACParams& params) = 0;

    // Key derivation
    virtual Result<std::vector<uint8_t>> derive_key_pbkdf2(const KeyDerivationParams& params) = 0;

    // Block cipher
    virtual Result<std::vector<uint8_t>> aes_cbc_encrypt(const CipherParams& params,
                                                         const std::vector<uint8_t>& plaintext) = 0;
    virtual Result<std::vector<uint8_t>> aes_cbc_decrypt(const CipherParams& params,
                                                         const std::vector<uint8_t>& ciphertext) = 0;

    // Asymmetric keys
    virtual Result<std::pair<std::unique_ptr<PrivateKey>, std::unique_ptr<PublicKey>>>
        generate_key_pair(KeyType type) = 0;

    /**
     * Import a P-256 public key from its uncompressed point encoding.
     * @return INVALID_PUBLIC_KEY if the bytes are not a point on the curve
     */
    virtual Result<std::unique_ptr<PublicKey>> import_public_key(const std::vector<uint8_t>& point) = 0;

    /**
     * Export an EC public key as a 65-byte uncompressed point.
     */
    virtual Result<std::vector<uint8_t>> export_public_key(const PublicKey& key) = 0;

    virtual Result<std::vector<uint8_t>> perform_key_exchange(const KeyExchangeParams& params) = 0;

    // Signatures
    virtual Result<std::vector<uint8_t>> sign_data(const SignatureParams& params) = 0;
    virtual Result<bool> verify_signature(const SignatureParams& params,
                                          const std::vector<uint8_t>& signature) = 0;

    // Certificates (PEM)
    virtual Result<std::string> create_self_signed_certificate(const PrivateKey& key,
                                                               const CertificateParams& params) = 0;
    virtual Result<std::string> issue_certificate(const PublicKey& subject_key,
                                                  const CertificateParams& params,
                                                  const std::string& issuer_certificate,
                                                  const PrivateKey& issuer_key) = 0;
    virtual Result<std::unique_ptr<PublicKey>> extract_public_key(const std::string& certificate) = 0;
    virtual Result<std::string> certificate_common_name(const std::string& certificate) = 0;
    virtual Result<bool> validate_certificate_chain(const CertValidationParams& params) = 0;

protected:
    CryptoProvider() = default;
};

// Key interface for cryptographic keys
class RSP_API CryptoKey {
public:
    virtual ~CryptoKey() = default;
    virtual std::string algorithm() const = 0;
    virtual size_t key_size() const = 0;
    virtual KeyType key_type() const = 0;
    virtual bool is_private() const = 0;

protected:
    CryptoKey() = default;
};

// Private key interface
class RSP_API PrivateKey : public CryptoKey {
public:
    ~PrivateKey() override = default;
    bool is_private() const override { return true; }
    virtual Result<std::unique_ptr<PublicKey>> derive_public_key() const = 0;

protected:
    PrivateKey() = default;
};

// Public key interface
class RSP_API PublicKey : public CryptoKey {
public:
    ~PublicKey() override = default;
    bool is_private() const override { return false; }
    virtual bool equals(const PublicKey& other) const = 0;

protected:
    PublicKey() = default;
};

} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_PROVIDER_H
