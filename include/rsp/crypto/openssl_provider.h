#ifndef RSP_CRYPTO_OPENSSL_PROVIDER_H
#define RSP_CRYPTO_OPENSSL_PROVIDER_H

#include <rsp/config.h>
#include <rsp/crypto/provider.h>
#include <memory>

// Forward declarations for OpenSSL types
struct evp_pkey_st;
typedef struct evp_pkey_st EVP_PKEY;

namespace rsp {
namespace crypto {

/**
 * OpenSSL-based cryptographic provider implementation
 *
 * Requires OpenSSL 3.0 or later (EVP_MAC for CMAC, EVP_PKEY_fromdata
 * for point import).
 */
class RSP_API OpenSSLProvider : public CryptoProvider {
public:
    OpenSSLProvider();
    ~OpenSSLProvider() override;

    // Non-copyable, movable
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    OpenSSLProvider(OpenSSLProvider&&) noexcept;
    OpenSSLProvider& operator=(OpenSSLProvider&&) noexcept;

    // Provider information
    std::string name() const override;
    std::string version() const override;
    bool is_available() const override;
    Result<void> initialize() override;
    void cleanup() override;

    Result<std::vector<uint8_t>> generate_random(const RandomParams& params) override;

    Result<std::vector<uint8_t>> compute_hash(const HashParams& params) override;
    Result<std::vector<uint8_t>> compute_hmac(const HMACParams& params) override;
    Result<bool> verify_hmac(const MACValidationParams& params) override;
    Result<std::vector<uint8_t>> compute_cmac(const CMACParams& params) override;

    Result<std::vector<uint8_t>> derive_key_pbkdf2(const KeyDerivationParams& params) override;

    Result<std::vector<uint8_t>> aes_cbc_encrypt(const CipherParams& params,
                                                 const std::vector<uint8_t>& plaintext) override;
    Result<std::vector<uint8_t>> aes_cbc_decrypt(const CipherParams& params,
                                                 const std::vector<uint8_t>& ciphertext) override;

    Result<std::pair<std::unique_ptr<PrivateKey>, std::unique_ptr<PublicKey>>>
        generate_key_pair(KeyType type) override;
    Result<std::unique_ptr<PublicKey>> import_public_key(const std::vector<uint8_t>& point) override;
    Result<std::vector<uint8_t>> export_public_key(const PublicKey& key) override;
    Result<std::vector<uint8_t>> perform_key_exchange(const KeyExchangeParams& params) override;

    Result<std::vector<uint8_t>> sign_data(const SignatureParams& params) override;
    Result<bool> verify_signature(const SignatureParams& params,
                                  const std::vector<uint8_t>& signature) override;

    Result<std::string> create_self_signed_certificate(const PrivateKey& key,
                                                       const CertificateParams& params) override;
    Result<std::string> issue_certificate(const PublicKey& subject_key,
                                          const CertificateParams& params,
                                          const std::string& issuer_certificate,
                                          const PrivateKey& issuer_key) override;
    Result<std::unique_ptr<PublicKey>> extract_public_key(const std::string& certificate) override;
    Result<std::string> certificate_common_name(const std::string& certificate) override;
    Result<bool> validate_certificate_chain(const CertValidationParams& params) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * OpenSSL private key implementation
 */
class RSP_API OpenSSLPrivateKey : public PrivateKey {
public:
    explicit OpenSSLPrivateKey(EVP_PKEY* key);
    ~OpenSSLPrivateKey() override;

    // Non-copyable, movable
    OpenSSLPrivateKey(const OpenSSLPrivateKey&) = delete;
    OpenSSLPrivateKey& operator=(const OpenSSLPrivateKey&) = delete;
    OpenSSLPrivateKey(OpenSSLPrivateKey&&) noexcept;
    OpenSSLPrivateKey& operator=(OpenSSLPrivateKey&&) noexcept;

    // CryptoKey interface
    std::string algorithm() const override;
    size_t key_size() const override;
    KeyType key_type() const override;

    // PrivateKey interface
    Result<std::unique_ptr<PublicKey>> derive_public_key() const override;

    // OpenSSL-specific access
    EVP_PKEY* native_key() const { return key_; }

private:
    EVP_PKEY* key_;
};

/**
 * OpenSSL public key implementation
 */
class RSP_API OpenSSLPublicKey : public PublicKey {
public:
    explicit OpenSSLPublicKey(EVP_PKEY* key);
    ~OpenSSLPublicKey() override;

    // Non-copyable, movable
    OpenSSLPublicKey(const OpenSSLPublicKey&) = delete;
    OpenSSLPublicKey& operator=(const OpenSSLPublicKey&) = delete;
    OpenSSLPublicKey(OpenSSLPublicKey&&) noexcept;
    OpenSSLPublicKey& operator=(OpenSSLPublicKey&&) noexcept;

    // CryptoKey interface
    std::string algorithm() const override;
    size_t key_size() const override;
    KeyType key_type() const override;

    // PublicKey interface
    bool equals(const PublicKey& other) const override;

    // OpenSSL-specific access
    EVP_PKEY* native_key() const { return key_; }

private:
    EVP_PKEY* key_;
};

// OpenSSL utility functions
namespace openssl_utils {

/**
 * Initialize OpenSSL library
 */
RSP_API Result<void> initialize_openssl();

/**
 * Check if OpenSSL is available and properly configured
 */
RSP_API bool is_openssl_available();

/**
 * Get OpenSSL version information
 */
RSP_API std::string get_openssl_version();

/**
 * Convert the queued OpenSSL error to an RSPError and clear the queue
 */
RSP_API RSPError map_openssl_error(RSPError fallback);

} // namespace openssl_utils
} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_OPENSSL_PROVIDER_H
