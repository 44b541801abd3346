#ifndef RSP_CRYPTO_IDENTITY_H
#define RSP_CRYPTO_IDENTITY_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

namespace rsp {
namespace crypto {

/**
 * Simulator root certificate authority.
 *
 * RSA-2048 key with a self-signed certificate valid for 3650 days,
 * BasicConstraints CA:TRUE and KeyUsage keyCertSign/cRLSign.
 */
class RSP_API CertificateAuthority {
public:
    static constexpr uint32_t ROOT_VALIDITY_DAYS = 3650;
    static constexpr uint32_t ENTITY_VALIDITY_DAYS = 365;

    static Result<std::unique_ptr<CertificateAuthority>> create(
        std::shared_ptr<CryptoProvider> provider,
        const std::string& common_name = "RSP Simulator Root CA");

    ~CertificateAuthority();

    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    const std::string& common_name() const { return common_name_; }
    const std::string& certificate_pem() const { return certificate_pem_; }

    /**
     * Issue an end-entity certificate for subject_key.
     */
    Result<std::string> issue_certificate(const PublicKey& subject_key,
                                          const std::string& common_name,
                                          uint32_t validity_days = ENTITY_VALIDITY_DAYS);

private:
    CertificateAuthority(std::shared_ptr<CryptoProvider> provider,
                         std::string common_name,
                         std::unique_ptr<PrivateKey> key,
                         std::string certificate_pem);

    std::shared_ptr<CryptoProvider> provider_;
    std::string common_name_;
    std::unique_ptr<PrivateKey> key_;
    std::string certificate_pem_;
    std::mutex issue_mutex_;
};

/**
 * Long-lived identity of one provisioning entity: a P-256 keypair and
 * the X.509 certificate binding it to the entity name.
 *
 * Immutable after creation.
 */
class RSP_API EntityIdentity {
public:
    /**
     * P-256 keypair with a self-signed certificate, CN=name, valid from
     * now for 365 days.
     */
    static Result<std::unique_ptr<EntityIdentity>> generate_self_signed(
        std::shared_ptr<CryptoProvider> provider, const std::string& name);

    /**
     * P-256 keypair with a certificate issued by the given CA.
     */
    static Result<std::unique_ptr<EntityIdentity>> issue(
        std::shared_ptr<CryptoProvider> provider, const std::string& name, CertificateAuthority& ca);

    ~EntityIdentity();

    EntityIdentity(const EntityIdentity&) = delete;
    EntityIdentity& operator=(const EntityIdentity&) = delete;

    const std::string& name() const { return name_; }
    const std::string& certificate_pem() const { return certificate_pem_; }
    const PublicKey& public_key() const { return *public_key_; }
    bool is_self_signed() const { return self_signed_; }

    /**
     * DER-encoded ECDSA-SHA256 signature over data.
     */
    Result<std::vector<uint8_t>> sign(const std::vector<uint8_t>& data) const;

private:
    EntityIdentity(std::shared_ptr<CryptoProvider> provider,
                   std::string name,
                   std::unique_ptr<PrivateKey> private_key,
                   std::unique_ptr<PublicKey> public_key,
                   std::string certificate_pem,
                   bool self_signed);

    std::shared_ptr<CryptoProvider> provider_;
    std::string name_;
    std::unique_ptr<PrivateKey> private_key_;
    std::unique_ptr<PublicKey> public_key_;
    std::string certificate_pem_;
    bool self_signed_;
};

/**
 * Verify an ECDSA-SHA256 signature. Fails closed: any malformed input or
 * provider error yields false.
 */
RSP_API bool verify_signature(CryptoProvider& provider,
                              const std::vector<uint8_t>& signature,
                              const std::vector<uint8_t>& data,
                              const PublicKey& public_key);

/**
 * Verify a signature with the public key carried in a PEM certificate.
 * @return SIGNATURE_VERIFICATION_FAILED on any failure
 */
RSP_API Result<void> verify_certificate_signature(CryptoProvider& provider,
                                                  const std::string& certificate_pem,
                                                  const std::vector<uint8_t>& signature,
                                                  const std::vector<uint8_t>& data);

/**
 * Certificate chain verification seam.
 */
class RSP_API CertificateVerifier {
public:
    virtual ~CertificateVerifier() = default;

    /**
     * @param chain PEM certificates, leaf first
     * @return CERTIFICATE_VERIFY_FAILED when the chain does not lead to a trusted root
     */
    virtual Result<void> verify(const std::vector<std::string>& chain) = 0;
};

/**
 * Validates chains with OpenSSL X509_verify_cert against a fixed set of
 * trusted roots. Validity periods are checked.
 */
class RSP_API X509ChainVerifier : public CertificateVerifier {
public:
    X509ChainVerifier(std::shared_ptr<CryptoProvider> provider,
                      std::vector<std::string> trusted_roots);

    Result<void> verify(const std::vector<std::string>& chain) override;

    void add_trusted_root(const std::string& certificate_pem);
    size_t trusted_root_count() const;

private:
    std::shared_ptr<CryptoProvider> provider_;
    std::vector<std::string> trusted_roots_;
    mutable std::mutex roots_mutex_;
};

} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_IDENTITY_H
