#include <rsp/crypto/identity.h>

namespace rsp {
namespace crypto {

// CertificateAuthority implementation
CertificateAuthority::CertificateAuthority(std::shared_ptr<CryptoProvider> provider,
                                           std::string common_name,
                                           std::unique_ptr<PrivateKey> key,
                                           std::string certificate_pem)
    : provider_(std::move(provider))
    , common_name_(std::move(common_name))
    , key_(std::move(key))
    , certificate_pem_(std::move(certificate_pem)) {}

CertificateAuthority::~CertificateAuthority() = default;

Result<std::unique_ptr<CertificateAuthority>> CertificateAuthority::create(
    std::shared_ptr<CryptoProvider> provider, const std::string& common_name) {
    using ReturnType = std::unique_ptr<CertificateAuthority>;

    if (!provider) {
        return make_error<ReturnType>(RSPError::INVALID_PARAMETER);
    }

    auto key_pair = provider->generate_key_pair(KeyType::RSA_2048);
    if (!key_pair) {
        return make_error<ReturnType>(key_pair.error());
    }

    CertificateParams params;
    params.common_name = common_name;
    params.validity_days = ROOT_VALIDITY_DAYS;
    params.is_ca = true;

    auto certificate = provider->create_self_signed_certificate(*key_pair->first, params);
    if (!certificate) {
        return make_error<ReturnType>(certificate.error());
    }

    return Result<ReturnType>(ReturnType(new CertificateAuthority(
        std::move(provider), common_name, std::move(key_pair->first), std::move(*certificate))));
}

Result<std::string> CertificateAuthority::issue_certificate(const PublicKey& subject_key,
                                                            const std::string& common_name,
                                                            uint32_t validity_days) {
    CertificateParams params;
    params.common_name = common_name;
    params.validity_days = validity_days;
    params.is_ca = false;

    std::lock_guard<std::mutex> lock(issue_mutex_);
    return provider_->issue_certificate(subject_key, params, certificate_pem_, *key_);
}

// EntityIdentity implementation
EntityIdentity::EntityIdentity(std::shared_ptr<CryptoProvider> provider,
                               std::string name,
                               std::unique_ptr<PrivateKey> private_key,
                               std::unique_ptr<PublicKey> public_key,
                               std::string certificate_pem,
                               bool self_signed)
    : provider_(std::move(provider))
    , name_(std::move(name))
    , private_key_(std::move(private_key))
    , public_key_(std::move(public_key))
    , certificate_pem_(std::move(certificate_pem))
    , self_signed_(self_signed) {}

EntityIdentity::~EntityIdentity() = default;

Result<std::unique_ptr<EntityIdentity>> EntityIdentity::generate_self_signed(
    std::shared_ptr<CryptoProvider> provider, const std::string& name) {
    using ReturnType = std::unique_ptr<EntityIdentity>;

    if (!provider || name.empty()) {
        return make_error<ReturnType>(RSPError::INVALID_PARAMETER);
    }

    auto key_pair = provider->generate_key_pair(KeyType::EC_P256);
    if (!key_pair) {
        return make_error<ReturnType>(key_pair.error());
    }

    CertificateParams params;
    params.common_name = name;
    params.validity_days = CertificateAuthority::ENTITY_VALIDITY_DAYS;

    auto certificate = provider->create_self_signed_certificate(*key_pair->first, params);
    if (!certificate) {
        return make_error<ReturnType>(certificate.error());
    }

    return Result<ReturnType>(ReturnType(new EntityIdentity(
        std::move(provider), name, std::move(key_pair->first), std::move(key_pair->second),
        std::move(*certificate), true)));
}

Result<std::unique_ptr<EntityIdentity>> EntityIdentity::issue(
    std::shared_ptr<CryptoProvider> provider, const std::string& name, CertificateAuthority& ca) {
    using ReturnType = std::unique_ptr<EntityIdentity>;

    if (!provider || name.empty()) {
        return make_error<ReturnType>(RSPError::INVALID_PARAMETER);
    }

    auto key_pair = provider->generate_key_pair(KeyType::EC_P256);
    if (!key_pair) {
        return make_error<ReturnType>(key_pair.error());
    }

    auto certificate = ca.issue_certificate(*key_pair->second, name);
    if (!certificate) {
        return make_error<ReturnType>(certificate.error());
    }

    return Result<ReturnType>(ReturnType(new EntityIdentity(
        std::move(provider), name, std::move(key_pair->first), std::move(key_pair->second),
        std::move(*certificate), false)));
}

Result<std::vector<uint8_t>> EntityIdentity::sign(const std::vector<uint8_t>& data) const {
    SignatureParams params;
    params.data = data;
    params.hash = HashAlgorithm::SHA256;
    params.private_key = private_key_.get();

    return provider_->sign_data(params);
}

bool verify_signature(CryptoProvider& provider,
                      const std::vector<uint8_t>& signature,
                      const std::vector<uint8_t>& data,
                      const PublicKey& public_key) {
    SignatureParams params;
    params.data = data;
    params.hash = HashAlgorithm::SHA256;
    params.public_key = &public_key;

    auto result = provider.verify_signature(params, signature);
    return result.is_success() && result.value();
}

Result<void> verify_certificate_signature(CryptoProvider& provider,
                                          const std::string& certificate_pem,
                                          const std::vector<uint8_t>& signature,
                                          const std::vector<uint8_t>& data) {
    auto public_key = provider.extract_public_key(certificate_pem);
    if (!public_key) {
        return Result<void>(RSPError::SIGNATURE_VERIFICATION_FAILED);
    }

    if (!verify_signature(provider, signature, data, **public_key)) {
        return Result<void>(RSPError::SIGNATURE_VERIFICATION_FAILED);
    }
    return Result<void>();
}

// X509ChainVerifier implementation
X509ChainVerifier::X509ChainVerifier(std::shared_ptr<CryptoProvider> provider,
                                     std::vector<std::string> trusted_roots)
    : provider_(std::move(provider))
    , trusted_roots_(std::move(trusted_roots)) {}

Result<void> X509ChainVerifier::verify(const std::vector<std::string>& chain) {
    CertValidationParams params;
    params.chain = chain;
    params.check_validity_period = true;
    {
        std::lock_guard<std::mutex> lock(roots_mutex_);
        params.trusted_roots = trusted_roots_;
    }

    if (!provider_ || chain.empty() || params.trusted_roots.empty()) {
        return Result<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }

    auto result = provider_->validate_certificate_chain(params);
    if (!result) {
        if (result.error() == RSPError::NOT_INITIALIZED) {
            return Result<void>(RSPError::NOT_INITIALIZED);
        }
        return Result<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }
    if (!result.value()) {
        return Result<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }
    return Result<void>();
}

void X509ChainVerifier::add_trusted_root(const std::string& certificate_pem) {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    trusted_roots_.push_back(certificate_pem);
}

size_t X509ChainVerifier::trusted_root_count() const {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    return trusted_roots_.size();
}

} // namespace crypto
} // namespace rsp
