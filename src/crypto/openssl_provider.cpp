#include <rsp/crypto/openssl_provider.h>
#include <rsp/crypto/crypto_utils.h>

#include <openssl/opensslv.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/err.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <openssl/param_build.h>
#include <atomic>
#include <cstring>
#include <limits>
#include <mutex>

namespace rsp {
namespace crypto {

namespace {

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BIOPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using EVPPKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EVPPKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EVPCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EVPMDCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr size_t P256_POINT_SIZE = 65;
constexpr size_t AES_BLOCK_SIZE_BYTES = 16;

const EVP_MD* hash_to_md(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA384: return EVP_sha384();
        case HashAlgorithm::SHA512: return EVP_sha512();
    }
    return nullptr;
}

const EVP_CIPHER* aes_cbc_for_key(size_t key_length) {
    switch (key_length) {
        case 16: return EVP_aes_128_cbc();
        case 24: return EVP_aes_192_cbc();
        case 32: return EVP_aes_256_cbc();
        default: return nullptr;
    }
}

const char* cmac_cipher_name(size_t key_length) {
    switch (key_length) {
        case 16: return "AES-128-CBC";
        case 24: return "AES-192-CBC";
        case 32: return "AES-256-CBC";
        default: return nullptr;
    }
}

X509Ptr parse_pem_certificate(const std::string& pem) {
    BIOPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        return X509Ptr(nullptr, X509_free);
    }
    return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free);
}

Result<std::string> certificate_to_pem(X509* cert) {
    BIOPtr bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio) {
        return make_error<std::string>(RSPError::OUT_OF_MEMORY);
    }
    if (PEM_write_bio_X509(bio.get(), cert) != 1) {
        return make_error<std::string>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }
    char* data = nullptr;
    long length = BIO_get_mem_data(bio.get(), &data);
    if (length <= 0 || !data) {
        return make_error<std::string>(RSPError::CRYPTO_PROVIDER_ERROR);
    }
    return std::string(data, static_cast<size_t>(length));
}

bool add_extension(X509* cert, X509* issuer, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) {
        return false;
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

/**
 * Build and sign a v3 certificate. A null issuer produces a
 * self-signed certificate whose issuer name is its own subject.
 */
Result<std::string> build_certificate(EVP_PKEY* subject_key,
                                      const CertificateParams& params,
                                      X509* issuer,
                                      EVP_PKEY* signing_key) {
    if (params.common_name.empty() || params.validity_days == 0) {
        return make_error<std::string>(RSPError::INVALID_PARAMETER);
    }

    X509Ptr cert(X509_new(), X509_free);
    if (!cert) {
        return make_error<std::string>(RSPError::OUT_OF_MEMORY);
    }

    bool ok = X509_set_version(cert.get(), 2) == 1;

    // Random 63-bit serial
    BIGNUM* serial = BN_new();
    ok = ok && serial && BN_rand(serial, 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) == 1;
    ok = ok && BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(cert.get())) != nullptr;
    BN_free(serial);

    ok = ok && X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) != nullptr;
    ok = ok && X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                               static_cast<long>(params.validity_days) * 24 * 60 * 60) != nullptr;
    ok = ok && X509_set_pubkey(cert.get(), subject_key) == 1;

    X509_NAME* subject = X509_get_subject_name(cert.get());
    ok = ok && X509_NAME_add_entry_by_txt(subject, "CN", MBSTRING_ASC,
                                          reinterpret_cast<const unsigned char*>(params.common_name.c_str()),
                                          -1, -1, 0) == 1;
    ok = ok && X509_set_issuer_name(cert.get(),
                                    issuer ? X509_get_subject_name(issuer) : subject) == 1;
    if (!ok) {
        return make_error<std::string>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    X509* issuer_for_ext = issuer ? issuer : cert.get();
    if (params.is_ca) {
        ok = add_extension(cert.get(), issuer_for_ext, NID_basic_constraints, "critical,CA:TRUE") &&
             add_extension(cert.get(), issuer_for_ext, NID_key_usage, "critical,keyCertSign,cRLSign");
    } else {
        ok = add_extension(cert.get(), issuer_for_ext, NID_basic_constraints, "critical,CA:FALSE") &&
             add_extension(cert.get(), issuer_for_ext, NID_key_usage, "critical,digitalSignature,keyAgreement");
    }
    ok = ok && add_extension(cert.get(), issuer_for_ext, NID_subject_key_identifier, "hash");
    if (!ok) {
        return make_error<std::string>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    if (X509_sign(cert.get(), signing_key, EVP_sha256()) <= 0) {
        return make_error<std::string>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    return certificate_to_pem(cert.get());
}

} // namespace

class OpenSSLProvider::Impl {
public:
    std::atomic<bool> initialized_{false};

    Impl() = default;
    ~Impl() = default;
};

OpenSSLProvider::OpenSSLProvider()
    : pimpl_(std::make_unique<Impl>()) {}

OpenSSLProvider::~OpenSSLProvider() {
    cleanup();
}

OpenSSLProvider::OpenSSLProvider(OpenSSLProvider&& other) noexcept
    : pimpl_(std::move(other.pimpl_)) {}

OpenSSLProvider& OpenSSLProvider::operator=(OpenSSLProvider&& other) noexcept {
    if (this != &other) {
        cleanup();
        pimpl_ = std::move(other.pimpl_);
    }
    return *this;
}

std::string OpenSSLProvider::name() const {
    return "openssl";
}

std::string OpenSSLProvider::version() const {
    return OPENSSL_VERSION_TEXT;
}

bool OpenSSLProvider::is_available() const {
    return openssl_utils::is_openssl_available();
}

Result<void> OpenSSLProvider::initialize() {
    if (pimpl_->initialized_) {
        return Result<void>(RSPError::ALREADY_INITIALIZED);
    }

    auto init_result = openssl_utils::initialize_openssl();
    if (!init_result) {
        return init_result;
    }

    pimpl_->initialized_ = true;
    return Result<void>();
}

void OpenSSLProvider::cleanup() {
    if (pimpl_ && pimpl_->initialized_) {
        pimpl_->initialized_ = false;
    }
}

Result<std::vector<uint8_t>> OpenSSLProvider::generate_random(const RandomParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    if (params.length == 0 || params.length > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    if (params.cryptographically_secure && RAND_status() != 1) {
        if (RAND_poll() != 1) {
            return Result<std::vector<uint8_t>>(RSPError::RANDOM_GENERATION_FAILED);
        }
    }

    std::vector<uint8_t> random_bytes(params.length);
    if (RAND_bytes(random_bytes.data(), static_cast<int>(params.length)) != 1) {
        utils::secure_zero(random_bytes);
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::RANDOM_GENERATION_FAILED));
    }

    return Result<std::vector<uint8_t>>(std::move(random_bytes));
}

Result<std::vector<uint8_t>> OpenSSLProvider::compute_hash(const HashParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const EVP_MD* md = hash_to_md(params.algorithm);
    if (!md) {
        return Result<std::vector<uint8_t>>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(params.data.data(), params.data.size(), digest.data(), &digest_len, md, nullptr) != 1) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    digest.resize(digest_len);
    return Result<std::vector<uint8_t>>(std::move(digest));
}

Result<std::vector<uint8_t>> OpenSSLProvider::compute_hmac(const HMACParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    if (params.key.empty()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    const EVP_MD* md = hash_to_md(params.algorithm);
    if (!md) {
        return Result<std::vector<uint8_t>>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    std::vector<uint8_t> hmac(EVP_MD_get_size(md));
    unsigned int hmac_len = 0;

    unsigned char* result = HMAC(md,
                                 params.key.data(), static_cast<int>(params.key.size()),
                                 params.data.data(), params.data.size(),
                                 hmac.data(), &hmac_len);

    if (!result) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    hmac.resize(hmac_len);
    return Result<std::vector<uint8_t>>(std::move(hmac));
}

Result<bool> OpenSSLProvider::verify_hmac(const MACValidationParams& params) {
    if (!pimpl_->initialized_) {
        return Result<bool>(RSPError::NOT_INITIALIZED);
    }

    if (params.key.empty() || params.expected_mac.empty()) {
        return Result<bool>(RSPError::INVALID_PARAMETER);
    }

    HMACParams hmac_params;
    hmac_params.key = params.key;
    hmac_params.data = params.data;
    hmac_params.algorithm = params.algorithm;

    auto computed = compute_hmac(hmac_params);
    if (!computed) {
        return Result<bool>(computed.error());
    }

    return Result<bool>(utils::constant_time_compare(computed.value(), params.expected_mac));
}

Result<std::vector<uint8_t>> OpenSSLProvider::compute_cmac(const CMACParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const char* cipher_name = cmac_cipher_name(params.key.size());
    if (!cipher_name) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_KEY_LENGTH);
    }

    EVP_MAC* mac = EVP_MAC_fetch(nullptr, "CMAC", nullptr);
    if (!mac) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }
    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
    EVP_MAC_free(mac);
    if (!ctx) {
        return Result<std::vector<uint8_t>>(RSPError::OUT_OF_MEMORY);
    }

    OSSL_PARAM mac_params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_CIPHER, const_cast<char*>(cipher_name), 0),
        OSSL_PARAM_construct_end()
    };

    std::vector<uint8_t> output(AES_BLOCK_SIZE_BYTES);
    size_t output_len = 0;
    bool ok = EVP_MAC_init(ctx, params.key.data(), params.key.size(), mac_params) == 1 &&
              EVP_MAC_update(ctx, params.data.data(), params.data.size()) == 1 &&
              EVP_MAC_final(ctx, output.data(), &output_len, output.size()) == 1;
    EVP_MAC_CTX_free(ctx);

    if (!ok) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    output.resize(output_len);
    return Result<std::vector<uint8_t>>(std::move(output));
}

Result<std::vector<uint8_t>> OpenSSLProvider::derive_key_pbkdf2(const KeyDerivationParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    if (params.secret.empty()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    if (params.output_length == 0 || params.output_length > 4096) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    if (params.iterations < 1000 || params.iterations > 1000000) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    const EVP_MD* md = hash_to_md(params.hash_algorithm);
    if (!md) {
        return Result<std::vector<uint8_t>>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    std::vector<uint8_t> output(params.output_length);

    const unsigned char* salt_ptr = params.salt.empty() ? nullptr : params.salt.data();
    int salt_len = static_cast<int>(params.salt.size());

    int result = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<const char*>(params.secret.data()),
        static_cast<int>(params.secret.size()),
        salt_ptr,
        salt_len,
        static_cast<int>(params.iterations),
        md,
        static_cast<int>(params.output_length),
        output.data()
    );

    if (result != 1) {
        utils::secure_zero(output);
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::KEY_DERIVATION_FAILED));
    }

    return Result<std::vector<uint8_t>>(std::move(output));
}

Result<std::vector<uint8_t>> OpenSSLProvider::aes_cbc_encrypt(const CipherParams& params,
                                                              const std::vector<uint8_t>& plaintext) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const EVP_CIPHER* cipher = aes_cbc_for_key(params.key.size());
    if (!cipher) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_KEY_LENGTH);
    }
    if (params.iv.size() != AES_BLOCK_SIZE_BYTES) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }
    if (!params.pkcs7_padding && plaintext.size() % AES_BLOCK_SIZE_BYTES != 0) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>(RSPError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_BLOCK_SIZE_BYTES);
    int len = 0;
    int total = 0;

    bool ok = EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, params.key.data(), params.iv.data()) == 1 &&
              EVP_CIPHER_CTX_set_padding(ctx.get(), params.pkcs7_padding ? 1 : 0) == 1 &&
              EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                                plaintext.data(), static_cast<int>(plaintext.size())) == 1;
    total = len;
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) == 1;

    if (!ok) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    total += len;
    ciphertext.resize(static_cast<size_t>(total));
    return Result<std::vector<uint8_t>>(std::move(ciphertext));
}

Result<std::vector<uint8_t>> OpenSSLProvider::aes_cbc_decrypt(const CipherParams& params,
                                                              const std::vector<uint8_t>& ciphertext) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const EVP_CIPHER* cipher = aes_cbc_for_key(params.key.size());
    if (!cipher) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_KEY_LENGTH);
    }
    if (params.iv.size() != AES_BLOCK_SIZE_BYTES) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }
    if (ciphertext.empty() || ciphertext.size() % AES_BLOCK_SIZE_BYTES != 0) {
        return Result<std::vector<uint8_t>>(RSPError::DECRYPTION_FAILED);
    }

    EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>(RSPError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> plaintext(ciphertext.size() + AES_BLOCK_SIZE_BYTES);
    int len = 0;
    int total = 0;

    bool ok = EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, params.key.data(), params.iv.data()) == 1 &&
              EVP_CIPHER_CTX_set_padding(ctx.get(), params.pkcs7_padding ? 1 : 0) == 1 &&
              EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                                ciphertext.data(), static_cast<int>(ciphertext.size())) == 1;
    total = len;
    // Final fails on bad PKCS#7 padding
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) == 1;

    if (!ok) {
        ERR_clear_error();
        utils::secure_zero(plaintext);
        return Result<std::vector<uint8_t>>(RSPError::DECRYPTION_FAILED);
    }

    total += len;
    plaintext.resize(static_cast<size_t>(total));
    return Result<std::vector<uint8_t>>(std::move(plaintext));
}

Result<std::pair<std::unique_ptr<PrivateKey>, std::unique_ptr<PublicKey>>>
OpenSSLProvider::generate_key_pair(KeyType type) {
    using ReturnType = std::pair<std::unique_ptr<PrivateKey>, std::unique_ptr<PublicKey>>;

    if (!pimpl_->initialized_) {
        return Result<ReturnType>(RSPError::NOT_INITIALIZED);
    }

    EVP_PKEY_CTX* pctx = nullptr;
    int result = 1;

    switch (type) {
        case KeyType::EC_P256:
            pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
            if (pctx) {
                result = EVP_PKEY_keygen_init(pctx);
            }
            if (pctx && result == 1) {
                result = EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1);
            }
            break;

        case KeyType::RSA_2048:
            pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
            if (pctx) {
                result = EVP_PKEY_keygen_init(pctx);
            }
            if (pctx && result == 1) {
                result = EVP_PKEY_CTX_set_rsa_keygen_bits(pctx, 2048);
            }
            break;

        default:
            return Result<ReturnType>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    if (!pctx || result != 1) {
        if (pctx) EVP_PKEY_CTX_free(pctx);
        return Result<ReturnType>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    EVP_PKEY* pkey = nullptr;
    result = EVP_PKEY_keygen(pctx, &pkey);
    EVP_PKEY_CTX_free(pctx);

    if (result != 1 || !pkey) {
        return Result<ReturnType>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    auto private_key = std::make_unique<OpenSSLPrivateKey>(pkey);
    auto public_key = private_key->derive_public_key();
    if (!public_key) {
        return Result<ReturnType>(public_key.error());
    }

    return Result<ReturnType>(ReturnType(std::move(private_key), std::move(public_key.value())));
}

Result<std::unique_ptr<PublicKey>> OpenSSLProvider::import_public_key(const std::vector<uint8_t>& point) {
    if (!pimpl_->initialized_) {
        return Result<std::unique_ptr<PublicKey>>(RSPError::NOT_INITIALIZED);
    }

    // Only the uncompressed SEC1 form is accepted on the wire
    if (point.size() != P256_POINT_SIZE || point[0] != 0x04) {
        return Result<std::unique_ptr<PublicKey>>(RSPError::INVALID_PUBLIC_KEY);
    }

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1);
    EC_POINT* ec_point = group ? EC_POINT_new(group) : nullptr;
    bool on_curve = ec_point &&
                    EC_POINT_oct2point(group, ec_point, point.data(), point.size(), nullptr) == 1 &&
                    EC_POINT_is_on_curve(group, ec_point, nullptr) == 1;
    if (ec_point) EC_POINT_free(ec_point);
    if (group) EC_GROUP_free(group);

    if (!on_curve) {
        ERR_clear_error();
        return Result<std::unique_ptr<PublicKey>>(RSPError::INVALID_PUBLIC_KEY);
    }

    OSSL_PARAM_BLD* param_bld = OSSL_PARAM_BLD_new();
    OSSL_PARAM* params = nullptr;
    if (param_bld &&
        OSSL_PARAM_BLD_push_utf8_string(param_bld, OSSL_PKEY_PARAM_GROUP_NAME, "prime256v1", 0) == 1 &&
        OSSL_PARAM_BLD_push_octet_string(param_bld, OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()) == 1) {
        params = OSSL_PARAM_BLD_to_param(param_bld);
    }
    OSSL_PARAM_BLD_free(param_bld);

    if (!params) {
        return Result<std::unique_ptr<PublicKey>>(RSPError::OUT_OF_MEMORY);
    }

    EVP_PKEY* pkey = nullptr;
    EVPPKeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free);
    bool ok = ctx &&
              EVP_PKEY_fromdata_init(ctx.get()) == 1 &&
              EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params) == 1;
    OSSL_PARAM_free(params);

    if (!ok || !pkey) {
        ERR_clear_error();
        return Result<std::unique_ptr<PublicKey>>(RSPError::INVALID_PUBLIC_KEY);
    }

    return Result<std::unique_ptr<PublicKey>>(std::make_unique<OpenSSLPublicKey>(pkey));
}

Result<std::vector<uint8_t>> OpenSSLProvider::export_public_key(const PublicKey& key) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const auto* openssl_key = dynamic_cast<const OpenSSLPublicKey*>(&key);
    if (!openssl_key || !openssl_key->native_key()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }
    if (openssl_key->key_type() != KeyType::EC_P256) {
        return Result<std::vector<uint8_t>>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    std::vector<uint8_t> point(P256_POINT_SIZE);
    size_t point_len = 0;
    if (EVP_PKEY_get_octet_string_param(openssl_key->native_key(),
                                        OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY,
                                        point.data(), point.size(), &point_len) != 1) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    point.resize(point_len);
    return Result<std::vector<uint8_t>>(std::move(point));
}

Result<std::vector<uint8_t>> OpenSSLProvider::perform_key_exchange(const KeyExchangeParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    if (!params.private_key) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    const auto* openssl_private_key = dynamic_cast<const OpenSSLPrivateKey*>(params.private_key);
    if (!openssl_private_key || !openssl_private_key->native_key() ||
        openssl_private_key->key_type() != KeyType::EC_P256) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    auto peer_result = import_public_key(params.peer_public_key);
    if (!peer_result) {
        return Result<std::vector<uint8_t>>(peer_result.error());
    }
    const auto* peer_key = static_cast<const OpenSSLPublicKey*>(peer_result.value().get());

    EVPPKeyCtxPtr ctx(EVP_PKEY_CTX_new(openssl_private_key->native_key(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>(RSPError::OUT_OF_MEMORY);
    }

    size_t shared_secret_len = 0;
    int result = EVP_PKEY_derive_init(ctx.get());
    if (result == 1) {
        result = EVP_PKEY_derive_set_peer(ctx.get(), peer_key->native_key());
    }
    if (result == 1) {
        result = EVP_PKEY_derive(ctx.get(), nullptr, &shared_secret_len);
    }

    std::vector<uint8_t> shared_secret;
    if (result == 1 && shared_secret_len > 0) {
        shared_secret.resize(shared_secret_len);
        result = EVP_PKEY_derive(ctx.get(), shared_secret.data(), &shared_secret_len);
    }

    if (result != 1) {
        utils::secure_zero(shared_secret);
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::KEY_EXCHANGE_FAILED));
    }

    shared_secret.resize(shared_secret_len);
    return Result<std::vector<uint8_t>>(std::move(shared_secret));
}

Result<std::vector<uint8_t>> OpenSSLProvider::sign_data(const SignatureParams& params) {
    if (!pimpl_->initialized_) {
        return Result<std::vector<uint8_t>>(RSPError::NOT_INITIALIZED);
    }

    const auto* openssl_key = dynamic_cast<const OpenSSLPrivateKey*>(params.private_key);
    if (!openssl_key || !openssl_key->native_key()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    const EVP_MD* md = hash_to_md(params.hash);
    if (!md) {
        return Result<std::vector<uint8_t>>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    EVPMDCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>(RSPError::OUT_OF_MEMORY);
    }

    size_t sig_len = 0;
    bool ok = EVP_DigestSignInit(ctx.get(), nullptr, md, nullptr, openssl_key->native_key()) == 1 &&
              EVP_DigestSign(ctx.get(), nullptr, &sig_len, params.data.data(), params.data.size()) == 1;

    std::vector<uint8_t> signature;
    if (ok) {
        signature.resize(sig_len);
        ok = EVP_DigestSign(ctx.get(), signature.data(), &sig_len,
                            params.data.data(), params.data.size()) == 1;
    }

    if (!ok) {
        return Result<std::vector<uint8_t>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    // DER ECDSA signatures vary in length
    signature.resize(sig_len);
    return Result<std::vector<uint8_t>>(std::move(signature));
}

Result<bool> OpenSSLProvider::verify_signature(const SignatureParams& params,
                                               const std::vector<uint8_t>& signature) {
    if (!pimpl_->initialized_) {
        return Result<bool>(RSPError::NOT_INITIALIZED);
    }

    const auto* openssl_key = dynamic_cast<const OpenSSLPublicKey*>(params.public_key);
    if (!openssl_key || !openssl_key->native_key()) {
        return Result<bool>(RSPError::INVALID_PARAMETER);
    }

    const EVP_MD* md = hash_to_md(params.hash);
    if (!md) {
        return Result<bool>(RSPError::OPERATION_NOT_SUPPORTED);
    }

    if (signature.empty()) {
        return Result<bool>(false);
    }

    EVPMDCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<bool>(RSPError::OUT_OF_MEMORY);
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, openssl_key->native_key()) != 1) {
        ERR_clear_error();
        return Result<bool>(false);
    }

    // 1 = valid, 0 = mismatch, negative = malformed; only 1 is accepted
    int verify_result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                         params.data.data(), params.data.size());
    if (verify_result != 1) {
        ERR_clear_error();
    }
    return Result<bool>(verify_result == 1);
}

Result<std::string> OpenSSLProvider::create_self_signed_certificate(const PrivateKey& key,
                                                                    const CertificateParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::string>(RSPError::NOT_INITIALIZED);
    }

    const auto* openssl_key = dynamic_cast<const OpenSSLPrivateKey*>(&key);
    if (!openssl_key || !openssl_key->native_key()) {
        return make_error<std::string>(RSPError::INVALID_PARAMETER);
    }

    return build_certificate(openssl_key->native_key(), params, nullptr, openssl_key->native_key());
}

Result<std::string> OpenSSLProvider::issue_certificate(const PublicKey& subject_key,
                                                       const CertificateParams& params,
                                                       const std::string& issuer_certificate,
                                                       const PrivateKey& issuer_key) {
    if (!pimpl_->initialized_) {
        return make_error<std::string>(RSPError::NOT_INITIALIZED);
    }

    const auto* subject = dynamic_cast<const OpenSSLPublicKey*>(&subject_key);
    const auto* issuer_private = dynamic_cast<const OpenSSLPrivateKey*>(&issuer_key);
    if (!subject || !subject->native_key() || !issuer_private || !issuer_private->native_key()) {
        return make_error<std::string>(RSPError::INVALID_PARAMETER);
    }

    X509Ptr issuer = parse_pem_certificate(issuer_certificate);
    if (!issuer) {
        ERR_clear_error();
        return make_error<std::string>(RSPError::DECODE_ERROR);
    }

    return build_certificate(subject->native_key(), params, issuer.get(), issuer_private->native_key());
}

Result<std::unique_ptr<PublicKey>> OpenSSLProvider::extract_public_key(const std::string& certificate) {
    if (!pimpl_->initialized_) {
        return Result<std::unique_ptr<PublicKey>>(RSPError::NOT_INITIALIZED);
    }

    X509Ptr cert = parse_pem_certificate(certificate);
    if (!cert) {
        ERR_clear_error();
        return Result<std::unique_ptr<PublicKey>>(RSPError::DECODE_ERROR);
    }

    EVP_PKEY* pkey = X509_get_pubkey(cert.get());
    if (!pkey) {
        return Result<std::unique_ptr<PublicKey>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    return Result<std::unique_ptr<PublicKey>>(std::make_unique<OpenSSLPublicKey>(pkey));
}

Result<std::string> OpenSSLProvider::certificate_common_name(const std::string& certificate) {
    if (!pimpl_->initialized_) {
        return make_error<std::string>(RSPError::NOT_INITIALIZED);
    }

    X509Ptr cert = parse_pem_certificate(certificate);
    if (!cert) {
        ERR_clear_error();
        return make_error<std::string>(RSPError::DECODE_ERROR);
    }

    char buffer[256] = {0};
    int len = X509_NAME_get_text_by_NID(X509_get_subject_name(cert.get()), NID_commonName,
                                        buffer, sizeof(buffer));
    if (len < 0) {
        return make_error<std::string>(RSPError::DECODE_ERROR);
    }
    return std::string(buffer, static_cast<size_t>(len));
}

Result<bool> OpenSSLProvider::validate_certificate_chain(const CertValidationParams& params) {
    if (!pimpl_->initialized_) {
        return Result<bool>(RSPError::NOT_INITIALIZED);
    }

    if (params.chain.empty() || params.trusted_roots.empty()) {
        return Result<bool>(RSPError::INVALID_PARAMETER);
    }

    // Only the configured roots are trusted; no system default paths
    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store(X509_STORE_new(), X509_STORE_free);
    if (!store) {
        return Result<bool>(RSPError::OUT_OF_MEMORY);
    }

    for (const auto& root_pem : params.trusted_roots) {
        X509Ptr root = parse_pem_certificate(root_pem);
        if (!root || X509_STORE_add_cert(store.get(), root.get()) != 1) {
            ERR_clear_error();
            return Result<bool>(RSPError::DECODE_ERROR);
        }
    }

    std::vector<X509Ptr> cert_chain;
    for (const auto& cert_pem : params.chain) {
        X509Ptr cert = parse_pem_certificate(cert_pem);
        if (!cert) {
            ERR_clear_error();
            return Result<bool>(RSPError::DECODE_ERROR);
        }
        cert_chain.push_back(std::move(cert));
    }

    std::unique_ptr<STACK_OF(X509), void (*)(STACK_OF(X509)*)> untrusted(
        sk_X509_new_null(), [](STACK_OF(X509)* stack) { sk_X509_free(stack); });
    if (!untrusted) {
        return Result<bool>(RSPError::OUT_OF_MEMORY);
    }
    for (size_t i = 1; i < cert_chain.size(); ++i) {
        sk_X509_push(untrusted.get(), cert_chain[i].get());
    }

    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx(X509_STORE_CTX_new(),
                                                                        X509_STORE_CTX_free);
    if (!ctx) {
        return Result<bool>(RSPError::OUT_OF_MEMORY);
    }

    if (X509_STORE_CTX_init(ctx.get(), store.get(), cert_chain[0].get(), untrusted.get()) != 1) {
        return Result<bool>(openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    // A pinned self-signed entity certificate is its own trust anchor
    unsigned long flags = X509_V_FLAG_PARTIAL_CHAIN;
    if (!params.check_validity_period) {
        flags |= X509_V_FLAG_NO_CHECK_TIME;
    }
    X509_STORE_CTX_set_flags(ctx.get(), flags);

    int verify_result = X509_verify_cert(ctx.get());
    if (verify_result != 1) {
        ERR_clear_error();
    }
    return Result<bool>(verify_result == 1);
}

// OpenSSLPrivateKey implementation
OpenSSLPrivateKey::OpenSSLPrivateKey(EVP_PKEY* key) : key_(key) {}

OpenSSLPrivateKey::~OpenSSLPrivateKey() {
    if (key_) {
        EVP_PKEY_free(key_);
    }
}

OpenSSLPrivateKey::OpenSSLPrivateKey(OpenSSLPrivateKey&& other) noexcept : key_(other.key_) {
    other.key_ = nullptr;
}

OpenSSLPrivateKey& OpenSSLPrivateKey::operator=(OpenSSLPrivateKey&& other) noexcept {
    if (this != &other) {
        if (key_) {
            EVP_PKEY_free(key_);
        }
        key_ = other.key_;
        other.key_ = nullptr;
    }
    return *this;
}

std::string OpenSSLPrivateKey::algorithm() const {
    if (!key_) return "none";
    return EVP_PKEY_get_base_id(key_) == EVP_PKEY_EC ? "EC" : "RSA";
}

size_t OpenSSLPrivateKey::key_size() const {
    return key_ ? static_cast<size_t>(EVP_PKEY_get_bits(key_)) : 0;
}

KeyType OpenSSLPrivateKey::key_type() const {
    return (key_ && EVP_PKEY_get_base_id(key_) == EVP_PKEY_RSA) ? KeyType::RSA_2048 : KeyType::EC_P256;
}

Result<std::unique_ptr<PublicKey>> OpenSSLPrivateKey::derive_public_key() const {
    if (!key_) {
        return Result<std::unique_ptr<PublicKey>>(RSPError::INVALID_PARAMETER);
    }

    // Round-trip through SubjectPublicKeyInfo so the public wrapper holds no private material
    unsigned char* der = nullptr;
    int der_len = i2d_PUBKEY(key_, &der);
    if (der_len <= 0 || !der) {
        return Result<std::unique_ptr<PublicKey>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    const unsigned char* cursor = der;
    EVP_PKEY* public_only = d2i_PUBKEY(nullptr, &cursor, der_len);
    OPENSSL_free(der);

    if (!public_only) {
        return Result<std::unique_ptr<PublicKey>>(
            openssl_utils::map_openssl_error(RSPError::CRYPTO_PROVIDER_ERROR));
    }

    return Result<std::unique_ptr<PublicKey>>(std::make_unique<OpenSSLPublicKey>(public_only));
}

// OpenSSLPublicKey implementation
OpenSSLPublicKey::OpenSSLPublicKey(EVP_PKEY* key) : key_(key) {}

OpenSSLPublicKey::~OpenSSLPublicKey() {
    if (key_) {
        EVP_PKEY_free(key_);
    }
}

OpenSSLPublicKey::OpenSSLPublicKey(OpenSSLPublicKey&& other) noexcept : key_(other.key_) {
    other.key_ = nullptr;
}

OpenSSLPublicKey& OpenSSLPublicKey::operator=(OpenSSLPublicKey&& other) noexcept {
    if (this != &other) {
        if (key_) {
            EVP_PKEY_free(key_);
        }
        key_ = other.key_;
        other.key_ = nullptr;
    }
    return *this;
}

std::string OpenSSLPublicKey::algorithm() const {
    if (!key_) return "none";
    return EVP_PKEY_get_base_id(key_) == EVP_PKEY_EC ? "EC" : "RSA";
}

size_t OpenSSLPublicKey::key_size() const {
    return key_ ? static_cast<size_t>(EVP_PKEY_get_bits(key_)) : 0;
}

KeyType OpenSSLPublicKey::key_type() const {
    return (key_ && EVP_PKEY_get_base_id(key_) == EVP_PKEY_RSA) ? KeyType::RSA_2048 : KeyType::EC_P256;
}

bool OpenSSLPublicKey::equals(const PublicKey& other) const {
    const auto* openssl_other = dynamic_cast<const OpenSSLPublicKey*>(&other);
    if (!openssl_other || !key_ || !openssl_other->key_) {
        return false;
    }
    return EVP_PKEY_eq(key_, openssl_other->key_) == 1;
}

// OpenSSL utility functions
namespace openssl_utils {

Result<void> initialize_openssl() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() {
        init_ok = OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS |
                                      OPENSSL_INIT_ADD_ALL_CIPHERS |
                                      OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr) == 1;
    });
    if (!init_ok) {
        return Result<void>(RSPError::CRYPTO_PROVIDER_ERROR);
    }
    return Result<void>();
}

bool is_openssl_available() {
    return OpenSSL_version_num() >= 0x30000000L;
}

std::string get_openssl_version() {
    return OpenSSL_version(OPENSSL_VERSION);
}

RSPError map_openssl_error(RSPError fallback) {
    unsigned long openssl_error = ERR_get_error();
    ERR_clear_error();
    if (openssl_error != 0 && ERR_GET_REASON(openssl_error) == ERR_R_MALLOC_FAILURE) {
        return RSPError::OUT_OF_MEMORY;
    }
    return fallback;
}

} // namespace openssl_utils
} // namespace crypto
} // namespace rsp
