#ifndef RSP_CRYPTO_ECDH_H
#define RSP_CRYPTO_ECDH_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <memory>
#include <vector>

namespace rsp {
namespace crypto {

/**
 * Per-attempt P-256 keypair used for one key establishment.
 *
 * The private key lives until release() is called or the pair is
 * destroyed; the public point stays available for receipts and logs.
 */
class RSP_API EphemeralKeyPair {
public:
    EphemeralKeyPair() = default;
    EphemeralKeyPair(std::unique_ptr<PrivateKey> private_key, std::vector<uint8_t> public_point);

    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;

    const PrivateKey* private_key() const { return private_key_.get(); }
    const std::vector<uint8_t>& public_point() const { return public_point_; }

    bool has_private_key() const { return private_key_ != nullptr; }

    // Free the private key
    void release() { private_key_.reset(); }

private:
    std::unique_ptr<PrivateKey> private_key_;
    std::vector<uint8_t> public_point_;
};

/**
 * Generate an ephemeral P-256 keypair. The public point is the 65-byte
 * uncompressed SEC1 encoding.
 */
RSP_API Result<EphemeralKeyPair> generate_keypair(CryptoProvider& provider);

/**
 * ECDH over P-256.
 * @return 32-byte shared secret, INVALID_PUBLIC_KEY for a malformed peer point
 */
RSP_API Result<std::vector<uint8_t>> compute_shared_secret(CryptoProvider& provider,
                                                           const PrivateKey& private_key,
                                                           const std::vector<uint8_t>& peer_public_point);

RSP_API Result<std::vector<uint8_t>> generate_random_challenge(CryptoProvider& provider);

} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_ECDH_H
