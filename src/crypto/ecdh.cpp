#include <rsp/crypto/ecdh.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/types.h>

namespace rsp {
namespace crypto {

EphemeralKeyPair::EphemeralKeyPair(std::unique_ptr<PrivateKey> private_key,
                                   std::vector<uint8_t> public_point)
    : private_key_(std::move(private_key))
    , public_point_(std::move(public_point)) {}

Result<EphemeralKeyPair> generate_keypair(CryptoProvider& provider) {
    auto key_pair = provider.generate_key_pair(KeyType::EC_P256);
    if (!key_pair) {
        return Result<EphemeralKeyPair>(key_pair.error());
    }

    auto point = provider.export_public_key(*key_pair->second);
    if (!point) {
        return Result<EphemeralKeyPair>(point.error());
    }

    return Result<EphemeralKeyPair>(EphemeralKeyPair(std::move(key_pair->first), std::move(*point)));
}

Result<std::vector<uint8_t>> compute_shared_secret(CryptoProvider& provider,
                                                   const PrivateKey& private_key,
                                                   const std::vector<uint8_t>& peer_public_point) {
    KeyExchangeParams params;
    params.peer_public_key = peer_public_point;
    params.private_key = &private_key;

    return provider.perform_key_exchange(params);
}

Result<std::vector<uint8_t>> generate_random_challenge(CryptoProvider& provider) {
    return utils::random_bytes(provider, constants::RANDOM_CHALLENGE_SIZE);
}

} // namespace crypto
} // namespace rsp
