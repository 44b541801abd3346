#ifndef RSP_CRYPTO_KDF_H
#define RSP_CRYPTO_KDF_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <string>
#include <vector>

namespace rsp {
namespace crypto {

/**
 * The three profile keys agreed during key establishment.
 */
struct DerivedKeySet {
    std::vector<uint8_t> encryption_key;       // Ke
    std::vector<uint8_t> mac_key;              // Km
    std::vector<uint8_t> key_protection_key;   // Ku

    bool operator==(const DerivedKeySet& other) const {
        return encryption_key == other.encryption_key &&
               mac_key == other.mac_key &&
               key_protection_key == other.key_protection_key;
    }
    bool operator!=(const DerivedKeySet& other) const { return !(*this == other); }

    void clear();
};

/**
 * NIST SP 800-108 counter-mode KDF with HMAC-SHA256 as the PRF.
 *
 * Block i (starting at 1) is
 *   HMAC(key, BE32(i) || "M2M_RSP_" key_type || 0x00 || context || BE32(output_length * 8))
 * and the blocks are concatenated and truncated to output_length.
 */
RSP_API Result<std::vector<uint8_t>> derive_key(CryptoProvider& provider,
                                                const std::vector<uint8_t>& key,
                                                size_t output_length,
                                                const std::string& key_type,
                                                const std::vector<uint8_t>& context);

/**
 * Derive {Ke, Km, Ku} from an ECDH shared secret with context "scp03t".
 */
RSP_API Result<DerivedKeySet> derive_profile_keys(CryptoProvider& provider,
                                                  const std::vector<uint8_t>& shared_secret);

} // namespace crypto
} // namespace rsp

#endif // RSP_CRYPTO_KDF_H
