#include <rsp/crypto/kdf.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/types.h>

#include <limits>

namespace rsp {
namespace crypto {

namespace {

constexpr size_t HMAC_SHA256_SIZE = 32;

} // namespace

void DerivedKeySet::clear() {
    utils::secure_zero(encryption_key);
    utils::secure_zero(mac_key);
    utils::secure_zero(key_protection_key);
}

Result<std::vector<uint8_t>> derive_key(CryptoProvider& provider,
                                        const std::vector<uint8_t>& key,
                                        size_t output_length,
                                        const std::string& key_type,
                                        const std::vector<uint8_t>& context) {
    if (key.empty() || output_length == 0 || key_type.empty()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }
    if (output_length > std::numeric_limits<uint32_t>::max() / 8) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    const std::string label = std::string(constants::KDF_LABEL_PREFIX) + key_type;

    // Fixed input data after the counter
    std::vector<uint8_t> fixed_input;
    utils::append(fixed_input, label);
    fixed_input.push_back(0x00);
    utils::append(fixed_input, context);
    utils::append_be32(fixed_input, static_cast<uint32_t>(output_length * 8));

    const size_t blocks = (output_length + HMAC_SHA256_SIZE - 1) / HMAC_SHA256_SIZE;

    std::vector<uint8_t> output;
    output.reserve(blocks * HMAC_SHA256_SIZE);

    for (uint32_t counter = 1; counter <= blocks; ++counter) {
        std::vector<uint8_t> block_input;
        block_input.reserve(4 + fixed_input.size());
        utils::append_be32(block_input, counter);
        utils::append(block_input, fixed_input);

        auto block = utils::hmac_sha256(provider, key, block_input);
        if (!block) {
            utils::secure_zero(output);
            return Result<std::vector<uint8_t>>(block.error() == RSPError::NOT_INITIALIZED
                                                    ? RSPError::NOT_INITIALIZED
                                                    : RSPError::KEY_DERIVATION_FAILED);
        }
        utils::append(output, *block);
    }

    output.resize(output_length);
    return Result<std::vector<uint8_t>>(std::move(output));
}

Result<DerivedKeySet> derive_profile_keys(CryptoProvider& provider,
                                          const std::vector<uint8_t>& shared_secret) {
    const auto context = utils::to_bytes(constants::KEY_AGREEMENT_CONTEXT);

    auto ke = derive_key(provider, shared_secret, constants::DERIVED_KEY_SIZE, "encryption_key", context);
    if (!ke) {
        return Result<DerivedKeySet>(ke.error());
    }
    auto km = derive_key(provider, shared_secret, constants::DERIVED_KEY_SIZE, "mac_key", context);
    if (!km) {
        return Result<DerivedKeySet>(km.error());
    }
    auto ku = derive_key(provider, shared_secret, constants::DERIVED_KEY_SIZE, "key_protection_key", context);
    if (!ku) {
        return Result<DerivedKeySet>(ku.error());
    }

    DerivedKeySet keys;
    keys.encryption_key = std::move(*ke);
    keys.mac_key = std::move(*km);
    keys.key_protection_key = std::move(*ku);
    return Result<DerivedKeySet>(std::move(keys));
}

} // namespace crypto
} // namespace rsp
