#include <rsp/protocol/psk_cipher.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/types.h>

namespace rsp {
namespace protocol {
namespace psk_cipher {

namespace {

Result<std::vector<uint8_t>> derive_pbkdf2(crypto::CryptoProvider& provider,
                                           const std::vector<uint8_t>& psk,
                                           const std::vector<uint8_t>& salt) {
    crypto::KeyDerivationParams params;
    params.secret = psk;
    params.salt = salt;
    params.output_length = DERIVED_KEY_SIZE;
    params.iterations = constants::PBKDF2_ITERATIONS;
    params.hash_algorithm = crypto::HashAlgorithm::SHA256;
    return provider.derive_key_pbkdf2(params);
}

std::vector<uint8_t> mac_key_salt(const std::vector<uint8_t>& iv) {
    std::vector<uint8_t> salt = iv;
    crypto::utils::append(salt, std::string(MAC_KEY_SALT_SUFFIX));
    return salt;
}

Result<std::vector<uint8_t>> decode_field(const nlohmann::json& value, const char* field, bool required) {
    auto it = value.find(field);
    if (it == value.end()) {
        if (required) {
            return Result<std::vector<uint8_t>>(RSPError::INVALID_MESSAGE_FORMAT);
        }
        return Result<std::vector<uint8_t>>(std::vector<uint8_t>());
    }
    if (!it->is_string()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    return crypto::utils::base64_decode(it->get<std::string>());
}

} // namespace

nlohmann::json EncryptedPayload::to_json() const {
    nlohmann::json value = {
        {"iv", crypto::utils::base64_encode(iv)},
        {"data", crypto::utils::base64_encode(data)},
        {"key_type", key_type}
    };
    if (has_mac()) {
        value["mac"] = crypto::utils::base64_encode(mac);
    }
    return value;
}

Result<EncryptedPayload> EncryptedPayload::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Result<EncryptedPayload>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    EncryptedPayload payload;

    auto iv = decode_field(value, "iv", true);
    if (!iv) {
        return Result<EncryptedPayload>(iv.error());
    }
    auto data = decode_field(value, "data", true);
    if (!data) {
        return Result<EncryptedPayload>(data.error());
    }
    auto mac = decode_field(value, "mac", false);
    if (!mac) {
        return Result<EncryptedPayload>(mac.error());
    }

    payload.iv = std::move(*iv);
    payload.data = std::move(*data);
    payload.mac = std::move(*mac);

    auto key_type = value.find("key_type");
    if (key_type != value.end()) {
        if (!key_type->is_string()) {
            return Result<EncryptedPayload>(RSPError::INVALID_MESSAGE_FORMAT);
        }
        payload.key_type = key_type->get<std::string>();
    }

    return Result<EncryptedPayload>(std::move(payload));
}

Result<std::string> key_type_for(const std::vector<uint8_t>& psk) {
    switch (psk.size()) {
        case 16: return std::string("AES-128");
        case 32: return std::string("AES-256");
        default: return make_error<std::string>(RSPError::INVALID_KEY_LENGTH);
    }
}

Result<EncryptedPayload> encrypt_bytes(crypto::CryptoProvider& provider,
                                       const std::vector<uint8_t>& plaintext,
                                       const std::vector<uint8_t>& psk,
                                       bool include_mac) {
    auto key_type = key_type_for(psk);
    if (!key_type) {
        return Result<EncryptedPayload>(key_type.error());
    }

    auto iv = crypto::utils::random_bytes(provider, IV_SIZE);
    if (!iv) {
        return Result<EncryptedPayload>(iv.error());
    }

    auto encryption_key = derive_pbkdf2(provider, psk, *iv);
    if (!encryption_key) {
        return Result<EncryptedPayload>(encryption_key.error());
    }

    crypto::CipherParams cipher_params;
    cipher_params.key = *encryption_key;
    cipher_params.iv = *iv;
    cipher_params.pkcs7_padding = true;

    auto ciphertext = provider.aes_cbc_encrypt(cipher_params, plaintext);
    crypto::utils::secure_zero(cipher_params.key);
    crypto::utils::secure_zero(*encryption_key);
    if (!ciphertext) {
        return Result<EncryptedPayload>(ciphertext.error());
    }

    EncryptedPayload payload;
    payload.iv = std::move(*iv);
    payload.data = std::move(*ciphertext);
    payload.key_type = std::move(*key_type);

    if (include_mac) {
        auto mac_key = derive_pbkdf2(provider, psk, mac_key_salt(payload.iv));
        if (!mac_key) {
            return Result<EncryptedPayload>(mac_key.error());
        }

        std::vector<uint8_t> authenticated = payload.iv;
        crypto::utils::append(authenticated, payload.data);

        auto mac = crypto::utils::hmac_sha256(provider, *mac_key, authenticated);
        crypto::utils::secure_zero(*mac_key);
        if (!mac) {
            return Result<EncryptedPayload>(mac.error());
        }
        payload.mac = std::move(*mac);
    }

    return Result<EncryptedPayload>(std::move(payload));
}

Result<EncryptedPayload> encrypt(crypto::CryptoProvider& provider,
                                 const nlohmann::json& value,
                                 const std::vector<uint8_t>& psk,
                                 bool include_mac) {
    return encrypt_bytes(provider, crypto::utils::to_bytes(value.dump()), psk, include_mac);
}

Result<std::vector<uint8_t>> decrypt_bytes(crypto::CryptoProvider& provider,
                                           const EncryptedPayload& payload,
                                           const std::vector<uint8_t>& psk,
                                           bool allow_unauthenticated) {
    auto key_type = key_type_for(psk);
    if (!key_type) {
        return Result<std::vector<uint8_t>>(key_type.error());
    }

    if (payload.iv.size() != IV_SIZE) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    if (payload.has_mac()) {
        auto mac_key = derive_pbkdf2(provider, psk, mac_key_salt(payload.iv));
        if (!mac_key) {
            return Result<std::vector<uint8_t>>(mac_key.error());
        }

        crypto::MACValidationParams mac_params;
        mac_params.key = std::move(*mac_key);
        mac_params.data = payload.iv;
        crypto::utils::append(mac_params.data, payload.data);
        mac_params.expected_mac = payload.mac;
        mac_params.algorithm = crypto::HashAlgorithm::SHA256;

        auto valid = provider.verify_hmac(mac_params);
        crypto::utils::secure_zero(mac_params.key);
        if (!valid) {
            return Result<std::vector<uint8_t>>(valid.error());
        }
        if (!*valid) {
            return Result<std::vector<uint8_t>>(RSPError::MAC_VERIFICATION_FAILED);
        }
    } else if (!allow_unauthenticated) {
        return Result<std::vector<uint8_t>>(RSPError::MAC_VERIFICATION_FAILED);
    }

    auto encryption_key = derive_pbkdf2(provider, psk, payload.iv);
    if (!encryption_key) {
        return Result<std::vector<uint8_t>>(encryption_key.error());
    }

    crypto::CipherParams cipher_params;
    cipher_params.key = std::move(*encryption_key);
    cipher_params.iv = payload.iv;
    cipher_params.pkcs7_padding = true;

    auto plaintext = provider.aes_cbc_decrypt(cipher_params, payload.data);
    crypto::utils::secure_zero(cipher_params.key);
    return plaintext;
}

Result<nlohmann::json> decrypt(crypto::CryptoProvider& provider,
                               const EncryptedPayload& payload,
                               const std::vector<uint8_t>& psk,
                               bool allow_unauthenticated) {
    auto plaintext = decrypt_bytes(provider, payload, psk, allow_unauthenticated);
    if (!plaintext) {
        return Result<nlohmann::json>(plaintext.error());
    }

    auto value = nlohmann::json::parse(plaintext->begin(), plaintext->end(), nullptr, false);
    crypto::utils::secure_zero(*plaintext);
    if (value.is_discarded()) {
        return Result<nlohmann::json>(RSPError::DECODE_ERROR);
    }
    return Result<nlohmann::json>(std::move(value));
}

} // namespace psk_cipher
} // namespace protocol
} // namespace rsp
