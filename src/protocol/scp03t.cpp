#include <rsp/protocol/scp03t.h>
#include <rsp/crypto/kdf.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/types.h>

namespace rsp {
namespace protocol {
namespace scp03t {

namespace {

std::vector<uint8_t> effective_icv(const std::vector<uint8_t>& icv) {
    return icv.empty() ? std::vector<uint8_t>(BLOCK_SIZE, 0x00) : icv;
}

} // namespace

void SessionKeys::clear() {
    crypto::utils::secure_zero(s_enc);
    crypto::utils::secure_zero(s_mac);
    crypto::utils::secure_zero(s_rmac);
}

Result<SessionKeys> derive_session_keys(crypto::CryptoProvider& provider,
                                        const std::vector<uint8_t>& shared_secret,
                                        const std::string& host_id,
                                        const std::string& card_id,
                                        const std::vector<uint8_t>& host_challenge,
                                        const std::vector<uint8_t>& card_challenge) {
    std::vector<uint8_t> context;
    crypto::utils::append(context, host_challenge);
    crypto::utils::append(context, card_challenge);
    crypto::utils::append(context, host_id);
    crypto::utils::append(context, card_id);

    SessionKeys keys;
    const struct {
        const char* key_type;
        std::vector<uint8_t>* target;
    } derivations[] = {
        {"s_enc", &keys.s_enc},
        {"s_mac", &keys.s_mac},
        {"s_rmac", &keys.s_rmac},
    };

    for (const auto& derivation : derivations) {
        auto key = crypto::derive_key(provider, shared_secret, constants::SCP03T_SESSION_KEY_SIZE,
                                      derivation.key_type, context);
        if (!key) {
            keys.clear();
            return Result<SessionKeys>(key.error());
        }
        *derivation.target = std::move(*key);
    }

    return Result<SessionKeys>(std::move(keys));
}

Result<std::vector<uint8_t>> encrypt_command(crypto::CryptoProvider& provider,
                                             const std::vector<uint8_t>& data,
                                             const std::vector<uint8_t>& s_enc,
                                             const std::vector<uint8_t>& icv) {
    crypto::CipherParams params;
    params.key = s_enc;
    params.iv = effective_icv(icv);
    params.pkcs7_padding = true;

    return provider.aes_cbc_encrypt(params, data);
}

Result<std::vector<uint8_t>> decrypt_response(crypto::CryptoProvider& provider,
                                              const std::vector<uint8_t>& ciphertext,
                                              const std::vector<uint8_t>& s_enc,
                                              const std::vector<uint8_t>& icv) {
    if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>>(RSPError::DECRYPTION_FAILED);
    }

    crypto::CipherParams params;
    params.key = s_enc;
    params.iv = effective_icv(icv);
    params.pkcs7_padding = true;

    return provider.aes_cbc_decrypt(params, ciphertext);
}

Result<std::vector<uint8_t>> calculate_mac(crypto::CryptoProvider& provider,
                                           const std::vector<uint8_t>& data,
                                           const std::vector<uint8_t>& s_mac,
                                           const std::vector<uint8_t>& counter) {
    crypto::CMACParams params;
    params.key = s_mac;
    params.data.reserve(counter.size() + data.size());
    crypto::utils::append(params.data, counter);
    crypto::utils::append(params.data, data);

    auto cmac = provider.compute_cmac(params);
    if (!cmac) {
        return cmac;
    }

    cmac->resize(MAC_SIZE);
    return cmac;
}

Result<void> verify_mac(crypto::CryptoProvider& provider,
                        const std::vector<uint8_t>& data,
                        const std::vector<uint8_t>& s_mac,
                        const std::vector<uint8_t>& mac,
                        const std::vector<uint8_t>& counter) {
    auto expected = calculate_mac(provider, data, s_mac, counter);
    if (!expected) {
        return Result<void>(expected.error());
    }

    if (!crypto::utils::constant_time_compare(*expected, mac)) {
        return Result<void>(RSPError::MAC_VERIFICATION_FAILED);
    }
    return Result<void>();
}

std::vector<uint8_t> encode_counter(uint32_t counter) {
    std::vector<uint8_t> encoded;
    encoded.reserve(COUNTER_SIZE);
    crypto::utils::append_be32(encoded, counter);
    return encoded;
}

Result<std::vector<uint8_t>> format_apdu(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2,
                                         const std::vector<uint8_t>& data,
                                         size_t expected_length) {
    if (data.size() > MAX_EXTENDED_DATA || expected_length > MAX_EXTENDED_LE) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    std::vector<uint8_t> apdu = {cla, ins, p1, p2};
    bool extended_lc = false;

    if (!data.empty()) {
        // An extended Le forces an extended Lc in case 4
        if (data.size() > MAX_SHORT_LC || expected_length > MAX_SHORT_LE) {
            extended_lc = true;
            apdu.push_back(0x00);
            apdu.push_back(static_cast<uint8_t>((data.size() >> 8) & 0xFF));
            apdu.push_back(static_cast<uint8_t>(data.size() & 0xFF));
        } else {
            apdu.push_back(static_cast<uint8_t>(data.size()));
        }
        crypto::utils::append(apdu, data);
    }

    if (expected_length > 0) {
        const uint8_t le_hi = static_cast<uint8_t>((expected_length >> 8) & 0xFF);
        const uint8_t le_lo = static_cast<uint8_t>(expected_length & 0xFF);
        if (extended_lc) {
            // Extended Lc already carries the 0x00 marker
            apdu.push_back(le_hi);
            apdu.push_back(le_lo);
        } else if (expected_length <= MAX_SHORT_LE) {
            apdu.push_back(le_lo);
        } else {
            apdu.push_back(0x00);
            apdu.push_back(le_hi);
            apdu.push_back(le_lo);
        }
    }

    return Result<std::vector<uint8_t>>(std::move(apdu));
}

Result<std::vector<uint8_t>> build_install_apdu(crypto::CryptoProvider& provider,
                                                const std::vector<uint8_t>& isdp_aid,
                                                const std::vector<uint8_t>& data,
                                                const std::vector<uint8_t>& s_enc,
                                                const std::vector<uint8_t>& s_mac,
                                                uint32_t counter) {
    if (isdp_aid.empty()) {
        return Result<std::vector<uint8_t>>(RSPError::INVALID_PARAMETER);
    }

    auto encrypted = encrypt_command(provider, data, s_enc);
    if (!encrypted) {
        return encrypted;
    }

    std::vector<uint8_t> body = isdp_aid;
    crypto::utils::append(body, *encrypted);

    auto mac = calculate_mac(provider, body, s_mac, encode_counter(counter));
    if (!mac) {
        return mac;
    }
    crypto::utils::append(body, *mac);

    return format_apdu(INSTALL_CLA, INSTALL_INS, INSTALL_P1, INSTALL_P2, body, 0);
}

Result<InstallCommand> parse_install_apdu(crypto::CryptoProvider& provider,
                                          const std::vector<uint8_t>& apdu,
                                          size_t aid_length,
                                          const std::vector<uint8_t>& s_enc,
                                          const std::vector<uint8_t>& s_mac,
                                          uint32_t counter) {
    constexpr size_t HEADER_SIZE = 4;

    if (apdu.size() < HEADER_SIZE + 1 ||
        apdu[0] != INSTALL_CLA || apdu[1] != INSTALL_INS ||
        apdu[2] != INSTALL_P1 || apdu[3] != INSTALL_P2) {
        return Result<InstallCommand>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    size_t offset = HEADER_SIZE;
    size_t body_length = 0;
    if (apdu[offset] == 0x00) {
        if (apdu.size() < HEADER_SIZE + 3) {
            return Result<InstallCommand>(RSPError::INVALID_MESSAGE_FORMAT);
        }
        body_length = (static_cast<size_t>(apdu[offset + 1]) << 8) | apdu[offset + 2];
        offset += 3;
    } else {
        body_length = apdu[offset];
        offset += 1;
    }

    // Install commands carry no Le
    if (apdu.size() != offset + body_length) {
        return Result<InstallCommand>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (aid_length == 0 || body_length < aid_length + BLOCK_SIZE + MAC_SIZE) {
        return Result<InstallCommand>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    const auto body_begin = apdu.begin() + static_cast<std::ptrdiff_t>(offset);
    const auto mac_begin = apdu.end() - static_cast<std::ptrdiff_t>(MAC_SIZE);

    std::vector<uint8_t> authenticated(body_begin, mac_begin);
    std::vector<uint8_t> mac(mac_begin, apdu.end());

    auto mac_check = verify_mac(provider, authenticated, s_mac, mac, encode_counter(counter));
    if (!mac_check) {
        return Result<InstallCommand>(mac_check.error());
    }

    InstallCommand command;
    command.isdp_aid.assign(authenticated.begin(),
                            authenticated.begin() + static_cast<std::ptrdiff_t>(aid_length));
    std::vector<uint8_t> ciphertext(authenticated.begin() + static_cast<std::ptrdiff_t>(aid_length),
                                    authenticated.end());

    auto plaintext = decrypt_response(provider, ciphertext, s_enc);
    if (!plaintext) {
        return Result<InstallCommand>(plaintext.error());
    }
    command.data = std::move(*plaintext);

    return Result<InstallCommand>(std::move(command));
}

} // namespace scp03t
} // namespace protocol
} // namespace rsp
