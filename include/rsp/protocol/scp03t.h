#ifndef RSP_PROTOCOL_SCP03T_H
#define RSP_PROTOCOL_SCP03T_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <cstdint>
#include <string>
#include <vector>

namespace rsp {
namespace protocol {
namespace scp03t {

constexpr size_t BLOCK_SIZE = 16;
constexpr size_t MAC_SIZE = 8;
constexpr size_t COUNTER_SIZE = 4;
constexpr size_t MAX_SHORT_LC = 255;
constexpr size_t MAX_SHORT_LE = 256;
constexpr size_t MAX_EXTENDED_DATA = 65535;
constexpr size_t MAX_EXTENDED_LE = 65536;

// INSTALL [for load] header
constexpr uint8_t INSTALL_CLA = 0x80;
constexpr uint8_t INSTALL_INS = 0xE6;
constexpr uint8_t INSTALL_P1 = 0x02;
constexpr uint8_t INSTALL_P2 = 0x00;

/**
 * SCP03t session keys, 16 bytes each.
 */
struct SessionKeys {
    std::vector<uint8_t> s_enc;
    std::vector<uint8_t> s_mac;
    std::vector<uint8_t> s_rmac;

    void clear();
};

struct InstallCommand {
    std::vector<uint8_t> isdp_aid;
    std::vector<uint8_t> data;
};

/**
 * Derive S-ENC, S-MAC and S-RMAC with the SP 800-108 KDF, context
 * host_challenge || card_challenge || host_id || card_id.
 */
RSP_API Result<SessionKeys> derive_session_keys(crypto::CryptoProvider& provider,
                                                const std::vector<uint8_t>& shared_secret,
                                                const std::string& host_id,
                                                const std::string& card_id,
                                                const std::vector<uint8_t>& host_challenge,
                                                const std::vector<uint8_t>& card_challenge);

/**
 * AES-CBC with PKCS#7 padding. An empty icv means 16 zero bytes.
 */
RSP_API Result<std::vector<uint8_t>> encrypt_command(crypto::CryptoProvider& provider,
                                                     const std::vector<uint8_t>& data,
                                                     const std::vector<uint8_t>& s_enc,
                                                     const std::vector<uint8_t>& icv = {});

/**
 * Inverse of encrypt_command.
 * @return DECRYPTION_FAILED on bad padding or a length that is not a
 *         positive multiple of the block size
 */
RSP_API Result<std::vector<uint8_t>> decrypt_response(crypto::CryptoProvider& provider,
                                                      const std::vector<uint8_t>& ciphertext,
                                                      const std::vector<uint8_t>& s_enc,
                                                      const std::vector<uint8_t>& icv = {});

/**
 * AES-CMAC over counter || data (or data alone when counter is empty),
 * truncated to 8 bytes.
 */
RSP_API Result<std::vector<uint8_t>> calculate_mac(crypto::CryptoProvider& provider,
                                                   const std::vector<uint8_t>& data,
                                                   const std::vector<uint8_t>& s_mac,
                                                   const std::vector<uint8_t>& counter = {});

/**
 * Constant-time check of a truncated CMAC.
 * @return MAC_VERIFICATION_FAILED on mismatch
 */
RSP_API Result<void> verify_mac(crypto::CryptoProvider& provider,
                                const std::vector<uint8_t>& data,
                                const std::vector<uint8_t>& s_mac,
                                const std::vector<uint8_t>& mac,
                                const std::vector<uint8_t>& counter = {});

RSP_API std::vector<uint8_t> encode_counter(uint32_t counter);

/**
 * ISO 7816-4 command APDU, cases 1 to 4 with short and extended lengths.
 * An expected_length of 0 omits Le. Lc and Le are either both short or
 * both extended.
 */
RSP_API Result<std::vector<uint8_t>> format_apdu(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2,
                                                 const std::vector<uint8_t>& data,
                                                 size_t expected_length = 0);

/**
 * INSTALL [for load] carrying aid || enc(data) || mac(aid || enc(data), counter).
 */
RSP_API Result<std::vector<uint8_t>> build_install_apdu(crypto::CryptoProvider& provider,
                                                        const std::vector<uint8_t>& isdp_aid,
                                                        const std::vector<uint8_t>& data,
                                                        const std::vector<uint8_t>& s_enc,
                                                        const std::vector<uint8_t>& s_mac,
                                                        uint32_t counter);

/**
 * Verify and decrypt an INSTALL APDU built by build_install_apdu. The MAC
 * is checked before anything is decrypted.
 */
RSP_API Result<InstallCommand> parse_install_apdu(crypto::CryptoProvider& provider,
                                                  const std::vector<uint8_t>& apdu,
                                                  size_t aid_length,
                                                  const std::vector<uint8_t>& s_enc,
                                                  const std::vector<uint8_t>& s_mac,
                                                  uint32_t counter);

} // namespace scp03t
} // namespace protocol
} // namespace rsp

#endif // RSP_PROTOCOL_SCP03T_H
