#include <gtest/gtest.h>
#include <rsp/protocol/scp03t.h>
#include <rsp/crypto/crypto_utils.h>
#include "../test_infrastructure/test_utilities.h"

using namespace rsp;
using namespace rsp::protocol;
using rsp::crypto::utils::from_hex;
using rsp::crypto::utils::to_bytes;

class Scp03tTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = test::make_provider();
        shared_secret_ = test::TestDataGenerator::generate_sequential_data(32);
        host_challenge_ = test::TestDataGenerator::generate_pattern_data(8, 0x11);
        card_challenge_ = test::TestDataGenerator::generate_pattern_data(8, 0x22);

        auto keys = scp03t::derive_session_keys(*provider_, shared_secret_, "SMDP_001",
                                                "89012345678901234567", host_challenge_, card_challenge_);
        ASSERT_TRUE(keys);
        keys_ = *keys;
        aid_ = from_hex("A0000005591010DEADBEEF").value();
    }

    std::shared_ptr<crypto::OpenSSLProvider> provider_;
    std::vector<uint8_t> shared_secret_;
    std::vector<uint8_t> host_challenge_;
    std::vector<uint8_t> card_challenge_;
    scp03t::SessionKeys keys_;
    std::vector<uint8_t> aid_;
};

TEST_F(Scp03tTest, SessionKeysAreDistinctAndSized) {
    EXPECT_EQ(keys_.s_enc.size(), 16u);
    EXPECT_EQ(keys_.s_mac.size(), 16u);
    EXPECT_EQ(keys_.s_rmac.size(), 16u);
    EXPECT_NE(keys_.s_enc, keys_.s_mac);
    EXPECT_NE(keys_.s_mac, keys_.s_rmac);
}

TEST_F(Scp03tTest, SessionKeysDependOnChallenges) {
    auto other_card = test::TestDataGenerator::generate_pattern_data(8, 0x23);
    auto other = scp03t::derive_session_keys(*provider_, shared_secret_, "SMDP_001",
                                             "89012345678901234567", host_challenge_, other_card);
    ASSERT_TRUE(other);
    EXPECT_NE(other->s_enc, keys_.s_enc);

    auto same = scp03t::derive_session_keys(*provider_, shared_secret_, "SMDP_001",
                                            "89012345678901234567", host_challenge_, card_challenge_);
    ASSERT_TRUE(same);
    EXPECT_EQ(same->s_mac, keys_.s_mac);
}

TEST_F(Scp03tTest, EncryptDecryptCommand) {
    auto data = to_bytes("{\"iccid\":\"8901234567890123456\"}");
    auto encrypted = scp03t::encrypt_command(*provider_, data, keys_.s_enc);
    ASSERT_TRUE(encrypted);
    EXPECT_EQ(encrypted->size() % scp03t::BLOCK_SIZE, 0u);
    EXPECT_NE(*encrypted, data);

    auto decrypted = scp03t::decrypt_response(*provider_, *encrypted, keys_.s_enc);
    ASSERT_TRUE(decrypted);
    EXPECT_EQ(*decrypted, data);
}

TEST_F(Scp03tTest, DecryptRejectsPartialBlocks) {
    EXPECT_EQ(scp03t::decrypt_response(*provider_, {}, keys_.s_enc).error(), RSPError::DECRYPTION_FAILED);
    EXPECT_EQ(scp03t::decrypt_response(*provider_, std::vector<uint8_t>(17, 0), keys_.s_enc).error(),
              RSPError::DECRYPTION_FAILED);
}

TEST_F(Scp03tTest, MacIsTruncatedAndCounterBound) {
    auto data = to_bytes("segment");
    auto mac = scp03t::calculate_mac(*provider_, data, keys_.s_mac, scp03t::encode_counter(1));
    ASSERT_TRUE(mac);
    EXPECT_EQ(mac->size(), scp03t::MAC_SIZE);

    EXPECT_TRUE(scp03t::verify_mac(*provider_, data, keys_.s_mac, *mac, scp03t::encode_counter(1)));
    EXPECT_EQ(scp03t::verify_mac(*provider_, data, keys_.s_mac, *mac, scp03t::encode_counter(2)).error(),
              RSPError::MAC_VERIFICATION_FAILED);

    auto flipped = *mac;
    flipped[7] ^= 0x80;
    EXPECT_EQ(scp03t::verify_mac(*provider_, data, keys_.s_mac, flipped, scp03t::encode_counter(1)).error(),
              RSPError::MAC_VERIFICATION_FAILED);
}

TEST_F(Scp03tTest, CounterEncodingIsBigEndian) {
    EXPECT_EQ(scp03t::encode_counter(0x01020304), (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(scp03t::encode_counter(1), (std::vector<uint8_t>{0x00, 0x00, 0x00, 0x01}));
}

TEST_F(Scp03tTest, ApduCase1) {
    auto apdu = scp03t::format_apdu(0x00, 0xA4, 0x04, 0x00, {});
    ASSERT_TRUE(apdu);
    EXPECT_EQ(*apdu, (std::vector<uint8_t>{0x00, 0xA4, 0x04, 0x00}));
}

TEST_F(Scp03tTest, ApduCase2Short) {
    auto apdu = scp03t::format_apdu(0x80, 0xCA, 0x00, 0x66, {}, 16);
    ASSERT_TRUE(apdu);
    EXPECT_EQ(*apdu, (std::vector<uint8_t>{0x80, 0xCA, 0x00, 0x66, 0x10}));

    // Le of 256 is encoded as 0x00
    auto max_short = scp03t::format_apdu(0x80, 0xCA, 0x00, 0x66, {}, 256);
    ASSERT_TRUE(max_short);
    EXPECT_EQ(*max_short, (std::vector<uint8_t>{0x80, 0xCA, 0x00, 0x66, 0x00}));
}

TEST_F(Scp03tTest, ApduCase2Extended) {
    auto apdu = scp03t::format_apdu(0x80, 0xCA, 0x00, 0x66, {}, 1000);
    ASSERT_TRUE(apdu);
    EXPECT_EQ(*apdu, (std::vector<uint8_t>{0x80, 0xCA, 0x00, 0x66, 0x00, 0x03, 0xE8}));

    auto max_extended = scp03t::format_apdu(0x80, 0xCA, 0x00, 0x66, {}, 65536);
    ASSERT_TRUE(max_extended);
    EXPECT_EQ(*max_extended, (std::vector<uint8_t>{0x80, 0xCA, 0x00, 0x66, 0x00, 0x00, 0x00}));
}

TEST_F(Scp03tTest, ApduCase3And4Short) {
    std::vector<uint8_t> data = {0xA0, 0x00, 0x00};
    auto case3 = scp03t::format_apdu(0x00, 0xA4, 0x04, 0x00, data);
    ASSERT_TRUE(case3);
    EXPECT_EQ(*case3, (std::vector<uint8_t>{0x00, 0xA4, 0x04, 0x00, 0x03, 0xA0, 0x00, 0x00}));

    auto case4 = scp03t::format_apdu(0x00, 0xA4, 0x04, 0x00, data, 0x20);
    ASSERT_TRUE(case4);
    EXPECT_EQ(*case4, (std::vector<uint8_t>{0x00, 0xA4, 0x04, 0x00, 0x03, 0xA0, 0x00, 0x00, 0x20}));
}

TEST_F(Scp03tTest, ApduExtendedLcAndLe) {
    std::vector<uint8_t> data(300, 0x5A);
    auto case3 = scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, data);
    ASSERT_TRUE(case3);
    ASSERT_EQ(case3->size(), 4u + 3u + 300u);
    EXPECT_EQ((*case3)[4], 0x00);
    EXPECT_EQ((*case3)[5], 0x01);
    EXPECT_EQ((*case3)[6], 0x2C);

    auto case4 = scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, data, 512);
    ASSERT_TRUE(case4);
    ASSERT_EQ(case4->size(), 4u + 3u + 300u + 2u);
    EXPECT_EQ((*case4)[case4->size() - 2], 0x02);
    EXPECT_EQ((*case4)[case4->size() - 1], 0x00);
}

TEST_F(Scp03tTest, ApduExtendedLeWidensShortLc) {
    std::vector<uint8_t> data(10, 0x5A);
    auto apdu = scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, data, 300);
    ASSERT_TRUE(apdu);
    ASSERT_EQ(apdu->size(), 4u + 3u + 10u + 2u);

    // 00 Lc_hi Lc_lo data Le_hi Le_lo
    EXPECT_EQ((*apdu)[4], 0x00);
    EXPECT_EQ((*apdu)[5], 0x00);
    EXPECT_EQ((*apdu)[6], 0x0A);
    EXPECT_EQ((*apdu)[17], 0x01);
    EXPECT_EQ((*apdu)[18], 0x2C);

    // Le of 256 still fits the short form
    auto short_form = scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, data, 256);
    ASSERT_TRUE(short_form);
    ASSERT_EQ(short_form->size(), 4u + 1u + 10u + 1u);
    EXPECT_EQ((*short_form)[4], 0x0A);
    EXPECT_EQ(short_form->back(), 0x00);
}

TEST_F(Scp03tTest, ApduRejectsOversizedFields) {
    EXPECT_EQ(scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, std::vector<uint8_t>(65536, 0)).error(),
              RSPError::INVALID_PARAMETER);
    EXPECT_EQ(scp03t::format_apdu(0x80, 0xE6, 0x02, 0x00, {}, 65537).error(),
              RSPError::INVALID_PARAMETER);
}

TEST_F(Scp03tTest, InstallApduRoundTrip) {
    auto segment = to_bytes("{\"iccid\":\"8901234567890123456\",\"imsi\":\"123456789012\"}");
    auto apdu = scp03t::build_install_apdu(*provider_, aid_, segment, keys_.s_enc, keys_.s_mac, 3);
    ASSERT_TRUE(apdu);
    EXPECT_EQ((*apdu)[0], scp03t::INSTALL_CLA);
    EXPECT_EQ((*apdu)[1], scp03t::INSTALL_INS);

    auto parsed = scp03t::parse_install_apdu(*provider_, *apdu, aid_.size(), keys_.s_enc, keys_.s_mac, 3);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->isdp_aid, aid_);
    EXPECT_EQ(parsed->data, segment);
}

TEST_F(Scp03tTest, InstallApduLargeSegmentUsesExtendedLength) {
    auto segment = test::TestDataGenerator::generate_sequential_data(1024);
    auto apdu = scp03t::build_install_apdu(*provider_, aid_, segment, keys_.s_enc, keys_.s_mac, 1);
    ASSERT_TRUE(apdu);
    EXPECT_EQ((*apdu)[4], 0x00);

    auto parsed = scp03t::parse_install_apdu(*provider_, *apdu, aid_.size(), keys_.s_enc, keys_.s_mac, 1);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->data, segment);
}

TEST_F(Scp03tTest, InstallApduTamperingIsDetected) {
    auto segment = to_bytes("profile data");
    auto apdu = scp03t::build_install_apdu(*provider_, aid_, segment, keys_.s_enc, keys_.s_mac, 1);
    ASSERT_TRUE(apdu);

    // Ciphertext byte
    auto tampered = *apdu;
    tampered[5 + aid_.size()] ^= 0x01;
    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, tampered, aid_.size(), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::MAC_VERIFICATION_FAILED);

    // AID byte
    tampered = *apdu;
    tampered[5] ^= 0x01;
    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, tampered, aid_.size(), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::MAC_VERIFICATION_FAILED);

    // Replayed under another counter
    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, *apdu, aid_.size(), keys_.s_enc, keys_.s_mac, 2).error(),
              RSPError::MAC_VERIFICATION_FAILED);
}

TEST_F(Scp03tTest, InstallApduRejectsMalformedFraming) {
    auto apdu = scp03t::build_install_apdu(*provider_, aid_, to_bytes("x"), keys_.s_enc, keys_.s_mac, 1);
    ASSERT_TRUE(apdu);

    auto wrong_ins = *apdu;
    wrong_ins[1] = 0xE8;
    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, wrong_ins, aid_.size(), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::INVALID_MESSAGE_FORMAT);

    auto truncated = *apdu;
    truncated.pop_back();
    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, truncated, aid_.size(), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::INVALID_MESSAGE_FORMAT);

    EXPECT_EQ(scp03t::parse_install_apdu(*provider_, {0x80, 0xE6}, aid_.size(), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::INVALID_MESSAGE_FORMAT);

    EXPECT_EQ(scp03t::build_install_apdu(*provider_, {}, to_bytes("x"), keys_.s_enc, keys_.s_mac, 1).error(),
              RSPError::INVALID_PARAMETER);
}
