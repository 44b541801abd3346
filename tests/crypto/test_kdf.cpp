#include <gtest/gtest.h>
#include <rsp/crypto/kdf.h>
#include <rsp/crypto/crypto_utils.h>
#include "../test_infrastructure/test_utilities.h"

using namespace rsp;
using namespace rsp::crypto;

class KdfTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = test::make_provider();
        secret_ = test::TestDataGenerator::generate_sequential_data(32);
        context_ = utils::to_bytes("scp03t");
    }

    // HMAC(secret, BE32(counter) || "M2M_RSP_" label || 0x00 || context || BE32(bits))
    std::vector<uint8_t> reference_block(uint32_t counter, const std::string& label, uint32_t bits) {
        std::vector<uint8_t> input;
        utils::append_be32(input, counter);
        utils::append(input, std::string("M2M_RSP_") + label);
        input.push_back(0x00);
        utils::append(input, context_);
        utils::append_be32(input, bits);
        return utils::hmac_sha256(*provider_, secret_, input).value();
    }

    std::shared_ptr<OpenSSLProvider> provider_;
    std::vector<uint8_t> secret_;
    std::vector<uint8_t> context_;
};

TEST_F(KdfTest, SingleBlockMatchesCounterModeConstruction) {
    auto derived = derive_key(*provider_, secret_, 32, "mac_key", context_);
    ASSERT_TRUE(derived);
    EXPECT_EQ(*derived, reference_block(1, "mac_key", 256));
}

TEST_F(KdfTest, MultiBlockOutputIsTruncatedConcatenation) {
    auto derived = derive_key(*provider_, secret_, 48, "encryption_key", context_);
    ASSERT_TRUE(derived);

    auto expected = reference_block(1, "encryption_key", 384);
    auto second = reference_block(2, "encryption_key", 384);
    expected.insert(expected.end(), second.begin(), second.begin() + 16);
    EXPECT_EQ(*derived, expected);
}

TEST_F(KdfTest, ShortOutputEncodesRequestedLength) {
    auto derived = derive_key(*provider_, secret_, 16, "S-ENC", context_);
    ASSERT_TRUE(derived);
    auto block = reference_block(1, "S-ENC", 128);
    block.resize(16);
    EXPECT_EQ(*derived, block);
}

TEST_F(KdfTest, DeterministicAndLabelSeparated) {
    auto first = derive_key(*provider_, secret_, 32, "mac_key", context_);
    auto again = derive_key(*provider_, secret_, 32, "mac_key", context_);
    auto other_label = derive_key(*provider_, secret_, 32, "encryption_key", context_);
    auto other_context = derive_key(*provider_, secret_, 32, "mac_key", utils::to_bytes("other"));
    ASSERT_TRUE(first && again && other_label && other_context);

    EXPECT_EQ(*first, *again);
    EXPECT_NE(*first, *other_label);
    EXPECT_NE(*first, *other_context);
}

TEST_F(KdfTest, RejectsInvalidParameters) {
    EXPECT_EQ(derive_key(*provider_, {}, 32, "mac_key", context_).error(), RSPError::INVALID_PARAMETER);
    EXPECT_EQ(derive_key(*provider_, secret_, 0, "mac_key", context_).error(), RSPError::INVALID_PARAMETER);
    EXPECT_EQ(derive_key(*provider_, secret_, 32, "", context_).error(), RSPError::INVALID_PARAMETER);
}

TEST_F(KdfTest, ProfileKeysAreDistinct) {
    auto keys = derive_profile_keys(*provider_, secret_);
    ASSERT_TRUE(keys);
    EXPECT_EQ(keys->encryption_key.size(), 32u);
    EXPECT_EQ(keys->mac_key.size(), 32u);
    EXPECT_EQ(keys->key_protection_key.size(), 32u);
    EXPECT_NE(keys->encryption_key, keys->mac_key);
    EXPECT_NE(keys->mac_key, keys->key_protection_key);

    EXPECT_EQ(keys->encryption_key, reference_block(1, "encryption_key", 256));
    EXPECT_EQ(keys->mac_key, reference_block(1, "mac_key", 256));
    EXPECT_EQ(keys->key_protection_key, reference_block(1, "key_protection_key", 256));
}

TEST_F(KdfTest, ClearWipesKeys) {
    auto keys = derive_profile_keys(*provider_, secret_);
    ASSERT_TRUE(keys);
    DerivedKeySet copy = *keys;
    EXPECT_EQ(copy, *keys);

    copy.clear();
    EXPECT_NE(copy, *keys);
    EXPECT_EQ(copy.mac_key, std::vector<uint8_t>(32, 0x00));
}
