#include <gtest/gtest.h>
#include <rsp/crypto/crypto_utils.h>
#include "../test_infrastructure/test_utilities.h"

using namespace rsp;
using namespace rsp::crypto;

class CryptoUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = test::make_provider();
    }

    std::shared_ptr<OpenSSLProvider> provider_;
};

TEST_F(CryptoUtilsTest, HexEncoding) {
    std::vector<uint8_t> data = {0x00, 0x1f, 0xa0, 0xff};
    EXPECT_EQ(utils::to_hex(data), "001fa0ff");
    EXPECT_EQ(utils::to_hex(data, true), "001FA0FF");

    auto upper = utils::from_hex("001FA0FF");
    auto lower = utils::from_hex("001fa0ff");
    ASSERT_TRUE(upper);
    ASSERT_TRUE(lower);
    EXPECT_EQ(*upper, data);
    EXPECT_EQ(*lower, data);

    EXPECT_TRUE(utils::from_hex("")->empty());
    EXPECT_EQ(utils::from_hex("abc").error(), RSPError::DECODE_ERROR);
    EXPECT_EQ(utils::from_hex("zz").error(), RSPError::DECODE_ERROR);
}

// RFC 4648 section 10
TEST_F(CryptoUtilsTest, Base64Encoding) {
    EXPECT_EQ(utils::base64_encode(utils::to_bytes("")), "");
    EXPECT_EQ(utils::base64_encode(utils::to_bytes("f")), "Zg==");
    EXPECT_EQ(utils::base64_encode(utils::to_bytes("fo")), "Zm8=");
    EXPECT_EQ(utils::base64_encode(utils::to_bytes("foo")), "Zm9v");
    EXPECT_EQ(utils::base64_encode(utils::to_bytes("foobar")), "Zm9vYmFy");

    auto decoded = utils::base64_decode("Zm8=");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, utils::to_bytes("fo"));

    auto binary = test::TestDataGenerator::generate_sequential_data(257);
    auto back = utils::base64_decode(utils::base64_encode(binary));
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, binary);
}

TEST_F(CryptoUtilsTest, Base64RejectsMalformedInput) {
    EXPECT_EQ(utils::base64_decode("Zm9").error(), RSPError::DECODE_ERROR);
    EXPECT_EQ(utils::base64_decode("Zm9v!A==").error(), RSPError::DECODE_ERROR);
    EXPECT_EQ(utils::base64_decode("Z=9v").error(), RSPError::DECODE_ERROR);
    EXPECT_EQ(utils::base64_decode("Zg=a").error(), RSPError::DECODE_ERROR);
}

TEST_F(CryptoUtilsTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    std::vector<uint8_t> shorter = {1, 2, 3};

    EXPECT_TRUE(utils::constant_time_compare(a, b));
    EXPECT_FALSE(utils::constant_time_compare(a, c));
    EXPECT_FALSE(utils::constant_time_compare(a, shorter));
    EXPECT_TRUE(utils::constant_time_compare({}, {}));
}

TEST_F(CryptoUtilsTest, SecureZero) {
    auto data = test::TestDataGenerator::generate_pattern_data(64, 0xAB);
    utils::secure_zero(data);
    EXPECT_EQ(data, std::vector<uint8_t>(64, 0x00));
}

TEST_F(CryptoUtilsTest, BigEndianAppend) {
    std::vector<uint8_t> out;
    utils::append_be32(out, 0x01020304);
    utils::append(out, std::string("AB"));
    utils::append(out, std::vector<uint8_t>{0xFF});
    EXPECT_EQ(out, (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 'A', 'B', 0xFF}));
}

TEST_F(CryptoUtilsTest, RandomHexIsUppercase) {
    auto value = utils::random_hex(*provider_, 4);
    ASSERT_TRUE(value);
    EXPECT_EQ(value->size(), 8u);
    EXPECT_EQ(value->find_first_not_of("0123456789ABCDEF"), std::string::npos);
}

TEST_F(CryptoUtilsTest, Sha256Hex) {
    auto digest = utils::sha256_hex(*provider_, "");
    ASSERT_TRUE(digest);
    EXPECT_EQ(*digest, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
