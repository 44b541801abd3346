#include <gtest/gtest.h>
#include <rsp/crypto/identity.h>
#include <rsp/crypto/crypto_utils.h>
#include "../test_infrastructure/test_utilities.h"

using namespace rsp;
using namespace rsp::crypto;

class IdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = test::make_provider();
        auto ca = CertificateAuthority::create(provider_);
        ASSERT_TRUE(ca);
        ca_ = std::move(ca).value();
    }

    std::shared_ptr<OpenSSLProvider> provider_;
    std::unique_ptr<CertificateAuthority> ca_;
};

TEST_F(IdentityTest, RootAuthorityCertificate) {
    EXPECT_EQ(ca_->common_name(), "RSP Simulator Root CA");
    auto cn = provider_->certificate_common_name(ca_->certificate_pem());
    ASSERT_TRUE(cn);
    EXPECT_EQ(*cn, "RSP Simulator Root CA");
}

TEST_F(IdentityTest, IssuedIdentityChainsToRoot) {
    auto identity = EntityIdentity::issue(provider_, "SMDP_001", *ca_);
    ASSERT_TRUE(identity);
    EXPECT_FALSE((*identity)->is_self_signed());
    EXPECT_EQ((*identity)->name(), "SMDP_001");

    auto cn = provider_->certificate_common_name((*identity)->certificate_pem());
    ASSERT_TRUE(cn);
    EXPECT_EQ(*cn, "SMDP_001");

    X509ChainVerifier verifier(provider_, {ca_->certificate_pem()});
    EXPECT_TRUE(verifier.verify({(*identity)->certificate_pem()}));
}

TEST_F(IdentityTest, UntrustedRootIsRejected) {
    auto other_ca = CertificateAuthority::create(provider_, "Other Root CA");
    ASSERT_TRUE(other_ca);
    auto identity = EntityIdentity::issue(provider_, "89012345678901234567", **other_ca);
    ASSERT_TRUE(identity);

    X509ChainVerifier verifier(provider_, {ca_->certificate_pem()});
    EXPECT_EQ(verifier.verify({(*identity)->certificate_pem()}).error(),
              RSPError::CERTIFICATE_VERIFY_FAILED);
}

TEST_F(IdentityTest, PinnedSelfSignedCertificate) {
    auto pinned = EntityIdentity::generate_self_signed(provider_, "SMDP_001");
    auto stranger = EntityIdentity::generate_self_signed(provider_, "SMDP_001");
    ASSERT_TRUE(pinned && stranger);
    EXPECT_TRUE((*pinned)->is_self_signed());

    X509ChainVerifier verifier(provider_, {(*pinned)->certificate_pem()});
    EXPECT_TRUE(verifier.verify({(*pinned)->certificate_pem()}));

    // Same name, different key: not the pinned certificate
    EXPECT_EQ(verifier.verify({(*stranger)->certificate_pem()}).error(),
              RSPError::CERTIFICATE_VERIFY_FAILED);
}

TEST_F(IdentityTest, VerifierRejectsEmptyInputs) {
    X509ChainVerifier no_roots(provider_, {});
    auto identity = EntityIdentity::issue(provider_, "SMDP_001", *ca_);
    ASSERT_TRUE(identity);
    EXPECT_EQ(no_roots.verify({(*identity)->certificate_pem()}).error(),
              RSPError::CERTIFICATE_VERIFY_FAILED);

    X509ChainVerifier verifier(provider_, {ca_->certificate_pem()});
    EXPECT_EQ(verifier.verify({}).error(), RSPError::CERTIFICATE_VERIFY_FAILED);
    EXPECT_EQ(verifier.verify({"garbage"}).error(), RSPError::CERTIFICATE_VERIFY_FAILED);

    no_roots.add_trusted_root(ca_->certificate_pem());
    EXPECT_EQ(no_roots.trusted_root_count(), 1u);
    EXPECT_TRUE(no_roots.verify({(*identity)->certificate_pem()}));
}

TEST_F(IdentityTest, SignAndVerifyWithCertificateKey) {
    auto identity = EntityIdentity::issue(provider_, "89012345678901234567", *ca_);
    ASSERT_TRUE(identity);

    auto data = utils::to_bytes("card public key || mac");
    auto signature = (*identity)->sign(data);
    ASSERT_TRUE(signature);

    EXPECT_TRUE(verify_signature(*provider_, *signature, data, (*identity)->public_key()));
    EXPECT_TRUE(verify_certificate_signature(*provider_, (*identity)->certificate_pem(), *signature, data));

    auto tampered = *signature;
    tampered[tampered.size() / 2] ^= 0x01;
    EXPECT_FALSE(verify_signature(*provider_, tampered, data, (*identity)->public_key()));
    EXPECT_EQ(verify_certificate_signature(*provider_, (*identity)->certificate_pem(), tampered, data).error(),
              RSPError::SIGNATURE_VERIFICATION_FAILED);
    EXPECT_EQ(verify_certificate_signature(*provider_, "garbage", *signature, data).error(),
              RSPError::SIGNATURE_VERIFICATION_FAILED);
}

TEST_F(IdentityTest, RejectsMissingInputs) {
    EXPECT_EQ(EntityIdentity::generate_self_signed(nullptr, "x").error(), RSPError::INVALID_PARAMETER);
    EXPECT_EQ(EntityIdentity::generate_self_signed(provider_, "").error(), RSPError::INVALID_PARAMETER);
    EXPECT_EQ(CertificateAuthority::create(nullptr).error(), RSPError::INVALID_PARAMETER);
}
