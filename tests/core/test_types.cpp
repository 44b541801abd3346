#include <gtest/gtest.h>
#include <rsp/types.h>
#include <string>

using namespace rsp;

class RSPTypesTest : public ::testing::Test {};

TEST_F(RSPTypesTest, IsdpStateNames) {
    EXPECT_EQ(to_string(IsdpState::CREATED), "CREATED");
    EXPECT_EQ(to_string(IsdpState::UPLOADED), "UPLOADED");
    EXPECT_EQ(to_string(IsdpState::INSTALLED), "INSTALLED");
    EXPECT_EQ(to_string(IsdpState::ENABLED), "ENABLED");
    EXPECT_EQ(to_string(IsdpState::DISABLED), "DISABLED");
    EXPECT_EQ(to_string(IsdpState::DELETED), "DELETED");
    EXPECT_EQ(to_string(static_cast<IsdpState>(42)), "UNKNOWN_ISDP_STATE(42)");
}

TEST_F(RSPTypesTest, ProvisioningPhaseOrderAndNames) {
    EXPECT_LT(ProvisioningPhase::REGISTRATION, ProvisioningPhase::ISDP_CREATION);
    EXPECT_LT(ProvisioningPhase::ISDP_CREATION, ProvisioningPhase::KEY_ESTABLISHMENT);
    EXPECT_LT(ProvisioningPhase::KEY_ESTABLISHMENT, ProvisioningPhase::PROFILE_DOWNLOAD);
    EXPECT_LT(ProvisioningPhase::PROFILE_DOWNLOAD, ProvisioningPhase::PROFILE_ENABLING);

    EXPECT_EQ(to_string(ProvisioningPhase::ISDP_CREATION), "isdp_creation");
    EXPECT_EQ(to_string(ProvisioningPhase::KEY_ESTABLISHMENT), "key_establishment");
    EXPECT_EQ(to_string(ProvisioningPhase::PROFILE_DOWNLOAD), "profile_download");
    EXPECT_EQ(to_string(ProvisioningPhase::PROFILE_ENABLING), "profile_enabling");
}

TEST_F(RSPTypesTest, ProfileStatusParsing) {
    const ProfileStatus statuses[] = {
        ProfileStatus::PREPARED, ProfileStatus::TRANSMITTED, ProfileStatus::INSTALLED,
        ProfileStatus::ENABLED, ProfileStatus::DISABLED
    };
    for (ProfileStatus status : statuses) {
        auto parsed = profile_status_from_string(to_string(status));
        ASSERT_TRUE(parsed) << to_string(status);
        EXPECT_EQ(*parsed, status);
    }

    EXPECT_EQ(profile_status_from_string("ENABLED").error(), RSPError::DECODE_ERROR);
    EXPECT_EQ(profile_status_from_string("").error(), RSPError::DECODE_ERROR);
}

TEST_F(RSPTypesTest, SessionAndPskNames) {
    EXPECT_EQ(to_string(SessionStep::INITIALIZED), "initialized");
    EXPECT_EQ(to_string(SessionStep::COMPLETED), "completed");
    EXPECT_EQ(to_string(PskOrigin::STATIC_REGISTRATION), "static_registration");
    EXPECT_EQ(to_string(PskOrigin::ECDH), "ecdh");
}

TEST_F(RSPTypesTest, ProtocolConstants) {
    EXPECT_EQ(constants::RANDOM_CHALLENGE_SIZE, 16u);
    EXPECT_EQ(constants::SCP03T_CHALLENGE_SIZE, 8u);
    EXPECT_EQ(constants::DERIVED_KEY_SIZE, 32u);
    EXPECT_EQ(constants::STATIC_PSK_SIZE, 16u);
    EXPECT_EQ(std::string(constants::ISDP_AID_PREFIX).size(), 14u);
}

TEST_F(RSPTypesTest, UnixTimeIsCurrent) {
    // 2020-01-01T00:00:00Z
    EXPECT_GT(unix_time_now(), 1577836800);
}
