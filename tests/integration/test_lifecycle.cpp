#include <gtest/gtest.h>
#include <rsp/orchestrator.h>
#include "../test_infrastructure/test_utilities.h"

namespace rsp {
namespace test {

/**
 * Profile lifecycle after provisioning: disable, re-enable and delete.
 */
class ProfileLifecycleTest : public SimulatorTest {
protected:
    void SetUp() override {
        SimulatorTest::SetUp();
        if (HasFatalFailure()) {
            return;
        }
        report_ = simulator_->orchestrator->run();
        ASSERT_TRUE(report_.success) << error_name(report_.error);
    }

    IsdpState isdp_state() {
        auto record = simulator_->smsr->isdp(report_.isdp_aid);
        EXPECT_TRUE(record.is_success());
        return record ? record->state : IsdpState::DELETED;
    }

    std::string card_status() {
        auto installed = simulator_->euicc->installed_profile(report_.iccid);
        return installed ? (*installed)["status"].get<std::string>() : std::string();
    }

    ProvisioningReport report_;
};

TEST_F(ProfileLifecycleTest, DisableThenEnable) {
    auto disabled = simulator_->smsr->disable_profile(report_.iccid);
    ASSERT_TRUE(disabled.is_success());
    EXPECT_EQ((*disabled)["profileStatus"], "disabled");
    EXPECT_EQ(isdp_state(), IsdpState::DISABLED);
    EXPECT_EQ(card_status(), "disabled");

    auto enabled = simulator_->smsr->enable_profile(report_.iccid);
    ASSERT_TRUE(enabled.is_success());
    EXPECT_EQ((*enabled)["profileStatus"], "enabled");
    EXPECT_EQ(isdp_state(), IsdpState::ENABLED);
    EXPECT_EQ(card_status(), "enabled");
}

TEST_F(ProfileLifecycleTest, InvalidStateChanges) {
    // Already enabled
    EXPECT_EQ(simulator_->smsr->enable_profile(report_.iccid).error(), RSPError::INVALID_STATE);

    ASSERT_TRUE(simulator_->smsr->disable_profile(report_.iccid).is_success());
    EXPECT_EQ(simulator_->smsr->disable_profile(report_.iccid).error(), RSPError::INVALID_STATE);

    // The card was not touched by the rejected commands
    EXPECT_EQ(card_status(), "disabled");
}

TEST_F(ProfileLifecycleTest, DeleteRefundsMemoryOnBothSides) {
    const uint32_t card_before = simulator_->euicc->free_memory();

    auto deleted = simulator_->smsr->delete_isdp(report_.isdp_aid);
    ASSERT_TRUE(deleted.is_success());

    EXPECT_EQ(isdp_state(), IsdpState::DELETED);
    EXPECT_EQ(simulator_->euicc->free_memory(), card_before + config_.orchestrator.memory_required);
    EXPECT_EQ(simulator_->euicc->free_memory(), config_.euicc.free_memory);
    EXPECT_TRUE(simulator_->euicc->isdp_aids().empty());
    EXPECT_EQ(simulator_->euicc->installed_profile(report_.iccid).error(), RSPError::PROFILE_NOT_FOUND);
    EXPECT_EQ(simulator_->euicc->derived_keys(report_.isdp_aid).error(), RSPError::ISDP_NOT_FOUND);
    EXPECT_EQ(simulator_->smsr->status()["isdps"], 0);
}

TEST_F(ProfileLifecycleTest, DeletedIsdpIsTerminal) {
    ASSERT_TRUE(simulator_->smsr->delete_isdp(report_.isdp_aid).is_success());

    EXPECT_EQ(simulator_->smsr->delete_isdp(report_.isdp_aid).error(), RSPError::INVALID_STATE);
    EXPECT_EQ(simulator_->smsr->enable_profile(report_.iccid).error(), RSPError::PROFILE_NOT_FOUND);
    EXPECT_EQ(simulator_->smsr->disable_profile(report_.iccid).error(), RSPError::PROFILE_NOT_FOUND);
}

TEST_F(ProfileLifecycleTest, DisabledProfileCanBeDeleted) {
    ASSERT_TRUE(simulator_->smsr->disable_profile(report_.iccid).is_success());
    ASSERT_TRUE(simulator_->smsr->delete_isdp(report_.isdp_aid).is_success());
    EXPECT_EQ(simulator_->euicc->free_memory(), config_.euicc.free_memory);
}

TEST_F(ProfileLifecycleTest, ReprovisionAfterDelete) {
    ASSERT_TRUE(simulator_->smsr->delete_isdp(report_.isdp_aid).is_success());

    // The freed memory is enough for a full-size ISD-P again
    auto report = simulator_->orchestrator->run(report_.iccid, config_.euicc.free_memory);
    ASSERT_TRUE(report.success) << error_name(report.error);
    EXPECT_NE(report.isdp_aid, report_.isdp_aid);
    EXPECT_EQ(simulator_->euicc->free_memory(), 0u);
}

} // namespace test
} // namespace rsp
