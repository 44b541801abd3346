#include <gtest/gtest.h>
#include <rsp/protocol/isdp_manager.h>
#include "../test_infrastructure/test_utilities.h"
#include <regex>
#include <set>

using namespace rsp;
using namespace rsp::protocol;

class IsdpManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<IsdpManager>(test::make_provider());
        ASSERT_TRUE(manager_->register_euicc(kEuicc, 512));
    }

    std::string create_installed() {
        auto record = manager_->create(kEuicc, 128);
        EXPECT_TRUE(record);
        EXPECT_TRUE(manager_->mark_uploaded(record->isdp_aid));
        EXPECT_TRUE(manager_->install(record->isdp_aid, "8901234567890123456"));
        return record->isdp_aid;
    }

    static constexpr const char* kEuicc = "89012345678901234567";
    std::unique_ptr<IsdpManager> manager_;
};

TEST_F(IsdpManagerTest, CreateAllocatesAidAndMemory) {
    auto record = manager_->create(kEuicc, 256);
    ASSERT_TRUE(record);
    EXPECT_TRUE(std::regex_match(record->isdp_aid, std::regex("A0000005591010[0-9A-F]{8}")));
    EXPECT_EQ(record->state, IsdpState::CREATED);
    EXPECT_EQ(record->memory_allocated, 256u);
    EXPECT_EQ(record->euicc_id, kEuicc);
    EXPECT_GT(record->creation_time, 0);

    EXPECT_EQ(*manager_->free_memory(kEuicc), 256u);
    auto owned = manager_->owned_aids(kEuicc);
    ASSERT_TRUE(owned);
    ASSERT_EQ(owned->size(), 1u);
    EXPECT_EQ(owned->front(), record->isdp_aid);
}

TEST_F(IsdpManagerTest, AidsAreUnique) {
    ASSERT_TRUE(manager_->register_euicc("89000000000000000002", 100000));
    std::set<std::string> aids;
    for (int i = 0; i < 50; ++i) {
        auto record = manager_->create("89000000000000000002", 1);
        ASSERT_TRUE(record);
        aids.insert(record->isdp_aid);
    }
    EXPECT_EQ(aids.size(), 50u);
}

TEST_F(IsdpManagerTest, InsufficientMemoryCreatesNothing) {
    EXPECT_EQ(manager_->create(kEuicc, 1024).error(), RSPError::INSUFFICIENT_MEMORY);
    EXPECT_EQ(*manager_->free_memory(kEuicc), 512u);
    EXPECT_EQ(manager_->active_count(), 0u);

    // Exactly the remaining memory is allowed
    EXPECT_TRUE(manager_->create(kEuicc, 512));
    EXPECT_EQ(*manager_->free_memory(kEuicc), 0u);
}

TEST_F(IsdpManagerTest, UnregisteredEuicc) {
    EXPECT_EQ(manager_->create("unknown", 1).error(), RSPError::EUICC_NOT_REGISTERED);
    EXPECT_EQ(manager_->free_memory("unknown").error(), RSPError::EUICC_NOT_REGISTERED);
    EXPECT_FALSE(manager_->is_registered("unknown"));
    EXPECT_EQ(manager_->create(kEuicc, 0).error(), RSPError::INVALID_PARAMETER);
}

TEST_F(IsdpManagerTest, FullLifecycle) {
    std::string aid = create_installed();
    auto record = manager_->get(aid);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->state, IsdpState::INSTALLED);
    EXPECT_EQ(record->bound_iccid, "8901234567890123456");

    EXPECT_TRUE(manager_->enable(aid));
    EXPECT_EQ(manager_->get(aid)->state, IsdpState::ENABLED);
    EXPECT_TRUE(manager_->disable(aid));
    EXPECT_EQ(manager_->get(aid)->state, IsdpState::DISABLED);
    EXPECT_TRUE(manager_->enable(aid));
    EXPECT_TRUE(manager_->remove(aid));
    EXPECT_EQ(manager_->get(aid)->state, IsdpState::DELETED);

    EXPECT_EQ(*manager_->free_memory(kEuicc), 512u);
    EXPECT_TRUE(manager_->owned_aids(kEuicc)->empty());
    EXPECT_EQ(manager_->active_count(), 0u);
}

TEST_F(IsdpManagerTest, CreatedCanInstallDirectly) {
    auto record = manager_->create(kEuicc, 64);
    ASSERT_TRUE(record);
    EXPECT_TRUE(manager_->install(record->isdp_aid, "8901234567890123456"));
}

TEST_F(IsdpManagerTest, InvalidTransitions) {
    auto record = manager_->create(kEuicc, 64);
    ASSERT_TRUE(record);
    const std::string aid = record->isdp_aid;

    EXPECT_EQ(manager_->enable(aid).error(), RSPError::INVALID_STATE);
    EXPECT_EQ(manager_->disable(aid).error(), RSPError::INVALID_STATE);

    ASSERT_TRUE(manager_->mark_uploaded(aid));
    EXPECT_EQ(manager_->mark_uploaded(aid).error(), RSPError::INVALID_STATE);

    ASSERT_TRUE(manager_->install(aid, "8901234567890123456"));
    EXPECT_EQ(manager_->disable(aid).error(), RSPError::INVALID_STATE);

    ASSERT_TRUE(manager_->remove(aid));
    EXPECT_EQ(manager_->enable(aid).error(), RSPError::INVALID_STATE);
    EXPECT_EQ(manager_->remove(aid).error(), RSPError::INVALID_STATE);

    EXPECT_EQ(manager_->enable("A0000005591010FFFFFFFF").error(), RSPError::ISDP_NOT_FOUND);
    EXPECT_EQ(manager_->get("A0000005591010FFFFFFFF").error(), RSPError::ISDP_NOT_FOUND);
}

TEST_F(IsdpManagerTest, TransitionTable) {
    using S = IsdpState;
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::CREATED, S::UPLOADED));
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::CREATED, S::INSTALLED));
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::UPLOADED, S::INSTALLED));
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::INSTALLED, S::ENABLED));
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::ENABLED, S::DISABLED));
    EXPECT_TRUE(IsdpManager::is_valid_transition(S::DISABLED, S::ENABLED));

    EXPECT_FALSE(IsdpManager::is_valid_transition(S::CREATED, S::ENABLED));
    EXPECT_FALSE(IsdpManager::is_valid_transition(S::UPLOADED, S::ENABLED));
    EXPECT_FALSE(IsdpManager::is_valid_transition(S::INSTALLED, S::DISABLED));
    EXPECT_FALSE(IsdpManager::is_valid_transition(S::ENABLED, S::INSTALLED));

    const S all[] = {S::CREATED, S::UPLOADED, S::INSTALLED, S::ENABLED, S::DISABLED, S::DELETED};
    for (S from : all) {
        EXPECT_EQ(IsdpManager::is_valid_transition(from, S::DELETED), from != S::DELETED);
        EXPECT_FALSE(IsdpManager::is_valid_transition(S::DELETED, from));
    }
}

TEST_F(IsdpManagerTest, ReRegistrationRules) {
    auto record = manager_->create(kEuicc, 64);
    ASSERT_TRUE(record);
    EXPECT_EQ(manager_->register_euicc(kEuicc, 1024).error(), RSPError::INVALID_STATE);

    ASSERT_TRUE(manager_->remove(record->isdp_aid));
    EXPECT_TRUE(manager_->register_euicc(kEuicc, 1024));
    EXPECT_EQ(*manager_->free_memory(kEuicc), 1024u);
}

TEST_F(IsdpManagerTest, RecordJson) {
    std::string aid = create_installed();
    auto value = manager_->get(aid)->to_json();
    EXPECT_EQ(value["isdpAid"], aid);
    EXPECT_EQ(value["state"], "INSTALLED");
    EXPECT_EQ(value["iccid"], "8901234567890123456");
    EXPECT_EQ(value["memoryAllocated"], 128);
    EXPECT_TRUE(value.contains("scp03"));
}
