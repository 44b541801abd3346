#include <gtest/gtest.h>
#include <rsp/orchestrator.h>
#include "../test_infrastructure/test_utilities.h"
#include <atomic>
#include <thread>
#include <vector>

namespace rsp {
namespace test {

class ConcurrentSessionsTest : public SimulatorTest {
protected:
    static constexpr int kIsdpCount = 8;

    void SetUp() override {
        SimulatorTest::SetUp();
        if (HasFatalFailure()) {
            return;
        }
        ASSERT_TRUE(simulator_->orchestrator->register_euicc().is_success());

        // 8 x 64 fills the default 512 bytes
        for (int i = 0; i < kIsdpCount; ++i) {
            auto created = simulator_->smsr->create_isdp(
                nlohmann::json{{"euiccId", config_.euicc.euicc_id}, {"memoryRequired", 64}});
            ASSERT_TRUE(created.is_success()) << error_name(created.error());
            aids_.push_back((*created)["isdpAid"].get<std::string>());
        }
    }

    std::vector<std::string> aids_;
};

TEST_F(ConcurrentSessionsTest, ParallelKeyEstablishments) {
    std::atomic<int> matched{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;

    for (const auto& aid : aids_) {
        threads.emplace_back([this, aid, &matched, &failed]() {
            auto& smdp = *simulator_->smdp;
            auto init = smdp.init_key_establishment(config_.euicc.euicc_id, aid);
            if (!init) {
                failed++;
                return;
            }
            auto answer = simulator_->smsr->relay_key_establishment(config_.euicc.euicc_id, *init);
            if (!answer) {
                failed++;
                return;
            }
            auto smdp_keys = smdp.complete_key_establishment(*answer);
            auto card_keys = simulator_->euicc->derived_keys(aid);
            if (smdp_keys && card_keys && *smdp_keys == *card_keys) {
                matched++;
            } else {
                failed++;
            }
            smdp.abort_key_establishment((*init)["session_id"].get<std::string>());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(matched.load(), kIsdpCount);
    EXPECT_EQ(failed.load(), 0);
    EXPECT_EQ(simulator_->smdp->active_sessions(), 0u);
    EXPECT_EQ(simulator_->smdp->completed_key_establishments(), static_cast<uint64_t>(kIsdpCount));
    EXPECT_EQ(metrics_->get_metrics().counters["smdp.key_establishments"],
              static_cast<uint64_t>(kIsdpCount));
}

TEST_F(ConcurrentSessionsTest, CompetingCompletionsOfOneSession) {
    auto init = simulator_->smdp->init_key_establishment(config_.euicc.euicc_id, aids_[0]);
    ASSERT_TRUE(init.is_success());
    auto answer = simulator_->smsr->relay_key_establishment(config_.euicc.euicc_id, *init);
    ASSERT_TRUE(answer.is_success());

    const nlohmann::json response = *answer;
    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([this, &response, &completed]() {
            if (simulator_->smdp->complete_key_establishment(response)) {
                completed++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // The session lock serializes completion; exactly one caller wins
    EXPECT_EQ(completed.load(), 1);
    EXPECT_EQ(simulator_->smdp->completed_key_establishments(), 1u);
}

TEST_F(ConcurrentSessionsTest, InitAndAbortUnderLoad) {
    std::vector<std::thread> threads;
    std::atomic<int> aborted{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t, &aborted]() {
            for (int i = 0; i < 20; ++i) {
                auto init = simulator_->smdp->init_key_establishment(
                    config_.euicc.euicc_id, aids_[static_cast<size_t>(t)]);
                if (init && simulator_->smdp->abort_key_establishment(
                                (*init)["session_id"].get<std::string>())) {
                    aborted++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(aborted.load(), 80);
    EXPECT_EQ(simulator_->smdp->active_sessions(), 0u);
}

TEST(IndependentSimulatorsTest, RunInParallel) {
    constexpr int kSimulators = 4;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kSimulators; ++i) {
        threads.emplace_back([&succeeded]() {
            auto metrics = std::make_shared<monitoring::InMemoryMetricsCollector>();
            auto simulator = build_simulator(make_test_config(), metrics);
            if (!simulator) {
                return;
            }
            auto report = (*simulator)->orchestrator->run();
            // Each simulator sees only its own run
            if (report.success && metrics->get_metrics().durations["provisioning_total"].count == 1) {
                succeeded++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), kSimulators);
}

} // namespace test
} // namespace rsp
