#include <gtest/gtest.h>
#include <rsp/monitoring/metrics_system.h>
#include <memory>
#include <thread>
#include <vector>

using namespace rsp::monitoring;

class MetricsCollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryMetricsCollector> collector_ = std::make_shared<InMemoryMetricsCollector>();
};

TEST_F(MetricsCollectorTest, AggregatesDurations) {
    collector_->record_duration("kdf", 0.5);
    collector_->record_duration("kdf", 1.5);
    collector_->record_duration("kdf", 1.0);

    auto snapshot = collector_->get_metrics();
    ASSERT_EQ(snapshot.durations.count("kdf"), 1u);
    const auto& stats = snapshot.durations.at("kdf");
    EXPECT_EQ(stats.count, 3u);
    EXPECT_DOUBLE_EQ(stats.total_seconds, 3.0);
    EXPECT_DOUBLE_EQ(stats.min_seconds, 0.5);
    EXPECT_DOUBLE_EQ(stats.max_seconds, 1.5);
    EXPECT_DOUBLE_EQ(stats.last_seconds, 1.0);
    EXPECT_DOUBLE_EQ(stats.mean_seconds(), 1.0);
}

TEST_F(MetricsCollectorTest, CountersAccumulate) {
    collector_->record_counter("smdp.key_establishments");
    collector_->record_counter("smdp.key_establishments", 4);
    EXPECT_EQ(collector_->get_metrics().counters.at("smdp.key_establishments"), 5u);
}

TEST_F(MetricsCollectorTest, RecordedNamesKeepFirstSeenOrder) {
    collector_->record_duration("isdp_creation", 0.1);
    collector_->record_duration("key_establishment", 0.2);
    collector_->record_duration("isdp_creation", 0.3);
    collector_->record_duration("profile_download", 0.4);

    std::vector<std::string> expected = {"isdp_creation", "key_establishment", "profile_download"};
    EXPECT_EQ(collector_->recorded_names(), expected);
}

TEST_F(MetricsCollectorTest, ResetClearsEverything) {
    collector_->record_duration("a", 1.0);
    collector_->record_counter("b");
    collector_->reset_metrics();

    auto snapshot = collector_->get_metrics();
    EXPECT_TRUE(snapshot.durations.empty());
    EXPECT_TRUE(snapshot.counters.empty());
    EXPECT_TRUE(collector_->recorded_names().empty());
}

TEST_F(MetricsCollectorTest, ScopedTimerRecordsOnce) {
    {
        ScopedTimer timer(collector_, "phase");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        timer.stop();
        double elapsed = timer.get_elapsed();
        EXPECT_GT(elapsed, 0.0);
        // Stopped timers freeze their elapsed value
        EXPECT_DOUBLE_EQ(timer.get_elapsed(), elapsed);
    }

    auto snapshot = collector_->get_metrics();
    ASSERT_EQ(snapshot.durations.count("phase"), 1u);
    EXPECT_EQ(snapshot.durations.at("phase").count, 1u);
}

TEST_F(MetricsCollectorTest, ScopedTimerMacroRecordsOnScopeExit) {
    {
        RSP_SCOPED_TIMER(collector_, "scoped");
    }
    EXPECT_EQ(collector_->get_metrics().durations.count("scoped"), 1u);
}

TEST(ScopedTimerTest, NullCollectorIsAllowed) {
    std::shared_ptr<MetricsCollector> none;
    ScopedTimer timer(none, "ignored");
    timer.stop();
    EXPECT_GE(timer.get_elapsed(), 0.0);
}

TEST(NullMetricsCollectorTest, DiscardsSamples) {
    NullMetricsCollector collector;
    collector.record_duration("x", 1.0);
    collector.record_counter("y");
    EXPECT_TRUE(collector.get_metrics().durations.empty());
    EXPECT_TRUE(collector.get_metrics().counters.empty());
}

TEST_F(MetricsCollectorTest, ConcurrentRecording) {
    constexpr int kThreads = 4;
    constexpr int kSamples = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < kSamples; ++i) {
                collector_->record_duration("shared", 0.001);
                collector_->record_counter("hits");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = collector_->get_metrics();
    EXPECT_EQ(snapshot.durations.at("shared").count, static_cast<uint64_t>(kThreads * kSamples));
    EXPECT_EQ(snapshot.counters.at("hits"), static_cast<uint64_t>(kThreads * kSamples));
}
