#include <gtest/gtest.h>
#include <rsp/error_reporter.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

using namespace rsp;

class ErrorReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.minimum_level = ErrorReporter::LogLevel::INFO;
        config_.write_to_stream = false;
        config_.max_reports_per_second = 1000;
        reporter_ = std::make_unique<ErrorReporter>(config_);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(report);
        });
    }

    size_t received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_.size();
    }

    ErrorReporter::ReportingConfig config_;
    std::unique_ptr<ErrorReporter> reporter_;
    std::mutex mutex_;
    std::vector<ErrorReporter::ErrorReport> received_;
};

TEST_F(ErrorReporterTest, DeliversReportsToCallbacks) {
    ASSERT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR, RSPError::ISDP_NOT_FOUND,
                                        "lifecycle", "no such isdp"));
    ASSERT_EQ(received(), 1u);
    EXPECT_EQ(received_[0].error_code, RSPError::ISDP_NOT_FOUND);
    EXPECT_EQ(received_[0].category, "lifecycle");
    EXPECT_FALSE(received_[0].is_security_incident);
    EXPECT_EQ(reporter_->get_statistics().total_reports.load(), 1u);
}

TEST_F(ErrorReporterTest, FiltersBelowMinimumLevel) {
    auto result = reporter_->report_error(ErrorReporter::LogLevel::DEBUG, RSPError::SUCCESS,
                                          "trace", "not kept");
    EXPECT_TRUE(result);
    EXPECT_EQ(received(), 0u);
    EXPECT_EQ(reporter_->get_statistics().filtered_reports.load(), 1u);
}

TEST_F(ErrorReporterTest, SecurityIncidentsBypassFilters) {
    config_.minimum_level = ErrorReporter::LogLevel::SECURITY;
    config_.max_reports_per_second = 1;
    ASSERT_TRUE(reporter_->update_configuration(config_));

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(reporter_->report_security_incident(RSPError::MAC_VERIFICATION_FAILED,
                                                        "SM-DP", "receipt mac mismatch"));
    }
    ASSERT_EQ(received(), 5u);
    EXPECT_TRUE(received_[0].is_security_incident);
    EXPECT_EQ(received_[0].component, "SM-DP");
    EXPECT_EQ(received_[0].metadata.at("error"), "MacVerificationFailed");
    EXPECT_EQ(reporter_->get_statistics().security_incidents.load(), 5u);
}

TEST_F(ErrorReporterTest, RateLimitsOrdinaryReports) {
    config_.max_reports_per_second = 2;
    ASSERT_TRUE(reporter_->update_configuration(config_));

    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::INFO, RSPError::SUCCESS, "a", "1"));
    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::INFO, RSPError::SUCCESS, "a", "2"));
    auto dropped = reporter_->report_error(ErrorReporter::LogLevel::INFO, RSPError::SUCCESS, "a", "3");
    EXPECT_EQ(dropped.error(), RSPError::RATE_LIMITED);
    EXPECT_EQ(received(), 2u);
    EXPECT_EQ(reporter_->get_statistics().rate_limited_reports.load(), 1u);
}

TEST_F(ErrorReporterTest, RejectsInvalidConfiguration) {
    ErrorReporter::ReportingConfig bad = config_;
    bad.max_reports_per_second = 0;
    EXPECT_EQ(reporter_->update_configuration(bad).error(), RSPError::INVALID_CONFIGURATION);

    bad = config_;
    bad.max_log_entry_size = 16;
    EXPECT_EQ(reporter_->update_configuration(bad).error(), RSPError::INVALID_CONFIGURATION);

    EXPECT_EQ(reporter_->get_configuration().max_reports_per_second, 1000u);
}

TEST_F(ErrorReporterTest, ReportBuilderCarriesMetadata) {
    auto result = reporter_->create_report(ErrorReporter::LogLevel::WARNING, RSPError::INVALID_STATE)
        .category("isdp")
        .component("SM-SR")
        .message("enable rejected")
        .metadata("aid", "A0000005591010FFFFFFFF")
        .submit();
    ASSERT_TRUE(result);
    ASSERT_EQ(received(), 1u);
    EXPECT_EQ(received_[0].component, "SM-SR");
    EXPECT_EQ(received_[0].metadata.at("aid"), "A0000005591010FFFFFFFF");
}

TEST_F(ErrorReporterTest, ConvenienceMacrosAcceptNullReporter) {
    std::shared_ptr<ErrorReporter> none;
    RSP_REPORT_INFO(none, "ignored");
    RSP_REPORT_SECURITY(none, RSPError::SIGNATURE_VERIFICATION_FAILED, "eUICC", "ignored");

    std::shared_ptr<ErrorReporter> shared = std::make_shared<ErrorReporter>(config_);
    size_t seen = 0;
    shared->add_reporter_callback([&seen](const ErrorReporter::ErrorReport&) { ++seen; });
    RSP_REPORT_WARNING(shared, RSPError::ENDPOINT_UNAVAILABLE, "route failed");
    EXPECT_EQ(seen, 1u);
}

TEST_F(ErrorReporterTest, WritesJsonLinesToFile) {
    std::string path = ::testing::TempDir() + "rsp_reporter_test.log";
    std::remove(path.c_str());

    config_.format = ErrorReporter::OutputFormat::JSON;
    config_.write_to_stream = true;
    config_.log_file_path = path;
    {
        ErrorReporter reporter(config_);
        ASSERT_TRUE(reporter.report_security_incident(RSPError::SIGNATURE_VERIFICATION_FAILED,
                                                      "SM-DP", "bad receipt signature"));
        ASSERT_TRUE(reporter.flush_logs());
    }

    std::ifstream input(path);
    std::string line;
    ASSERT_TRUE(std::getline(input, line));
    auto entry = nlohmann::json::parse(line);
    EXPECT_EQ(entry["level"], "SECURITY");
    EXPECT_EQ(entry["error"], "SignatureVerificationFailed");
    EXPECT_EQ(entry["component"], "SM-DP");
    EXPECT_TRUE(entry["security_incident"].get<bool>());
    std::remove(path.c_str());
}

TEST(ErrorReporterLevelTest, LevelNames) {
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::CRITICAL), "CRITICAL");
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::SECURITY), "SECURITY");
}
