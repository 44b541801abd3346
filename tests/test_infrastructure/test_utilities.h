#ifndef RSP_TEST_UTILITIES_H
#define RSP_TEST_UTILITIES_H

#include <rsp/crypto/openssl_provider.h>
#include <rsp/crypto/identity.h>
#include <rsp/entities/endpoints.h>
#include <rsp/error_reporter.h>
#include <rsp/orchestrator.h>
#include <rsp/simulator_config.h>
#include <rsp/monitoring/metrics_system.h>
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rsp {
namespace test {

/**
 * Certificate verifier that accepts every chain.
 *
 * Test double only; lets a test reach checks that sit behind chain
 * validation (signatures, MACs) with certificates nobody trusts.
 */
class AcceptAllVerifier : public crypto::CertificateVerifier {
public:
    Result<void> verify(const std::vector<std::string>& chain) override {
        ++calls_;
        if (chain.empty()) {
            return make_error<void>(RSPError::INVALID_PARAMETER);
        }
        return make_result();
    }

    uint32_t calls() const { return calls_.load(); }

private:
    std::atomic<uint32_t> calls_{0};
};

/**
 * Key agreement endpoint that forwards to the real card and lets the
 * test rewrite the answer on its way back to SM-DP.
 */
class TamperingKeyAgreementEndpoint : public entities::EuiccKeyAgreementEndpoint {
public:
    using Tamper = std::function<void(nlohmann::json&)>;

    TamperingKeyAgreementEndpoint(std::shared_ptr<entities::EuiccKeyAgreementEndpoint> target, Tamper tamper)
        : target_(std::move(target)), tamper_(std::move(tamper)) {}

    Result<nlohmann::json> respond_to_key_establishment(const nlohmann::json& init_message) override;

private:
    std::shared_ptr<entities::EuiccKeyAgreementEndpoint> target_;
    Tamper tamper_;
};

/**
 * Reporter wired to keep every submitted report for assertions.
 */
class ReportCapture {
public:
    explicit ReportCapture(ErrorReporter::LogLevel minimum_level = ErrorReporter::LogLevel::DEBUG);

    std::shared_ptr<ErrorReporter> reporter() const { return reporter_; }
    std::vector<ErrorReporter::ErrorReport> reports() const;
    size_t count(ErrorReporter::LogLevel level) const;
    size_t security_incidents() const;
    bool contains_error(RSPError error) const;

private:
    struct Store {
        std::mutex mutex;
        std::vector<ErrorReporter::ErrorReport> reports;
    };

    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<Store> store_;
};

// Initialized OpenSSL provider; throws RSPException when OpenSSL is unusable
std::shared_ptr<crypto::OpenSSLProvider> make_provider();

// Default configuration with logging routed to callbacks only
SimulatorConfig make_test_config();

// Flip one bit of a base64 field in place
void flip_base64_bit(nlohmann::json& message, const std::string& field, size_t byte_index = 0);

/**
 * Data Generation Utilities
 */
class TestDataGenerator {
public:
    static std::vector<uint8_t> generate_sequential_data(size_t size);
    static std::vector<uint8_t> generate_pattern_data(size_t size, uint8_t pattern);
};

/**
 * Fixture holding a fully wired simulator built from make_test_config().
 */
class SimulatorTest : public ::testing::Test {
protected:
    void SetUp() override;

    // Rebuild with a modified configuration
    void rebuild(const SimulatorConfig& config);

    SimulatorConfig config_;
    std::shared_ptr<monitoring::InMemoryMetricsCollector> metrics_;
    std::unique_ptr<ReportCapture> capture_;
    std::unique_ptr<Simulator> simulator_;
};

} // namespace test
} // namespace rsp

#endif // RSP_TEST_UTILITIES_H
