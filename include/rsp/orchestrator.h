#ifndef RSP_ORCHESTRATOR_H
#define RSP_ORCHESTRATOR_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/error_reporter.h>
#include <rsp/simulator_config.h>
#include <rsp/crypto/identity.h>
#include <rsp/entities/sm_dp.h>
#include <rsp/entities/sm_sr.h>
#include <rsp/entities/euicc.h>
#include <rsp/monitoring/metrics_system.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rsp {

struct PhaseTiming {
    std::string phase;
    double seconds = 0.0;
};

/**
 * Outcome of one provisioning run.
 *
 * A failed run names the phase that stopped it and the error kind; the
 * identifiers collected up to that point are kept for diagnosis.
 */
struct ProvisioningReport {
    bool success = false;
    std::optional<ProvisioningPhase> failed_phase;
    RSPError error = RSPError::SUCCESS;
    std::string euicc_id;
    std::string isdp_aid;
    std::string iccid;
    std::string session_id;
    std::string profile_hash;
    bool keys_match = false;
    std::vector<PhaseTiming> timings;
    double total_seconds = 0.0;

    nlohmann::json to_json() const;
};

/**
 * Runs registration and the four provisioning phases across SM-DP,
 * SM-SR and the eUICC:
 *   1. ISD-P creation
 *   2. key establishment (and transport rekey when enabled)
 *   3. profile preparation and download
 *   4. profile enabling
 *
 * Phase durations go to the injected MetricsCollector as isdp_creation,
 * key_establishment, profile_download, profile_enabling and
 * provisioning_total.
 */
class RSP_API ProvisioningOrchestrator {
public:
    ProvisioningOrchestrator(OrchestratorConfig config,
                             std::shared_ptr<entities::SmDp> smdp,
                             std::shared_ptr<entities::SmSr> smsr,
                             std::shared_ptr<entities::Euicc> euicc,
                             std::shared_ptr<monitoring::MetricsCollector> metrics = nullptr,
                             std::shared_ptr<ErrorReporter> reporter = nullptr);

    ProvisioningOrchestrator(const ProvisioningOrchestrator&) = delete;
    ProvisioningOrchestrator& operator=(const ProvisioningOrchestrator&) = delete;

    /**
     * Register the eUICC with SM-SR and attach it as the ES8 endpoint.
     * Runs once; later calls return immediately.
     */
    Result<void> register_euicc();

    // Provision the configured ICCID
    ProvisioningReport run();
    ProvisioningReport run(const std::string& iccid, uint32_t memory_required);

    entities::SmDp& smdp() { return *smdp_; }
    entities::SmSr& smsr() { return *smsr_; }
    entities::Euicc& euicc() { return *euicc_; }

private:
    Result<void> create_isdp(ProvisioningReport& report, uint32_t memory_required);
    Result<void> establish_keys(ProvisioningReport& report);
    Result<void> download_profile(ProvisioningReport& report);
    Result<void> enable_profile(ProvisioningReport& report);

    OrchestratorConfig config_;
    std::shared_ptr<entities::SmDp> smdp_;
    std::shared_ptr<entities::SmSr> smsr_;
    std::shared_ptr<entities::Euicc> euicc_;
    std::shared_ptr<monitoring::MetricsCollector> metrics_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::mutex registration_mutex_;
    bool registered_ = false;
};

/**
 * Fully wired simulator: one provider, root CA, the three entities and
 * an orchestrator over them.
 */
struct RSP_API Simulator {
    SimulatorConfig config;
    std::shared_ptr<crypto::CryptoProvider> provider;
    std::unique_ptr<crypto::CertificateAuthority> certificate_authority;
    std::shared_ptr<ErrorReporter> reporter;
    std::shared_ptr<monitoring::MetricsCollector> metrics;
    std::shared_ptr<entities::SmDp> smdp;
    std::shared_ptr<entities::SmSr> smsr;
    std::shared_ptr<entities::Euicc> euicc;
    std::unique_ptr<ProvisioningOrchestrator> orchestrator;
};

/**
 * Build a simulator from configuration.
 *
 * Entity certificates come from a fresh root CA, or are self-signed and
 * pinned by the peer when use_certificate_authority is false. A null
 * metrics collector or reporter is replaced by an in-memory collector and
 * a reporter built from config.logging.
 */
RSP_API Result<std::unique_ptr<Simulator>> build_simulator(
    const SimulatorConfig& config,
    std::shared_ptr<monitoring::MetricsCollector> metrics = nullptr,
    std::shared_ptr<ErrorReporter> reporter = nullptr);

} // namespace rsp

#endif // RSP_ORCHESTRATOR_H
