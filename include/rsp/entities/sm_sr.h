#ifndef RSP_ENTITIES_SM_SR_H
#define RSP_ENTITIES_SM_SR_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/error_reporter.h>
#include <rsp/simulator_config.h>
#include <rsp/crypto/provider.h>
#include <rsp/protocol/isdp_manager.h>
#include <rsp/entities/endpoints.h>
#include <rsp/entities/psk_registry.h>
#include <rsp/monitoring/metrics_system.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rsp {
namespace entities {

/**
 * Subscription Manager Secure Routing.
 *
 * Registers eUICCs and issues their transport PSK, owns the ISD-P
 * records, forwards messages between SM-DP and the eUICC and carries
 * Bound Profile Packages to the card as ES8 commands.
 */
class RSP_API SmSr {
public:
    SmSr(SmsrConfig config,
         std::shared_ptr<crypto::CryptoProvider> provider,
         std::shared_ptr<ErrorReporter> reporter = nullptr,
         std::shared_ptr<monitoring::MetricsCollector> metrics = nullptr);
    ~SmSr();

    SmSr(const SmSr&) = delete;
    SmSr& operator=(const SmSr&) = delete;

    // "SMSR_" followed by 8 hex characters, fixed for the instance lifetime
    const std::string& smsr_id() const { return smsr_id_; }
    bool transport_rekey_enabled() const { return config_.transport_rekey; }

    /**
     * Register an eUICC from its EIS {euiccId, memoryFree, pskSupport}.
     * @return {status, smsrId, euiccId, psk} with a fresh static PSK, or
     *         PSK_NOT_ESTABLISHED when the card has no PSK support
     */
    Result<nlohmann::json> register_euicc(const nlohmann::json& eis);

    Result<void> attach_endpoint(const std::string& euicc_id,
                                 std::shared_ptr<Es8Endpoint> es8,
                                 std::shared_ptr<EuiccKeyAgreementEndpoint> key_agreement);
    void detach_endpoint(const std::string& euicc_id);

    /**
     * Forward a message unchanged and count it.
     * @return ENDPOINT_UNAVAILABLE for an unknown destination
     */
    Result<nlohmann::json> route_message(const std::string& source,
                                         const std::string& destination,
                                         const nlohmann::json& message);

    // {euiccId, memoryRequired} -> {status, isdpAid, euiccId}
    Result<nlohmann::json> create_isdp(const nlohmann::json& request);

    // Hand an SM-DP key establishment init to the card and return its answer
    Result<nlohmann::json> relay_key_establishment(const std::string& euicc_id,
                                                   const nlohmann::json& init_message);

    /**
     * Replace the static transport PSK with an ECDH secret agreed with
     * the card inside the current PSK channel.
     */
    Result<void> rekey_transport(const std::string& euicc_id);

    Result<nlohmann::json> receive_bound_profile_package(const nlohmann::json& package);

    /**
     * Load every segment of the stored package, then install it.
     * The ISD-P moves CREATED -> UPLOADED -> INSTALLED.
     */
    Result<nlohmann::json> download_profile(const std::string& iccid);

    Result<nlohmann::json> enable_profile(const std::string& iccid);
    Result<nlohmann::json> disable_profile(const std::string& iccid);
    Result<nlohmann::json> delete_isdp(const std::string& isdp_aid);

    Result<protocol::IsdpRecord> isdp(const std::string& isdp_aid) const;
    Result<PskOrigin> psk_origin(const std::string& euicc_id) const;
    uint64_t routed_messages() const { return routed_messages_.load(); }

    // {status: "active", entity: "SM-SR", registeredEuiccs, isdps, routedMessages, profiles}
    nlohmann::json status() const;

private:
    struct EisRecord {
        std::string euicc_id;
        uint32_t memory_free = 0;
        bool psk_support = false;
        int64_t registration_time = 0;
    };

    struct Endpoints {
        std::shared_ptr<Es8Endpoint> es8;
        std::shared_ptr<EuiccKeyAgreementEndpoint> key_agreement;
    };

    struct ProfileEntry {
        std::string iccid;
        std::string euicc_id;
        std::string isdp_aid;
        nlohmann::json package;
        ProfileStatus status = ProfileStatus::TRANSMITTED;
    };

    Result<nlohmann::json> send_es8(const std::string& euicc_id, const nlohmann::json& command);
    Result<ProfileEntry> find_profile(const std::string& iccid) const;
    void set_profile_status(const std::string& iccid, ProfileStatus status);

    SmsrConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<monitoring::MetricsCollector> metrics_;
    std::string smsr_id_;

    protocol::IsdpManager isdp_manager_;
    PskRegistry psk_registry_;
    std::atomic<uint64_t> routed_messages_{0};

    std::unordered_map<std::string, EisRecord> eis_;
    std::unordered_map<std::string, Endpoints> endpoints_;
    std::unordered_map<std::string, ProfileEntry> profiles_;
    mutable std::mutex mutex_;
};

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_SM_SR_H
