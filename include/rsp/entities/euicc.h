#ifndef RSP_ENTITIES_EUICC_H
#define RSP_ENTITIES_EUICC_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/error_reporter.h>
#include <rsp/simulator_config.h>
#include <rsp/crypto/provider.h>
#include <rsp/crypto/ecdh.h>
#include <rsp/crypto/kdf.h>
#include <rsp/crypto/identity.h>
#include <rsp/entities/endpoints.h>
#include <rsp/monitoring/metrics_system.h>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rsp {
namespace entities {

/**
 * Embedded UICC.
 *
 * Answers key establishment from SM-DP and executes ES8 commands that
 * SM-SR sends inside the PSK transport channel: ISD-P creation, transport
 * rekey, segment loading, installation, enabling, disabling and deletion.
 */
class RSP_API Euicc : public Es8Endpoint, public EuiccKeyAgreementEndpoint {
public:
    Euicc(EuiccConfig config,
          std::shared_ptr<crypto::CryptoProvider> provider,
          std::unique_ptr<crypto::EntityIdentity> identity,
          std::shared_ptr<crypto::CertificateVerifier> verifier,
          std::shared_ptr<ErrorReporter> reporter = nullptr,
          std::shared_ptr<monitoring::MetricsCollector> metrics = nullptr);
    ~Euicc() override;

    Euicc(const Euicc&) = delete;
    Euicc& operator=(const Euicc&) = delete;

    const std::string& euicc_id() const { return config_.euicc_id; }
    const std::string& certificate_pem() const;

    // eUICC Information Set sent to SM-SR: {euiccId, memoryFree, pskSupport}
    nlohmann::json eis() const;

    /**
     * Take the static PSK and SM-SR id out of a registration response.
     */
    Result<void> accept_registration(const nlohmann::json& response);

    /**
     * Decrypt, execute and answer one ES8 command.
     *
     * The reply is encrypted under the PSK that protected the command. A
     * command that fails to authenticate is rejected without a reply.
     */
    Result<nlohmann::json> receive_es8(const nlohmann::json& envelope) override;

    /**
     * Verify the SM-DP certificate and signature, agree on a secret for the
     * addressed ISD-P and return the signed receipt.
     */
    Result<nlohmann::json> respond_to_key_establishment(const nlohmann::json& init_message) override;

    Result<crypto::DerivedKeySet> derived_keys(const std::string& isdp_aid) const;
    Result<nlohmann::json> installed_profile(const std::string& iccid) const;
    std::vector<std::string> isdp_aids() const;
    uint32_t free_memory() const;
    bool has_psk() const;
    Result<PskOrigin> psk_origin() const;

    // {status: "active", entity: "eUICC", installedProfiles, isdps, pskPresent}
    nlohmann::json status() const;

private:
    struct IsdpEntry {
        uint32_t memory_allocated = 0;
        std::string smdp_id;
        std::vector<uint8_t> shared_secret;
        std::vector<uint8_t> card_challenge;
        crypto::DerivedKeySet keys;
        bool keys_established = false;
        std::vector<uint8_t> host_challenge;
        std::vector<std::string> segments;
        uint64_t segment_count = 0;
        std::string bound_iccid;

        void wipe();
    };

    Result<nlohmann::json> dispatch(const nlohmann::json& command);
    Result<nlohmann::json> handle_create_isdp(const nlohmann::json& command);
    Result<nlohmann::json> handle_rekey_init(const nlohmann::json& command);
    Result<nlohmann::json> handle_rekey_complete(const nlohmann::json& command);
    Result<nlohmann::json> handle_load_segment(const nlohmann::json& command);
    Result<nlohmann::json> handle_install_profile(const nlohmann::json& command);
    Result<nlohmann::json> handle_set_profile_state(const nlohmann::json& command, bool enable);
    Result<nlohmann::json> handle_delete_isdp(const nlohmann::json& command);

    Result<void> verify_smdp_certificate(const std::string& certificate, const std::string& smdp_id);
    void report_security(RSPError error, const std::string& description);

    EuiccConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::unique_ptr<crypto::EntityIdentity> identity_;
    std::shared_ptr<crypto::CertificateVerifier> verifier_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<monitoring::MetricsCollector> metrics_;

    mutable std::mutex mutex_;
    uint32_t free_memory_;
    std::vector<uint8_t> psk_;
    PskOrigin psk_origin_ = PskOrigin::STATIC_REGISTRATION;
    std::string smsr_id_;
    std::vector<uint8_t> pending_transport_secret_;
    std::map<std::string, IsdpEntry> isdps_;
    std::map<std::string, nlohmann::json> installed_profiles_;
};

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_EUICC_H
