#ifndef RSP_ENTITIES_SM_DP_H
#define RSP_ENTITIES_SM_DP_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/error_reporter.h>
#include <rsp/session_store.h>
#include <rsp/simulator_config.h>
#include <rsp/crypto/provider.h>
#include <rsp/crypto/ecdh.h>
#include <rsp/crypto/kdf.h>
#include <rsp/crypto/identity.h>
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
 * SM-DP side of one key establishment with an eUICC.
 */
struct KeyEstablishmentSession {
    std::string euicc_id;
    std::string isdp_aid;
    crypto::EphemeralKeyPair ephemeral;
    std::vector<uint8_t> random_challenge;
    std::vector<uint8_t> peer_public_key;
    std::vector<uint8_t> shared_secret;
    std::vector<uint8_t> card_challenge;
    crypto::DerivedKeySet keys;
    SessionStep step = SessionStep::INITIALIZED;

    KeyEstablishmentSession() = default;
    KeyEstablishmentSession(KeyEstablishmentSession&&) = default;
    KeyEstablishmentSession& operator=(KeyEstablishmentSession&&) = default;
    ~KeyEstablishmentSession();
};

/**
 * Subscription Manager Data Preparation.
 *
 * Prepares profiles, runs the SM-DP half of authenticated ECDH key
 * establishment and binds prepared profiles to a completed session as a
 * segmented Bound Profile Package of SCP03t INSTALL APDUs.
 */
class RSP_API SmDp {
public:
    SmDp(SmdpConfig config,
         std::shared_ptr<crypto::CryptoProvider> provider,
         std::unique_ptr<crypto::EntityIdentity> identity,
         std::shared_ptr<crypto::CertificateVerifier> verifier,
         std::shared_ptr<ErrorReporter> reporter = nullptr,
         std::shared_ptr<monitoring::MetricsCollector> metrics = nullptr);
    ~SmDp();

    SmDp(const SmDp&) = delete;
    SmDp& operator=(const SmDp&) = delete;

    const std::string& smdp_id() const { return config_.smdp_id; }
    const std::string& certificate_pem() const;

    /**
     * Start key establishment for the ISD-P on euicc_id.
     *
     * Creates a session holding an ephemeral keypair and a 16-byte
     * challenge, and signs public_key || random_challenge || isdp_aid.
     * @return {status, session_id, public_key, random_challenge, signature,
     *          certificate, isdp_aid, smdp_id}
     */
    Result<nlohmann::json> init_key_establishment(const std::string& euicc_id,
                                                  const std::string& isdp_aid);

    /**
     * Finish key establishment from the eUICC response.
     *
     * Checks the session (INVALID_SESSION, SESSION_EXPIRED), the eUICC
     * certificate chain and receipt signature, derives {Ke, Km, Ku} and
     * checks the receipt MAC. Any failure erases the session and frees
     * its ephemeral key.
     */
    Result<crypto::DerivedKeySet> complete_key_establishment(const nlohmann::json& response);

    /**
     * Drop a session and release its ephemeral key.
     */
    bool abort_key_establishment(const std::string& session_id);

    /**
     * Keys of a completed session; INVALID_STATE before completion.
     */
    Result<crypto::DerivedKeySet> session_keys(const std::string& session_id);

    /**
     * Create the sample profile for iccid with status "prepared".
     */
    Result<nlohmann::json> prepare_profile(const std::string& iccid, const std::string& profile_type);

    /**
     * Segment the prepared profile into INSTALL APDUs protected with
     * SCP03t keys derived from the session's shared secret.
     * @return {type, iccid, isdpAid, euiccId, smdpId, hostChallenge,
     *          segmentSize, segments[], hash}
     */
    Result<nlohmann::json> build_bound_profile_package(const std::string& session_id,
                                                       const std::string& iccid);

    Result<void> update_profile_status(const std::string& iccid, ProfileStatus status);
    Result<nlohmann::json> get_profile(const std::string& iccid) const;

    size_t active_sessions() const { return sessions_.size(); }
    uint64_t completed_key_establishments() const { return completed_key_establishments_.load(); }

    /**
     * {status: "active", entity: "SM-DP", profiles, sessions, completedKeyEstablishments}
     */
    nlohmann::json status() const;

private:
    Result<void> verify_peer_certificate(const std::string& certificate, const std::string& expected_name);
    void report_security(RSPError error, const std::string& description);

    SmdpConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::unique_ptr<crypto::EntityIdentity> identity_;
    std::shared_ptr<crypto::CertificateVerifier> verifier_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<monitoring::MetricsCollector> metrics_;

    SessionStore<KeyEstablishmentSession> sessions_;
    std::atomic<uint64_t> completed_key_establishments_{0};

    std::unordered_map<std::string, nlohmann::json> profiles_;
    mutable std::mutex profiles_mutex_;
};

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_SM_DP_H
