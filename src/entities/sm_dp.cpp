#include <rsp/entities/sm_dp.h>
#include <rsp/entities/messages.h>
#include <rsp/entities/profile.h>
#include <rsp/protocol/scp03t.h>
#include <rsp/crypto/crypto_utils.h>

namespace rsp {
namespace entities {

namespace {

constexpr const char* COMPONENT = "SM-DP";

} // namespace

KeyEstablishmentSession::~KeyEstablishmentSession() {
    ephemeral.release();
    crypto::utils::secure_zero(shared_secret);
    keys.clear();
}

SmDp::SmDp(SmdpConfig config,
           std::shared_ptr<crypto::CryptoProvider> provider,
           std::unique_ptr<crypto::EntityIdentity> identity,
           std::shared_ptr<crypto::CertificateVerifier> verifier,
           std::shared_ptr<ErrorReporter> reporter,
           std::shared_ptr<monitoring::MetricsCollector> metrics)
    : config_(std::move(config))
    , provider_(std::move(provider))
    , identity_(std::move(identity))
    , verifier_(std::move(verifier))
    , reporter_(std::move(reporter))
    , metrics_(std::move(metrics))
    , sessions_(std::chrono::duration_cast<std::chrono::milliseconds>(config_.session_ttl)) {
    if (!provider_ || !identity_ || !verifier_) {
        throw RSPException(RSPError::INVALID_PARAMETER, "SM-DP requires provider, identity and verifier");
    }
}

SmDp::~SmDp() = default;

const std::string& SmDp::certificate_pem() const {
    return identity_->certificate_pem();
}

void SmDp::report_security(RSPError error, const std::string& description) {
    RSP_REPORT_SECURITY(reporter_, error, COMPONENT, description);
    if (metrics_) {
        metrics_->record_counter("smdp.security_failures");
    }
}

Result<void> SmDp::verify_peer_certificate(const std::string& certificate,
                                           const std::string& expected_name) {
    auto chain_result = verifier_->verify({certificate});
    if (!chain_result) {
        return chain_result;
    }

    auto common_name = provider_->certificate_common_name(certificate);
    if (!common_name) {
        return make_error<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }
    if (*common_name != expected_name) {
        return make_error<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }
    return make_result();
}

Result<nlohmann::json> SmDp::init_key_establishment(const std::string& euicc_id,
                                                    const std::string& isdp_aid) {
    if (euicc_id.empty() || isdp_aid.empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_PARAMETER);
    }

    // Abandoned sessions release their ephemeral keys here
    const size_t purged = sessions_.purge_expired();
    if (purged > 0) {
        RSP_REPORT_INFO(reporter_, "Purged " + std::to_string(purged) + " expired key establishment sessions");
    }

    auto session_id = generate_session_id(*provider_);
    if (!session_id) {
        return make_error<nlohmann::json>(session_id.error());
    }

    KeyEstablishmentSession session;
    session.euicc_id = euicc_id;
    session.isdp_aid = isdp_aid;

    auto keypair = crypto::generate_keypair(*provider_);
    if (!keypair) {
        return make_error<nlohmann::json>(keypair.error());
    }
    session.ephemeral = std::move(*keypair);

    auto challenge = crypto::generate_random_challenge(*provider_);
    if (!challenge) {
        return make_error<nlohmann::json>(challenge.error());
    }
    session.random_challenge = std::move(*challenge);

    std::vector<uint8_t> signed_data = session.ephemeral.public_point();
    crypto::utils::append(signed_data, session.random_challenge);
    crypto::utils::append(signed_data, isdp_aid);

    auto signature = identity_->sign(signed_data);
    if (!signature) {
        return make_error<nlohmann::json>(signature.error());
    }

    nlohmann::json message = {
        {"status", "success"},
        {"session_id", *session_id},
        {"public_key", crypto::utils::base64_encode(session.ephemeral.public_point())},
        {"random_challenge", crypto::utils::base64_encode(session.random_challenge)},
        {"signature", crypto::utils::base64_encode(*signature)},
        {"certificate", identity_->certificate_pem()},
        {"isdp_aid", isdp_aid},
        {"smdp_id", config_.smdp_id}
    };

    auto stored = sessions_.create(*session_id, std::move(session));
    if (!stored) {
        return make_error<nlohmann::json>(stored.error());
    }

    RSP_REPORT_INFO(reporter_, "Key establishment initiated for ISD-P " + isdp_aid);
    return Result<nlohmann::json>(std::move(message));
}

Result<crypto::DerivedKeySet> SmDp::complete_key_establishment(const nlohmann::json& response) {
    auto session_id = get_string(response, "session_id");
    if (!session_id) {
        return make_error<crypto::DerivedKeySet>(session_id.error());
    }

    auto result = sessions_.with_session(*session_id,
        [&](KeyEstablishmentSession& session) -> Result<crypto::DerivedKeySet> {
            if (session.step != SessionStep::INITIALIZED) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_STATE);
            }
            if (!session.ephemeral.has_private_key()) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_SESSION);
            }

            auto peer_public_key = get_base64(response, "public_key");
            auto card_challenge = get_base64(response, "card_challenge");
            auto certificate = get_string(response, "certificate");
            auto receipt = get_object(response, "receipt");
            if (!peer_public_key || !card_challenge || !certificate || !receipt) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_MESSAGE_FORMAT);
            }
            auto receipt_mac = get_base64(**receipt, "mac");
            auto receipt_signature = get_base64(**receipt, "signature");
            if (!receipt_mac || !receipt_signature) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_MESSAGE_FORMAT);
            }
            if (card_challenge->size() != constants::SCP03T_CHALLENGE_SIZE) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_MESSAGE_FORMAT);
            }

            auto certificate_result = verify_peer_certificate(*certificate, session.euicc_id);
            if (!certificate_result) {
                return make_error<crypto::DerivedKeySet>(certificate_result.error());
            }

            std::vector<uint8_t> signed_data = *peer_public_key;
            crypto::utils::append(signed_data, *receipt_mac);
            auto signature_result = crypto::verify_certificate_signature(
                *provider_, *certificate, *receipt_signature, signed_data);
            if (!signature_result) {
                return make_error<crypto::DerivedKeySet>(signature_result.error());
            }

            auto shared_secret = crypto::compute_shared_secret(
                *provider_, *session.ephemeral.private_key(), *peer_public_key);
            if (!shared_secret) {
                return make_error<crypto::DerivedKeySet>(shared_secret.error());
            }

            auto keys = crypto::derive_profile_keys(*provider_, *shared_secret);
            if (!keys) {
                crypto::utils::secure_zero(*shared_secret);
                return make_error<crypto::DerivedKeySet>(keys.error());
            }

            std::vector<uint8_t> mac_input = crypto::utils::to_bytes(session.euicc_id);
            crypto::utils::append(mac_input, config_.smdp_id);
            crypto::utils::append(mac_input, session.random_challenge);
            auto expected_mac = crypto::utils::hmac_sha256(*provider_, keys->mac_key, mac_input);
            if (!expected_mac) {
                crypto::utils::secure_zero(*shared_secret);
                keys->clear();
                return make_error<crypto::DerivedKeySet>(expected_mac.error());
            }
            if (!crypto::utils::constant_time_compare(*expected_mac, *receipt_mac)) {
                crypto::utils::secure_zero(*shared_secret);
                keys->clear();
                return make_error<crypto::DerivedKeySet>(RSPError::MAC_VERIFICATION_FAILED);
            }

            session.peer_public_key = std::move(*peer_public_key);
            session.card_challenge = std::move(*card_challenge);
            session.shared_secret = std::move(*shared_secret);
            session.keys = *keys;
            session.step = SessionStep::COMPLETED;
            session.ephemeral.release();

            return Result<crypto::DerivedKeySet>(std::move(*keys));
        });

    if (!result) {
        const RSPError error = result.error();
        // Failed sessions never keep their ephemeral key around
        sessions_.erase(*session_id);
        if (is_security_error(error) || error == RSPError::SESSION_EXPIRED) {
            report_security(error, "Key establishment rejected for session " + *session_id);
        } else {
            RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::ERROR, error,
                             "Key establishment failed for session " + *session_id);
        }
        return result;
    }

    completed_key_establishments_.fetch_add(1);
    if (metrics_) {
        metrics_->record_counter("smdp.key_establishments");
    }
    RSP_REPORT_INFO(reporter_, "Key establishment completed for session " + *session_id);
    return result;
}

bool SmDp::abort_key_establishment(const std::string& session_id) {
    return sessions_.erase(session_id);
}

Result<crypto::DerivedKeySet> SmDp::session_keys(const std::string& session_id) {
    return sessions_.with_session(session_id,
        [](KeyEstablishmentSession& session) -> Result<crypto::DerivedKeySet> {
            if (session.step != SessionStep::COMPLETED) {
                return make_error<crypto::DerivedKeySet>(RSPError::INVALID_STATE);
            }
            return session.keys;
        });
}

Result<nlohmann::json> SmDp::prepare_profile(const std::string& iccid, const std::string& profile_type) {
    const std::string& type = profile_type.empty() ? config_.default_profile_type : profile_type;

    auto profile = create_sample_profile(*provider_, iccid, type);
    if (!profile) {
        return profile;
    }

    {
        std::lock_guard<std::mutex> lock(profiles_mutex_);
        profiles_[iccid] = *profile;
    }

    RSP_REPORT_INFO(reporter_, "Profile prepared for ICCID " + iccid);
    return profile;
}

Result<nlohmann::json> SmDp::build_bound_profile_package(const std::string& session_id,
                                                         const std::string& iccid) {
    nlohmann::json profile;
    {
        std::lock_guard<std::mutex> lock(profiles_mutex_);
        auto it = profiles_.find(iccid);
        if (it == profiles_.end()) {
            return make_error<nlohmann::json>(RSPError::PROFILE_NOT_FOUND);
        }
        profile = it->second;
    }

    RSP_SCOPED_TIMER(metrics_, "smdp.build_bound_profile_package");

    return sessions_.with_session(session_id,
        [&](KeyEstablishmentSession& session) -> Result<nlohmann::json> {
            if (session.step != SessionStep::COMPLETED) {
                return make_error<nlohmann::json>(RSPError::INVALID_STATE);
            }

            auto aid_bytes = crypto::utils::from_hex(session.isdp_aid);
            if (!aid_bytes) {
                return make_error<nlohmann::json>(aid_bytes.error());
            }

            auto host_challenge = crypto::utils::random_bytes(*provider_, constants::SCP03T_CHALLENGE_SIZE);
            if (!host_challenge) {
                return make_error<nlohmann::json>(host_challenge.error());
            }

            auto session_keys = protocol::scp03t::derive_session_keys(
                *provider_, session.shared_secret, config_.smdp_id, session.euicc_id,
                *host_challenge, session.card_challenge);
            if (!session_keys) {
                return make_error<nlohmann::json>(session_keys.error());
            }

            const std::string serialized = profile.dump();
            nlohmann::json segments = nlohmann::json::array();
            uint32_t counter = 1;
            for (size_t offset = 0; offset < serialized.size(); offset += config_.segment_size) {
                const std::string chunk = serialized.substr(offset, config_.segment_size);
                auto apdu = protocol::scp03t::build_install_apdu(
                    *provider_, *aid_bytes, crypto::utils::to_bytes(chunk),
                    session_keys->s_enc, session_keys->s_mac, counter++);
                if (!apdu) {
                    session_keys->clear();
                    return make_error<nlohmann::json>(apdu.error());
                }
                segments.push_back(crypto::utils::to_hex(*apdu, true));
            }
            session_keys->clear();

            nlohmann::json package = {
                {"type", "bound_profile_package"},
                {"iccid", iccid},
                {"isdpAid", session.isdp_aid},
                {"euiccId", session.euicc_id},
                {"smdpId", config_.smdp_id},
                {"hostChallenge", crypto::utils::base64_encode(*host_challenge)},
                {"segmentSize", config_.segment_size},
                {"segments", std::move(segments)},
                {"hash", profile.value("integrity_hash", std::string())}
            };
            return Result<nlohmann::json>(std::move(package));
        });
}

Result<void> SmDp::update_profile_status(const std::string& iccid, ProfileStatus status) {
    std::lock_guard<std::mutex> lock(profiles_mutex_);
    auto it = profiles_.find(iccid);
    if (it == profiles_.end()) {
        return make_error<void>(RSPError::PROFILE_NOT_FOUND);
    }
    it->second["status"] = to_string(status);
    return make_result();
}

Result<nlohmann::json> SmDp::get_profile(const std::string& iccid) const {
    std::lock_guard<std::mutex> lock(profiles_mutex_);
    auto it = profiles_.find(iccid);
    if (it == profiles_.end()) {
        return make_error<nlohmann::json>(RSPError::PROFILE_NOT_FOUND);
    }
    return Result<nlohmann::json>(it->second);
}

nlohmann::json SmDp::status() const {
    size_t profile_count = 0;
    {
        std::lock_guard<std::mutex> lock(profiles_mutex_);
        profile_count = profiles_.size();
    }
    return nlohmann::json{
        {"status", "active"},
        {"entity", COMPONENT},
        {"smdpId", config_.smdp_id},
        {"profiles", profile_count},
        {"sessions", sessions_.size()},
        {"completedKeyEstablishments", completed_key_establishments_.load()}
    };
}

} // namespace entities
} // namespace rsp
