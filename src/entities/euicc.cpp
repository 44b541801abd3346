#include <rsp/entities/euicc.h>
#include <rsp/entities/messages.h>
#include <rsp/entities/profile.h>
#include <rsp/protocol/psk_cipher.h>
#include <rsp/protocol/scp03t.h>
#include <rsp/crypto/crypto_utils.h>
#include <algorithm>

namespace rsp {
namespace entities {

namespace {

constexpr const char* COMPONENT = "eUICC";

void wipe_string(std::string& value) {
    std::fill(value.begin(), value.end(), '\0');
    value.clear();
}

} // namespace

void Euicc::IsdpEntry::wipe() {
    crypto::utils::secure_zero(shared_secret);
    keys.clear();
    keys_established = false;
    for (auto& segment : segments) {
        wipe_string(segment);
    }
    segments.clear();
    segment_count = 0;
}

Euicc::Euicc(EuiccConfig config,
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
    , free_memory_(config_.free_memory) {
    if (!provider_ || !identity_ || !verifier_) {
        throw RSPException(RSPError::INVALID_PARAMETER, "eUICC requires provider, identity and verifier");
    }
}

Euicc::~Euicc() {
    crypto::utils::secure_zero(psk_);
    crypto::utils::secure_zero(pending_transport_secret_);
    for (auto& entry : isdps_) {
        entry.second.wipe();
    }
}

const std::string& Euicc::certificate_pem() const {
    return identity_->certificate_pem();
}

void Euicc::report_security(RSPError error, const std::string& description) {
    RSP_REPORT_SECURITY(reporter_, error, COMPONENT, description);
    if (metrics_) {
        metrics_->record_counter("euicc.security_failures");
    }
}

nlohmann::json Euicc::eis() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"euiccId", config_.euicc_id},
        {"memoryFree", free_memory_},
        {"pskSupport", config_.psk_support}
    };
}

Result<void> Euicc::accept_registration(const nlohmann::json& response) {
    const RSPError status = response_error(response);
    if (status != RSPError::SUCCESS) {
        return make_error<void>(status);
    }

    auto euicc_id = get_string(response, "euiccId");
    auto smsr_id = get_string(response, "smsrId");
    auto psk = get_base64(response, "psk");
    if (!euicc_id || !smsr_id || !psk) {
        return make_error<void>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (*euicc_id != config_.euicc_id) {
        crypto::utils::secure_zero(*psk);
        return make_error<void>(RSPError::INVALID_PARAMETER);
    }
    if (psk->size() != 16 && psk->size() != 32) {
        crypto::utils::secure_zero(*psk);
        return make_error<void>(RSPError::INVALID_KEY_LENGTH);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    crypto::utils::secure_zero(psk_);
    psk_ = std::move(*psk);
    psk_origin_ = PskOrigin::STATIC_REGISTRATION;
    smsr_id_ = *smsr_id;

    RSP_REPORT_INFO(reporter_, "Registered with " + smsr_id_);
    return make_result();
}

Result<nlohmann::json> Euicc::receive_es8(const nlohmann::json& envelope) {
    auto euicc_id = get_string(envelope, "euiccId");
    auto encrypted = get_object(envelope, "encryptedData");
    if (!euicc_id || !encrypted) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (*euicc_id != config_.euicc_id) {
        return make_error<nlohmann::json>(RSPError::INVALID_PARAMETER);
    }

    auto payload = protocol::psk_cipher::EncryptedPayload::from_json(**encrypted);
    if (!payload) {
        return make_error<nlohmann::json>(payload.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (psk_.empty()) {
        return make_error<nlohmann::json>(RSPError::PSK_NOT_ESTABLISHED);
    }

    // Replies travel under the key that protected the command, even when
    // the command itself replaces that key
    std::vector<uint8_t> channel_psk = psk_;

    auto command = protocol::psk_cipher::decrypt(*provider_, *payload, channel_psk);
    if (!command) {
        crypto::utils::secure_zero(channel_psk);
        report_security(command.error(), "ES8 command rejected by PSK channel");
        return make_error<nlohmann::json>(command.error());
    }

    auto reply = dispatch(*command);
    nlohmann::json plain_reply;
    if (reply) {
        plain_reply = std::move(*reply);
    } else {
        if (is_security_error(reply.error())) {
            report_security(reply.error(), "ES8 command failed verification");
        } else {
            RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::ERROR, reply.error(),
                             "ES8 command failed");
        }
        plain_reply = make_error_response(reply.error());
    }

    auto encrypted_reply = protocol::psk_cipher::encrypt(*provider_, plain_reply, channel_psk);
    crypto::utils::secure_zero(channel_psk);
    if (!encrypted_reply) {
        return make_error<nlohmann::json>(encrypted_reply.error());
    }

    nlohmann::json response = {
        {"status", plain_reply.value("status", std::string("error"))},
        {"encryptedData", encrypted_reply->to_json()}
    };
    auto isdp_aid = plain_reply.find("isdpAid");
    if (isdp_aid != plain_reply.end()) {
        response["isdpAid"] = *isdp_aid;
    }
    return Result<nlohmann::json>(std::move(response));
}

// Caller holds mutex_
Result<nlohmann::json> Euicc::dispatch(const nlohmann::json& command) {
    auto name = get_string(command, "command");
    if (!name) {
        return make_error<nlohmann::json>(name.error());
    }

    if (*name == es8::CREATE_ISDP) {
        return handle_create_isdp(command);
    }
    if (*name == es8::KEY_ESTABLISHMENT_INIT) {
        return handle_rekey_init(command);
    }
    if (*name == es8::KEY_ESTABLISHMENT_COMPLETE) {
        return handle_rekey_complete(command);
    }
    if (*name == es8::LOAD_SEGMENT) {
        return handle_load_segment(command);
    }
    if (*name == es8::INSTALL_PROFILE) {
        return handle_install_profile(command);
    }
    if (*name == es8::ENABLE_PROFILE) {
        return handle_set_profile_state(command, true);
    }
    if (*name == es8::DISABLE_PROFILE) {
        return handle_set_profile_state(command, false);
    }
    if (*name == es8::DELETE_ISDP) {
        return handle_delete_isdp(command);
    }
    return make_error<nlohmann::json>(RSPError::OPERATION_NOT_SUPPORTED);
}

Result<nlohmann::json> Euicc::handle_create_isdp(const nlohmann::json& command) {
    auto isdp_aid = get_string(command, "isdpAid");
    auto memory = get_unsigned(command, "memoryAllocated");
    if (!isdp_aid || !memory) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (isdps_.count(*isdp_aid) != 0) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }
    if (*memory > free_memory_) {
        return make_error<nlohmann::json>(RSPError::INSUFFICIENT_MEMORY);
    }

    IsdpEntry entry;
    entry.memory_allocated = static_cast<uint32_t>(*memory);
    isdps_.emplace(*isdp_aid, std::move(entry));
    free_memory_ -= static_cast<uint32_t>(*memory);

    nlohmann::json reply = make_success_response();
    reply["isdpAid"] = *isdp_aid;
    reply["memoryFree"] = free_memory_;
    return Result<nlohmann::json>(std::move(reply));
}

Result<nlohmann::json> Euicc::handle_rekey_init(const nlohmann::json& command) {
    auto peer_public_key = get_base64(command, "public_key");
    if (!peer_public_key) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto keypair = crypto::generate_keypair(*provider_);
    if (!keypair) {
        return make_error<nlohmann::json>(keypair.error());
    }

    auto secret = crypto::compute_shared_secret(*provider_, *keypair->private_key(), *peer_public_key);
    keypair->release();
    if (!secret) {
        return make_error<nlohmann::json>(secret.error());
    }

    crypto::utils::secure_zero(pending_transport_secret_);
    pending_transport_secret_ = std::move(*secret);

    nlohmann::json reply = make_success_response();
    reply["public_key"] = crypto::utils::base64_encode(keypair->public_point());
    return Result<nlohmann::json>(std::move(reply));
}

Result<nlohmann::json> Euicc::handle_rekey_complete(const nlohmann::json& command) {
    auto confirmation = get_base64(command, "confirmation");
    if (!confirmation) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (pending_transport_secret_.empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    auto expected = crypto::utils::hmac_sha256(*provider_, pending_transport_secret_,
                                               crypto::utils::to_bytes(es8::TRANSPORT_REKEY_CONFIRMATION));
    if (!expected) {
        return make_error<nlohmann::json>(expected.error());
    }
    if (!crypto::utils::constant_time_compare(*expected, *confirmation)) {
        crypto::utils::secure_zero(pending_transport_secret_);
        return make_error<nlohmann::json>(RSPError::MAC_VERIFICATION_FAILED);
    }

    crypto::utils::secure_zero(psk_);
    psk_ = std::move(pending_transport_secret_);
    pending_transport_secret_.clear();
    psk_origin_ = PskOrigin::ECDH;

    RSP_REPORT_INFO(reporter_, "Transport PSK replaced by ECDH secret");
    return make_success_response();
}

Result<nlohmann::json> Euicc::handle_load_segment(const nlohmann::json& command) {
    auto isdp_aid = get_string(command, "isdpAid");
    auto index = get_unsigned(command, "segmentIndex");
    auto count = get_unsigned(command, "segmentCount");
    auto host_challenge = get_base64(command, "hostChallenge");
    auto apdu_hex = get_string(command, "apdu");
    if (!isdp_aid || !index || !count || !host_challenge || !apdu_hex) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (*count == 0 || *index >= *count || *count > UINT32_MAX) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto it = isdps_.find(*isdp_aid);
    if (it == isdps_.end()) {
        return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
    }
    IsdpEntry& entry = it->second;
    if (!entry.keys_established || !entry.bound_iccid.empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    if (*index == 0) {
        for (auto& segment : entry.segments) {
            wipe_string(segment);
        }
        entry.segments.clear();
        entry.segment_count = *count;
        entry.host_challenge = *host_challenge;
    } else if (*index != entry.segments.size() || *count != entry.segment_count ||
               *host_challenge != entry.host_challenge) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    auto aid_bytes = crypto::utils::from_hex(*isdp_aid);
    auto apdu = crypto::utils::from_hex(*apdu_hex);
    if (!aid_bytes || !apdu) {
        return make_error<nlohmann::json>(RSPError::DECODE_ERROR);
    }

    auto session_keys = protocol::scp03t::derive_session_keys(
        *provider_, entry.shared_secret, entry.smdp_id, config_.euicc_id,
        entry.host_challenge, entry.card_challenge);
    if (!session_keys) {
        return make_error<nlohmann::json>(session_keys.error());
    }

    auto install = protocol::scp03t::parse_install_apdu(
        *provider_, *apdu, aid_bytes->size(), session_keys->s_enc, session_keys->s_mac,
        static_cast<uint32_t>(*index + 1));
    session_keys->clear();
    if (!install) {
        return make_error<nlohmann::json>(install.error());
    }
    if (install->isdp_aid != *aid_bytes) {
        crypto::utils::secure_zero(install->data);
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    entry.segments.emplace_back(install->data.begin(), install->data.end());
    crypto::utils::secure_zero(install->data);

    nlohmann::json reply = make_success_response();
    reply["segment"] = *index;
    reply["isdpAid"] = *isdp_aid;
    return Result<nlohmann::json>(std::move(reply));
}

Result<nlohmann::json> Euicc::handle_install_profile(const nlohmann::json& command) {
    auto iccid = get_string(command, "iccid");
    auto isdp_aid = get_string(command, "isdpAid");
    auto hash = get_string(command, "hash");
    if (!iccid || !isdp_aid || !hash) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto it = isdps_.find(*isdp_aid);
    if (it == isdps_.end()) {
        return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
    }
    IsdpEntry& entry = it->second;
    if (entry.segment_count == 0 || entry.segments.size() != entry.segment_count) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    std::string serialized;
    for (auto& segment : entry.segments) {
        serialized += segment;
        wipe_string(segment);
    }
    entry.segments.clear();
    entry.segment_count = 0;

    nlohmann::json profile = nlohmann::json::parse(serialized, nullptr, false);
    wipe_string(serialized);
    if (profile.is_discarded() || !profile.is_object()) {
        return make_error<nlohmann::json>(RSPError::DECODE_ERROR);
    }
    if (profile.value("iccid", std::string()) != *iccid) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto computed = compute_profile_hash(*provider_, profile);
    if (!computed) {
        return make_error<nlohmann::json>(computed.error());
    }
    if (*computed != *hash || *computed != profile.value("integrity_hash", std::string())) {
        return make_error<nlohmann::json>(RSPError::PROFILE_INTEGRITY_FAILED);
    }

    installed_profiles_[*iccid] = nlohmann::json{
        {"status", to_string(ProfileStatus::INSTALLED)},
        {"install_time", unix_time_now()},
        {"isdp_aid", *isdp_aid},
        {"profile_type", profile.value("profileType", std::string())}
    };
    entry.bound_iccid = *iccid;

    RSP_REPORT_INFO(reporter_, "Profile " + *iccid + " installed in " + *isdp_aid);

    nlohmann::json reply = make_success_response();
    reply["iccid"] = *iccid;
    reply["isdpAid"] = *isdp_aid;
    return Result<nlohmann::json>(std::move(reply));
}

Result<nlohmann::json> Euicc::handle_set_profile_state(const nlohmann::json& command, bool enable) {
    auto iccid = get_string(command, "iccid");
    auto isdp_aid = get_string(command, "isdpAid");
    if (!iccid || !isdp_aid) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto it = installed_profiles_.find(*iccid);
    if (it == installed_profiles_.end()) {
        return make_error<nlohmann::json>(RSPError::PROFILE_NOT_FOUND);
    }
    if (it->second.value("isdp_aid", std::string()) != *isdp_aid) {
        return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
    }

    const std::string current = it->second.value("status", std::string());
    if (enable && current != to_string(ProfileStatus::INSTALLED) &&
        current != to_string(ProfileStatus::DISABLED)) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }
    if (!enable && current != to_string(ProfileStatus::ENABLED)) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    const std::string next = to_string(enable ? ProfileStatus::ENABLED : ProfileStatus::DISABLED);
    it->second["status"] = next;

    nlohmann::json reply = make_success_response();
    reply["iccid"] = *iccid;
    reply["isdpAid"] = *isdp_aid;
    reply["profileStatus"] = next;
    return Result<nlohmann::json>(std::move(reply));
}

Result<nlohmann::json> Euicc::handle_delete_isdp(const nlohmann::json& command) {
    auto isdp_aid = get_string(command, "isdpAid");
    if (!isdp_aid) {
        return make_error<nlohmann::json>(isdp_aid.error());
    }

    auto it = isdps_.find(*isdp_aid);
    if (it == isdps_.end()) {
        return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
    }

    if (!it->second.bound_iccid.empty()) {
        installed_profiles_.erase(it->second.bound_iccid);
    }
    free_memory_ += it->second.memory_allocated;
    it->second.wipe();
    isdps_.erase(it);

    nlohmann::json reply = make_success_response();
    reply["isdpAid"] = *isdp_aid;
    reply["memoryFree"] = free_memory_;
    return Result<nlohmann::json>(std::move(reply));
}

Result<void> Euicc::verify_smdp_certificate(const std::string& certificate, const std::string& smdp_id) {
    auto chain_result = verifier_->verify({certificate});
    if (!chain_result) {
        return chain_result;
    }
    auto common_name = provider_->certificate_common_name(certificate);
    if (!common_name || *common_name != smdp_id) {
        return make_error<void>(RSPError::CERTIFICATE_VERIFY_FAILED);
    }
    return make_result();
}

Result<nlohmann::json> Euicc::respond_to_key_establishment(const nlohmann::json& init_message) {
    auto session_id = get_string(init_message, "session_id");
    auto peer_public_key = get_base64(init_message, "public_key");
    auto random_challenge = get_base64(init_message, "random_challenge");
    auto signature = get_base64(init_message, "signature");
    auto certificate = get_string(init_message, "certificate");
    auto isdp_aid = get_string(init_message, "isdp_aid");
    auto smdp_id = get_string(init_message, "smdp_id");
    if (!session_id || !peer_public_key || !random_challenge || !signature ||
        !certificate || !isdp_aid || !smdp_id) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto certificate_result = verify_smdp_certificate(*certificate, *smdp_id);
    if (!certificate_result) {
        report_security(certificate_result.error(), "SM-DP certificate rejected");
        return make_error<nlohmann::json>(certificate_result.error());
    }

    std::vector<uint8_t> signed_data = *peer_public_key;
    crypto::utils::append(signed_data, *random_challenge);
    crypto::utils::append(signed_data, *isdp_aid);
    auto signature_result = crypto::verify_certificate_signature(*provider_, *certificate,
                                                                 *signature, signed_data);
    if (!signature_result) {
        report_security(signature_result.error(), "SM-DP key establishment signature rejected");
        return make_error<nlohmann::json>(signature_result.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isdps_.count(*isdp_aid) == 0) {
            return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
        }
    }

    auto keypair = crypto::generate_keypair(*provider_);
    if (!keypair) {
        return make_error<nlohmann::json>(keypair.error());
    }
    auto shared_secret = crypto::compute_shared_secret(*provider_, *keypair->private_key(), *peer_public_key);
    keypair->release();
    if (!shared_secret) {
        return make_error<nlohmann::json>(shared_secret.error());
    }

    auto keys = crypto::derive_profile_keys(*provider_, *shared_secret);
    if (!keys) {
        crypto::utils::secure_zero(*shared_secret);
        return make_error<nlohmann::json>(keys.error());
    }

    auto card_challenge = crypto::utils::random_bytes(*provider_, constants::SCP03T_CHALLENGE_SIZE);
    if (!card_challenge) {
        crypto::utils::secure_zero(*shared_secret);
        keys->clear();
        return make_error<nlohmann::json>(card_challenge.error());
    }

    std::vector<uint8_t> mac_input = crypto::utils::to_bytes(config_.euicc_id);
    crypto::utils::append(mac_input, *smdp_id);
    crypto::utils::append(mac_input, *random_challenge);
    auto receipt_mac = crypto::utils::hmac_sha256(*provider_, keys->mac_key, mac_input);
    if (!receipt_mac) {
        crypto::utils::secure_zero(*shared_secret);
        keys->clear();
        return make_error<nlohmann::json>(receipt_mac.error());
    }

    std::vector<uint8_t> receipt_data = keypair->public_point();
    crypto::utils::append(receipt_data, *receipt_mac);
    auto receipt_signature = identity_->sign(receipt_data);
    if (!receipt_signature) {
        crypto::utils::secure_zero(*shared_secret);
        keys->clear();
        return make_error<nlohmann::json>(receipt_signature.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = isdps_.find(*isdp_aid);
        if (it == isdps_.end()) {
            crypto::utils::secure_zero(*shared_secret);
            keys->clear();
            return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
        }
        IsdpEntry& entry = it->second;
        entry.wipe();
        entry.smdp_id = *smdp_id;
        entry.shared_secret = std::move(*shared_secret);
        entry.card_challenge = *card_challenge;
        entry.keys = std::move(*keys);
        entry.keys_established = true;
    }

    if (metrics_) {
        metrics_->record_counter("euicc.key_establishments");
    }

    nlohmann::json response = {
        {"session_id", *session_id},
        {"public_key", crypto::utils::base64_encode(keypair->public_point())},
        {"card_challenge", crypto::utils::base64_encode(*card_challenge)},
        {"certificate", identity_->certificate_pem()},
        {"receipt", {
            {"mac", crypto::utils::base64_encode(*receipt_mac)},
            {"signature", crypto::utils::base64_encode(*receipt_signature)}
        }}
    };
    return Result<nlohmann::json>(std::move(response));
}

Result<crypto::DerivedKeySet> Euicc::derived_keys(const std::string& isdp_aid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = isdps_.find(isdp_aid);
    if (it == isdps_.end()) {
        return make_error<crypto::DerivedKeySet>(RSPError::ISDP_NOT_FOUND);
    }
    if (!it->second.keys_established) {
        return make_error<crypto::DerivedKeySet>(RSPError::INVALID_STATE);
    }
    return Result<crypto::DerivedKeySet>(it->second.keys);
}

Result<nlohmann::json> Euicc::installed_profile(const std::string& iccid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = installed_profiles_.find(iccid);
    if (it == installed_profiles_.end()) {
        return make_error<nlohmann::json>(RSPError::PROFILE_NOT_FOUND);
    }
    return Result<nlohmann::json>(it->second);
}

std::vector<std::string> Euicc::isdp_aids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> aids;
    aids.reserve(isdps_.size());
    for (const auto& entry : isdps_) {
        aids.push_back(entry.first);
    }
    return aids;
}

uint32_t Euicc::free_memory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_memory_;
}

bool Euicc::has_psk() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !psk_.empty();
}

Result<PskOrigin> Euicc::psk_origin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (psk_.empty()) {
        return make_error<PskOrigin>(RSPError::PSK_NOT_ESTABLISHED);
    }
    return psk_origin_;
}

nlohmann::json Euicc::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"status", "active"},
        {"entity", COMPONENT},
        {"euiccId", config_.euicc_id},
        {"installedProfiles", installed_profiles_.size()},
        {"isdps", isdps_.size()},
        {"memoryFree", free_memory_},
        {"pskPresent", !psk_.empty()}
    };
}

} // namespace entities
} // namespace rsp
