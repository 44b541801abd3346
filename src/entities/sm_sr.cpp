#include <rsp/entities/sm_sr.h>
#include <rsp/entities/messages.h>
#include <rsp/protocol/psk_cipher.h>
#include <rsp/crypto/ecdh.h>
#include <rsp/crypto/crypto_utils.h>

namespace rsp {
namespace entities {

namespace {

constexpr const char* COMPONENT = "SM-SR";
constexpr size_t SMSR_ID_BYTES = 4;

std::string generate_smsr_id(crypto::CryptoProvider& provider, const std::string& prefix) {
    auto suffix = crypto::utils::random_bytes(provider, SMSR_ID_BYTES);
    if (!suffix) {
        throw RSPException(suffix.error(), "Cannot allocate SM-SR identifier");
    }
    return prefix + crypto::utils::to_hex(*suffix);
}

} // namespace

SmSr::SmSr(SmsrConfig config,
           std::shared_ptr<crypto::CryptoProvider> provider,
           std::shared_ptr<ErrorReporter> reporter,
           std::shared_ptr<monitoring::MetricsCollector> metrics)
    : config_(std::move(config))
    , provider_(std::move(provider))
    , reporter_(std::move(reporter))
    , metrics_(std::move(metrics))
    , isdp_manager_(provider_) {
    if (!provider_) {
        throw RSPException(RSPError::INVALID_PARAMETER, "SM-SR requires a crypto provider");
    }
    smsr_id_ = generate_smsr_id(*provider_, config_.smsr_id_prefix);
}

SmSr::~SmSr() = default;

Result<nlohmann::json> SmSr::register_euicc(const nlohmann::json& eis) {
    auto euicc_id = get_string(eis, "euiccId");
    if (!euicc_id) {
        return make_error<nlohmann::json>(euicc_id.error());
    }
    if (euicc_id->empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_PARAMETER);
    }

    uint32_t memory_free = config_.default_free_memory;
    if (eis.contains("memoryFree")) {
        auto memory = get_unsigned(eis, "memoryFree");
        if (!memory || *memory > UINT32_MAX) {
            return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
        }
        memory_free = static_cast<uint32_t>(*memory);
    }

    auto psk_support = eis.find("pskSupport");
    if (psk_support == eis.end() || !psk_support->is_boolean() || !psk_support->get<bool>()) {
        RSP_REPORT_WARNING(reporter_, RSPError::PSK_NOT_ESTABLISHED,
                           "eUICC " + *euicc_id + " registered without PSK support");
        return make_error<nlohmann::json>(RSPError::PSK_NOT_ESTABLISHED);
    }

    auto registered = isdp_manager_.register_euicc(*euicc_id, memory_free);
    if (!registered) {
        return make_error<nlohmann::json>(registered.error());
    }

    auto psk = crypto::utils::random_bytes(*provider_, config_.static_psk_length);
    if (!psk) {
        return make_error<nlohmann::json>(psk.error());
    }
    const std::string encoded_psk = crypto::utils::base64_encode(*psk);

    auto stored = psk_registry_.store(*euicc_id, std::move(*psk), PskOrigin::STATIC_REGISTRATION);
    if (!stored) {
        return make_error<nlohmann::json>(stored.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        EisRecord record;
        record.euicc_id = *euicc_id;
        record.memory_free = memory_free;
        record.psk_support = true;
        record.registration_time = unix_time_now();
        eis_[*euicc_id] = record;
    }

    RSP_REPORT_INFO(reporter_, "eUICC " + *euicc_id + " registered");

    nlohmann::json response = make_success_response();
    response["smsrId"] = smsr_id_;
    response["euiccId"] = *euicc_id;
    response["psk"] = encoded_psk;
    return Result<nlohmann::json>(std::move(response));
}

Result<void> SmSr::attach_endpoint(const std::string& euicc_id,
                                   std::shared_ptr<Es8Endpoint> es8,
                                   std::shared_ptr<EuiccKeyAgreementEndpoint> key_agreement) {
    if (!es8 || !key_agreement) {
        return make_error<void>(RSPError::ENDPOINT_UNAVAILABLE);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (eis_.count(euicc_id) == 0) {
        return make_error<void>(RSPError::EUICC_NOT_REGISTERED);
    }
    endpoints_[euicc_id] = Endpoints{std::move(es8), std::move(key_agreement)};
    return make_result();
}

void SmSr::detach_endpoint(const std::string& euicc_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(euicc_id);
}

Result<nlohmann::json> SmSr::route_message(const std::string& source,
                                           const std::string& destination,
                                           const nlohmann::json& message) {
    bool known = destination == SMDP_ENTITY || destination == SMSR_ENTITY;
    if (!known) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destination == EUICC_ENTITY) {
            known = !endpoints_.empty();
        } else {
            known = endpoints_.count(destination) != 0;
        }
    }
    if (!known) {
        RSP_REPORT_WARNING(reporter_, RSPError::ENDPOINT_UNAVAILABLE,
                           "No route from " + source + " to " + destination);
        return make_error<nlohmann::json>(RSPError::ENDPOINT_UNAVAILABLE);
    }

    routed_messages_.fetch_add(1);
    if (metrics_) {
        metrics_->record_counter("smsr.routed_messages");
    }
    RSP_REPORT_DEBUG(reporter_, "Routed message " + source + " -> " + destination);
    return Result<nlohmann::json>(message);
}

Result<nlohmann::json> SmSr::send_es8(const std::string& euicc_id, const nlohmann::json& command) {
    std::shared_ptr<Es8Endpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(euicc_id);
        if (it == endpoints_.end() || !it->second.es8) {
            return make_error<nlohmann::json>(RSPError::ENDPOINT_UNAVAILABLE);
        }
        endpoint = it->second.es8;
    }

    auto record = psk_registry_.get(euicc_id);
    if (!record) {
        return make_error<nlohmann::json>(record.error());
    }

    auto encrypted = protocol::psk_cipher::encrypt(*provider_, command, record->psk);
    if (!encrypted) {
        crypto::utils::secure_zero(record->psk);
        return make_error<nlohmann::json>(encrypted.error());
    }

    nlohmann::json envelope = {
        {"euiccId", euicc_id},
        {"encryptedData", encrypted->to_json()}
    };
    routed_messages_.fetch_add(1);

    auto reply = endpoint->receive_es8(envelope);
    if (!reply) {
        crypto::utils::secure_zero(record->psk);
        return make_error<nlohmann::json>(reply.error());
    }

    auto encrypted_reply = get_object(*reply, "encryptedData");
    if (!encrypted_reply) {
        crypto::utils::secure_zero(record->psk);
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    auto payload = protocol::psk_cipher::EncryptedPayload::from_json(**encrypted_reply);
    if (!payload) {
        crypto::utils::secure_zero(record->psk);
        return make_error<nlohmann::json>(payload.error());
    }

    auto plain = protocol::psk_cipher::decrypt(*provider_, *payload, record->psk);
    crypto::utils::secure_zero(record->psk);
    if (!plain) {
        RSP_REPORT_SECURITY(reporter_, plain.error(), COMPONENT,
                            "ES8 reply from " + euicc_id + " failed authentication");
        return plain;
    }

    const RSPError status = response_error(*plain);
    if (status != RSPError::SUCCESS) {
        return make_error<nlohmann::json>(status);
    }
    return plain;
}

Result<nlohmann::json> SmSr::create_isdp(const nlohmann::json& request) {
    auto euicc_id = get_string(request, "euiccId");
    auto memory_required = get_unsigned(request, "memoryRequired");
    if (!euicc_id || !memory_required || *memory_required > UINT32_MAX) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto record = isdp_manager_.create(*euicc_id, static_cast<uint32_t>(*memory_required));
    if (!record) {
        RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::ERROR, record.error(),
                         "ISD-P creation refused for " + *euicc_id);
        return make_error<nlohmann::json>(record.error());
    }

    nlohmann::json command = {
        {"command", es8::CREATE_ISDP},
        {"isdpAid", record->isdp_aid},
        {"memoryAllocated", record->memory_allocated}
    };
    auto reply = send_es8(*euicc_id, command);
    if (!reply) {
        // The card never got the ISD-P, give the memory back
        auto rollback = isdp_manager_.remove(record->isdp_aid);
        if (!rollback) {
            RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::ERROR, rollback.error(),
                             "ISD-P rollback failed for " + record->isdp_aid);
        }
        return make_error<nlohmann::json>(reply.error());
    }

    RSP_REPORT_INFO(reporter_, "ISD-P " + record->isdp_aid + " created on " + *euicc_id);

    nlohmann::json response = make_success_response();
    response["isdpAid"] = record->isdp_aid;
    response["euiccId"] = *euicc_id;
    return Result<nlohmann::json>(std::move(response));
}

Result<nlohmann::json> SmSr::relay_key_establishment(const std::string& euicc_id,
                                                     const nlohmann::json& init_message) {
    std::shared_ptr<EuiccKeyAgreementEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(euicc_id);
        if (it == endpoints_.end() || !it->second.key_agreement) {
            return make_error<nlohmann::json>(RSPError::ENDPOINT_UNAVAILABLE);
        }
        endpoint = it->second.key_agreement;
    }

    routed_messages_.fetch_add(1);
    auto response = endpoint->respond_to_key_establishment(init_message);
    if (response) {
        routed_messages_.fetch_add(1);
    }
    return response;
}

Result<void> SmSr::rekey_transport(const std::string& euicc_id) {
    RSP_SCOPED_TIMER(metrics_, "smsr.transport_rekey");

    auto keypair = crypto::generate_keypair(*provider_);
    if (!keypair) {
        return make_error<void>(keypair.error());
    }

    nlohmann::json init = {
        {"command", es8::KEY_ESTABLISHMENT_INIT},
        {"public_key", crypto::utils::base64_encode(keypair->public_point())}
    };
    auto init_reply = send_es8(euicc_id, init);
    if (!init_reply) {
        return make_error<void>(init_reply.error());
    }

    auto card_public_key = get_base64(*init_reply, "public_key");
    if (!card_public_key) {
        return make_error<void>(RSPError::INVALID_MESSAGE_FORMAT);
    }

    auto secret = crypto::compute_shared_secret(*provider_, *keypair->private_key(), *card_public_key);
    keypair->release();
    if (!secret) {
        return make_error<void>(secret.error());
    }

    auto confirmation = crypto::utils::hmac_sha256(
        *provider_, *secret, crypto::utils::to_bytes(es8::TRANSPORT_REKEY_CONFIRMATION));
    if (!confirmation) {
        crypto::utils::secure_zero(*secret);
        return make_error<void>(confirmation.error());
    }

    nlohmann::json complete = {
        {"command", es8::KEY_ESTABLISHMENT_COMPLETE},
        {"confirmation", crypto::utils::base64_encode(*confirmation)}
    };
    auto complete_reply = send_es8(euicc_id, complete);
    if (!complete_reply) {
        crypto::utils::secure_zero(*secret);
        return make_error<void>(complete_reply.error());
    }

    auto stored = psk_registry_.store(euicc_id, std::move(*secret), PskOrigin::ECDH);
    if (!stored) {
        return stored;
    }

    RSP_REPORT_INFO(reporter_, "Transport PSK for " + euicc_id + " rekeyed by ECDH");
    return make_result();
}

Result<nlohmann::json> SmSr::receive_bound_profile_package(const nlohmann::json& package) {
    auto iccid = get_string(package, "iccid");
    auto isdp_aid = get_string(package, "isdpAid");
    auto euicc_id = get_string(package, "euiccId");
    auto hash = get_string(package, "hash");
    auto host_challenge = get_string(package, "hostChallenge");
    if (!iccid || !isdp_aid || !euicc_id || !hash || !host_challenge) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    auto segments = package.find("segments");
    if (segments == package.end() || !segments->is_array() || segments->empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    for (const auto& segment : *segments) {
        if (!segment.is_string()) {
            return make_error<nlohmann::json>(RSPError::INVALID_MESSAGE_FORMAT);
        }
    }

    auto record = isdp_manager_.get(*isdp_aid);
    if (!record) {
        return make_error<nlohmann::json>(record.error());
    }
    if (record->euicc_id != *euicc_id) {
        return make_error<nlohmann::json>(RSPError::ISDP_NOT_FOUND);
    }
    if (record->state != IsdpState::CREATED) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ProfileEntry entry;
        entry.iccid = *iccid;
        entry.euicc_id = *euicc_id;
        entry.isdp_aid = *isdp_aid;
        entry.package = package;
        entry.status = ProfileStatus::TRANSMITTED;
        profiles_[*iccid] = std::move(entry);
    }

    nlohmann::json response = make_success_response();
    response["iccid"] = *iccid;
    response["isdpAid"] = *isdp_aid;
    response["segments"] = segments->size();
    return Result<nlohmann::json>(std::move(response));
}

Result<SmSr::ProfileEntry> SmSr::find_profile(const std::string& iccid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(iccid);
    if (it == profiles_.end()) {
        return make_error<ProfileEntry>(RSPError::PROFILE_NOT_FOUND);
    }
    return Result<ProfileEntry>(it->second);
}

void SmSr::set_profile_status(const std::string& iccid, ProfileStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(iccid);
    if (it != profiles_.end()) {
        it->second.status = status;
    }
}

Result<nlohmann::json> SmSr::download_profile(const std::string& iccid) {
    auto profile = find_profile(iccid);
    if (!profile) {
        return make_error<nlohmann::json>(profile.error());
    }

    const nlohmann::json& segments = profile->package["segments"];
    const uint64_t segment_count = segments.size();
    for (uint64_t index = 0; index < segment_count; ++index) {
        nlohmann::json command = {
            {"command", es8::LOAD_SEGMENT},
            {"isdpAid", profile->isdp_aid},
            {"segmentIndex", index},
            {"segmentCount", segment_count},
            {"hostChallenge", profile->package["hostChallenge"]},
            {"apdu", segments[index]}
        };
        auto ack = send_es8(profile->euicc_id, command);
        if (!ack) {
            RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::ERROR, ack.error(),
                             "Segment " + std::to_string(index) + " rejected for " + profile->isdp_aid);
            return make_error<nlohmann::json>(ack.error());
        }
    }

    auto uploaded = isdp_manager_.mark_uploaded(profile->isdp_aid);
    if (!uploaded) {
        return make_error<nlohmann::json>(uploaded.error());
    }

    nlohmann::json install = {
        {"command", es8::INSTALL_PROFILE},
        {"iccid", iccid},
        {"isdpAid", profile->isdp_aid},
        {"hash", profile->package["hash"]}
    };
    auto installed_reply = send_es8(profile->euicc_id, install);
    if (!installed_reply) {
        return make_error<nlohmann::json>(installed_reply.error());
    }

    auto installed = isdp_manager_.install(profile->isdp_aid, iccid);
    if (!installed) {
        return make_error<nlohmann::json>(installed.error());
    }
    set_profile_status(iccid, ProfileStatus::INSTALLED);

    RSP_REPORT_INFO(reporter_, "Profile " + iccid + " installed in " + profile->isdp_aid);

    nlohmann::json response = make_success_response();
    response["iccid"] = iccid;
    response["isdpAid"] = profile->isdp_aid;
    response["segments"] = segment_count;
    return Result<nlohmann::json>(std::move(response));
}

Result<nlohmann::json> SmSr::enable_profile(const std::string& iccid) {
    auto profile = find_profile(iccid);
    if (!profile) {
        return make_error<nlohmann::json>(profile.error());
    }

    auto record = isdp_manager_.get(profile->isdp_aid);
    if (!record) {
        return make_error<nlohmann::json>(record.error());
    }
    if (!protocol::IsdpManager::is_valid_transition(record->state, IsdpState::ENABLED)) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    nlohmann::json command = {
        {"command", es8::ENABLE_PROFILE},
        {"iccid", iccid},
        {"isdpAid", profile->isdp_aid}
    };
    auto reply = send_es8(profile->euicc_id, command);
    if (!reply) {
        return make_error<nlohmann::json>(reply.error());
    }

    auto enabled = isdp_manager_.enable(profile->isdp_aid);
    if (!enabled) {
        return make_error<nlohmann::json>(enabled.error());
    }
    set_profile_status(iccid, ProfileStatus::ENABLED);

    nlohmann::json response = make_success_response();
    response["iccid"] = iccid;
    response["isdpAid"] = profile->isdp_aid;
    response["profileStatus"] = to_string(ProfileStatus::ENABLED);
    return Result<nlohmann::json>(std::move(response));
}

Result<nlohmann::json> SmSr::disable_profile(const std::string& iccid) {
    auto profile = find_profile(iccid);
    if (!profile) {
        return make_error<nlohmann::json>(profile.error());
    }

    auto record = isdp_manager_.get(profile->isdp_aid);
    if (!record) {
        return make_error<nlohmann::json>(record.error());
    }
    if (record->state != IsdpState::ENABLED) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    nlohmann::json command = {
        {"command", es8::DISABLE_PROFILE},
        {"iccid", iccid},
        {"isdpAid", profile->isdp_aid}
    };
    auto reply = send_es8(profile->euicc_id, command);
    if (!reply) {
        return make_error<nlohmann::json>(reply.error());
    }

    auto disabled = isdp_manager_.disable(profile->isdp_aid);
    if (!disabled) {
        return make_error<nlohmann::json>(disabled.error());
    }
    set_profile_status(iccid, ProfileStatus::DISABLED);

    nlohmann::json response = make_success_response();
    response["iccid"] = iccid;
    response["isdpAid"] = profile->isdp_aid;
    response["profileStatus"] = to_string(ProfileStatus::DISABLED);
    return Result<nlohmann::json>(std::move(response));
}

Result<nlohmann::json> SmSr::delete_isdp(const std::string& isdp_aid) {
    auto record = isdp_manager_.get(isdp_aid);
    if (!record) {
        return make_error<nlohmann::json>(record.error());
    }
    if (record->state == IsdpState::DELETED) {
        return make_error<nlohmann::json>(RSPError::INVALID_STATE);
    }

    nlohmann::json command = {
        {"command", es8::DELETE_ISDP},
        {"isdpAid", isdp_aid}
    };
    auto reply = send_es8(record->euicc_id, command);
    if (!reply) {
        return make_error<nlohmann::json>(reply.error());
    }

    auto removed = isdp_manager_.remove(isdp_aid);
    if (!removed) {
        return make_error<nlohmann::json>(removed.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = profiles_.begin(); it != profiles_.end();) {
            if (it->second.isdp_aid == isdp_aid) {
                it = profiles_.erase(it);
            } else {
                ++it;
            }
        }
    }

    RSP_REPORT_INFO(reporter_, "ISD-P " + isdp_aid + " deleted");

    nlohmann::json response = make_success_response();
    response["isdpAid"] = isdp_aid;
    response["euiccId"] = record->euicc_id;
    return Result<nlohmann::json>(std::move(response));
}

Result<protocol::IsdpRecord> SmSr::isdp(const std::string& isdp_aid) const {
    return isdp_manager_.get(isdp_aid);
}

Result<PskOrigin> SmSr::psk_origin(const std::string& euicc_id) const {
    auto record = psk_registry_.get(euicc_id);
    if (!record) {
        return make_error<PskOrigin>(record.error());
    }
    crypto::utils::secure_zero(record->psk);
    return record->origin;
}

nlohmann::json SmSr::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"status", "active"},
        {"entity", COMPONENT},
        {"smsrId", smsr_id_},
        {"registeredEuiccs", eis_.size()},
        {"isdps", isdp_manager_.active_count()},
        {"routedMessages", routed_messages_.load()},
        {"profiles", profiles_.size()}
    };
}

} // namespace entities
} // namespace rsp
