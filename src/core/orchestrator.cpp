#include <rsp/orchestrator.h>
#include <rsp/crypto/openssl_provider.h>
#include <rsp/entities/messages.h>

namespace rsp {

nlohmann::json ProvisioningReport::to_json() const {
    nlohmann::json timings_json = nlohmann::json::object();
    for (const auto& timing : timings) {
        timings_json[timing.phase] = timing.seconds;
    }

    nlohmann::json value = {
        {"success", success},
        {"euiccId", euicc_id},
        {"isdpAid", isdp_aid},
        {"iccid", iccid},
        {"sessionId", session_id},
        {"profileHash", profile_hash},
        {"keysMatch", keys_match},
        {"timings", std::move(timings_json)},
        {"totalSeconds", total_seconds}
    };
    if (!success) {
        value["failedPhase"] = failed_phase ? to_string(*failed_phase) : std::string("unknown");
        value["error"] = error_name(error);
        value["message"] = error_message(error);
    }
    return value;
}

ProvisioningOrchestrator::ProvisioningOrchestrator(OrchestratorConfig config,
                                                   std::shared_ptr<entities::SmDp> smdp,
                                                   std::shared_ptr<entities::SmSr> smsr,
                                                   std::shared_ptr<entities::Euicc> euicc,
                                                   std::shared_ptr<monitoring::MetricsCollector> metrics,
                                                   std::shared_ptr<ErrorReporter> reporter)
    : config_(std::move(config))
    , smdp_(std::move(smdp))
    , smsr_(std::move(smsr))
    , euicc_(std::move(euicc))
    , metrics_(std::move(metrics))
    , reporter_(std::move(reporter)) {
    if (!smdp_ || !smsr_ || !euicc_) {
        throw RSPException(RSPError::INVALID_PARAMETER, "Orchestrator requires SM-DP, SM-SR and eUICC");
    }
}

Result<void> ProvisioningOrchestrator::register_euicc() {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (registered_) {
        return make_result();
    }

    auto eis = smsr_->route_message(entities::EUICC_ENTITY, entities::SMSR_ENTITY, euicc_->eis());
    if (!eis) {
        return make_error<void>(eis.error());
    }

    auto response = smsr_->register_euicc(*eis);
    if (!response) {
        return make_error<void>(response.error());
    }

    auto accepted = euicc_->accept_registration(*response);
    if (!accepted) {
        return accepted;
    }

    auto attached = smsr_->attach_endpoint(euicc_->euicc_id(), euicc_, euicc_);
    if (!attached) {
        return attached;
    }

    registered_ = true;
    return make_result();
}

Result<void> ProvisioningOrchestrator::create_isdp(ProvisioningReport& report, uint32_t memory_required) {
    nlohmann::json request = {
        {"euiccId", report.euicc_id},
        {"memoryRequired", memory_required}
    };

    auto routed = smsr_->route_message(entities::SMDP_ENTITY, entities::SMSR_ENTITY, request);
    if (!routed) {
        return make_error<void>(routed.error());
    }

    auto created = smsr_->create_isdp(*routed);
    if (!created) {
        return make_error<void>(created.error());
    }

    auto response = smsr_->route_message(entities::SMSR_ENTITY, entities::SMDP_ENTITY, *created);
    if (!response) {
        return make_error<void>(response.error());
    }

    auto isdp_aid = entities::get_string(*response, "isdpAid");
    if (!isdp_aid) {
        return make_error<void>(isdp_aid.error());
    }
    report.isdp_aid = *isdp_aid;
    return make_result();
}

Result<void> ProvisioningOrchestrator::establish_keys(ProvisioningReport& report) {
    auto init = smdp_->init_key_establishment(report.euicc_id, report.isdp_aid);
    if (!init) {
        return make_error<void>(init.error());
    }
    report.session_id = (*init)["session_id"].get<std::string>();

    auto routed_init = smsr_->route_message(entities::SMDP_ENTITY, report.euicc_id, *init);
    if (!routed_init) {
        return make_error<void>(routed_init.error());
    }

    auto card_response = smsr_->relay_key_establishment(report.euicc_id, *routed_init);
    if (!card_response) {
        return make_error<void>(card_response.error());
    }

    auto routed_response = smsr_->route_message(report.euicc_id, entities::SMDP_ENTITY, *card_response);
    if (!routed_response) {
        return make_error<void>(routed_response.error());
    }

    auto smdp_keys = smdp_->complete_key_establishment(*routed_response);
    if (!smdp_keys) {
        return make_error<void>(smdp_keys.error());
    }

    auto card_keys = euicc_->derived_keys(report.isdp_aid);
    if (!card_keys) {
        smdp_keys->clear();
        return make_error<void>(card_keys.error());
    }

    report.keys_match = *smdp_keys == *card_keys;
    smdp_keys->clear();
    card_keys->clear();
    if (!report.keys_match) {
        return make_error<void>(RSPError::KEY_DERIVATION_FAILED);
    }

    if (smsr_->transport_rekey_enabled()) {
        auto rekeyed = smsr_->rekey_transport(report.euicc_id);
        if (!rekeyed) {
            return rekeyed;
        }
    }
    return make_result();
}

Result<void> ProvisioningOrchestrator::download_profile(ProvisioningReport& report) {
    auto profile = smdp_->prepare_profile(report.iccid, config_.profile_type);
    if (!profile) {
        return make_error<void>(profile.error());
    }
    report.profile_hash = (*profile)["integrity_hash"].get<std::string>();

    auto package = smdp_->build_bound_profile_package(report.session_id, report.iccid);
    if (!package) {
        return make_error<void>(package.error());
    }

    auto routed = smsr_->route_message(entities::SMDP_ENTITY, entities::SMSR_ENTITY, *package);
    if (!routed) {
        return make_error<void>(routed.error());
    }

    auto received = smsr_->receive_bound_profile_package(*routed);
    if (!received) {
        return make_error<void>(received.error());
    }

    auto transmitted = smdp_->update_profile_status(report.iccid, ProfileStatus::TRANSMITTED);
    if (!transmitted) {
        return transmitted;
    }

    auto downloaded = smsr_->download_profile(report.iccid);
    if (!downloaded) {
        return make_error<void>(downloaded.error());
    }

    return smdp_->update_profile_status(report.iccid, ProfileStatus::INSTALLED);
}

Result<void> ProvisioningOrchestrator::enable_profile(ProvisioningReport& report) {
    auto enabled = smsr_->enable_profile(report.iccid);
    if (!enabled) {
        return make_error<void>(enabled.error());
    }
    return smdp_->update_profile_status(report.iccid, ProfileStatus::ENABLED);
}

ProvisioningReport ProvisioningOrchestrator::run() {
    return run(config_.iccid, config_.memory_required);
}

ProvisioningReport ProvisioningOrchestrator::run(const std::string& iccid, uint32_t memory_required) {
    ProvisioningReport report;
    report.euicc_id = euicc_->euicc_id();
    report.iccid = iccid;

    monitoring::ScopedTimer total_timer(metrics_, "provisioning_total");

    auto fail = [&](ProvisioningPhase phase, RSPError error) {
        report.success = false;
        report.failed_phase = phase;
        report.error = error;
        // Frees the SM-DP ephemeral key of an unfinished key establishment
        if (!report.session_id.empty()) {
            smdp_->abort_key_establishment(report.session_id);
        }
        RSP_REPORT_ERROR(reporter_, ErrorReporter::LogLevel::CRITICAL, error,
                         "Provisioning of " + iccid + " stopped in phase " + to_string(phase));
    };

    auto registered = register_euicc();
    if (!registered) {
        fail(ProvisioningPhase::REGISTRATION, registered.error());
        total_timer.stop();
        report.total_seconds = total_timer.get_elapsed();
        return report;
    }

    using PhaseStep = Result<void> (ProvisioningOrchestrator::*)(ProvisioningReport&);
    struct Phase {
        ProvisioningPhase phase;
        PhaseStep step;
    };
    const Phase phases[] = {
        {ProvisioningPhase::KEY_ESTABLISHMENT, &ProvisioningOrchestrator::establish_keys},
        {ProvisioningPhase::PROFILE_DOWNLOAD, &ProvisioningOrchestrator::download_profile},
        {ProvisioningPhase::PROFILE_ENABLING, &ProvisioningOrchestrator::enable_profile},
    };

    {
        const std::string name = to_string(ProvisioningPhase::ISDP_CREATION);
        monitoring::ScopedTimer timer(metrics_, name);
        auto created = create_isdp(report, memory_required);
        timer.stop();
        report.timings.push_back({name, timer.get_elapsed()});
        if (!created) {
            fail(ProvisioningPhase::ISDP_CREATION, created.error());
            total_timer.stop();
            report.total_seconds = total_timer.get_elapsed();
            return report;
        }
    }

    for (const auto& phase : phases) {
        const std::string name = to_string(phase.phase);
        monitoring::ScopedTimer timer(metrics_, name);
        auto result = (this->*phase.step)(report);
        timer.stop();
        report.timings.push_back({name, timer.get_elapsed()});
        if (!result) {
            fail(phase.phase, result.error());
            total_timer.stop();
            report.total_seconds = total_timer.get_elapsed();
            return report;
        }
    }

    // Session secrets are no longer needed once the profile is enabled
    smdp_->abort_key_establishment(report.session_id);

    report.success = true;
    total_timer.stop();
    report.total_seconds = total_timer.get_elapsed();

    RSP_REPORT_INFO(reporter_, "Provisioning of " + iccid + " completed in " + report.isdp_aid);
    return report;
}

Result<std::unique_ptr<Simulator>> build_simulator(const SimulatorConfig& config,
                                                   std::shared_ptr<monitoring::MetricsCollector> metrics,
                                                   std::shared_ptr<ErrorReporter> reporter) {
    using ReturnType = std::unique_ptr<Simulator>;

    auto valid = config.validate();
    if (!valid) {
        return make_error<ReturnType>(valid.error());
    }

    auto simulator = std::make_unique<Simulator>();
    simulator->config = config;
    simulator->metrics = metrics ? std::move(metrics)
                                 : std::make_shared<monitoring::InMemoryMetricsCollector>();
    simulator->reporter = reporter ? std::move(reporter)
                                   : std::make_shared<ErrorReporter>(config.logging);

    auto provider = std::make_shared<crypto::OpenSSLProvider>();
    auto initialized = provider->initialize();
    if (!initialized) {
        return make_error<ReturnType>(initialized.error());
    }
    simulator->provider = provider;

    std::unique_ptr<crypto::EntityIdentity> smdp_identity;
    std::unique_ptr<crypto::EntityIdentity> euicc_identity;
    std::vector<std::string> smdp_trusted;
    std::vector<std::string> euicc_trusted;

    if (config.use_certificate_authority) {
        auto ca = crypto::CertificateAuthority::create(provider);
        if (!ca) {
            return make_error<ReturnType>(ca.error());
        }
        simulator->certificate_authority = std::move(*ca);

        auto smdp_id = crypto::EntityIdentity::issue(provider, config.smdp.smdp_id,
                                                     *simulator->certificate_authority);
        auto euicc_id = crypto::EntityIdentity::issue(provider, config.euicc.euicc_id,
                                                      *simulator->certificate_authority);
        if (!smdp_id || !euicc_id) {
            return make_error<ReturnType>(!smdp_id ? smdp_id.error() : euicc_id.error());
        }
        smdp_identity = std::move(*smdp_id);
        euicc_identity = std::move(*euicc_id);
        smdp_trusted.push_back(simulator->certificate_authority->certificate_pem());
        euicc_trusted.push_back(simulator->certificate_authority->certificate_pem());
    } else {
        auto smdp_id = crypto::EntityIdentity::generate_self_signed(provider, config.smdp.smdp_id);
        auto euicc_id = crypto::EntityIdentity::generate_self_signed(provider, config.euicc.euicc_id);
        if (!smdp_id || !euicc_id) {
            return make_error<ReturnType>(!smdp_id ? smdp_id.error() : euicc_id.error());
        }
        smdp_identity = std::move(*smdp_id);
        euicc_identity = std::move(*euicc_id);
        // Each side pins the other's self-signed certificate
        smdp_trusted.push_back(euicc_identity->certificate_pem());
        euicc_trusted.push_back(smdp_identity->certificate_pem());
    }

    auto smdp_verifier = std::make_shared<crypto::X509ChainVerifier>(provider, std::move(smdp_trusted));
    auto euicc_verifier = std::make_shared<crypto::X509ChainVerifier>(provider, std::move(euicc_trusted));

    try {
        simulator->smdp = std::make_shared<entities::SmDp>(
            config.smdp, provider, std::move(smdp_identity), smdp_verifier,
            simulator->reporter, simulator->metrics);
        simulator->smsr = std::make_shared<entities::SmSr>(
            config.smsr, provider, simulator->reporter, simulator->metrics);
        simulator->euicc = std::make_shared<entities::Euicc>(
            config.euicc, provider, std::move(euicc_identity), euicc_verifier,
            simulator->reporter, simulator->metrics);
        simulator->orchestrator = std::make_unique<ProvisioningOrchestrator>(
            config.orchestrator, simulator->smdp, simulator->smsr, simulator->euicc,
            simulator->metrics, simulator->reporter);
    } catch (const RSPException& e) {
        return make_error<ReturnType>(e.rsp_error());
    }

    return Result<ReturnType>(std::move(simulator));
}

} // namespace rsp
