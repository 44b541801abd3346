#include <rsp/simulator_config.h>

#include <fstream>

namespace rsp {

Result<void> SmdpConfig::validate() const {
    if (smdp_id.empty() || session_ttl.count() <= 0 || segment_size == 0) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    if (default_profile_type.empty()) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    return make_result();
}

Result<void> SmsrConfig::validate() const {
    if (smsr_id_prefix.empty() || session_ttl.count() <= 0) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    // The transport cipher accepts AES-128 and AES-256 sized PSKs only
    if (static_psk_length != 16 && static_psk_length != 32) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    return make_result();
}

Result<void> EuiccConfig::validate() const {
    if (euicc_id.empty()) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    return make_result();
}

Result<void> OrchestratorConfig::validate() const {
    if (memory_required == 0 || profile_type.empty()) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    // imsi is built from iccid[3..15)
    if (iccid.size() < 15) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    return make_result();
}

Result<void> SimulatorConfig::validate() const {
    auto result = smdp.validate();
    if (!result) return result;
    result = smsr.validate();
    if (!result) return result;
    result = euicc.validate();
    if (!result) return result;
    result = orchestrator.validate();
    if (!result) return result;
    return logging.validate();
}

namespace {

template<typename T>
void read_optional(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end()) {
        it->get_to(target);
    }
}

void read_seconds(const nlohmann::json& j, const char* key, std::chrono::seconds& target) {
    auto it = j.find(key);
    if (it != j.end()) {
        target = std::chrono::seconds(it->get<int64_t>());
    }
}

Result<ErrorReporter::LogLevel> log_level_from_string(const std::string& value) {
    static const std::pair<const char*, ErrorReporter::LogLevel> levels[] = {
        {"debug", ErrorReporter::LogLevel::DEBUG},
        {"info", ErrorReporter::LogLevel::INFO},
        {"warning", ErrorReporter::LogLevel::WARNING},
        {"error", ErrorReporter::LogLevel::ERROR},
        {"critical", ErrorReporter::LogLevel::CRITICAL},
        {"security", ErrorReporter::LogLevel::SECURITY},
    };
    for (const auto& level : levels) {
        if (value == level.first) {
            return level.second;
        }
    }
    return make_error<ErrorReporter::LogLevel>(RSPError::INVALID_CONFIGURATION);
}

// Throws nlohmann::json::exception on type mismatches
Result<void> read_logging(const nlohmann::json& j, ErrorReporter::ReportingConfig& config) {
    auto level = j.find("minimum_level");
    if (level != j.end()) {
        auto parsed = log_level_from_string(level->get<std::string>());
        if (!parsed) {
            return make_error<void>(parsed.error());
        }
        config.minimum_level = *parsed;
    }
    auto format = j.find("format");
    if (format != j.end()) {
        const auto name = format->get<std::string>();
        if (name == "json") {
            config.format = ErrorReporter::OutputFormat::JSON;
        } else if (name == "human") {
            config.format = ErrorReporter::OutputFormat::HUMAN_READABLE;
        } else {
            return make_error<void>(RSPError::INVALID_CONFIGURATION);
        }
    }
    read_optional(j, "max_reports_per_second", config.max_reports_per_second);
    read_optional(j, "max_log_entry_size", config.max_log_entry_size);
    read_optional(j, "log_file_path", config.log_file_path);
    read_optional(j, "write_to_stream", config.write_to_stream);
    read_optional(j, "use_utc_timestamps", config.use_utc_timestamps);
    return make_result();
}

} // namespace

void from_json(const nlohmann::json& j, SmdpConfig& config) {
    read_optional(j, "smdp_id", config.smdp_id);
    read_seconds(j, "session_ttl_seconds", config.session_ttl);
    read_optional(j, "segment_size", config.segment_size);
    read_optional(j, "default_profile_type", config.default_profile_type);
}

void from_json(const nlohmann::json& j, SmsrConfig& config) {
    read_optional(j, "smsr_id_prefix", config.smsr_id_prefix);
    read_optional(j, "default_free_memory", config.default_free_memory);
    read_optional(j, "static_psk_length", config.static_psk_length);
    read_seconds(j, "session_ttl_seconds", config.session_ttl);
    read_optional(j, "transport_rekey", config.transport_rekey);
}

void from_json(const nlohmann::json& j, EuiccConfig& config) {
    read_optional(j, "euicc_id", config.euicc_id);
    read_optional(j, "free_memory", config.free_memory);
    read_optional(j, "psk_support", config.psk_support);
}

void from_json(const nlohmann::json& j, OrchestratorConfig& config) {
    read_optional(j, "memory_required", config.memory_required);
    read_optional(j, "iccid", config.iccid);
    read_optional(j, "profile_type", config.profile_type);
}

Result<SimulatorConfig> parse_simulator_config(const nlohmann::json& value) {
    if (!value.is_object()) {
        return make_error<SimulatorConfig>(RSPError::INVALID_CONFIGURATION);
    }

    SimulatorConfig config;
    try {
        read_optional(value, "smdp", config.smdp);
        read_optional(value, "smsr", config.smsr);
        read_optional(value, "euicc", config.euicc);
        read_optional(value, "orchestrator", config.orchestrator);
        read_optional(value, "use_certificate_authority", config.use_certificate_authority);

        auto logging = value.find("logging");
        if (logging != value.end()) {
            if (!logging->is_object()) {
                return make_error<SimulatorConfig>(RSPError::INVALID_CONFIGURATION);
            }
            auto logging_result = read_logging(*logging, config.logging);
            if (!logging_result) {
                return make_error<SimulatorConfig>(logging_result.error());
            }
        }
    } catch (const nlohmann::json::exception&) {
        return make_error<SimulatorConfig>(RSPError::INVALID_CONFIGURATION);
    }

    auto valid = config.validate();
    if (!valid) {
        return make_error<SimulatorConfig>(valid.error());
    }
    return config;
}

Result<SimulatorConfig> load_simulator_config(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        return make_error<SimulatorConfig>(RSPError::INVALID_CONFIGURATION);
    }

    auto value = nlohmann::json::parse(input, nullptr, false);
    if (value.is_discarded()) {
        return make_error<SimulatorConfig>(RSPError::INVALID_CONFIGURATION);
    }
    return parse_simulator_config(value);
}

nlohmann::json to_json(const SimulatorConfig& config) {
    return nlohmann::json{
        {"smdp", {
            {"smdp_id", config.smdp.smdp_id},
            {"session_ttl_seconds", config.smdp.session_ttl.count()},
            {"segment_size", config.smdp.segment_size},
            {"default_profile_type", config.smdp.default_profile_type}
        }},
        {"smsr", {
            {"smsr_id_prefix", config.smsr.smsr_id_prefix},
            {"default_free_memory", config.smsr.default_free_memory},
            {"static_psk_length", config.smsr.static_psk_length},
            {"session_ttl_seconds", config.smsr.session_ttl.count()},
            {"transport_rekey", config.smsr.transport_rekey}
        }},
        {"euicc", {
            {"euicc_id", config.euicc.euicc_id},
            {"free_memory", config.euicc.free_memory},
            {"psk_support", config.euicc.psk_support}
        }},
        {"orchestrator", {
            {"memory_required", config.orchestrator.memory_required},
            {"iccid", config.orchestrator.iccid},
            {"profile_type", config.orchestrator.profile_type}
        }},
        {"use_certificate_authority", config.use_certificate_authority}
    };
}

} // namespace rsp
