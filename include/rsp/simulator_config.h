#ifndef RSP_SIMULATOR_CONFIG_H
#define RSP_SIMULATOR_CONFIG_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/error_reporter.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace rsp {

struct SmdpConfig {
    std::string smdp_id = "SMDP_001";
    std::chrono::seconds session_ttl{300};
    size_t segment_size = constants::DEFAULT_SEGMENT_SIZE;
    std::string default_profile_type = "telecom";

    Result<void> validate() const;
};

struct SmsrConfig {
    std::string smsr_id_prefix = "SMSR_";
    uint32_t default_free_memory = constants::DEFAULT_EUICC_FREE_MEMORY;
    size_t static_psk_length = constants::STATIC_PSK_SIZE;
    std::chrono::seconds session_ttl{300};

    // Replace the static PSK with an ECDH secret after key establishment
    bool transport_rekey = true;

    Result<void> validate() const;
};

struct EuiccConfig {
    std::string euicc_id = "89012345678901234567";
    uint32_t free_memory = constants::DEFAULT_EUICC_FREE_MEMORY;
    bool psk_support = true;

    Result<void> validate() const;
};

struct OrchestratorConfig {
    uint32_t memory_required = 256;
    std::string iccid = "8901234567890123456";
    std::string profile_type = "telecom";

    Result<void> validate() const;
};

/**
 * Complete simulator configuration. Every field has a default, so an
 * empty JSON object is a valid configuration file.
 */
struct SimulatorConfig {
    SmdpConfig smdp;
    SmsrConfig smsr;
    EuiccConfig euicc;
    OrchestratorConfig orchestrator;
    ErrorReporter::ReportingConfig logging;

    // Issue entity certificates from the simulator root CA instead of self-signing
    bool use_certificate_authority = true;

    Result<void> validate() const;
};

/**
 * Build a configuration from parsed JSON. Missing keys keep their
 * defaults; wrong types or failed validation give INVALID_CONFIGURATION.
 */
RSP_API Result<SimulatorConfig> parse_simulator_config(const nlohmann::json& value);

/**
 * Read and parse a JSON configuration file.
 */
RSP_API Result<SimulatorConfig> load_simulator_config(const std::string& path);

RSP_API nlohmann::json to_json(const SimulatorConfig& config);

} // namespace rsp

#endif // RSP_SIMULATOR_CONFIG_H
