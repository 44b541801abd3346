#ifndef RSP_ENTITIES_PROFILE_H
#define RSP_ENTITIES_PROFILE_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <nlohmann/json.hpp>
#include <string>

namespace rsp {
namespace entities {

constexpr const char* USIM_AID = "A0000000871002";
constexpr const char* ISIM_AID = "A0000000871004";

/**
 * Build a sample profile:
 *   {"profileType", "iccid", "status": "prepared", "timestamp",
 *    "sim_data": {"imsi", "ki", "opc"}, "applications": [USIM, ISIM], "integrity_hash"}
 *
 * imsi is "001" followed by iccid[3..15); ki and opc are 16 random bytes
 * in hex. iccid must have at least 15 characters.
 */
RSP_API Result<nlohmann::json> create_sample_profile(crypto::CryptoProvider& provider,
                                                     const std::string& iccid,
                                                     const std::string& profile_type);

/**
 * SHA-256 hex of the profile's canonical serialization (sorted keys,
 * compact) with "integrity_hash" and "status" removed.
 */
RSP_API Result<std::string> compute_profile_hash(crypto::CryptoProvider& provider,
                                                 const nlohmann::json& profile);

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_PROFILE_H
