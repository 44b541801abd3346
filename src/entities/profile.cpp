#include <rsp/entities/profile.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/types.h>

namespace rsp {
namespace entities {

namespace {

constexpr size_t SIM_KEY_BYTES = 16;

} // namespace

Result<nlohmann::json> create_sample_profile(crypto::CryptoProvider& provider,
                                             const std::string& iccid,
                                             const std::string& profile_type) {
    if (iccid.size() < 15 || profile_type.empty()) {
        return make_error<nlohmann::json>(RSPError::INVALID_PARAMETER);
    }

    auto ki = crypto::utils::random_bytes(provider, SIM_KEY_BYTES);
    if (!ki) {
        return make_error<nlohmann::json>(ki.error());
    }
    auto opc = crypto::utils::random_bytes(provider, SIM_KEY_BYTES);
    if (!opc) {
        return make_error<nlohmann::json>(opc.error());
    }

    nlohmann::json profile = {
        {"profileType", profile_type},
        {"iccid", iccid},
        {"status", to_string(ProfileStatus::PREPARED)},
        {"timestamp", unix_time_now()},
        {"sim_data", {
            {"imsi", "001" + iccid.substr(3, 12)},
            {"ki", crypto::utils::to_hex(*ki)},
            {"opc", crypto::utils::to_hex(*opc)}
        }},
        {"applications", nlohmann::json::array({
            {{"aid", USIM_AID}, {"name", "USIM"}, {"priority", 1}},
            {{"aid", ISIM_AID}, {"name", "ISIM"}, {"priority", 2}}
        })}
    };

    crypto::utils::secure_zero(*ki);
    crypto::utils::secure_zero(*opc);

    auto hash = compute_profile_hash(provider, profile);
    if (!hash) {
        return make_error<nlohmann::json>(hash.error());
    }
    profile["integrity_hash"] = *hash;

    return Result<nlohmann::json>(std::move(profile));
}

Result<std::string> compute_profile_hash(crypto::CryptoProvider& provider,
                                         const nlohmann::json& profile) {
    if (!profile.is_object()) {
        return make_error<std::string>(RSPError::INVALID_PARAMETER);
    }

    nlohmann::json canonical = profile;
    canonical.erase("integrity_hash");
    canonical.erase("status");

    // nlohmann::json objects keep their keys sorted, so dump() is canonical
    return crypto::utils::sha256_hex(provider, canonical.dump());
}

} // namespace entities
} // namespace rsp
