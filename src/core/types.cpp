#include <rsp/types.h>
#include <sstream>
#include <unordered_map>

namespace rsp {

std::string to_string(IsdpState state) {
    static const std::unordered_map<IsdpState, std::string> state_names = {
        {IsdpState::CREATED, "CREATED"},
        {IsdpState::UPLOADED, "UPLOADED"},
        {IsdpState::INSTALLED, "INSTALLED"},
        {IsdpState::ENABLED, "ENABLED"},
        {IsdpState::DISABLED, "DISABLED"},
        {IsdpState::DELETED, "DELETED"}
    };

    auto it = state_names.find(state);
    if (it != state_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "UNKNOWN_ISDP_STATE(" << static_cast<int>(state) << ")";
    return oss.str();
}

std::string to_string(ProfileStatus status) {
    switch (status) {
        case ProfileStatus::PREPARED: return "prepared";
        case ProfileStatus::TRANSMITTED: return "transmitted";
        case ProfileStatus::INSTALLED: return "installed";
        case ProfileStatus::ENABLED: return "enabled";
        case ProfileStatus::DISABLED: return "disabled";
    }
    return "unknown";
}

std::string to_string(SessionStep step) {
    return step == SessionStep::COMPLETED ? "completed" : "initialized";
}

std::string to_string(PskOrigin origin) {
    return origin == PskOrigin::ECDH ? "ecdh" : "static_registration";
}

std::string to_string(ProvisioningPhase phase) {
    switch (phase) {
        case ProvisioningPhase::REGISTRATION: return "registration";
        case ProvisioningPhase::ISDP_CREATION: return "isdp_creation";
        case ProvisioningPhase::KEY_ESTABLISHMENT: return "key_establishment";
        case ProvisioningPhase::PROFILE_DOWNLOAD: return "profile_download";
        case ProvisioningPhase::PROFILE_ENABLING: return "profile_enabling";
    }
    return "unknown";
}

Result<ProfileStatus> profile_status_from_string(const std::string& value) {
    static const std::unordered_map<std::string, ProfileStatus> statuses = {
        {"prepared", ProfileStatus::PREPARED},
        {"transmitted", ProfileStatus::TRANSMITTED},
        {"installed", ProfileStatus::INSTALLED},
        {"enabled", ProfileStatus::ENABLED},
        {"disabled", ProfileStatus::DISABLED}
    };

    auto it = statuses.find(value);
    if (it == statuses.end()) {
        return make_error<ProfileStatus>(RSPError::DECODE_ERROR);
    }
    return it->second;
}

int64_t unix_time_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace rsp
