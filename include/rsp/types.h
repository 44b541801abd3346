#ifndef RSP_TYPES_H
#define RSP_TYPES_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace rsp {

// ISD-P lifecycle states
enum class IsdpState : uint8_t {
    CREATED = 0,
    UPLOADED = 1,
    INSTALLED = 2,
    ENABLED = 3,
    DISABLED = 4,
    DELETED = 5
};

// Profile status as tracked by SM-DP and the eUICC
enum class ProfileStatus : uint8_t {
    PREPARED = 0,
    TRANSMITTED = 1,
    INSTALLED = 2,
    ENABLED = 3,
    DISABLED = 4
};

// Key-establishment session progress
enum class SessionStep : uint8_t {
    INITIALIZED = 0,
    COMPLETED = 1
};

// Origin of the live transport PSK for an eUICC
enum class PskOrigin : uint8_t {
    STATIC_REGISTRATION = 0,
    ECDH = 1
};

// Provisioning phases, in execution order
enum class ProvisioningPhase : uint8_t {
    REGISTRATION = 0,
    ISDP_CREATION = 1,
    KEY_ESTABLISHMENT = 2,
    PROFILE_DOWNLOAD = 3,
    PROFILE_ENABLING = 4
};

// Protocol constants
namespace constants {
    constexpr size_t RANDOM_CHALLENGE_SIZE = 16;
    constexpr size_t SCP03T_CHALLENGE_SIZE = 8;
    constexpr size_t DERIVED_KEY_SIZE = 32;
    constexpr size_t SCP03T_SESSION_KEY_SIZE = 16;
    constexpr size_t STATIC_PSK_SIZE = 16;
    constexpr size_t SESSION_ID_BYTES = 16;
    constexpr size_t DEFAULT_SEGMENT_SIZE = 1024;
    constexpr uint32_t DEFAULT_EUICC_FREE_MEMORY = 512;
    constexpr uint32_t PBKDF2_ITERATIONS = 10000;
    constexpr const char* ISDP_AID_PREFIX = "A0000005591010";
    constexpr const char* KDF_LABEL_PREFIX = "M2M_RSP_";
    constexpr const char* KEY_AGREEMENT_CONTEXT = "scp03t";
}

RSP_API std::string to_string(IsdpState state);
RSP_API std::string to_string(ProfileStatus status);
RSP_API std::string to_string(SessionStep step);
RSP_API std::string to_string(PskOrigin origin);
RSP_API std::string to_string(ProvisioningPhase phase);

RSP_API Result<ProfileStatus> profile_status_from_string(const std::string& value);

// Seconds since the Unix epoch, as carried in JSON records
RSP_API int64_t unix_time_now();

} // namespace rsp

#endif // RSP_TYPES_H
