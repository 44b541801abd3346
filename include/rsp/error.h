#ifndef RSP_ERROR_H
#define RSP_ERROR_H

#include <rsp/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace rsp {

// RSP-specific error codes
enum class RSPError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    OUT_OF_MEMORY = 2,
    NOT_INITIALIZED = 3,
    ALREADY_INITIALIZED = 4,
    OPERATION_NOT_SUPPORTED = 5,
    INTERNAL_ERROR = 6,
    RATE_LIMITED = 7,

    // Message and encoding errors (20-39)
    INVALID_MESSAGE_FORMAT = 20,
    DECODE_ERROR = 21,
    ENDPOINT_UNAVAILABLE = 22,

    // Cryptographic errors (40-69)
    INVALID_PUBLIC_KEY = 40,
    SIGNATURE_VERIFICATION_FAILED = 41,
    MAC_VERIFICATION_FAILED = 42,
    DECRYPTION_FAILED = 43,
    INVALID_KEY_LENGTH = 44,
    KEY_EXCHANGE_FAILED = 45,
    KEY_DERIVATION_FAILED = 46,
    RANDOM_GENERATION_FAILED = 47,
    CRYPTO_PROVIDER_ERROR = 48,
    CERTIFICATE_VERIFY_FAILED = 49,

    // Session errors (70-79)
    INVALID_SESSION = 70,
    SESSION_EXPIRED = 71,
    PSK_NOT_ESTABLISHED = 72,

    // Provisioning errors (80-99)
    INSUFFICIENT_MEMORY = 80,
    PROFILE_NOT_FOUND = 81,
    PROFILE_INTEGRITY_FAILED = 82,
    ISDP_NOT_FOUND = 83,
    EUICC_NOT_REGISTERED = 84,
    INVALID_STATE = 85,

    // Configuration errors (100-109)
    INVALID_CONFIGURATION = 100
};

// Error category for RSP errors
class RSPErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "rsp";
    }

    std::string message(int ev) const override;

    static const RSPErrorCategory& instance() {
        static RSPErrorCategory instance;
        return instance;
    }
};

// Create error code from RSP error
inline std::error_code make_error_code(RSPError e) {
    return std::error_code(static_cast<int>(e), RSPErrorCategory::instance());
}

// Exception class for RSP errors
class RSP_API RSPException : public std::system_error {
public:
    explicit RSPException(RSPError error)
        : std::system_error(make_error_code(error)) {}

    RSPException(RSPError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    RSPError rsp_error() const noexcept {
        return static_cast<RSPError>(code().value());
    }
};

// Utility functions
RSP_API std::string error_message(RSPError error);

/**
 * Stable CamelCase kind name used in JSON error responses
 * and provisioning reports, e.g. "InsufficientMemory".
 */
RSP_API std::string error_name(RSPError error);

/**
 * Inverse of error_name; INTERNAL_ERROR for names it does not know.
 */
RSP_API RSPError error_from_name(const std::string& name);

RSP_API bool is_security_error(RSPError error);

#define RSP_THROW_IF_ERROR(error) \
    do { \
        if ((error) != ::rsp::RSPError::SUCCESS) { \
            throw ::rsp::RSPException((error)); \
        } \
    } while (0)

#define RSP_RETURN_IF_ERROR(result) \
    do { \
        if (!(result).is_success()) { \
            return (result).error(); \
        } \
    } while (0)

} // namespace rsp

// Make RSPError compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<rsp::RSPError> : true_type {};
}

#endif // RSP_ERROR_H
