#include <rsp/error.h>
#include <unordered_map>

namespace rsp {

namespace {

struct ErrorText {
    const char* name;
    const char* message;
};

const std::unordered_map<RSPError, ErrorText>& error_table() {
    static const std::unordered_map<RSPError, ErrorText> table = {
        {RSPError::SUCCESS, {"Success", "Success"}},

        // General errors
        {RSPError::INVALID_PARAMETER, {"InvalidParameter", "Invalid parameter provided"}},
        {RSPError::OUT_OF_MEMORY, {"OutOfMemory", "Memory allocation failed"}},
        {RSPError::NOT_INITIALIZED, {"NotInitialized", "Component not initialized"}},
        {RSPError::ALREADY_INITIALIZED, {"AlreadyInitialized", "Component already initialized"}},
        {RSPError::OPERATION_NOT_SUPPORTED, {"OperationNotSupported", "Operation not supported"}},
        {RSPError::INTERNAL_ERROR, {"InternalError", "Internal implementation error"}},
        {RSPError::RATE_LIMITED, {"RateLimited", "Rate limit exceeded"}},

        // Message and encoding errors
        {RSPError::INVALID_MESSAGE_FORMAT, {"InvalidMessageFormat", "Invalid message format"}},
        {RSPError::DECODE_ERROR, {"DecodeError", "Message decode error"}},
        {RSPError::ENDPOINT_UNAVAILABLE, {"EndpointUnavailable", "Destination endpoint not reachable"}},

        // Cryptographic errors
        {RSPError::INVALID_PUBLIC_KEY, {"InvalidPublicKey", "Peer public key is not a valid curve point"}},
        {RSPError::SIGNATURE_VERIFICATION_FAILED, {"SignatureVerificationFailed", "Digital signature verification failed"}},
        {RSPError::MAC_VERIFICATION_FAILED, {"MacVerificationFailed", "MAC verification failed"}},
        {RSPError::DECRYPTION_FAILED, {"DecryptionFailed", "Decryption failed"}},
        {RSPError::INVALID_KEY_LENGTH, {"InvalidKeyLength", "Key length not supported"}},
        {RSPError::KEY_EXCHANGE_FAILED, {"KeyExchangeFailed", "Key exchange failed"}},
        {RSPError::KEY_DERIVATION_FAILED, {"KeyDerivationFailed", "Key derivation failed"}},
        {RSPError::RANDOM_GENERATION_FAILED, {"RandomGenerationFailed", "Random number generation failed"}},
        {RSPError::CRYPTO_PROVIDER_ERROR, {"CryptoProviderError", "Cryptographic provider error"}},
        {RSPError::CERTIFICATE_VERIFY_FAILED, {"CertificateVerifyFailed", "Certificate verification failed"}},

        // Session errors
        {RSPError::INVALID_SESSION, {"InvalidSession", "Invalid session ID"}},
        {RSPError::SESSION_EXPIRED, {"SessionExpired", "Session has expired"}},
        {RSPError::PSK_NOT_ESTABLISHED, {"PskNotEstablished", "No PSK established with SM-SR"}},

        // Provisioning errors
        {RSPError::INSUFFICIENT_MEMORY, {"InsufficientMemory", "Not enough memory on eUICC"}},
        {RSPError::PROFILE_NOT_FOUND, {"ProfileNotFound", "Profile not found"}},
        {RSPError::PROFILE_INTEGRITY_FAILED, {"ProfileIntegrityFailed", "Profile integrity hash mismatch"}},
        {RSPError::ISDP_NOT_FOUND, {"IsdpNotFound", "ISD-P not found"}},
        {RSPError::EUICC_NOT_REGISTERED, {"EuiccNotRegistered", "eUICC not registered"}},
        {RSPError::INVALID_STATE, {"InvalidState", "Invalid state for operation"}},

        // Configuration errors
        {RSPError::INVALID_CONFIGURATION, {"InvalidConfiguration", "Invalid configuration"}}
    };
    return table;
}

} // namespace

std::string RSPErrorCategory::message(int ev) const {
    auto it = error_table().find(static_cast<RSPError>(ev));
    if (it != error_table().end()) {
        return it->second.message;
    }
    return "Unknown RSP error";
}

std::string error_message(RSPError error) {
    return RSPErrorCategory::instance().message(static_cast<int>(error));
}

std::string error_name(RSPError error) {
    auto it = error_table().find(error);
    if (it != error_table().end()) {
        return it->second.name;
    }
    return "Unknown";
}

RSPError error_from_name(const std::string& name) {
    for (const auto& entry : error_table()) {
        if (name == entry.second.name) {
            return entry.first;
        }
    }
    return RSPError::INTERNAL_ERROR;
}

bool is_security_error(RSPError error) {
    switch (error) {
        case RSPError::INVALID_PUBLIC_KEY:
        case RSPError::SIGNATURE_VERIFICATION_FAILED:
        case RSPError::MAC_VERIFICATION_FAILED:
        case RSPError::DECRYPTION_FAILED:
        case RSPError::CERTIFICATE_VERIFY_FAILED:
        case RSPError::PROFILE_INTEGRITY_FAILED:
        case RSPError::INVALID_SESSION:
            return true;
        default:
            return false;
    }
}

} // namespace rsp
