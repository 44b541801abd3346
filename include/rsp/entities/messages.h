#ifndef RSP_ENTITIES_MESSAGES_H
#define RSP_ENTITIES_MESSAGES_H

#include <rsp/config.h>
#include <rsp/error.h>
#include <rsp/result.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rsp {
namespace entities {

// Entity names used as route_message endpoints
constexpr const char* SMDP_ENTITY = "SM-DP";
constexpr const char* SMSR_ENTITY = "SM-SR";
constexpr const char* EUICC_ENTITY = "eUICC";

// ES8 command names
namespace es8 {
constexpr const char* CREATE_ISDP = "create_isdp";
constexpr const char* KEY_ESTABLISHMENT_INIT = "key_establishment_init";
constexpr const char* KEY_ESTABLISHMENT_COMPLETE = "key_establishment_complete";
constexpr const char* LOAD_SEGMENT = "load_segment";
constexpr const char* INSTALL_PROFILE = "install_profile";
constexpr const char* ENABLE_PROFILE = "enable_profile";
constexpr const char* DISABLE_PROFILE = "disable_profile";
constexpr const char* DELETE_ISDP = "delete_isdp";

// HMAC label proving both sides hold the rekeyed transport secret
constexpr const char* TRANSPORT_REKEY_CONFIRMATION = "transport_rekey_confirm";
} // namespace es8

/**
 * {"status": "error", "message": <text>, "error": <stable name>}
 */
RSP_API nlohmann::json make_error_response(RSPError error, const std::string& message = {});

RSP_API nlohmann::json make_success_response();

/**
 * Error kind carried by a response. SUCCESS when status is not "error".
 */
RSP_API RSPError response_error(const nlohmann::json& response);

// Field accessors; INVALID_MESSAGE_FORMAT when missing or mistyped
RSP_API Result<std::string> get_string(const nlohmann::json& message, const char* field);
RSP_API Result<uint64_t> get_unsigned(const nlohmann::json& message, const char* field);
RSP_API Result<const nlohmann::json*> get_object(const nlohmann::json& message, const char* field);

/**
 * Base64 field; DECODE_ERROR when the text is not base64.
 */
RSP_API Result<std::vector<uint8_t>> get_base64(const nlohmann::json& message, const char* field);

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_MESSAGES_H
