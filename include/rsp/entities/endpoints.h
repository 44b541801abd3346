#ifndef RSP_ENTITIES_ENDPOINTS_H
#define RSP_ENTITIES_ENDPOINTS_H

#include <rsp/config.h>
#include <rsp/result.h>
#include <nlohmann/json.hpp>

namespace rsp {
namespace entities {

/**
 * The eUICC as seen by SM-SR over ES8.
 *
 * The envelope is {"euiccId", "encryptedData"} where encryptedData is a
 * PSK cipher payload holding {"command", ...}. The reply envelope is
 * {"status", "encryptedData", ...} protected with the same PSK.
 */
class RSP_API Es8Endpoint {
public:
    virtual ~Es8Endpoint() = default;

    virtual Result<nlohmann::json> receive_es8(const nlohmann::json& envelope) = 0;
};

/**
 * The eUICC side of SM-DP key establishment, reached through SM-SR.
 */
class RSP_API EuiccKeyAgreementEndpoint {
public:
    virtual ~EuiccKeyAgreementEndpoint() = default;

    virtual Result<nlohmann::json> respond_to_key_establishment(const nlohmann::json& init_message) = 0;
};

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_ENDPOINTS_H
