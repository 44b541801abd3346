#ifndef RSP_ENTITIES_PSK_REGISTRY_H
#define RSP_ENTITIES_PSK_REGISTRY_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rsp {
namespace entities {

struct PskRecord {
    std::string euicc_id;
    std::vector<uint8_t> psk;
    int64_t registration_time = 0;
    PskOrigin origin = PskOrigin::STATIC_REGISTRATION;
};

/**
 * Transport PSKs held by SM-SR, exactly one live key per eUICC.
 */
class RSP_API PskRegistry {
public:
    PskRegistry() = default;
    ~PskRegistry();

    PskRegistry(const PskRegistry&) = delete;
    PskRegistry& operator=(const PskRegistry&) = delete;

    /**
     * Install or replace the eUICC's PSK; the previous key is wiped.
     * @return INVALID_KEY_LENGTH unless the PSK is 16 or 32 bytes
     */
    Result<void> store(const std::string& euicc_id, std::vector<uint8_t> psk, PskOrigin origin);

    /**
     * @return PSK_NOT_ESTABLISHED when the eUICC has no key
     */
    Result<PskRecord> get(const std::string& euicc_id) const;

    bool erase(const std::string& euicc_id);
    size_t size() const;

private:
    std::unordered_map<std::string, PskRecord> records_;
    mutable std::mutex mutex_;
};

} // namespace entities
} // namespace rsp

#endif // RSP_ENTITIES_PSK_REGISTRY_H
