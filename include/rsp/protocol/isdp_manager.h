#ifndef RSP_PROTOCOL_ISDP_MANAGER_H
#define RSP_PROTOCOL_ISDP_MANAGER_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rsp {
namespace protocol {

// SCP03 keyset references held by an ISD-P
struct Scp03KeysetRef {
    uint8_t keyset_version = 1;
    uint8_t keyset_id = 1;
    uint8_t initial_key_version = 1;
    uint8_t base_key_index = 1;
};

struct IsdpRecord {
    std::string isdp_aid;
    std::string euicc_id;
    uint32_t memory_allocated = 0;
    IsdpState state = IsdpState::CREATED;
    std::string bound_iccid;                  // Empty until install
    Scp03KeysetRef keyset;
    int64_t creation_time = 0;

    nlohmann::json to_json() const;
};

/**
 * ISD-P lifecycle manager
 *
 * Tracks the security domains allocated on each registered eUICC and
 * enforces the lifecycle:
 *
 *   CREATED -> UPLOADED -> INSTALLED -> ENABLED <-> DISABLED
 *   CREATED -> INSTALLED
 *   any state except DELETED -> DELETED
 *
 * Deleted records are kept so that later operations on the AID report
 * INVALID_STATE rather than ISDP_NOT_FOUND.
 *
 * @thread_safety All public methods are safe to call concurrently.
 */
class RSP_API IsdpManager {
public:
    explicit IsdpManager(std::shared_ptr<crypto::CryptoProvider> provider);
    ~IsdpManager() = default;

    IsdpManager(const IsdpManager&) = delete;
    IsdpManager& operator=(const IsdpManager&) = delete;

    /**
     * Declare an eUICC and its free memory. Re-registering an eUICC that
     * owns no live ISD-P resets its capacity.
     */
    Result<void> register_euicc(const std::string& euicc_id, uint32_t free_memory);
    bool is_registered(const std::string& euicc_id) const;

    /**
     * Allocate a new ISD-P on the eUICC.
     * @return EUICC_NOT_REGISTERED, or INSUFFICIENT_MEMORY with no record created
     */
    Result<IsdpRecord> create(const std::string& euicc_id, uint32_t memory_required);

    Result<void> mark_uploaded(const std::string& isdp_aid);
    Result<void> install(const std::string& isdp_aid, const std::string& iccid);
    Result<void> enable(const std::string& isdp_aid);
    Result<void> disable(const std::string& isdp_aid);

    /**
     * Delete the ISD-P and return its memory to the eUICC.
     */
    Result<void> remove(const std::string& isdp_aid);

    Result<IsdpRecord> get(const std::string& isdp_aid) const;
    Result<std::vector<std::string>> owned_aids(const std::string& euicc_id) const;
    Result<uint32_t> free_memory(const std::string& euicc_id) const;

    // Records not yet deleted
    size_t active_count() const;

    static bool is_valid_transition(IsdpState from, IsdpState to);

private:
    struct EuiccCapacity {
        uint32_t free_memory = 0;
        std::vector<std::string> owned_aids;
    };

    Result<std::string> allocate_aid();
    Result<void> transition(const std::string& isdp_aid, IsdpState new_state);

    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::unordered_map<std::string, EuiccCapacity> euiccs_;
    std::unordered_map<std::string, IsdpRecord> records_;
    mutable std::mutex mutex_;
};

} // namespace protocol
} // namespace rsp

#endif // RSP_PROTOCOL_ISDP_MANAGER_H
