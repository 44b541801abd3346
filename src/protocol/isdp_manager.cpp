#include <rsp/protocol/isdp_manager.h>
#include <rsp/crypto/crypto_utils.h>

#include <algorithm>

namespace rsp {
namespace protocol {

namespace {

constexpr size_t AID_SUFFIX_BYTES = 4;
constexpr int MAX_AID_ATTEMPTS = 16;

} // namespace

nlohmann::json IsdpRecord::to_json() const {
    nlohmann::json value = {
        {"isdpAid", isdp_aid},
        {"euiccId", euicc_id},
        {"memoryAllocated", memory_allocated},
        {"state", to_string(state)},
        {"creationTime", creation_time},
        {"scp03", {
            {"keysetVersion", keyset.keyset_version},
            {"keysetId", keyset.keyset_id},
            {"initialKeyVersion", keyset.initial_key_version},
            {"baseKeyIndex", keyset.base_key_index}
        }}
    };
    if (!bound_iccid.empty()) {
        value["iccid"] = bound_iccid;
    }
    return value;
}

IsdpManager::IsdpManager(std::shared_ptr<crypto::CryptoProvider> provider)
    : provider_(std::move(provider)) {}

Result<void> IsdpManager::register_euicc(const std::string& euicc_id, uint32_t free_memory) {
    if (euicc_id.empty()) {
        return make_error<void>(RSPError::INVALID_PARAMETER);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = euiccs_.find(euicc_id);
    if (it != euiccs_.end() && !it->second.owned_aids.empty()) {
        return make_error<void>(RSPError::INVALID_STATE);
    }

    euiccs_[euicc_id] = EuiccCapacity{free_memory, {}};
    return make_result();
}

bool IsdpManager::is_registered(const std::string& euicc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return euiccs_.count(euicc_id) != 0;
}

Result<std::string> IsdpManager::allocate_aid() {
    for (int attempt = 0; attempt < MAX_AID_ATTEMPTS; ++attempt) {
        auto suffix = crypto::utils::random_hex(*provider_, AID_SUFFIX_BYTES);
        if (!suffix) {
            return suffix;
        }
        std::string aid = std::string(constants::ISDP_AID_PREFIX) + *suffix;
        if (records_.count(aid) == 0) {
            return aid;
        }
    }
    return make_error<std::string>(RSPError::INTERNAL_ERROR);
}

Result<IsdpRecord> IsdpManager::create(const std::string& euicc_id, uint32_t memory_required) {
    if (memory_required == 0) {
        return make_error<IsdpRecord>(RSPError::INVALID_PARAMETER);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto euicc = euiccs_.find(euicc_id);
    if (euicc == euiccs_.end()) {
        return make_error<IsdpRecord>(RSPError::EUICC_NOT_REGISTERED);
    }
    if (memory_required > euicc->second.free_memory) {
        return make_error<IsdpRecord>(RSPError::INSUFFICIENT_MEMORY);
    }

    auto aid = allocate_aid();
    if (!aid) {
        return make_error<IsdpRecord>(aid.error());
    }

    IsdpRecord record;
    record.isdp_aid = *aid;
    record.euicc_id = euicc_id;
    record.memory_allocated = memory_required;
    record.state = IsdpState::CREATED;
    record.creation_time = unix_time_now();

    euicc->second.free_memory -= memory_required;
    euicc->second.owned_aids.push_back(record.isdp_aid);
    records_.emplace(record.isdp_aid, record);

    return record;
}

bool IsdpManager::is_valid_transition(IsdpState from, IsdpState to) {
    switch (from) {
        case IsdpState::CREATED:
            return (to == IsdpState::UPLOADED) ||
                   (to == IsdpState::INSTALLED) ||
                   (to == IsdpState::DELETED);

        case IsdpState::UPLOADED:
            return (to == IsdpState::INSTALLED) ||
                   (to == IsdpState::DELETED);

        case IsdpState::INSTALLED:
            return (to == IsdpState::ENABLED) ||
                   (to == IsdpState::DELETED);

        case IsdpState::ENABLED:
            return (to == IsdpState::DISABLED) ||
                   (to == IsdpState::DELETED);

        case IsdpState::DISABLED:
            return (to == IsdpState::ENABLED) ||
                   (to == IsdpState::DELETED);

        case IsdpState::DELETED:
            return false;
    }
    return false;
}

Result<void> IsdpManager::transition(const std::string& isdp_aid, IsdpState new_state) {
    auto it = records_.find(isdp_aid);
    if (it == records_.end()) {
        return make_error<void>(RSPError::ISDP_NOT_FOUND);
    }
    if (!is_valid_transition(it->second.state, new_state)) {
        return make_error<void>(RSPError::INVALID_STATE);
    }
    it->second.state = new_state;
    return make_result();
}

Result<void> IsdpManager::mark_uploaded(const std::string& isdp_aid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition(isdp_aid, IsdpState::UPLOADED);
}

Result<void> IsdpManager::install(const std::string& isdp_aid, const std::string& iccid) {
    if (iccid.empty()) {
        return make_error<void>(RSPError::INVALID_PARAMETER);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = transition(isdp_aid, IsdpState::INSTALLED);
    if (!result) {
        return result;
    }
    records_[isdp_aid].bound_iccid = iccid;
    return make_result();
}

Result<void> IsdpManager::enable(const std::string& isdp_aid) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(isdp_aid);
    if (it == records_.end()) {
        return make_error<void>(RSPError::ISDP_NOT_FOUND);
    }
    if (!is_valid_transition(it->second.state, IsdpState::ENABLED)) {
        return make_error<void>(RSPError::INVALID_STATE);
    }
    if (it->second.bound_iccid.empty()) {
        return make_error<void>(RSPError::PROFILE_NOT_FOUND);
    }
    it->second.state = IsdpState::ENABLED;
    return make_result();
}

Result<void> IsdpManager::disable(const std::string& isdp_aid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition(isdp_aid, IsdpState::DISABLED);
}

Result<void> IsdpManager::remove(const std::string& isdp_aid) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = transition(isdp_aid, IsdpState::DELETED);
    if (!result) {
        return result;
    }

    auto& record = records_[isdp_aid];
    auto euicc = euiccs_.find(record.euicc_id);
    if (euicc != euiccs_.end()) {
        euicc->second.free_memory += record.memory_allocated;
        auto& owned = euicc->second.owned_aids;
        owned.erase(std::remove(owned.begin(), owned.end(), isdp_aid), owned.end());
    }
    return make_result();
}

Result<IsdpRecord> IsdpManager::get(const std::string& isdp_aid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(isdp_aid);
    if (it == records_.end()) {
        return make_error<IsdpRecord>(RSPError::ISDP_NOT_FOUND);
    }
    return it->second;
}

Result<std::vector<std::string>> IsdpManager::owned_aids(const std::string& euicc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = euiccs_.find(euicc_id);
    if (it == euiccs_.end()) {
        return make_error<std::vector<std::string>>(RSPError::EUICC_NOT_REGISTERED);
    }
    return it->second.owned_aids;
}

Result<uint32_t> IsdpManager::free_memory(const std::string& euicc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = euiccs_.find(euicc_id);
    if (it == euiccs_.end()) {
        return make_error<uint32_t>(RSPError::EUICC_NOT_REGISTERED);
    }
    return it->second.free_memory;
}

size_t IsdpManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [](const std::pair<const std::string, IsdpRecord>& entry) {
            return entry.second.state != IsdpState::DELETED;
        }));
}

} // namespace protocol
} // namespace rsp
