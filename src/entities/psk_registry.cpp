#include <rsp/entities/psk_registry.h>
#include <rsp/crypto/crypto_utils.h>

namespace rsp {
namespace entities {

PskRegistry::~PskRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : records_) {
        crypto::utils::secure_zero(entry.second.psk);
    }
}

Result<void> PskRegistry::store(const std::string& euicc_id, std::vector<uint8_t> psk, PskOrigin origin) {
    if (euicc_id.empty()) {
        return make_error<void>(RSPError::INVALID_PARAMETER);
    }
    if (psk.size() != 16 && psk.size() != 32) {
        crypto::utils::secure_zero(psk);
        return make_error<void>(RSPError::INVALID_KEY_LENGTH);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = records_[euicc_id];
    crypto::utils::secure_zero(record.psk);
    record.euicc_id = euicc_id;
    record.psk = std::move(psk);
    record.registration_time = unix_time_now();
    record.origin = origin;
    return make_result();
}

Result<PskRecord> PskRegistry::get(const std::string& euicc_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(euicc_id);
    if (it == records_.end()) {
        return make_error<PskRecord>(RSPError::PSK_NOT_ESTABLISHED);
    }
    return it->second;
}

bool PskRegistry::erase(const std::string& euicc_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(euicc_id);
    if (it == records_.end()) {
        return false;
    }
    crypto::utils::secure_zero(it->second.psk);
    records_.erase(it);
    return true;
}

size_t PskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace entities
} // namespace rsp
