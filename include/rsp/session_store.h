#ifndef RSP_SESSION_STORE_H
#define RSP_SESSION_STORE_H

#include <rsp/config.h>
#include <rsp/types.h>
#include <rsp/result.h>
#include <rsp/crypto/provider.h>
#include <rsp/crypto/crypto_utils.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace rsp {

/**
 * Keyed table of in-flight sessions with a time-to-live.
 *
 * The map is guarded by a shared mutex; every entry carries its own mutex
 * so at most one mutation runs per session while different sessions
 * proceed in parallel. Entries past their TTL are erased on access and
 * reported as SESSION_EXPIRED; unknown ids are INVALID_SESSION.
 */
template<typename T>
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionStore(std::chrono::milliseconds ttl = std::chrono::seconds(300))
        : ttl_(ttl) {}

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @return INVALID_PARAMETER for an empty or duplicate id
     */
    Result<void> create(const std::string& id, T value) {
        if (id.empty()) {
            return make_error<void>(RSPError::INVALID_PARAMETER);
        }

        auto entry = std::make_shared<Entry>(std::move(value), Clock::now() + ttl_);

        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (!entries_.emplace(id, std::move(entry)).second) {
            return make_error<void>(RSPError::INVALID_PARAMETER);
        }
        return make_result();
    }

    /**
     * Run fn(T&) under the session's lock. fn must return a Result.
     */
    template<typename F>
    auto with_session(const std::string& id, F&& fn) -> std::invoke_result_t<F, T&> {
        using ReturnType = std::invoke_result_t<F, T&>;

        std::shared_ptr<Entry> entry = find(id);
        if (!entry) {
            return ReturnType(RSPError::INVALID_SESSION);
        }

        std::unique_lock<std::mutex> entry_lock(entry->mutex);
        if (entry->erased) {
            return ReturnType(RSPError::INVALID_SESSION);
        }
        if (Clock::now() >= entry->expires_at) {
            entry->erased = true;
            entry_lock.unlock();
            remove_entry(id, entry);
            return ReturnType(RSPError::SESSION_EXPIRED);
        }

        return fn(entry->value);
    }

    /**
     * Remove a session; the stored value is destroyed once no caller is
     * inside with_session for it.
     */
    bool erase(const std::string& id) {
        std::shared_ptr<Entry> entry = find(id);
        if (!entry) {
            return false;
        }
        {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            entry->erased = true;
        }
        return remove_entry(id, entry);
    }

    bool contains(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return entries_.count(id) != 0;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return entries_.size();
    }

    size_t purge_expired() {
        const auto now = Clock::now();
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        size_t purged = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second->expires_at) {
                it = entries_.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }
        return purged;
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        Entry(T v, Clock::time_point expiry)
            : value(std::move(v)), expires_at(expiry) {}

        std::mutex mutex;
        T value;
        Clock::time_point expires_at;
        bool erased = false;
    };

    std::shared_ptr<Entry> find(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : it->second;
    }

    bool remove_entry(const std::string& id, const std::shared_ptr<Entry>& entry) {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second != entry) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    std::chrono::milliseconds ttl_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    mutable std::shared_mutex map_mutex_;
};

/**
 * 32 lowercase hex characters from 16 random bytes.
 */
inline Result<std::string> generate_session_id(crypto::CryptoProvider& provider) {
    auto bytes = crypto::utils::random_bytes(provider, constants::SESSION_ID_BYTES);
    if (!bytes) {
        return make_error<std::string>(bytes.error());
    }
    return crypto::utils::to_hex(*bytes);
}

} // namespace rsp

#endif // RSP_SESSION_STORE_H
