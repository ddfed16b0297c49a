#ifndef JCX_MYLIST_CORE_LOCK_MANAGER_H
#define JCX_MYLIST_CORE_LOCK_MANAGER_H

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "jcailloux/mylist/backend/KvBackend.h"
#include "jcailloux/mylist/core/CacheKeys.h"
#include "jcailloux/mylist/io/Task.h"

namespace jcailloux::mylist {

using LockToken = std::string;

// =============================================================================
// LockManager - per (user, signature) rebuild lock with holder tokens
//
// Acquire is one SET NX PX; release deletes only while the key still holds
// the caller's token, so a holder whose lock expired cannot release the lock
// of whoever acquired it next. The TTL is the only recovery if a holder dies.
// =============================================================================

class LockManager {
public:
    explicit LockManager(KvBackend& kv) noexcept : kv_(&kv) {}

    /// nullopt when another holder has the lock.
    io::Task<std::optional<LockToken>> tryAcquire(
        std::string_view userId, std::string_view signature, std::chrono::milliseconds ttl)
    {
        auto token = newToken();
        if (co_await kv_->setIfAbsent(keys::lock(userId, signature), token, ttl))
            co_return std::optional<LockToken>{std::move(token)};
        co_return std::nullopt;
    }

    /// false when the lock expired or now belongs to someone else.
    io::Task<bool> release(std::string_view userId, std::string_view signature, const LockToken& token) {
        co_return co_await kv_->deleteIfEquals(keys::lock(userId, signature), token);
    }

    /// mt19937_64 seeded with 256 bits drawn from std::random_device.
    [[nodiscard]] static std::mt19937_64 seededEngine() {
        std::random_device device;
        std::array<std::random_device::result_type, 8> words{};
        for (auto& w : words) w = device();
        std::seed_seq seq(words.begin(), words.end());
        return std::mt19937_64(seq);
    }

    /// 128 random bits as 32 lowercase hex digits.
    [[nodiscard]] static LockToken newToken() {
        static thread_local std::mt19937_64 rng = seededEngine();
        static constexpr char hex[] = "0123456789abcdef";
        LockToken token(32, '0');
        for (int half = 0; half < 2; ++half) {
            uint64_t bits = rng();
            for (int i = 0; i < 16; ++i) {
                token[static_cast<size_t>(half * 16 + i)] = hex[bits & 0xF];
                bits >>= 4;
            }
        }
        return token;
    }

private:
    KvBackend* kv_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_LOCK_MANAGER_H
