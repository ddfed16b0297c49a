#ifndef JCX_MYLIST_CORE_VERSION_STORE_H
#define JCX_MYLIST_CORE_VERSION_STORE_H

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/backend/KvBackend.h"
#include "jcailloux/mylist/core/CacheKeys.h"
#include "jcailloux/mylist/io/Task.h"

namespace jcailloux::mylist {

// =============================================================================
// VersionStore - one monotonically increasing version per user
//
// Every page key embeds the version, so advancing it makes all of the user's
// cached pages unreachable at once. Version keys never expire.
// =============================================================================

class VersionStore {
public:
    VersionStore(KvBackend& kv, int64_t initialVersion) noexcept
        : kv_(&kv), initial_(initialVersion) {}

    /// Current version, creating it at the initial value on first access.
    /// Concurrent first accesses all observe the same value.
    io::Task<int64_t> get(std::string_view userId) {
        auto key = keys::version(userId);
        if (auto raw = co_await kv_->get(key))
            co_return parse(*raw);

        if (co_await kv_->setIfAbsent(key, std::to_string(initial_), KvBackend::Ttl::zero()))
            co_return initial_;

        // Another request created it first.
        if (auto raw = co_await kv_->get(key))
            co_return parse(*raw);
        throw CacheUnavailable("version key vanished right after creation");
    }

    /// Atomically advance the version; returns the new value.
    io::Task<int64_t> bump(std::string_view userId) {
        // INCR on a missing key would start from 0 and could hand out a
        // version that pages were already cached under.
        co_await get(userId);
        co_return co_await kv_->incr(keys::version(userId));
    }

    [[nodiscard]] int64_t initialVersion() const noexcept { return initial_; }

private:
    static int64_t parse(std::string_view raw) {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
        if (ec != std::errc{} || ptr != raw.data() + raw.size())
            throw CacheUnavailable("version key holds a non-integer value");
        return v;
    }

    KvBackend* kv_;
    int64_t initial_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_VERSION_STORE_H
