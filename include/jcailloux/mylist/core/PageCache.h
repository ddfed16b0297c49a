#ifndef JCX_MYLIST_CORE_PAGE_CACHE_H
#define JCX_MYLIST_CORE_PAGE_CACHE_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/KvBackend.h"
#include "jcailloux/mylist/core/CacheKeys.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/Page.h"

namespace jcailloux::mylist {

// =============================================================================
// PageCache - serialized pages keyed by (user, signature, version)
//
// Pages are stored as their JSON response body. The version is always
// supplied by the caller from VersionStore, never guessed here.
// =============================================================================

class PageCache {
public:
    explicit PageCache(KvBackend& kv) noexcept : kv_(&kv) {}

    /// nullopt on miss. A corrupt entry is logged and reported as a miss.
    io::Task<std::optional<Page>> get(std::string_view userId, std::string_view signature, int64_t version) {
        auto key = keys::page(userId, signature, version);
        auto raw = co_await kv_->get(key);
        if (!raw) co_return std::nullopt;

        auto page = Page::fromJson(*raw);
        if (!page) {
            MYLIST_LOG_WARN << "PageCache: corrupt entry " << key << ", treating as miss";
            co_return std::nullopt;
        }
        co_return page;
    }

    io::Task<void> put(std::string_view userId, std::string_view signature, int64_t version,
                       const Page& page, std::chrono::milliseconds ttl) {
        auto json = page.toJson();
        if (json.empty())
            throw CacheUnavailable("page could not be serialized");
        co_await kv_->set(keys::page(userId, signature, version), json, ttl);
    }

    /// true when an entry was removed.
    io::Task<bool> drop(std::string_view userId, std::string_view signature, int64_t version) {
        co_return co_await kv_->del(keys::page(userId, signature, version));
    }

private:
    KvBackend* kv_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_PAGE_CACHE_H
