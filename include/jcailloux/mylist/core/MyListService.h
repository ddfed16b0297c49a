#ifndef JCX_MYLIST_CORE_MY_LIST_SERVICE_H
#define JCX_MYLIST_CORE_MY_LIST_SERVICE_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/KvBackend.h"
#include "jcailloux/mylist/backend/ListStore.h"
#include "jcailloux/mylist/config/MyListConfig.h"
#include "jcailloux/mylist/core/CacheKeys.h"
#include "jcailloux/mylist/core/LockManager.h"
#include "jcailloux/mylist/core/Metrics.h"
#include "jcailloux/mylist/core/MutationCoordinator.h"
#include "jcailloux/mylist/core/PageCache.h"
#include "jcailloux/mylist/core/PaginatedReader.h"
#include "jcailloux/mylist/core/VersionStore.h"
#include "jcailloux/mylist/cursor/CursorCodec.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/Page.h"

namespace jcailloux::mylist {

// =============================================================================
// MyListService - read path orchestration and mutation entry points
//
// getPage:
//   version -> page cache -> (miss) rebuild lock
//     holder: build from the store, cache under the version read above,
//             release the lock (always, also when the build failed)
//     busy:   poll the cache with capped exponential backoff, then fall
//             back to an uncached store read
//
// The cache backend is optional for correctness: any CacheUnavailable on the
// read path degrades to a direct store read. StoreUnavailable propagates.
//
// Waiting goes through SleepFn so the service does not depend on a concrete
// event loop (production: io::sleepFor on the EpollIoContext).
// =============================================================================

class MyListService {
public:
    using SleepFn = std::function<io::Task<void>(std::chrono::milliseconds)>;

    MyListService(ListStore& store, KvBackend& kv, config::MyListConfig config, SleepFn sleep)
        : config_(validated(std::move(config)))
        , sleep_(std::move(sleep))
        , versions_(kv, config_.initial_version)
        , locks_(kv)
        , pages_(kv)
        , reader_(store, config_.default_limit, config_.max_limit)
        , mutations_(store, versions_, pages_, config_, counters_)
    {}

    MyListService(const MyListService&) = delete;
    MyListService& operator=(const MyListService&) = delete;

    io::Task<Page> getPage(std::string_view userId,
                           std::optional<std::string_view> cursorToken,
                           std::optional<int> limit) {
        validateId(userId, "userId");
        const int lim = reader_.normalizeLimit(limit);
        std::optional<CursorPosition> after;
        if (cursorToken) after = cursor::decode(*cursorToken);
        const auto sig = keys::cursorSignature(cursorToken, lim);

        std::optional<Page> page;
        try {
            page = co_await cachedRead(userId, sig, after, lim);
        } catch (const CacheUnavailable& e) {
            MYLIST_LOG_WARN << "MyListService: cache unavailable for " << userId
                            << ", reading from store: " << e.what();
        }
        if (page) co_return std::move(*page);

        MYLIST_METRICS_INC(counters_.degraded_reads);
        co_return co_await reader_.fetchPage(userId, after, lim);
    }

    io::Task<AddResult> add(std::string_view userId, std::string_view contentId, std::string_view contentType) {
        co_return co_await mutations_.add(userId, contentId, contentType);
    }

    io::Task<bool> remove(std::string_view userId, std::string_view contentId) {
        co_return co_await mutations_.remove(userId, contentId);
    }

    [[nodiscard]] MetricsSnapshot metrics() const noexcept { return counters_.snapshot(); }

    [[nodiscard]] const config::MyListConfig& config() const noexcept { return config_; }

private:
    static config::MyListConfig validated(config::MyListConfig config) {
        config.validate();
        return config;
    }

    io::Task<Page> cachedRead(std::string_view userId, std::string_view sig,
                              std::optional<CursorPosition> after, int limit) {
        const int64_t version = co_await versions_.get(userId);

        if (auto hit = co_await pages_.get(userId, sig, version)) {
            MYLIST_METRICS_INC(counters_.page_hits);
            co_return std::move(*hit);
        }
        MYLIST_METRICS_INC(counters_.page_misses);

        if (auto token = co_await locks_.tryAcquire(userId, sig, config_.lock_ttl))
            co_return co_await rebuild(userId, sig, version, after, limit, *token);

        MYLIST_METRICS_INC(counters_.lock_busy);
        co_return co_await awaitRebuild(userId, sig, version, after, limit);
    }

    // Lock holder: build, cache, release. A failed build caches nothing.
    // The page is looked up again first: the previous holder may have written
    // it between this reader's miss and its SET NX.
    io::Task<Page> rebuild(std::string_view userId, std::string_view sig, int64_t version,
                           std::optional<CursorPosition> after, int limit, LockToken token) {
        Page page;
        bool built = false;
        std::exception_ptr failure;
        try {
            if (auto cached = co_await pages_.get(userId, sig, version)) {
                MYLIST_METRICS_INC(counters_.page_hits);
                page = std::move(*cached);
            } else {
                page = co_await reader_.fetchPage(userId, after, limit);
                built = true;
            }
        } catch (...) {
            failure = std::current_exception();
        }

        if (built) {
            try {
                co_await pages_.put(userId, sig, version, page, config_.page_ttl);
                MYLIST_METRICS_INC(counters_.rebuilds);
            } catch (const CacheUnavailable& e) {
                MYLIST_LOG_WARN << "MyListService: could not cache " << sig << " for " << userId
                                << ": " << e.what();
            }
        }

        try {
            bool released = co_await locks_.release(userId, sig, token);
            if (!released) {
                MYLIST_LOG_WARN << "MyListService: rebuild lock " << sig << " for " << userId
                                << " expired before release";
            }
        } catch (const CacheUnavailable& e) {
            MYLIST_LOG_WARN << "MyListService: lock release failed, it expires on its own: " << e.what();
        }

        if (failure) std::rethrow_exception(failure);
        co_return page;
    }

    // Lock busy: someone else is building this page. Poll for it with
    // exponential backoff, taking the lock over if the holder released it
    // without writing the page; past lock_max_wait read the store directly.
    io::Task<Page> awaitRebuild(std::string_view userId, std::string_view sig, int64_t version,
                                std::optional<CursorPosition> after, int limit) {
        auto delay = config_.lock_poll_initial;
        std::chrono::milliseconds waited{0};

        while (waited < config_.lock_max_wait) {
            auto step = std::min(delay, config_.lock_max_wait - waited);
            co_await sleep_(step);
            waited += step;

            if (auto page = co_await pages_.get(userId, sig, version)) {
                MYLIST_METRICS_INC(counters_.poll_hits);
                co_return std::move(*page);
            }
            if (auto token = co_await locks_.tryAcquire(userId, sig, config_.lock_ttl)) {
                MYLIST_LOG_DEBUG << "MyListService: took over rebuild of " << sig << " for " << userId
                                 << " after " << waited.count() << "ms";
                co_return co_await rebuild(userId, sig, version, after, limit, *token);
            }
            delay = std::min(delay * 2, config_.lock_poll_max);
        }

        MYLIST_METRICS_INC(counters_.direct_reads);
        MYLIST_LOG_DEBUG << "MyListService: gave up waiting for " << sig << " after "
                         << waited.count() << "ms, reading " << userId << " directly";
        co_return co_await reader_.fetchPage(userId, after, limit);
    }

    config::MyListConfig config_;
    SleepFn sleep_;
    ServiceCounters counters_;
    VersionStore versions_;
    LockManager locks_;
    PageCache pages_;
    PaginatedReader reader_;
    MutationCoordinator mutations_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_MY_LIST_SERVICE_H
