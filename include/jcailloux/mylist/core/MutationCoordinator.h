#ifndef JCX_MYLIST_CORE_MUTATION_COORDINATOR_H
#define JCX_MYLIST_CORE_MUTATION_COORDINATOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/ListStore.h"
#include "jcailloux/mylist/config/MyListConfig.h"
#include "jcailloux/mylist/core/CacheKeys.h"
#include "jcailloux/mylist/core/Metrics.h"
#include "jcailloux/mylist/core/PageCache.h"
#include "jcailloux/mylist/core/VersionStore.h"
#include "jcailloux/mylist/cursor/CursorCodec.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/Page.h"

namespace jcailloux::mylist {

struct AddResult {
    ListItem item;
    bool created = false;       // false: the item was already in the list
};

/// Maximum accepted size of userId and contentId.
inline constexpr size_t kMaxIdLength = 256;

inline void validateId(std::string_view value, const char* name) {
    if (value.empty())
        throw ValidationError(std::string(name) + " is required");
    if (value.size() > kMaxIdLength)
        throw ValidationError(std::string(name) + " exceeds 256 bytes");
}

// =============================================================================
// MutationCoordinator - add/remove against the store, then version bump
//
// The store mutation is the commit point. Everything after it (version bump,
// first-page patch) only affects cache freshness: a failure there is logged
// and the mutation still succeeds, with staleness bounded by the page TTL.
//
// add patches the cached first page in place (new version, new item on top).
// remove never patches: it can shift every page boundary, so it only bumps.
// =============================================================================

class MutationCoordinator {
public:
    MutationCoordinator(ListStore& store, VersionStore& versions, PageCache& pages,
                        const config::MyListConfig& config, ServiceCounters& counters)
        : store_(&store), versions_(&versions), pages_(&pages)
        , config_(config), counters_(&counters) {}

    io::Task<AddResult> add(std::string_view userId, std::string_view contentId, std::string_view contentType) {
        validateId(userId, "userId");
        validateId(contentId, "contentId");
        if (!config_.supportsContentType(contentType))
            throw InvalidContent("unsupported contentType: " + std::string(contentType));
        if (!co_await store_->contentExists(contentId, contentType))
            throw InvalidContent("content " + std::string(contentId) + " does not exist");

        auto inserted = co_await store_->insertIfAbsent(userId, contentId, contentType);
        AddResult result{std::move(inserted.item), inserted.inserted};

        auto newVersion = co_await bumpAbsorbing(userId);
        if (!newVersion) co_return result;

        for (int limit : config_.effectiveFastPathLimits()) {
            bool failed = false;
            try {
                co_await patchFirstPage(userId, result, *newVersion - 1, *newVersion, limit);
            } catch (const CacheUnavailable& e) {
                MYLIST_LOG_WARN << "MutationCoordinator: first-page patch for " << userId
                                << " l" << limit << " skipped: " << e.what();
                failed = true;
            }
            if (failed) break;
        }
        co_return result;
    }

    /// true when a row was deleted. Removing a missing item changes nothing
    /// visible, so the version is left alone.
    io::Task<bool> remove(std::string_view userId, std::string_view contentId) {
        validateId(userId, "userId");
        validateId(contentId, "contentId");

        bool deleted = co_await store_->deleteIfExists(userId, contentId);
        if (deleted)
            co_await bumpAbsorbing(userId);
        co_return deleted;
    }

    /// First page after prepending `item`, or nullopt when the patch would
    /// not be exact (item does not sort strictly before the cached head).
    [[nodiscard]] static std::optional<Page> prepend(const Page& cached, const ListItem& item, int limit) {
        if (!cached.items.empty() && !positionOf(item).sortsBefore(positionOf(cached.items.front())))
            return std::nullopt;

        Page patched;
        patched.items.reserve(cached.items.size() + 1);
        patched.items.push_back(item);
        patched.items.insert(patched.items.end(), cached.items.begin(), cached.items.end());
        patched.hasMore = cached.hasMore;
        patched.nextCursor = cached.nextCursor;

        if (patched.items.size() > static_cast<size_t>(limit)) {
            patched.items.resize(static_cast<size_t>(limit));
            patched.hasMore = true;
            patched.nextCursor = cursor::encode(positionOf(patched.items.back()));
        }
        return patched;
    }

private:
    io::Task<std::optional<int64_t>> bumpAbsorbing(std::string_view userId) {
        std::optional<int64_t> bumped;
        try {
            bumped = co_await versions_->bump(userId);
        } catch (const CacheUnavailable& e) {
            MYLIST_LOG_WARN << "MutationCoordinator: version bump for " << userId
                            << " failed: " << e.what();
        }
        if (!bumped) co_await dropFirstPages(userId);
        co_return bumped;
    }

    // Without a bump, pages under the current version predate the mutation.
    // The first pages are the ones readers hit; other pages stay until TTL.
    io::Task<void> dropFirstPages(std::string_view userId) {
        try {
            auto version = co_await versions_->get(userId);
            for (int limit : config_.effectiveFastPathLimits())
                co_await pages_->drop(userId, keys::cursorSignature(std::nullopt, limit), version);
        } catch (const CacheUnavailable& e) {
            MYLIST_LOG_WARN << "MutationCoordinator: could not drop first pages of " << userId
                            << ", cached pages stay until TTL: " << e.what();
        }
    }

    io::Task<void> patchFirstPage(std::string_view userId, const AddResult& added,
                                  int64_t oldVersion, int64_t newVersion, int limit) {
        auto sig = keys::cursorSignature(std::nullopt, limit);
        auto cached = co_await pages_->get(userId, sig, oldVersion);
        if (!cached) co_return;

        if (!added.created) {
            // Duplicate add: contents unchanged, carry the page forward.
            co_await pages_->put(userId, sig, newVersion, *cached, config_.page_ttl);
            MYLIST_METRICS_INC(counters_->fast_path_patches);
            co_return;
        }

        auto patched = prepend(*cached, added.item, limit);
        if (!patched) {
            MYLIST_LOG_DEBUG << "MutationCoordinator: item " << added.item.id
                             << " does not sort first, leaving " << sig << " to rebuild";
            co_return;
        }
        co_await pages_->put(userId, sig, newVersion, *patched, config_.page_ttl);
        MYLIST_METRICS_INC(counters_->fast_path_patches);
    }

    ListStore* store_;
    VersionStore* versions_;
    PageCache* pages_;
    config::MyListConfig config_;
    ServiceCounters* counters_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_MUTATION_COORDINATOR_H
