/**
 * test_mutation_coordinator.cpp
 *
 * add/remove against the store, version bump and first-page fast path.
 *
 * Covers:
 *   1. Validation          - ids, content type, catalog lookup
 *   2. Idempotency         - duplicate add, remove of a missing item
 *   3. Versioning          - which mutations bump
 *   4. Fast path           - cached first page patched under the new version
 *   5. prepend()           - truncation, cursor, ordering guard
 *   6. Degraded cache      - mutations succeed with the cache backend down
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/mylist/Error.h>
#include <jcailloux/mylist/config/MyListConfig.h>
#include <jcailloux/mylist/core/CacheKeys.h>
#include <jcailloux/mylist/core/Metrics.h>
#include <jcailloux/mylist/core/MutationCoordinator.h>
#include <jcailloux/mylist/core/PageCache.h>
#include <jcailloux/mylist/core/PaginatedReader.h>
#include <jcailloux/mylist/core/VersionStore.h>
#include <jcailloux/mylist/cursor/CursorCodec.h>

#include "fixtures/ManualIoContext.h"
#include "fixtures/MemoryKvBackend.h"
#include "fixtures/MemoryListStore.h"
#include "fixtures/TestRunner.h"

#include <string>

using namespace jcailloux::mylist;
using namespace jcailloux::mylist::test;
using namespace std::chrono_literals;

namespace {

struct Harness {
    explicit Harness(config::MyListConfig cfg = {})
        : kv(io), store(io), versions(kv, cfg.initial_version), pages(kv)
        , reader(store, cfg.default_limit, cfg.max_limit)
        , coordinator(store, versions, pages, cfg, counters)
    {
        for (int i = 0; i < 10; ++i) store.addContent("movie", "m" + std::to_string(i));
        store.addContent("tvshow", "s1");
    }

    int64_t version(std::string_view user) { return runTask(io, versions.get(user)); }

    /// Build and cache the head page the way the read path does.
    Page warmHead(std::string_view user, int limit) {
        auto v = version(user);
        auto page = runTask(io, reader.fetchPage(user, std::nullopt, limit));
        runTask(io, pages.put(user, keys::cursorSignature(std::nullopt, limit), v, page, 300s));
        return page;
    }

    std::optional<Page> cachedHead(std::string_view user, int limit) {
        return runTask(io, pages.get(user, keys::cursorSignature(std::nullopt, limit), version(user)));
    }

    ManualIoContext io;
    MemoryKvBackend kv;
    MemoryListStore store;
    ServiceCounters counters;
    VersionStore versions;
    PageCache pages;
    PaginatedReader reader;
    MutationCoordinator coordinator;
};

} // anonymous namespace

// =============================================================================
// 1. Validation
// =============================================================================

TEST_CASE("MutationCoordinator - validation", "[mutation]") {
    Harness h;

    SECTION("empty ids") {
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("", "m1", "movie")), ValidationError);
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("u1", "", "movie")), ValidationError);
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.remove("", "m1")), ValidationError);
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.remove("u1", "")), ValidationError);
    }

    SECTION("oversized ids") {
        std::string big(kMaxIdLength + 1, 'x');
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add(big, "m1", "movie")), ValidationError);
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("u1", big, "movie")), ValidationError);
        CHECK_NOTHROW(validateId(std::string(kMaxIdLength, 'x'), "userId"));
    }

    SECTION("unsupported content type") {
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("u1", "m1", "podcast")), InvalidContent);
    }

    SECTION("content missing from the catalog") {
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("u1", "m404", "movie")), InvalidContent);
        CHECK_THROWS_AS(runTask(h.io, h.coordinator.add("u1", "m1", "tvshow")), InvalidContent);
        CHECK(h.store.rowCount() == 0);
    }

    SECTION("store failure propagates as retryable") {
        h.store.down = true;
        try {
            runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
            FAIL("add succeeded with the store down");
        } catch (const MyListError& e) {
            CHECK(e.code() == ErrorCode::StoreUnavailable);
            CHECK(e.retryable());
        }
    }
}

// =============================================================================
// 2-3. Idempotency and versioning
// =============================================================================

TEST_CASE("MutationCoordinator - idempotency and versions", "[mutation]") {
    Harness h;

    SECTION("add creates once") {
        auto first = runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK(first.created);
        CHECK(first.item.userId == "u1");
        CHECK(first.item.contentType == "movie");

        auto again = runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK_FALSE(again.created);
        CHECK(again.item == first.item);
        CHECK(h.store.rowCount() == 1);
    }

    SECTION("add bumps the version, also for a duplicate") {
        CHECK(h.version("u1") == 1);
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK(h.version("u1") == 2);
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK(h.version("u1") == 3);
    }

    SECTION("remove of an existing item bumps") {
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        auto before = h.version("u1");
        CHECK(runTask(h.io, h.coordinator.remove("u1", "m1")));
        CHECK(h.version("u1") == before + 1);
        CHECK(h.store.rowCount() == 0);
    }

    SECTION("remove of a missing item leaves the version alone") {
        auto before = h.version("u1");
        CHECK_FALSE(runTask(h.io, h.coordinator.remove("u1", "m1")));
        CHECK(h.version("u1") == before);
    }
}

// =============================================================================
// 4. Fast path
// =============================================================================

TEST_CASE("MutationCoordinator - first page fast path", "[mutation]") {

    SECTION("added item appears on top of the cached first page") {
        Harness h(config::MyListConfig{}.with_limits(2, 100));
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        runTask(h.io, h.coordinator.add("u1", "m2", "movie"));
        h.warmHead("u1", 2);
        auto queriesBefore = h.store.queryPageCalls();

        auto added = runTask(h.io, h.coordinator.add("u1", "m3", "movie"));

        auto cached = h.cachedHead("u1", 2);
        REQUIRE(cached.has_value());
        REQUIRE(cached->items.size() == 2);
        CHECK(cached->items[0] == added.item);
        CHECK(cached->items[1].contentId == "m2");
        CHECK(cached->hasMore);
        REQUIRE(cached->nextCursor.has_value());
        CHECK(cursor::decode(*cached->nextCursor) == positionOf(cached->items[1]));
        CHECK(h.store.queryPageCalls() == queriesBefore);

        // Same result as a rebuild from the store.
        auto rebuilt = runTask(h.io, h.reader.fetchPage("u1", std::nullopt, 2));
        CHECK(*cached == rebuilt);
    }

    SECTION("nothing is written when the first page was not cached") {
        Harness h;
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK_FALSE(h.cachedHead("u1", 20).has_value());
    }

    SECTION("duplicate add carries the cached page forward") {
        Harness h;
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        auto page = h.warmHead("u1", 20);
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));

        auto cached = h.cachedHead("u1", 20);
        REQUIRE(cached.has_value());
        CHECK(*cached == page);
    }

    SECTION("every configured limit is patched") {
        Harness h(config::MyListConfig{}.with_fast_path_limits({1, 5}));
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        h.warmHead("u1", 1);
        h.warmHead("u1", 5);

        runTask(h.io, h.coordinator.add("u1", "m2", "movie"));

        auto one = h.cachedHead("u1", 1);
        auto five = h.cachedHead("u1", 5);
        REQUIRE(one.has_value());
        REQUIRE(five.has_value());
        CHECK(one->items.size() == 1);
        CHECK(one->items[0].contentId == "m2");
        CHECK(one->hasMore);
        CHECK(five->items.size() == 2);
        CHECK_FALSE(five->hasMore);
    }

    SECTION("remove never patches") {
        Harness h;
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        runTask(h.io, h.coordinator.add("u1", "m2", "movie"));
        h.warmHead("u1", 20);
        runTask(h.io, h.coordinator.remove("u1", "m2"));
        CHECK_FALSE(h.cachedHead("u1", 20).has_value());
    }
}

// =============================================================================
// 5. prepend()
// =============================================================================

TEST_CASE("MutationCoordinator - prepend", "[mutation]") {
    ListItem older{1, "u1", "m1", "movie", 1000};
    ListItem newer{2, "u1", "m2", "movie", 2000};

    SECTION("onto an empty page") {
        auto patched = MutationCoordinator::prepend(Page{}, newer, 2);
        REQUIRE(patched.has_value());
        CHECK(patched->items.size() == 1);
        CHECK_FALSE(patched->hasMore);
        CHECK_FALSE(patched->nextCursor.has_value());
    }

    SECTION("an item that does not sort first is refused") {
        Page cached;
        cached.items.push_back(newer);
        CHECK_FALSE(MutationCoordinator::prepend(cached, older, 2).has_value());
        CHECK_FALSE(MutationCoordinator::prepend(cached, newer, 2).has_value());
    }

    SECTION("a full page keeps its size and moves the cursor") {
        Page cached;
        cached.items.push_back(older);
        auto patched = MutationCoordinator::prepend(cached, newer, 1);
        REQUIRE(patched.has_value());
        REQUIRE(patched->items.size() == 1);
        CHECK(patched->items[0] == newer);
        CHECK(patched->hasMore);
        CHECK(patched->nextCursor == cursor::encode(positionOf(newer)));
    }
}

// =============================================================================
// 6. Degraded cache
// =============================================================================

TEST_CASE("MutationCoordinator - cache backend down", "[mutation]") {
    Harness h;

    SECTION("add and remove still commit") {
        h.kv.down = true;
        auto added = runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK(added.created);
        CHECK(runTask(h.io, h.coordinator.remove("u1", "m1")));
        CHECK(h.store.rowCount() == 0);
    }

    SECTION("a failed patch write still bumps and returns") {
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        h.warmHead("u1", 20);
        h.kv.failOps.insert("set");

        auto added = runTask(h.io, h.coordinator.add("u1", "m2", "movie"));
        CHECK(added.created);
        h.kv.failOps.clear();
        CHECK(h.version("u1") == 3);
        CHECK_FALSE(h.cachedHead("u1", 20).has_value());
    }

    SECTION("a failed version bump drops the first pages of the current version") {
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        h.warmHead("u1", 20);
        REQUIRE(h.cachedHead("u1", 20).has_value());
        h.kv.failOps.insert("incr");

        auto added = runTask(h.io, h.coordinator.add("u1", "m2", "movie"));
        CHECK(added.created);
        CHECK(h.version("u1") == 2);
        CHECK_FALSE(h.cachedHead("u1", 20).has_value());
        CHECK(h.kv.calls("del") == 1);
    }

    SECTION("the same holds for remove") {
        runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        runTask(h.io, h.coordinator.add("u1", "m2", "movie"));
        h.warmHead("u1", 20);
        h.kv.failOps.insert("incr");

        CHECK(runTask(h.io, h.coordinator.remove("u1", "m2")));
        CHECK_FALSE(h.cachedHead("u1", 20).has_value());
    }

    SECTION("bump and drop both failing still commit") {
        h.kv.failOps = {"incr", "del"};
        auto added = runTask(h.io, h.coordinator.add("u1", "m1", "movie"));
        CHECK(added.created);
        CHECK(h.store.rowCount() == 1);
    }
}
