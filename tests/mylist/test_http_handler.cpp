/**
 * test_http_handler.cpp
 *
 * HTTP contract of MyListHandler over the in-memory backends.
 *
 * Covers:
 *   1. Pagination scenario   - three items, limit=2, follow the cursor
 *   2. Add                   - 201 then 200 for the same content, list holds it once
 *   3. Remove                - removed / not in list, percent-decoded path
 *   4. Error mapping         - 400, 404, 405, 503 and the error body
 *   5. Query parsing         - percent-decoding, empty values, case-insensitive headers
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/mylist/config/MyListConfig.h>
#include <jcailloux/mylist/core/MyListService.h>
#include <jcailloux/mylist/http/MyListHandler.h>
#include <jcailloux/mylist/http/ParseUtils.h>
#include <jcailloux/mylist/io/Sleep.h>
#include <jcailloux/mylist/model/Page.h>

#include "fixtures/ManualIoContext.h"
#include "fixtures/MemoryKvBackend.h"
#include "fixtures/MemoryListStore.h"
#include "fixtures/TestRunner.h"

#include <glaze/glaze.hpp>

#include <string>

using namespace jcailloux::mylist;
using namespace jcailloux::mylist::test;
using jcailloux::mylist::http::HttpRequest;
using jcailloux::mylist::http::HttpResponse;

namespace {

struct Harness {
    Harness()
        : kv(io), store(io)
        , service(store, kv, config::MyListConfig{},
                  [this](std::chrono::milliseconds d) { return io::sleepFor(io, d); })
        , handler(service)
    {
        store.addContent("movie", "m1");
        store.addContent("movie", "m2");
        store.addContent("movie", "m3");
        store.addContent("movie", "a b/c");
        store.addContent("movie", "a+b");
        store.addContent("movie", "a b");
        store.addContent("tvshow", "s1");
    }

    HttpResponse call(std::string method, std::string path, std::string body = {},
                      std::string user = "alice") {
        HttpRequest req;
        req.method = std::move(method);
        req.path = std::move(path);
        req.body = std::move(body);
        if (!user.empty()) req.headers.emplace_back("x-user-id", std::move(user));
        return runTask(io, handler.handle(req));
    }

    HttpResponse post(std::string_view contentId, std::string_view contentType = "movie") {
        std::string body = "{\"contentId\":\"" + std::string(contentId)
                         + "\",\"contentType\":\"" + std::string(contentType) + "\"}";
        return call("POST", "/my-list", body);
    }

    ManualIoContext io;
    MemoryKvBackend kv;
    MemoryListStore store;
    MyListService service;
    http::MyListHandler handler;
};

Page pageOf(const HttpResponse& r) {
    auto page = Page::fromJson(r.body);
    REQUIRE(page.has_value());
    return *page;
}

http::dto::AddResponse addedOf(const HttpResponse& r) {
    http::dto::AddResponse out;
    REQUIRE_FALSE(glz::read_json(out, r.body));
    return out;
}

http::dto::ErrorResponse errorOf(const HttpResponse& r) {
    http::dto::ErrorResponse out;
    REQUIRE_FALSE(glz::read_json(out, r.body));
    return out;
}

} // anonymous namespace

// =============================================================================
// 1. Pagination scenario
// =============================================================================

TEST_CASE("HTTP - three items paged by two", "[http]") {
    Harness h;
    REQUIRE(h.post("m1").status == 201);   // t1
    REQUIRE(h.post("m2").status == 201);   // t2
    REQUIRE(h.post("m3").status == 201);   // t3

    auto first = h.call("GET", "/my-list?limit=2");
    REQUIRE(first.status == 200);
    CHECK(first.contentType == "application/json");
    auto p1 = pageOf(first);
    REQUIRE(p1.items.size() == 2);
    CHECK(p1.items[0].contentId == "m3");
    CHECK(p1.items[1].contentId == "m2");
    CHECK(p1.hasMore);
    REQUIRE(p1.nextCursor.has_value());

    auto second = h.call("GET", "/my-list?limit=2&cursor=" + *p1.nextCursor);
    REQUIRE(second.status == 200);
    auto p2 = pageOf(second);
    REQUIRE(p2.items.size() == 1);
    CHECK(p2.items[0].contentId == "m1");
    CHECK_FALSE(p2.hasMore);
    CHECK_FALSE(p2.nextCursor.has_value());
    CHECK(second.body.find("\"nextCursor\":null") != std::string::npos);
}

// =============================================================================
// 2. Add
// =============================================================================

TEST_CASE("HTTP - add is idempotent", "[http]") {
    Harness h;

    auto first = h.post("m1");
    CHECK(first.status == 201);
    auto a = addedOf(first);
    CHECK(a.message == "Added to list");
    CHECK(a.item.contentId == "m1");
    CHECK(a.item.userId == "alice");

    auto second = h.post("m1");
    CHECK(second.status == 200);
    auto b = addedOf(second);
    CHECK(b.message == "Already in list");
    CHECK(b.item == a.item);

    auto page = pageOf(h.call("GET", "/my-list"));
    REQUIRE(page.items.size() == 1);
    CHECK(page.items[0].contentId == "m1");
}

// =============================================================================
// 3. Remove
// =============================================================================

TEST_CASE("HTTP - remove", "[http]") {
    Harness h;
    h.post("m1");

    auto removed = h.call("DELETE", "/my-list/m1");
    CHECK(removed.status == 200);
    CHECK(removed.body == R"({"message":"Removed from list"})");

    auto again = h.call("DELETE", "/my-list/m1");
    CHECK(again.status == 200);
    CHECK(again.body == R"({"message":"Not in list"})");

    SECTION("content ids are percent-decoded") {
        REQUIRE(h.post("a b/c").status == 201);
        CHECK(h.call("DELETE", "/my-list/a%20b%2Fc").body == R"({"message":"Removed from list"})");
    }

    SECTION("a '+' in the path is a literal plus") {
        REQUIRE(h.post("a+b").status == 201);
        REQUIRE(h.post("a b").status == 201);

        CHECK(h.call("DELETE", "/my-list/a+b").body == R"({"message":"Removed from list"})");
        auto left = pageOf(h.call("GET", "/my-list"));
        REQUIRE(left.items.size() == 1);
        CHECK(left.items[0].contentId == "a b");

        CHECK(h.call("DELETE", "/my-list/a+b").body == R"({"message":"Not in list"})");
    }
}

// =============================================================================
// 4. Error mapping
// =============================================================================

TEST_CASE("HTTP - errors", "[http]") {
    Harness h;

    SECTION("missing user header") {
        auto r = h.call("GET", "/my-list", {}, "");
        CHECK(r.status == 400);
        CHECK(errorOf(r).error == "VALIDATION_ERROR");
    }

    SECTION("bad limit") {
        CHECK(h.call("GET", "/my-list?limit=abc").status == 400);
        CHECK(h.call("GET", "/my-list?limit=0").status == 400);
        CHECK(h.call("GET", "/my-list?limit=-3").status == 400);
    }

    SECTION("bad cursor") {
        auto r = h.call("GET", "/my-list?cursor=tampered");
        CHECK(r.status == 400);
        CHECK(errorOf(r).error == "INVALID_CURSOR");
    }

    SECTION("unknown or unsupported content") {
        auto missing = h.post("m404");
        CHECK(missing.status == 400);
        CHECK(errorOf(missing).error == "INVALID_CONTENT");

        auto badType = h.post("m1", "podcast");
        CHECK(badType.status == 400);
        CHECK(errorOf(badType).error == "INVALID_CONTENT");
    }

    SECTION("malformed body") {
        auto r = h.call("POST", "/my-list", "{not json");
        CHECK(r.status == 400);
        CHECK(errorOf(r).error == "VALIDATION_ERROR");
        CHECK(h.call("POST", "/my-list", R"({"contentId":"m1"})").status == 400);
    }

    SECTION("store down is 503") {
        h.store.down = true;
        auto r = h.call("GET", "/my-list");
        CHECK(r.status == 503);
        CHECK(errorOf(r).error == "STORE_UNAVAILABLE");
    }

    SECTION("cache down still serves reads") {
        h.post("m1");
        h.kv.down = true;
        CHECK(h.call("GET", "/my-list").status == 200);
    }

    SECTION("routing") {
        CHECK(h.call("GET", "/elsewhere").status == 404);
        CHECK(h.call("GET", "/my-list/a/b").status == 404);
        CHECK(h.call("PUT", "/my-list").status == 405);
        CHECK(h.call("GET", "/my-list/m1").status == 405);
        CHECK(errorOf(h.call("PATCH", "/my-list")).error == "METHOD_NOT_ALLOWED");
    }
}

// =============================================================================
// 5. Query parsing
// =============================================================================

TEST_CASE("HTTP - request parsing", "[http]") {
    Harness h;
    h.post("m1");
    h.post("m2");

    SECTION("header names are case-insensitive") {
        HttpRequest req;
        req.method = "GET";
        req.path = "/my-list";
        req.headers.emplace_back("X-User-Id", "alice");
        auto r = runTask(h.io, h.handler.handle(req));
        CHECK(r.status == 200);
        CHECK(pageOf(r).items.size() == 2);
    }

    SECTION("query may be passed separately from the path") {
        HttpRequest req;
        req.method = "GET";
        req.path = "/my-list";
        req.query = "limit=1";
        req.headers.emplace_back("x-user-id", "alice");
        CHECK(pageOf(runTask(h.io, h.handler.handle(req))).items.size() == 1);
    }

    SECTION("empty values count as absent") {
        auto page = pageOf(h.call("GET", "/my-list?limit=&cursor="));
        CHECK(page.items.size() == 2);
    }

    SECTION("percent-encoded values") {
        CHECK(pageOf(h.call("GET", "/my-list?limit=%31")).items.size() == 1);
    }
}

TEST_CASE("ParseUtils - helpers", "[http][parse]") {
    using namespace jcailloux::mylist::http::parse;

    CHECK(toInt("42") == 42);
    CHECK(toInt("-7") == -7);
    CHECK_FALSE(toInt("4x").has_value());
    CHECK_FALSE(toInt("").has_value());

    CHECK(percentDecode("a%20b+c") == "a b c");
    CHECK_FALSE(percentDecode("%4").has_value());
    CHECK_FALSE(percentDecode("%zz").has_value());
    CHECK(pathDecode("a%20b+c") == "a b+c");
    CHECK_FALSE(pathDecode("%2").has_value());

    CHECK(queryParam("a=1&b=2", "b") == "2");
    CHECK_FALSE(queryParam("a=1&bb=2", "b").has_value());

    CHECK(iequals("X-User-Id", "x-user-id"));
    CHECK_FALSE(iequals("x-user", "x-user-id"));
}
