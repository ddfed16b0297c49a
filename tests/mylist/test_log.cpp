/**
 * test_log.cpp
 *
 * Log sink routing, level threshold, and a warning raised by the cache layer.
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/mylist/Log.h>
#include <jcailloux/mylist/core/CacheKeys.h>
#include <jcailloux/mylist/core/PageCache.h>

#include "fixtures/ManualIoContext.h"
#include "fixtures/MemoryKvBackend.h"
#include "fixtures/TestRunner.h"

#include <string>
#include <utility>
#include <vector>

using namespace jcailloux::mylist;
using namespace jcailloux::mylist::test;

namespace {

std::vector<std::pair<log::Level, std::string>> captured;

void capture(log::Level level, const char* msg, size_t len) {
    captured.emplace_back(level, std::string(msg, len));
}

// Installs the capturing sink for one test and restores silence afterwards.
struct CaptureLogs {
    CaptureLogs() {
        captured.clear();
        log::setCallback(&capture);
        log::setMinLevel(log::Level::Debug);
    }
    ~CaptureLogs() {
        log::setCallback(nullptr);
        log::setMinLevel(log::Level::Debug);
    }
};

int evaluations = 0;
int counted() { return ++evaluations; }

} // anonymous namespace

TEST_CASE("Log - routing and threshold", "[log]") {
    CaptureLogs guard;

    SECTION("messages reach the sink with their level") {
        MYLIST_LOG_WARN << "cache down: " << 3 << " attempts, retry=" << true;
        REQUIRE(captured.size() == 1);
        CHECK(captured[0].first == log::Level::Warn);
        CHECK(captured[0].second == "cache down: 3 attempts, retry=true");
    }

    SECTION("levels below the threshold are dropped unevaluated") {
        evaluations = 0;
        log::setMinLevel(log::Level::Warn);
        MYLIST_LOG_DEBUG << "debug " << counted();
        MYLIST_LOG_INFO << "info " << counted();
        MYLIST_LOG_ERROR << "error " << counted();
        REQUIRE(captured.size() == 1);
        CHECK(captured[0].first == log::Level::Error);
        CHECK(evaluations == 1);
    }

    SECTION("no sink, no formatting") {
        evaluations = 0;
        log::setCallback(nullptr);
        MYLIST_LOG_ERROR << counted();
        CHECK(evaluations == 0);
        CHECK(captured.empty());
    }

    SECTION("level names") {
        CHECK(log::levelName(log::Level::Info) == "info");
        CHECK(log::levelName(log::Level::Error) == "error");
    }
}

TEST_CASE("Log - corrupt cached page is reported", "[log][cache]") {
    CaptureLogs guard;
    ManualIoContext io;
    MemoryKvBackend kv(io);
    PageCache pages(kv);

    kv.poke(keys::page("u1", "head.l20", 1), "{not json");
    CHECK_FALSE(runTask(io, pages.get("u1", "head.l20", 1)).has_value());

    REQUIRE(captured.size() == 1);
    CHECK(captured[0].first == log::Level::Warn);
    CHECK(captured[0].second.find("corrupt entry") != std::string::npos);
}
