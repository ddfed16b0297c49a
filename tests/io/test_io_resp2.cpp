#include <catch2/catch_test_macros.hpp>
#include <jcailloux/mylist/io/redis/RedisError.h>
#include <jcailloux/mylist/io/redis/RedisReply.h>
#include <jcailloux/mylist/io/redis/RespParser.h>
#include <jcailloux/mylist/io/redis/RespWriter.h>

#include <initializer_list>
#include <string>
#include <string_view>

using namespace jcailloux::mylist::io;

namespace {

// Decode one complete reply that makes up the whole input.
RedisReply reply(std::string_view wire) {
    RespParser parser;
    parser.feed(wire);
    auto r = parser.next();
    REQUIRE(r.has_value());
    REQUIRE(parser.buffered() == 0);
    return std::move(*r);
}

std::string encode(std::initializer_list<std::string_view> args) {
    RespWriter w;
    w.append(args);
    return std::string(w.pending());
}

} // anonymous namespace

// =============================================================================
// RespWriter - the commands the cache backend sends
// =============================================================================

TEST_CASE("RespWriter - cache commands", "[resp2][writer]") {

    SECTION("SET NX PX for lock acquisition") {
        CHECK(encode({"SET", "mylist:lock:u1:head.l20", "tok", "NX", "PX", "5000"}) ==
            "*6\r\n$3\r\nSET\r\n$23\r\nmylist:lock:u1:head.l20\r\n$3\r\ntok\r\n"
            "$2\r\nNX\r\n$2\r\nPX\r\n$4\r\n5000\r\n");
    }

    SECTION("page payloads are length-prefixed, not escaped") {
        std::string_view json = "{\"a\":\"x\r\ny\"}";
        auto wire = encode({"SET", "k", json});
        CHECK(wire.find("$" + std::to_string(json.size()) + "\r\n") != std::string::npos);
        // *3, $3 SET, $1 k, then the payload with its own header and CRLF
        CHECK(wire.size() == 4 + 9 + 7 + (1 + 2 + 2) + json.size() + 2);
    }

    SECTION("empty argument") {
        CHECK(encode({"GET", ""}) == "*2\r\n$3\r\nGET\r\n$0\r\n\r\n");
    }

    SECTION("partial writes leave the unsent tail pending") {
        RespWriter w;
        w.append({"INCR", "mylist:u1:version"});
        auto total = w.pending().size();
        w.consume(4);
        CHECK(w.pending().size() == total - 4);
        CHECK(w.pending().substr(0, 4) == "$4\r\n");
        w.consume(w.pending().size());
        CHECK(w.empty());
        CHECK(w.pending().empty());
    }

    SECTION("commands queue back to back") {
        RespWriter w;
        w.append({"GET", "a"});
        w.append({"GET", "b"});
        CHECK(w.pending() == "*2\r\n$3\r\nGET\r\n$1\r\na\r\n*2\r\n$3\r\nGET\r\n$1\r\nb\r\n");
    }
}

// =============================================================================
// RespParser / RedisReply - the replies the cache backend reads
// =============================================================================

TEST_CASE("RespParser - replies", "[resp2][parser]") {

    SECTION("+OK from a successful SET") {
        auto r = reply("+OK\r\n");
        CHECK(r.kind() == RedisReply::Kind::Status);
        CHECK(r.isString());
        CHECK(r.asString() == "OK");
    }

    SECTION("nil bulk from SET NX on an existing key or GET miss") {
        auto r = reply("$-1\r\n");
        CHECK(r.isNil());
        CHECK_FALSE(r.asOptionalString().has_value());
    }

    SECTION("bulk string with CRLF inside") {
        auto r = reply("$6\r\nab\r\ncd\r\n");
        REQUIRE(r.isString());
        CHECK(r.asStringView() == "ab\r\ncd");
        CHECK(r.asOptionalString() == "ab\r\ncd");
    }

    SECTION("empty bulk string is not nil") {
        auto r = reply("$0\r\n\r\n");
        CHECK_FALSE(r.isNil());
        CHECK(r.asOptionalString() == "");
    }

    SECTION("integers from INCR, DEL and EVAL") {
        CHECK(reply(":42\r\n").asInteger() == 42);
        CHECK(reply(":-1\r\n").asInteger() == -1);
        CHECK(reply(":0\r\n").isInteger());
    }

    SECTION("error replies") {
        auto r = reply("-ERR value is not an integer or out of range\r\n");
        CHECK(r.isError());
        CHECK(r.errorMessage() == "ERR value is not an integer or out of range");
        CHECK(r.asStringView().empty());
    }

    SECTION("nested arrays") {
        auto r = reply("*3\r\n:1\r\n*2\r\n$1\r\na\r\n$-1\r\n+done\r\n");
        REQUIRE(r.isArray());
        REQUIRE(r.arraySize() == 3);
        CHECK(r.at(0).asInteger() == 1);
        REQUIRE(r.at(1).arraySize() == 2);
        CHECK(r.at(1).at(0).asString() == "a");
        CHECK(r.at(1).at(1).isNil());
        CHECK(r.at(2).asString() == "done");
        CHECK(r.at(7).isNil());
    }
}

TEST_CASE("RespParser - partial and malformed input", "[resp2][parser]") {
    RespParser parser;

    SECTION("incomplete replies wait for more bytes") {
        std::string_view full = "$5\r\nhello\r\n";
        for (size_t i = 0; i + 1 < full.size(); ++i) {
            parser.feed(full.substr(i, 1));
            CHECK_FALSE(parser.next().has_value());
        }
        parser.feed(full.substr(full.size() - 1));
        auto r = parser.next();
        REQUIRE(r.has_value());
        CHECK(r->asString() == "hello");
        CHECK(parser.buffered() == 0);
    }

    SECTION("an array split across reads") {
        parser.feed("*2\r\n:1\r\n");
        CHECK_FALSE(parser.next().has_value());
        parser.feed(":2\r\n");
        auto r = parser.next();
        REQUIRE(r.has_value());
        CHECK(r->at(1).asInteger() == 2);
    }

    SECTION("back-to-back replies decode one at a time") {
        parser.feed(":1\r\n:2\r\n");
        CHECK(parser.next()->asInteger() == 1);
        CHECK(parser.buffered() == 4);
        CHECK(parser.next()->asInteger() == 2);
        CHECK_FALSE(parser.next().has_value());
    }

    SECTION("unknown type byte") {
        parser.feed("?what\r\n");
        CHECK_THROWS_AS(parser.next(), RedisProtocolError);
    }

    SECTION("non-numeric integer") {
        parser.feed(":12x\r\n");
        CHECK_THROWS_AS(parser.next(), RedisProtocolError);
    }

    SECTION("bulk length that does not match the payload") {
        parser.feed("$2\r\nabc\r\n");
        CHECK_THROWS_AS(parser.next(), RedisProtocolError);
    }

    SECTION("protocol errors are redis errors") {
        parser.feed("!\r\n");
        CHECK_THROWS_AS(parser.next(), RedisError);
    }
}
