/**
 * test_cursor_codec.cpp
 *
 * Opaque cursor tokens: encode/decode of (createdAt, id) positions.
 *
 * Covers:
 *   1. Round-trip            - fixed-size URL-safe tokens decode to the same position
 *   2. Malformed tokens      - length, alphabet
 *   3. Tampered tokens       - any changed character is rejected
 *   4. Ordering helpers      - sortsBefore over ties in createdAt
 */

#include <catch2/catch_test_macros.hpp>

#include <jcailloux/mylist/Error.h>
#include <jcailloux/mylist/cursor/CursorCodec.h>
#include <jcailloux/mylist/model/ListItem.h>

#include <cstdint>
#include <limits>
#include <string>

using namespace jcailloux::mylist;

// =============================================================================
// 1. Round-trip
// =============================================================================

TEST_CASE("CursorCodec - round-trip", "[cursor]") {

    SECTION("typical position") {
        CursorPosition pos{1'700'000'000'123'456, 42};
        auto token = cursor::encode(pos);
        CHECK(token.size() == cursor::kTokenSize);
        CHECK(cursor::decode(token) == pos);
    }

    SECTION("extreme values") {
        CursorPosition zero{0, 0};
        CursorPosition big{std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::max()};
        CHECK(cursor::decode(cursor::encode(zero)) == zero);
        CHECK(cursor::decode(cursor::encode(big)) == big);
    }

    SECTION("token only uses the URL-safe alphabet") {
        auto token = cursor::encode({123456789, 987654321});
        for (char c : token) {
            bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                   || (c >= '0' && c <= '9') || c == '-' || c == '_';
            CHECK(ok);
        }
    }

    SECTION("distinct positions give distinct tokens") {
        CHECK(cursor::encode({100, 1}) != cursor::encode({100, 2}));
        CHECK(cursor::encode({100, 1}) != cursor::encode({101, 1}));
    }
}

// =============================================================================
// 2. Malformed tokens
// =============================================================================

TEST_CASE("CursorCodec - malformed tokens are rejected", "[cursor]") {

    SECTION("empty") {
        CHECK_THROWS_AS(cursor::decode(""), InvalidCursor);
    }

    SECTION("wrong length") {
        auto token = cursor::encode({1, 1});
        CHECK_THROWS_AS(cursor::decode(token.substr(0, token.size() - 1)), InvalidCursor);
        CHECK_THROWS_AS(cursor::decode(token + "A"), InvalidCursor);
    }

    SECTION("characters outside the alphabet") {
        auto token = cursor::encode({1, 1});
        token[3] = '+';
        CHECK_THROWS_AS(cursor::decode(token), InvalidCursor);
        token[3] = '=';
        CHECK_THROWS_AS(cursor::decode(token), InvalidCursor);
    }

    SECTION("arbitrary text") {
        CHECK_THROWS_AS(cursor::decode("not-a-cursor"), InvalidCursor);
        CHECK_THROWS_AS(cursor::decode(std::string(cursor::kTokenSize, 'A')), InvalidCursor);
    }

    SECTION("the error code is INVALID_CURSOR") {
        try {
            (void)cursor::decode("garbage");
            FAIL("decode accepted garbage");
        } catch (const MyListError& e) {
            CHECK(e.code() == ErrorCode::InvalidCursor);
            CHECK_FALSE(e.retryable());
        }
    }
}

// =============================================================================
// 3. Tampering
// =============================================================================

TEST_CASE("CursorCodec - tampered tokens are rejected", "[cursor]") {
    auto token = cursor::encode({1'700'000'000'000'000, 7});

    // 28 characters hold exactly 21 bytes, so every character is significant.
    for (size_t i = 0; i < token.size(); ++i) {
        auto tampered = token;
        tampered[i] = tampered[i] == 'A' ? 'B' : 'A';
        INFO("position " << i);
        CHECK_THROWS_AS(cursor::decode(tampered), InvalidCursor);
    }
}

// =============================================================================
// 4. Ordering
// =============================================================================

TEST_CASE("CursorPosition - list order", "[cursor]") {
    CursorPosition newer{200, 1};
    CursorPosition older{100, 9};
    CursorPosition tieHigh{100, 10};

    CHECK(newer.sortsBefore(older));
    CHECK_FALSE(older.sortsBefore(newer));
    CHECK(tieHigh.sortsBefore(older));
    CHECK_FALSE(older.sortsBefore(older));
}
