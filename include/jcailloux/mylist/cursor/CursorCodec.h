#ifndef JCX_MYLIST_CURSOR_CODEC_H
#define JCX_MYLIST_CURSOR_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <xxhash.h>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/model/ListItem.h"

namespace jcailloux::mylist::cursor {

// =============================================================================
// CursorCodec - opaque keyset cursor <-> (createdAt, id)
//
// Binary layout (21 bytes), base64url without padding (28 chars):
//
//   [0]      format byte (0x01)
//   [1..8]   createdAt, big-endian int64
//   [9..16]  id, big-endian int64
//   [17..20] low 32 bits of XXH3-64 over bytes [0..16], big-endian
//
// The checksum rejects truncated and hand-edited tokens. It is not a MAC.
// =============================================================================

inline constexpr uint8_t kFormatV1 = 0x01;
inline constexpr size_t kPayloadSize = 17;
inline constexpr size_t kRawSize = kPayloadSize + 4;
inline constexpr size_t kTokenSize = 28;   // ceil(21 * 8 / 6)

namespace detail {

inline constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

inline constexpr std::array<uint8_t, 256> kDecodeTable = [] {
    std::array<uint8_t, 256> t{};
    for (auto& v : t) v = 64;
    for (uint8_t i = 0; i < 64; ++i)
        t[static_cast<uint8_t>(kAlphabet[i])] = i;
    return t;
}();

inline void putBigEndian(uint8_t* out, uint64_t v, size_t width) noexcept {
    for (size_t i = 0; i < width; ++i)
        out[i] = static_cast<uint8_t>(v >> (8 * (width - 1 - i)));
}

inline uint64_t getBigEndian(const uint8_t* in, size_t width) noexcept {
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i)
        v = (v << 8) | in[i];
    return v;
}

inline uint32_t checksum(const uint8_t* payload) noexcept {
    return static_cast<uint32_t>(XXH3_64bits(payload, kPayloadSize));
}

}  // namespace detail

[[nodiscard]] inline std::string encode(const CursorPosition& pos) {
    std::array<uint8_t, kRawSize> raw{};
    raw[0] = kFormatV1;
    detail::putBigEndian(raw.data() + 1, static_cast<uint64_t>(pos.createdAt), 8);
    detail::putBigEndian(raw.data() + 9, static_cast<uint64_t>(pos.id), 8);
    detail::putBigEndian(raw.data() + kPayloadSize, detail::checksum(raw.data()), 4);

    std::string out;
    out.reserve(kTokenSize);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : raw) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out += detail::kAlphabet[(buffer >> bits) & 0x3F];
        }
    }
    if (bits > 0)
        out += detail::kAlphabet[(buffer << (6 - bits)) & 0x3F];
    return out;
}

/// Throws InvalidCursor for anything encode() could not have produced.
[[nodiscard]] inline CursorPosition decode(std::string_view token) {
    if (token.size() != kTokenSize)
        throw InvalidCursor("cursor has invalid length");

    std::array<uint8_t, kRawSize> raw{};
    size_t n = 0;
    uint32_t buffer = 0;
    int bits = 0;
    for (char ch : token) {
        uint8_t c = detail::kDecodeTable[static_cast<uint8_t>(ch)];
        if (c == 64) throw InvalidCursor("cursor contains invalid characters");
        buffer = (buffer << 6) | c;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            raw[n++] = static_cast<uint8_t>((buffer >> bits) & 0xFF);
        }
    }
    // 28 chars carry 168 bits: 21 bytes exactly, no trailing bits.
    if (n != kRawSize)
        throw InvalidCursor("cursor has invalid length");

    if (raw[0] != kFormatV1)
        throw InvalidCursor("cursor has unknown format");

    auto expected = static_cast<uint32_t>(detail::getBigEndian(raw.data() + kPayloadSize, 4));
    if (expected != detail::checksum(raw.data()))
        throw InvalidCursor("cursor checksum mismatch");

    CursorPosition pos;
    pos.createdAt = static_cast<int64_t>(detail::getBigEndian(raw.data() + 1, 8));
    pos.id = static_cast<int64_t>(detail::getBigEndian(raw.data() + 9, 8));
    if (pos.id < 0)
        throw InvalidCursor("cursor has negative id");
    return pos;
}

}  // namespace jcailloux::mylist::cursor

#endif  // JCX_MYLIST_CURSOR_CODEC_H
