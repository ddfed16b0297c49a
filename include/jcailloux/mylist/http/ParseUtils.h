#ifndef JCX_MYLIST_HTTP_PARSE_UTILS_H
#define JCX_MYLIST_HTTP_PARSE_UTILS_H

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace jcailloux::mylist::http::parse {

/// Whole-string int parse; nullopt on empty input, junk, or overflow.
[[nodiscard]] inline std::optional<int> toInt(std::string_view str) noexcept {
    if (str.empty()) return std::nullopt;
    int result = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
    return result;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

namespace detail {

inline std::optional<std::string> decodeEscapes(std::string_view in, bool plusIsSpace) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+' && plusIsSpace) {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace detail

/// Query-string decoding: %XX escapes and '+' as space. nullopt on a
/// truncated or non-hex escape.
[[nodiscard]] inline std::optional<std::string> percentDecode(std::string_view in) {
    return detail::decodeEscapes(in, true);
}

/// Path-segment decoding: %XX escapes only, '+' stays literal.
[[nodiscard]] inline std::optional<std::string> pathDecode(std::string_view in) {
    return detail::decodeEscapes(in, false);
}

/// Raw (still encoded) value of the first `name` parameter in a query
/// string such as "limit=2&cursor=abc". nullopt when absent.
[[nodiscard]] inline std::optional<std::string_view> queryParam(std::string_view query, std::string_view name) {
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        if (key == name)
            return eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

}  // namespace jcailloux::mylist::http::parse

#endif  // JCX_MYLIST_HTTP_PARSE_UTILS_H
