#ifndef JCX_MYLIST_IO_REDIS_RESP_PARSER_H
#define JCX_MYLIST_IO_REDIS_RESP_PARSER_H

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "jcailloux/mylist/io/redis/RedisError.h"
#include "jcailloux/mylist/io/redis/RedisReply.h"

namespace jcailloux::mylist::io {

// RespParser - incremental RESP2 decoder.
//
// Bytes read from the socket are fed in as they arrive; next() decodes one
// complete reply from the front of the buffer, or returns nullopt and keeps
// the bytes until more arrive. Malformed input throws RedisProtocolError
// instead of waiting for bytes that will never come.
//
//   parser.feed(buf, n);
//   while (auto reply = parser.next()) handle(std::move(*reply));

class RespParser {
public:
    void feed(const char* data, size_t len) { buffer_.append(data, len); }
    void feed(std::string_view bytes) { feed(bytes.data(), bytes.size()); }

    std::optional<RedisReply> next() {
        std::string_view pending(buffer_);
        pending.remove_prefix(start_);

        size_t pos = 0;
        auto reply = decode(pending, pos);
        if (!reply) return std::nullopt;

        start_ += pos;
        if (start_ == buffer_.size()) {
            clear();
        } else if (start_ > kCompactThreshold && start_ * 2 > buffer_.size()) {
            buffer_.erase(0, start_);
            start_ = 0;
        }
        return reply;
    }

    /// Bytes fed but not yet decoded.
    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - start_; }

    void clear() noexcept {
        buffer_.clear();
        start_ = 0;
    }

private:
    static constexpr size_t kCompactThreshold = 4096;

    // Header line after the type byte; nullopt until its CRLF has arrived.
    static std::optional<std::string_view> line(std::string_view in, size_t& pos) {
        auto eol = in.find("\r\n", pos);
        if (eol == std::string_view::npos) return std::nullopt;
        auto text = in.substr(pos, eol - pos);
        pos = eol + 2;
        return text;
    }

    static int64_t number(std::string_view field) {
        int64_t v = 0;
        const char* end = field.data() + field.size();
        auto [ptr, ec] = std::from_chars(field.data(), end, v);
        if (field.empty() || ec != std::errc{} || ptr != end)
            throw RedisProtocolError("invalid RESP2 integer '" + std::string(field) + "'");
        return v;
    }

    static std::optional<RedisReply> decode(std::string_view in, size_t& pos) {
        if (pos >= in.size()) return std::nullopt;

        const char type = in[pos];
        if (std::string_view("+-:$*").find(type) == std::string_view::npos)
            throw RedisProtocolError(std::string("unknown RESP2 type byte '") + type + "'");

        size_t cur = pos + 1;
        auto header = line(in, cur);
        if (!header) return std::nullopt;

        RedisReply reply;
        switch (type) {
        case '+':
            reply = RedisReply::status(std::string(*header));
            break;
        case '-':
            reply = RedisReply::error(std::string(*header));
            break;
        case ':':
            reply = RedisReply::integer(number(*header));
            break;
        case '$': {
            int64_t len = number(*header);
            if (len < 0) break;
            auto n = static_cast<size_t>(len);
            if (in.size() - cur < n + 2) return std::nullopt;
            if (in.substr(cur + n, 2) != "\r\n")
                throw RedisProtocolError("bulk string is not CRLF-terminated");
            reply = RedisReply::bulk(std::string(in.substr(cur, n)));
            cur += n + 2;
            break;
        }
        case '*': {
            int64_t count = number(*header);
            if (count < 0) break;
            std::vector<RedisReply> elements;
            elements.reserve(static_cast<size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                auto element = decode(in, cur);
                if (!element) return std::nullopt;
                elements.push_back(std::move(*element));
            }
            reply = RedisReply::array(std::move(elements));
            break;
        }
        }

        pos = cur;
        return reply;
    }

    std::string buffer_;
    size_t start_ = 0;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_RESP_PARSER_H
