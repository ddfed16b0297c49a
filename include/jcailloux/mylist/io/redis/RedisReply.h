#ifndef JCX_MYLIST_IO_REDIS_REPLY_H
#define JCX_MYLIST_IO_REDIS_REPLY_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jcailloux::mylist::io {

// RedisReply - one decoded RESP2 reply, owning its strings and elements.
//
// Status (+OK) and bulk ($n) replies both read as strings. A missing key and
// a null array both decode to Nil.

class RedisReply {
public:
    enum class Kind : uint8_t { Nil, Status, Error, Integer, Bulk, Array };

    RedisReply() noexcept = default;

    static RedisReply nil() noexcept { return {}; }
    static RedisReply status(std::string s) { return RedisReply(Kind::Status, std::move(s)); }
    static RedisReply error(std::string s) { return RedisReply(Kind::Error, std::move(s)); }
    static RedisReply bulk(std::string s) { return RedisReply(Kind::Bulk, std::move(s)); }

    static RedisReply integer(int64_t v) noexcept {
        RedisReply r;
        r.kind_ = Kind::Integer;
        r.integer_ = v;
        return r;
    }

    static RedisReply array(std::vector<RedisReply> elements) {
        RedisReply r;
        r.kind_ = Kind::Array;
        r.elements_ = std::move(elements);
        return r;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isNil() const noexcept { return kind_ == Kind::Nil; }
    [[nodiscard]] bool isString() const noexcept { return kind_ == Kind::Status || kind_ == Kind::Bulk; }
    [[nodiscard]] bool isInteger() const noexcept { return kind_ == Kind::Integer; }
    [[nodiscard]] bool isArray() const noexcept { return kind_ == Kind::Array; }
    [[nodiscard]] bool isError() const noexcept { return kind_ == Kind::Error; }

    /// Empty unless the reply is a string.
    [[nodiscard]] std::string_view asStringView() const noexcept {
        return isString() ? std::string_view(text_) : std::string_view{};
    }

    [[nodiscard]] std::string asString() const { return std::string(asStringView()); }

    /// nullopt for anything but a string (GET on a missing key replies Nil).
    [[nodiscard]] std::optional<std::string> asOptionalString() const {
        if (!isString()) return std::nullopt;
        return text_;
    }

    /// 0 unless the reply is an integer.
    [[nodiscard]] int64_t asInteger() const noexcept { return isInteger() ? integer_ : 0; }

    [[nodiscard]] std::string_view errorMessage() const noexcept {
        return isError() ? std::string_view(text_) : std::string_view{};
    }

    [[nodiscard]] size_t arraySize() const noexcept { return elements_.size(); }

    /// Out-of-range indexes read as Nil.
    [[nodiscard]] const RedisReply& at(size_t index) const noexcept {
        static const RedisReply kNil;
        return index < elements_.size() ? elements_[index] : kNil;
    }

private:
    RedisReply(Kind kind, std::string text) : kind_(kind), text_(std::move(text)) {}

    Kind kind_ = Kind::Nil;
    int64_t integer_ = 0;
    std::string text_;
    std::vector<RedisReply> elements_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_REPLY_H
