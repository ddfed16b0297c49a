#ifndef JCX_MYLIST_IO_REDIS_RESP_WRITER_H
#define JCX_MYLIST_IO_REDIS_RESP_WRITER_H

#include <charconv>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace jcailloux::mylist::io {

// RespWriter - outgoing RESP2 commands, queued until the socket takes them.
//
// A command is an array of bulk strings, so arguments are length-prefixed and
// never escaped (cached page JSON goes through untouched):
//
//   *3\r\n$3\r\nGET\r\n$13\r\nmylist:u1:ver\r\n ...

class RespWriter {
public:
    void append(std::span<const std::string_view> args) {
        header('*', args.size());
        for (auto arg : args) {
            header('$', arg.size());
            out_.append(arg);
            out_.append("\r\n");
        }
    }

    void append(std::initializer_list<std::string_view> args) {
        append(std::span<const std::string_view>(args.begin(), args.size()));
    }

    /// Unsent bytes, starting at the first one the socket has not accepted.
    [[nodiscard]] std::string_view pending() const noexcept {
        return std::string_view(out_).substr(sent_);
    }

    [[nodiscard]] bool empty() const noexcept { return sent_ == out_.size(); }

    /// Mark n bytes of pending() as written.
    void consume(size_t n) noexcept {
        sent_ += n;
        if (sent_ == out_.size()) clear();
    }

    void clear() noexcept {
        out_.clear();
        sent_ = 0;
    }

private:
    void header(char type, size_t n) {
        char digits[24];
        auto res = std::to_chars(digits, digits + sizeof(digits), n);
        out_.push_back(type);
        out_.append(digits, res.ptr);
        out_.append("\r\n");
    }

    std::string out_;
    size_t sent_ = 0;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_RESP_WRITER_H
