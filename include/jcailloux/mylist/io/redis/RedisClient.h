#ifndef JCX_MYLIST_IO_REDIS_CLIENT_H
#define JCX_MYLIST_IO_REDIS_CLIENT_H

#include <array>
#include <chrono>
#include <concepts>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/redis/RedisConnection.h"
#include "jcailloux/mylist/io/redis/RedisError.h"
#include "jcailloux/mylist/io/redis/RedisReply.h"

namespace jcailloux::mylist::io {

/// Where a RedisClient connects. An empty unix_path means TCP host:port.
struct RedisEndpoint {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string unix_path;
    std::chrono::milliseconds connect_timeout{500};
    std::chrono::milliseconds command_timeout{500};
};

namespace detail {

// One command on the wire at a time. Waiters are resumed through post() so a
// long queue never nests resumptions on the stack.
template<IoContext Io>
class CommandGate {
public:
    explicit CommandGate(Io& io) noexcept : io_(&io) {}

    struct Enter {
        CommandGate* gate;
        bool await_ready() const noexcept { return !gate->busy_; }
        void await_suspend(std::coroutine_handle<> h) { gate->queue_.push_back(h); }
        void await_resume() noexcept { gate->busy_ = true; }
    };

    Enter enter() noexcept { return Enter{this}; }

    void leave() {
        if (queue_.empty()) {
            busy_ = false;
            return;
        }
        auto next = queue_.front();
        queue_.pop_front();
        io_->post([next] { next.resume(); });
    }

private:
    Io* io_;
    bool busy_ = false;
    std::deque<std::coroutine_handle<>> queue_;
};

inline std::string_view argText(std::string_view s) noexcept { return s; }
inline std::string_view argText(const std::string& s) noexcept { return s; }
inline std::string_view argText(const char* s) noexcept { return s; }

template<std::integral T>
std::string argText(T v) { return std::to_string(v); }

} // namespace detail

// RedisClient - one lazily (re)connected Redis connection shared by the
// coroutines of a loop.
//
// Commands are serialized; each gets endpoint.command_timeout for its write
// and its reply together. After a connection or protocol failure the socket
// is discarded and the next command reconnects. Error replies (-ERR ...) are
// thrown as RedisServerError and keep the connection.

template<IoContext Io>
class RedisClient {
public:
    RedisClient(Io& io, RedisEndpoint endpoint)
        : io_(&io), endpoint_(std::move(endpoint)), gate_(io) {}

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /// Connects immediately so a bad endpoint fails at startup.
    static Task<std::unique_ptr<RedisClient>> connect(Io& io, RedisEndpoint endpoint) {
        auto client = std::make_unique<RedisClient>(io, std::move(endpoint));
        co_await client->reconnect();
        co_return std::move(client);
    }

    /// exec("SET", key, value, "PX", ttlMs). Integral arguments are sent in
    /// decimal; strings are sent as-is.
    template<typename... Args>
    Task<RedisReply> exec(const Args&... args) {
        // Integral arguments need owned storage; everything else is viewed.
        auto owned = std::make_tuple(detail::argText(args)...);
        std::array<std::string_view, sizeof...(Args)> argv = std::apply(
            [](const auto&... a) { return std::array<std::string_view, sizeof...(Args)>{std::string_view(a)...}; },
            owned);
        co_return co_await execute(argv);
    }

    Task<RedisReply> execute(std::span<const std::string_view> args) {
        co_await gate_.enter();

        RedisReply reply;
        std::exception_ptr failure;
        try {
            if (!conn_ || !conn_->open())
                co_await reconnect();
            reply = co_await conn_->roundTrip(args, endpoint_.command_timeout);
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            // The protocol state is unknown; never reuse this socket.
            conn_.reset();
            gate_.leave();
            std::rethrow_exception(failure);
        }
        gate_.leave();

        if (reply.isError())
            throw RedisServerError(std::string(reply.errorMessage()));
        co_return reply;
    }

    [[nodiscard]] const RedisEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    Task<void> reconnect() {
        conn_.reset();
        if (endpoint_.unix_path.empty())
            conn_ = co_await RedisConnection<Io>::connectTcp(
                *io_, endpoint_.host, endpoint_.port, endpoint_.connect_timeout);
        else
            conn_ = co_await RedisConnection<Io>::connectUnix(
                *io_, endpoint_.unix_path, endpoint_.connect_timeout);
    }

    Io* io_;
    RedisEndpoint endpoint_;
    detail::CommandGate<Io> gate_;
    std::unique_ptr<RedisConnection<Io>> conn_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_CLIENT_H
