#ifndef JCX_MYLIST_IO_REDIS_CONNECTION_H
#define JCX_MYLIST_IO_REDIS_CONNECTION_H

#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstring>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/redis/RedisError.h"
#include "jcailloux/mylist/io/redis/RedisReply.h"
#include "jcailloux/mylist/io/redis/RespParser.h"
#include "jcailloux/mylist/io/redis/RespWriter.h"

namespace jcailloux::mylist::io {

// RedisConnection - one non-blocking TCP or Unix socket speaking RESP2.
//
// Each round trip runs under a deadline: the command must be written and its
// reply read before it passes, otherwise the socket is closed (its protocol
// state is unknown at that point) and RedisTimeoutError is thrown. Owned
// through unique_ptr because pending awaiters point back at it.

template<IoContext Io>
class RedisConnection {
public:
    using Clock = std::chrono::steady_clock;

    ~RedisConnection() { close(); }

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    static Task<std::unique_ptr<RedisConnection>> connectTcp(
        Io& io, const std::string& host, int port, std::chrono::milliseconds timeout)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* found = nullptr;
        if (int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &found); rc != 0)
            throw RedisConnectionError("resolve " + host + ": " + ::gai_strerror(rc));
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addr(found, &::freeaddrinfo);

        int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          addr->ai_protocol);
        if (fd < 0) throw RedisConnectionError("socket: " + errnoText());

        auto conn = std::unique_ptr<RedisConnection>(new RedisConnection(io, fd));
        bool pending = ::connect(fd, addr->ai_addr, addr->ai_addrlen) < 0;
        if (pending && errno != EINPROGRESS)
            throw RedisConnectionError("connect " + host + ":" + std::to_string(port) + ": " + errnoText());
        if (pending) co_await conn->finishConnect(timeout);
        co_return std::move(conn);
    }

    static Task<std::unique_ptr<RedisConnection>> connectUnix(
        Io& io, const std::string& path, std::chrono::milliseconds timeout)
    {
        sockaddr_un addr{};
        if (path.size() >= sizeof(addr.sun_path))
            throw RedisConnectionError("unix socket path too long: " + path);
        addr.sun_family = AF_UNIX;
        std::memcpy(addr.sun_path, path.data(), path.size());

        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) throw RedisConnectionError("socket: " + errnoText());

        auto conn = std::unique_ptr<RedisConnection>(new RedisConnection(io, fd));
        bool pending = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0;
        if (pending && errno != EINPROGRESS && errno != EAGAIN)
            throw RedisConnectionError("connect " + path + ": " + errnoText());
        if (pending) co_await conn->finishConnect(timeout);
        co_return std::move(conn);
    }

    [[nodiscard]] bool open() const noexcept { return fd_ >= 0; }

    /// Send one command and read its reply, all within `timeout`.
    Task<RedisReply> roundTrip(std::span<const std::string_view> args, std::chrono::milliseconds timeout) {
        deadline_ = Clock::now() + timeout;
        writer_.append(args);
        co_await flush();
        co_return co_await readReply();
    }

    /// Drop the socket together with any half-written or half-read bytes.
    void close() noexcept {
        if (fd_ < 0) return;
        unwatch();
        ::close(fd_);
        fd_ = -1;
        writer_.clear();
        parser_.clear();
    }

private:
    RedisConnection(Io& io, int fd) noexcept : io_(&io), fd_(fd) {}

    static std::string errnoText() { return std::strerror(errno); }

    Task<void> finishConnect(std::chrono::milliseconds timeout) {
        deadline_ = Clock::now() + timeout;
        co_await ready(IoEvent::Write);

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            close();
            throw RedisConnectionError(std::string("connect: ") + std::strerror(err));
        }
    }

    Task<void> flush() {
        while (!writer_.empty()) {
            auto out = writer_.pending();
            ssize_t n = ::send(fd_, out.data(), out.size(), MSG_NOSIGNAL);
            if (n >= 0) {
                writer_.consume(static_cast<size_t>(n));
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                co_await ready(IoEvent::Write);
            } else if (errno != EINTR) {
                throw RedisConnectionError("send: " + errnoText());
            }
        }
    }

    Task<RedisReply> readReply() {
        while (true) {
            if (auto reply = parser_.next()) co_return std::move(*reply);

            co_await ready(IoEvent::Read);
            char chunk[8192];
            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n > 0) {
                parser_.feed(chunk, static_cast<size_t>(n));
            } else if (n == 0) {
                close();
                throw RedisConnectionError("connection closed by server");
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                throw RedisConnectionError("recv: " + errnoText());
            }
        }
    }

    // Resumes once: on readiness or when the deadline passes. Whichever fires
    // first cancels the other.
    struct Readiness {
        RedisConnection* conn;
        IoEvent events;
        std::coroutine_handle<> waiter{};
        typename Io::TimerToken timer{};
        bool expired = false;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> h) {
            waiter = h;
            auto left = std::chrono::ceil<std::chrono::milliseconds>(conn->deadline_ - Clock::now());
            if (left.count() < 0) left = std::chrono::milliseconds{0};

            conn->watch(events, [this](IoEvent) {
                conn->io_->cancelTimer(timer);
                conn->unwatch();
                waiter.resume();
            });
            timer = conn->io_->postDelayed(left, [this] {
                expired = true;
                conn->unwatch();
                waiter.resume();
            });
        }

        void await_resume() {
            if (!expired) return;
            conn->close();
            throw RedisTimeoutError("redis command timed out");
        }
    };

    Readiness ready(IoEvent events) {
        if (fd_ < 0) throw RedisConnectionError("redis connection is closed");
        return Readiness{this, events};
    }

    void watch(IoEvent events, std::function<void(IoEvent)> cb) {
        unwatch();
        watch_ = io_->addWatch(fd_, events, std::move(cb));
        watching_ = true;
    }

    void unwatch() noexcept {
        if (!watching_) return;
        io_->removeWatch(watch_);
        watching_ = false;
    }

    Io* io_;
    int fd_ = -1;
    typename Io::WatchHandle watch_{};
    bool watching_ = false;
    Clock::time_point deadline_{};
    RespWriter writer_;
    RespParser parser_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_CONNECTION_H
