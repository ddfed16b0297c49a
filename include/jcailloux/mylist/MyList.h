#ifndef JCX_MYLIST_MY_LIST_H
#define JCX_MYLIST_MY_LIST_H

#include <chrono>
#include <memory>
#include <utility>

#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/PgListStore.h"
#include "jcailloux/mylist/backend/RedisKvBackend.h"
#include "jcailloux/mylist/config/MyListConfig.h"
#include "jcailloux/mylist/core/MyListService.h"
#include "jcailloux/mylist/http/MyListHandler.h"
#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Sleep.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/pg/PgPool.h"
#include "jcailloux/mylist/io/redis/RedisPool.h"

namespace jcailloux::mylist {

// =============================================================================
// MyListApp - one event loop's worth of connected components
//
// Startup:
//   io::EpollIoContext io;
//   auto app = co_await MyListApp<io::EpollIoContext>::connect(io, cfg);
//   auto response = co_await app->handler().handle(request);
//
// Members reference each other by address, so the app is created on the
// heap and never moves. It must outlive every request coroutine using it.
// =============================================================================

template<io::IoContext Io>
class MyListApp {
public:
    MyListApp(const MyListApp&) = delete;
    MyListApp& operator=(const MyListApp&) = delete;

    /// Open the Redis and PostgreSQL pools, then build the service on top.
    /// Connection failures propagate as io::RedisError / io::PgError.
    static io::Task<std::unique_ptr<MyListApp>> connect(Io& io, config::AppConfig cfg) {
        cfg.cache.validate();

        io::RedisEndpoint endpoint;
        endpoint.host = cfg.redis.host;
        endpoint.port = cfg.redis.port;
        endpoint.unix_path = cfg.redis.unix_path;
        endpoint.connect_timeout = cfg.redis.connect_timeout;
        endpoint.command_timeout = cfg.redis.command_timeout;
        auto redis = co_await io::RedisPool<Io>::create(io, endpoint, cfg.redis.pool_size);

        io::PgPoolOptions options;
        options.min_connections = cfg.postgres.min_connections;
        options.max_connections = cfg.postgres.max_connections;
        options.connect_timeout = cfg.postgres.connect_timeout;
        options.query_timeout = cfg.postgres.query_timeout;
        auto pg = co_await io::PgPool<Io>::create(io, cfg.postgres.conninfo, options);

        MYLIST_LOG_INFO << "MyListApp: connected redis x" << redis.size()
                        << ", postgres min " << options.min_connections
                        << " max " << options.max_connections;

        co_return std::unique_ptr<MyListApp>(
            new MyListApp(io, std::move(redis), std::move(pg), std::move(cfg.cache)));
    }

    [[nodiscard]] http::MyListHandler& handler() noexcept { return handler_; }
    [[nodiscard]] MyListService& service() noexcept { return service_; }
    [[nodiscard]] Io& io() noexcept { return *io_; }

private:
    MyListApp(Io& io, io::RedisPool<Io> redis, std::shared_ptr<io::PgPool<Io>> pg,
              config::MyListConfig cache)
        : io_(&io)
        , redis_(std::move(redis))
        , pg_(std::move(pg))
        , kv_(redis_)
        , store_(pg_)
        , service_(store_, kv_, std::move(cache),
                   [ioPtr = &io](std::chrono::milliseconds d) { return io::sleepFor(*ioPtr, d); })
        , handler_(service_)
    {}

    Io* io_;
    io::RedisPool<Io> redis_;
    io::PgClient<Io> pg_;
    RedisKvBackend<Io> kv_;
    PgListStore<Io> store_;
    MyListService service_;
    http::MyListHandler handler_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_MY_LIST_H
