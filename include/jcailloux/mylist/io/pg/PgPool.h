#ifndef JCX_MYLIST_IO_PG_POOL_H
#define JCX_MYLIST_IO_PG_POOL_H

#include <algorithm>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/pg/PgConnection.h"
#include "jcailloux/mylist/io/pg/PgError.h"
#include "jcailloux/mylist/io/pg/PgParams.h"
#include "jcailloux/mylist/io/pg/PgResult.h"

namespace jcailloux::mylist::io {

struct PgPoolOptions {
    size_t min_connections = 2;
    size_t max_connections = 16;
    std::chrono::milliseconds connect_timeout{2000};
    /// Bound for both the wait on an exhausted pool and each query.
    std::chrono::milliseconds query_timeout{2000};
};

// PgPool - bounded set of PgConnections shared by the coroutines of a loop.
//
// min_connections are opened by create(); more are opened on demand up to
// max_connections. When every slot is busy, acquire() queues until a
// connection is released or query_timeout passes. A connection that comes
// back broken is closed and its slot freed.

template<IoContext Io>
class PgPool : public std::enable_shared_from_this<PgPool<Io>> {
public:
    using Connection = PgConnection<Io>;

    // Lease - a borrowed connection, handed back when the lease goes away.
    class Lease {
    public:
        Lease(std::shared_ptr<PgPool> pool, std::unique_ptr<Connection> conn) noexcept
            : pool_(std::move(pool)), conn_(std::move(conn)) {}

        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() {
            if (pool_ && conn_) pool_->giveBack(std::move(conn_));
        }

        [[nodiscard]] Connection& operator*() const noexcept { return *conn_; }
        [[nodiscard]] Connection* operator->() const noexcept { return conn_.get(); }

    private:
        std::shared_ptr<PgPool> pool_;
        std::unique_ptr<Connection> conn_;
    };

    static Task<std::shared_ptr<PgPool>> create(Io& io, std::string conninfo, PgPoolOptions options) {
        if (options.max_connections == 0)
            throw PgError("PgPool max_connections must be positive");
        options.min_connections = std::min(options.min_connections, options.max_connections);

        auto pool = std::shared_ptr<PgPool>(new PgPool(io, std::move(conninfo), options));
        while (pool->open_ < options.min_connections) {
            pool->idle_.push_back(co_await Connection::connect(io, pool->conninfo_, options.connect_timeout));
            ++pool->open_;
        }
        co_return pool;
    }

    Task<Lease> acquire() {
        const auto deadline = std::chrono::steady_clock::now() + options_.query_timeout;

        while (true) {
            while (!idle_.empty()) {
                auto conn = std::move(idle_.back());
                idle_.pop_back();
                if (conn->usable())
                    co_return Lease(this->shared_from_this(), std::move(conn));
                --open_;
            }

            if (open_ < options_.max_connections)
                co_return Lease(this->shared_from_this(), co_await openOne());

            auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
                throw PgTimeoutError("timed out waiting for a PostgreSQL connection");

            if (auto handed = co_await Queue{this, left})
                co_return Lease(this->shared_from_this(), std::move(handed));
            // Woken because a broken connection freed its slot.
        }
    }

    [[nodiscard]] const PgPoolOptions& options() const noexcept { return options_; }
    [[nodiscard]] size_t openConnections() const noexcept { return open_; }
    [[nodiscard]] size_t idleConnections() const noexcept { return idle_.size(); }

private:
    PgPool(Io& io, std::string conninfo, PgPoolOptions options)
        : io_(&io), conninfo_(std::move(conninfo)), options_(options) {}

    // Reserves a slot for the connect so concurrent callers cannot overshoot
    // max_connections; the slot is returned if the connect fails.
    Task<std::unique_ptr<Connection>> openOne() {
        ++open_;
        std::exception_ptr failure;
        std::unique_ptr<Connection> conn;
        try {
            conn = co_await Connection::connect(*io_, conninfo_, options_.connect_timeout);
        } catch (...) {
            failure = std::current_exception();
        }
        if (failure) {
            --open_;
            std::rethrow_exception(failure);
        }
        co_return std::move(conn);
    }

    void giveBack(std::unique_ptr<Connection> conn) {
        if (!conn->usable()) {
            --open_;
            conn.reset();
        }
        if (!queue_.empty()) {
            Queue* next = queue_.front();
            queue_.pop_front();
            next->handOver(std::move(conn));
            return;
        }
        if (conn) idle_.push_back(std::move(conn));
    }

    // Parks a coroutine until giveBack() hands it a connection (or null when
    // only a slot was freed), or until its wait budget runs out.
    struct Queue {
        PgPool* pool;
        std::chrono::milliseconds budget;
        std::unique_ptr<Connection> conn{};
        std::coroutine_handle<> waiter{};
        typename Io::TimerToken timer{};
        bool expired = false;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> h) {
            waiter = h;
            pool->queue_.push_back(this);
            timer = pool->io_->postDelayed(budget, [this] {
                std::erase(pool->queue_, this);
                expired = true;
                waiter.resume();
            });
        }

        void handOver(std::unique_ptr<Connection> c) {
            conn = std::move(c);
            pool->io_->cancelTimer(timer);
            pool->io_->post([h = waiter] { h.resume(); });
        }

        std::unique_ptr<Connection> await_resume() {
            if (expired)
                throw PgTimeoutError("timed out waiting for a PostgreSQL connection");
            return std::move(conn);
        }
    };

    Io* io_;
    std::string conninfo_;
    PgPoolOptions options_;
    size_t open_ = 0;
    std::vector<std::unique_ptr<Connection>> idle_;
    std::deque<Queue*> queue_;
};

// PgClient - statement interface over a PgPool. Each call leases one
// connection for its duration and runs under the pool's query timeout.

template<IoContext Io>
class PgClient {
public:
    using Pool = PgPool<Io>;

    explicit PgClient(std::shared_ptr<Pool> pool) noexcept : pool_(std::move(pool)) {}

    Task<PgResult> query(const char* sql) {
        auto conn = co_await pool_->acquire();
        co_return co_await conn->query(sql, pool_->options().query_timeout);
    }

    Task<PgResult> queryParams(const char* sql, const PgParams& params) {
        auto conn = co_await pool_->acquire();
        co_return co_await conn->queryParams(sql, params, pool_->options().query_timeout);
    }

    /// queryArgs(sql, userId, limit) binds the arguments as $1, $2, ...
    template<typename... Args>
    Task<PgResult> queryArgs(const char* sql, Args&&... args) {
        auto params = PgParams::make(std::forward<Args>(args)...);
        co_return co_await queryParams(sql, params);
    }

    [[nodiscard]] Pool& pool() noexcept { return *pool_; }

private:
    std::shared_ptr<Pool> pool_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_PG_POOL_H
