#ifndef JCX_MYLIST_IO_PG_CONNECTION_H
#define JCX_MYLIST_IO_PG_CONNECTION_H

#include <chrono>
#include <coroutine>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <libpq-fe.h>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/pg/PgError.h"
#include "jcailloux/mylist/io/pg/PgParams.h"
#include "jcailloux/mylist/io/pg/PgResult.h"

namespace jcailloux::mylist::io {

// PgConnection - one non-blocking libpq connection driven by the event loop.
//
// Parameterized statements are prepared on first use and looked up by SQL
// text afterwards. Every wait is bounded; on expiry the connection is marked
// broken (usable() turns false) and PgTimeoutError is thrown, and the pool
// discards it on release. Owned through unique_ptr because pending awaiters
// point back at it.

template<IoContext Io>
class PgConnection {
public:
    ~PgConnection() {
        unwatch();
        PQfinish(conn_);
    }

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    static Task<std::unique_ptr<PgConnection>> connect(
        Io& io, const std::string& conninfo, std::chrono::milliseconds timeout)
    {
        PGconn* raw = PQconnectStart(conninfo.c_str());
        if (!raw)
            throw PgConnectionError("PQconnectStart: out of memory");
        auto conn = std::unique_ptr<PgConnection>(new PgConnection(io, raw));
        if (PQstatus(raw) == CONNECTION_BAD)
            throw PgConnectionError(std::string("connect: ") + PQerrorMessage(raw));

        co_await Handshake{{conn.get(), timeout}};
        PQsetnonblocking(raw, 1);
        co_return std::move(conn);
    }

    [[nodiscard]] bool usable() const noexcept {
        return !broken_ && PQstatus(conn_) == CONNECTION_OK;
    }

    /// Unparameterized statement, sent through the extended protocol (one
    /// statement per call).
    Task<PgResult> query(const char* sql, std::chrono::milliseconds timeout) {
        requireUsable();
        if (!PQsendQueryParams(conn_, sql, 0, nullptr, nullptr, nullptr, nullptr, 0))
            throw markBroken("PQsendQueryParams");
        co_return co_await Reply{{this, timeout}};
    }

    Task<PgResult> queryParams(const char* sql, const PgParams& params,
                               std::chrono::milliseconds timeout) {
        requireUsable();
        std::string stmt = co_await statementFor(sql, params.count(), timeout);

        auto values = params.values();
        auto lengths = params.lengths();
        if (!PQsendQueryPrepared(conn_, stmt.c_str(), params.count(),
                                 values.data(), lengths.data(), nullptr, 0))
            throw markBroken("PQsendQueryPrepared");
        co_return co_await Reply{{this, timeout}};
    }

private:
    PgConnection(Io& io, PGconn* conn) noexcept : io_(&io), conn_(conn) {}

    void requireUsable() const {
        if (!usable())
            throw PgConnectionError("PostgreSQL connection is not usable");
    }

    PgConnectionError markBroken(const char* call) {
        broken_ = true;
        return PgConnectionError(std::string(call) + ": " + PQerrorMessage(conn_));
    }

    Task<std::string> statementFor(const char* sql, int nParams, std::chrono::milliseconds timeout);

    // Exactly one of the socket callback and the deadline timer resumes the
    // waiting coroutine; the other is cancelled.
    struct Bounded {
        PgConnection* conn;
        std::chrono::milliseconds timeout;
        std::coroutine_handle<> waiter{};
        typename Io::TimerToken timer{};
        bool expired = false;

        void startTimer() {
            timer = conn->io_->postDelayed(timeout, [this] {
                expired = true;
                conn->broken_ = true;
                conn->unwatch();
                waiter.resume();
            });
        }

        void finish() {
            conn->io_->cancelTimer(timer);
            conn->unwatch();
            waiter.resume();
        }
    };

    // Drives PQconnectPoll until the connection is up or has failed.
    struct Handshake : Bounded {
        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> h) {
            this->waiter = h;
            auto want = interest(PQconnectPoll(this->conn->conn_));
            if (want == IoEvent::None) {
                this->conn->io_->post([h] { h.resume(); });
                return;
            }
            this->conn->watch(want, [this](IoEvent) { step(); });
            this->startTimer();
        }

        void await_resume() const {
            if (this->expired)
                throw PgTimeoutError("PostgreSQL connect timed out");
            if (PQstatus(this->conn->conn_) != CONNECTION_OK)
                throw PgConnectionError(std::string("connect: ") + PQerrorMessage(this->conn->conn_));
        }

    private:
        static IoEvent interest(PostgresPollingStatusType status) noexcept {
            if (status == PGRES_POLLING_READING) return IoEvent::Read;
            if (status == PGRES_POLLING_WRITING) return IoEvent::Write;
            return IoEvent::None;
        }

        void step() {
            auto want = interest(PQconnectPoll(this->conn->conn_));
            if (want == IoEvent::None) this->finish();
            else this->conn->rewatch(want);
        }
    };

    // Flushes the request (non-blocking mode may leave bytes queued), then
    // reads until libpq holds the complete result of the statement.
    struct Reply : Bounded {
        PgResult result{};
        bool lost = false;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> h) {
            this->waiter = h;
            IoEvent want = flush() ? (IoEvent::Read | IoEvent::Write) : IoEvent::Read;
            this->conn->watch(want, [this](IoEvent ev) { onReady(ev); });
            this->startTimer();
        }

        PgResult await_resume() {
            if (this->expired)
                throw PgTimeoutError("PostgreSQL query timed out");
            if (lost)
                throw PgConnectionError(std::string("PostgreSQL connection lost: ")
                                        + PQerrorMessage(this->conn->conn_));
            if (!result.ok())
                throw PgQueryError(result.errorMessage(), result.sqlState());
            return std::move(result);
        }

    private:
        // true while output is still queued in libpq
        bool flush() {
            int rc = PQflush(this->conn->conn_);
            if (rc < 0) lost = true;
            return rc == 1;
        }

        void onReady(IoEvent ev) {
            PGconn* pg = this->conn->conn_;
            if (hasEvent(ev, IoEvent::Write)) {
                bool more = flush();
                if (lost) return fail();
                if (!more) this->conn->rewatch(IoEvent::Read);
            }
            if (!hasEvent(ev, IoEvent::Read) && !hasEvent(ev, IoEvent::Error)) return;
            if (!PQconsumeInput(pg)) return fail();
            if (PQisBusy(pg)) return;

            // Keep the last result; a single statement yields one plus the
            // terminating nullptr.
            PGresult* last = nullptr;
            while (PGresult* next = PQgetResult(pg)) {
                if (last) PQclear(last);
                last = next;
            }
            result = PgResult(last);
            this->finish();
        }

        void fail() {
            lost = true;
            this->conn->broken_ = true;
            this->finish();
        }
    };

    void watch(IoEvent events, std::function<void(IoEvent)> cb) {
        unwatch();
        watch_ = io_->addWatch(PQsocket(conn_), events, std::move(cb));
        watching_ = true;
    }

    void rewatch(IoEvent events) {
        if (watching_) io_->updateWatch(watch_, events);
    }

    void unwatch() noexcept {
        if (!watching_) return;
        io_->removeWatch(watch_);
        watching_ = false;
    }

    Io* io_;
    PGconn* conn_;
    typename Io::WatchHandle watch_{};
    bool watching_ = false;
    bool broken_ = false;
    std::unordered_map<std::string, std::string> statements_;
};

template<IoContext Io>
Task<std::string> PgConnection<Io>::statementFor(
    const char* sql, int nParams, std::chrono::milliseconds timeout)
{
    if (auto it = statements_.find(sql); it != statements_.end())
        co_return it->second;

    auto name = "mylist_" + std::to_string(statements_.size());
    if (!PQsendPrepare(conn_, name.c_str(), sql, nParams, nullptr))
        throw markBroken("PQsendPrepare");
    co_await Reply{{this, timeout}};
    co_return statements_.emplace(sql, std::move(name)).first->second;
}

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_PG_CONNECTION_H
