#ifndef JCX_MYLIST_BACKEND_REDIS_KV_BACKEND_H
#define JCX_MYLIST_BACKEND_REDIS_KV_BACKEND_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/KvBackend.h"
#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/redis/RedisError.h"
#include "jcailloux/mylist/io/redis/RedisPool.h"
#include "jcailloux/mylist/io/redis/RedisReply.h"

namespace jcailloux::mylist {

// =============================================================================
// RedisKvBackend - KvBackend over a RedisPool
//
//   setIfAbsent     SET key value NX [PX ttl]
//   get             GET key
//   set             SET key value [PX ttl]
//   del             DEL key
//   incr            INCR key
//   deleteIfEquals  EVAL (GET + DEL in one server-side script)
//
// Any io::RedisError (connect failure, timeout, -ERR reply, bad RESP) is
// logged and rethrown as CacheUnavailable.
// =============================================================================

template<io::IoContext Io>
class RedisKvBackend final : public KvBackend {
public:
    explicit RedisKvBackend(io::RedisPool<Io>& pool) noexcept : pool_(&pool) {}

    io::Task<bool> setIfAbsent(std::string_view key, std::string_view value, Ttl ttl) override {
        io::RedisReply r;
        if (ttl.count() > 0)
            r = co_await run("SET", pool_->next().exec("SET", key, value, "NX", "PX",
                                                       static_cast<int64_t>(ttl.count())));
        else
            r = co_await run("SET", pool_->next().exec("SET", key, value, "NX"));
        // NX miss replies nil; a write replies +OK.
        co_return !r.isNil();
    }

    io::Task<std::optional<std::string>> get(std::string_view key) override {
        auto r = co_await run("GET", pool_->next().exec("GET", key));
        co_return r.asOptionalString();
    }

    io::Task<void> set(std::string_view key, std::string_view value, Ttl ttl) override {
        if (ttl.count() > 0)
            co_await run("SET", pool_->next().exec("SET", key, value, "PX",
                                                  static_cast<int64_t>(ttl.count())));
        else
            co_await run("SET", pool_->next().exec("SET", key, value));
    }

    io::Task<bool> del(std::string_view key) override {
        auto r = co_await run("DEL", pool_->next().exec("DEL", key));
        co_return r.asInteger() > 0;
    }

    io::Task<int64_t> incr(std::string_view key) override {
        auto r = co_await run("INCR", pool_->next().exec("INCR", key));
        if (!r.isInteger())
            throw CacheUnavailable("INCR returned a non-integer reply");
        co_return r.asInteger();
    }

    io::Task<bool> deleteIfEquals(std::string_view key, std::string_view value) override {
        auto r = co_await run("EVAL", pool_->next().exec(
            "EVAL", kCompareAndDelete, "1", key, value));
        co_return r.asInteger() > 0;
    }

private:
    static constexpr const char* kCompareAndDelete =
        "if redis.call('GET', KEYS[1]) == ARGV[1] then "
        "return redis.call('DEL', KEYS[1]) "
        "else return 0 end";

    static io::Task<io::RedisReply> run(const char* command, io::Task<io::RedisReply> task) {
        try {
            co_return co_await task;
        } catch (const io::RedisError& e) {
            MYLIST_LOG_WARN << "RedisKvBackend " << command << " failed: " << e.what();
            throw CacheUnavailable(std::string("redis ") + command + ": " + e.what());
        }
    }

    io::RedisPool<Io>* pool_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_BACKEND_REDIS_KV_BACKEND_H
