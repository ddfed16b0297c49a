#ifndef JCX_MYLIST_IO_REDIS_POOL_H
#define JCX_MYLIST_IO_REDIS_POOL_H

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/redis/RedisClient.h"

namespace jcailloux::mylist::io {

// RedisPool - the Redis connections of one loop, handed out round-robin.
//
// Each client serializes its own commands, so a pool of N lets N cache
// operations be in flight at once (a rebuild holding one client while
// readers poll on the others).

template<IoContext Io>
class RedisPool {
public:
    RedisPool() noexcept = default;
    RedisPool(RedisPool&&) noexcept = default;
    RedisPool& operator=(RedisPool&&) noexcept = default;

    static Task<RedisPool> create(Io& io, RedisEndpoint endpoint, size_t size) {
        if (size == 0)
            throw std::invalid_argument("RedisPool size must be positive");

        RedisPool pool;
        pool.clients_.reserve(size);
        while (pool.clients_.size() < size)
            pool.clients_.push_back(co_await RedisClient<Io>::connect(io, endpoint));
        co_return std::move(pool);
    }

    [[nodiscard]] RedisClient<Io>& next() noexcept {
        auto& client = *clients_[cursor_];
        cursor_ = (cursor_ + 1) % clients_.size();
        return client;
    }

    [[nodiscard]] size_t size() const noexcept { return clients_.size(); }

private:
    std::vector<std::unique_ptr<RedisClient<Io>>> clients_;
    size_t cursor_ = 0;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_POOL_H
