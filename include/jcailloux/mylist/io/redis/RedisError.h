#ifndef JCX_MYLIST_IO_REDIS_ERROR_H
#define JCX_MYLIST_IO_REDIS_ERROR_H

#include <stdexcept>
#include <string>

namespace jcailloux::mylist::io {

// Every failure of the Redis client derives from RedisError, so callers that
// only need "the cache did not answer" catch that one type.

class RedisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The socket could not be opened, or it failed or closed mid-command.
class RedisConnectionError : public RedisError {
public:
    using RedisError::RedisError;
};

/// A command exceeded its deadline; the socket it ran on has been closed.
class RedisTimeoutError : public RedisConnectionError {
public:
    using RedisConnectionError::RedisConnectionError;
};

/// The server sent bytes that are not valid RESP2.
class RedisProtocolError : public RedisError {
public:
    using RedisError::RedisError;
};

/// The server answered with an error reply (-ERR ..., -WRONGTYPE ...).
/// The connection stays usable.
class RedisServerError : public RedisError {
public:
    using RedisError::RedisError;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_REDIS_ERROR_H
