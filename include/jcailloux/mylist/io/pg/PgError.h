#ifndef JCX_MYLIST_IO_PG_ERROR_H
#define JCX_MYLIST_IO_PG_ERROR_H

#include <stdexcept>
#include <string>

namespace jcailloux::mylist::io {

class PgError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The server rejected a statement. sqlState() holds the five-character code.
class PgQueryError : public PgError {
public:
    PgQueryError(const std::string& message, std::string sqlstate)
        : PgError(message), sqlstate_(std::move(sqlstate)) {}

    [[nodiscard]] const std::string& sqlState() const noexcept { return sqlstate_; }

private:
    std::string sqlstate_;
};

class PgConnectionError : public PgError {
public:
    using PgError::PgError;
};

/// A query or a pool acquire exceeded its deadline.
class PgTimeoutError : public PgConnectionError {
public:
    using PgConnectionError::PgConnectionError;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_PG_ERROR_H
