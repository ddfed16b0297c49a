#ifndef JCX_MYLIST_ERROR_H
#define JCX_MYLIST_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jcailloux::mylist {

// =============================================================================
// Error taxonomy
//
// Client-fixable problems (bad cursor, bad content, bad input) are kept apart
// from transient backend problems (store or cache down) so callers can choose
// between abort and retry from the code alone.
//
// Transport errors (io::RedisError, io::PgError) never cross the backend
// boundary: RedisKvBackend and PgListStore translate them into
// CacheUnavailable and StoreUnavailable.
// =============================================================================

enum class ErrorCode : uint8_t {
    InvalidCursor,
    InvalidContent,
    Validation,
    StoreUnavailable,
    CacheUnavailable
};

[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidCursor:    return "INVALID_CURSOR";
        case ErrorCode::InvalidContent:   return "INVALID_CONTENT";
        case ErrorCode::Validation:       return "VALIDATION_ERROR";
        case ErrorCode::StoreUnavailable: return "STORE_UNAVAILABLE";
        case ErrorCode::CacheUnavailable: return "CACHE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

class MyListError : public std::runtime_error {
public:
    MyListError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// True for backend failures a caller may retry as-is.
    [[nodiscard]] bool retryable() const noexcept {
        return code_ == ErrorCode::StoreUnavailable
            || code_ == ErrorCode::CacheUnavailable;
    }

private:
    ErrorCode code_;
};

class InvalidCursor : public MyListError {
public:
    explicit InvalidCursor(const std::string& message)
        : MyListError(ErrorCode::InvalidCursor, message) {}
};

class InvalidContent : public MyListError {
public:
    explicit InvalidContent(const std::string& message)
        : MyListError(ErrorCode::InvalidContent, message) {}
};

class ValidationError : public MyListError {
public:
    explicit ValidationError(const std::string& message)
        : MyListError(ErrorCode::Validation, message) {}
};

class StoreUnavailable : public MyListError {
public:
    explicit StoreUnavailable(const std::string& message)
        : MyListError(ErrorCode::StoreUnavailable, message) {}
};

class CacheUnavailable : public MyListError {
public:
    explicit CacheUnavailable(const std::string& message)
        : MyListError(ErrorCode::CacheUnavailable, message) {}
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_ERROR_H
