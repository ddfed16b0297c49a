#ifndef JCX_MYLIST_BACKEND_KV_BACKEND_H
#define JCX_MYLIST_BACKEND_KV_BACKEND_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jcailloux/mylist/io/Task.h"

namespace jcailloux::mylist {

// =============================================================================
// KvBackend - shared key-value service holding versions, pages and locks
//
// Every operation is atomic on the server. A ttl of zero means no expiry.
// Implementations report failure (unreachable, timeout, protocol error) as
// CacheUnavailable and nothing else.
// =============================================================================

class KvBackend {
public:
    using Ttl = std::chrono::milliseconds;

    virtual ~KvBackend() = default;

    /// Set only when the key is absent. true when this call wrote it.
    virtual io::Task<bool> setIfAbsent(std::string_view key, std::string_view value, Ttl ttl) = 0;

    virtual io::Task<std::optional<std::string>> get(std::string_view key) = 0;

    virtual io::Task<void> set(std::string_view key, std::string_view value, Ttl ttl) = 0;

    /// true when a key was removed.
    virtual io::Task<bool> del(std::string_view key) = 0;

    /// Atomic increment; returns the new value.
    virtual io::Task<int64_t> incr(std::string_view key) = 0;

    /// Atomic compare-and-delete: removes the key only while it holds `value`.
    virtual io::Task<bool> deleteIfEquals(std::string_view key, std::string_view value) = 0;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_BACKEND_KV_BACKEND_H
