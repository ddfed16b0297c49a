#ifndef JCX_MYLIST_CONFIG_H
#define JCX_MYLIST_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <glaze/glaze.hpp>

#include "jcailloux/mylist/Error.h"

namespace jcailloux::mylist::config {
    using namespace std::chrono_literals;

    // =========================================================================
    // MyListConfig - cache coherence and pagination tuning
    // =========================================================================
    //
    // Usage:
    //   MyListConfig cfg;                                        // defaults
    //   auto cfg = MyListConfig{}.with_page_ttl(10min)
    //                            .with_fast_path_limits({20, 50});
    //

    struct MyListConfig {
        // Page cache
        std::chrono::milliseconds page_ttl = 300s;

        // Rebuild lock and busy polling (exponential backoff, capped)
        std::chrono::milliseconds lock_ttl = 5s;
        std::chrono::milliseconds lock_poll_initial = 25ms;
        std::chrono::milliseconds lock_poll_max = 200ms;
        std::chrono::milliseconds lock_max_wait = 2s;

        // Pagination
        int default_limit = 20;
        int max_limit = 100;

        int64_t initial_version = 1;
        std::vector<std::string> supported_content_types{"movie", "tvshow"};

        /// First-page limits patched in place on add. Empty = {default_limit}.
        std::vector<int> fast_path_limits;

        MyListConfig with_page_ttl(std::chrono::milliseconds v) const { auto c = *this; c.page_ttl = v; return c; }
        MyListConfig with_lock_ttl(std::chrono::milliseconds v) const { auto c = *this; c.lock_ttl = v; return c; }
        MyListConfig with_lock_poll(std::chrono::milliseconds initial, std::chrono::milliseconds max) const {
            auto c = *this; c.lock_poll_initial = initial; c.lock_poll_max = max; return c;
        }
        MyListConfig with_lock_max_wait(std::chrono::milliseconds v) const { auto c = *this; c.lock_max_wait = v; return c; }
        MyListConfig with_limits(int def, int max) const { auto c = *this; c.default_limit = def; c.max_limit = max; return c; }
        MyListConfig with_initial_version(int64_t v) const { auto c = *this; c.initial_version = v; return c; }
        MyListConfig with_content_types(std::vector<std::string> v) const { auto c = *this; c.supported_content_types = std::move(v); return c; }
        MyListConfig with_fast_path_limits(std::vector<int> v) const { auto c = *this; c.fast_path_limits = std::move(v); return c; }

        [[nodiscard]] std::vector<int> effectiveFastPathLimits() const {
            if (fast_path_limits.empty()) return {default_limit};
            return fast_path_limits;
        }

        [[nodiscard]] bool supportsContentType(std::string_view type) const noexcept {
            for (const auto& t : supported_content_types)
                if (t == type) return true;
            return false;
        }

        /// Throws ValidationError on the first inconsistent value.
        void validate() const {
            if (page_ttl.count() <= 0) throw ValidationError("page_ttl must be positive");
            if (lock_ttl.count() <= 0) throw ValidationError("lock_ttl must be positive");
            if (lock_poll_initial.count() <= 0 || lock_poll_max < lock_poll_initial)
                throw ValidationError("lock poll interval must satisfy 0 < initial <= max");
            if (lock_max_wait.count() < 0) throw ValidationError("lock_max_wait must not be negative");
            if (max_limit < 1) throw ValidationError("max_limit must be at least 1");
            if (default_limit < 1 || default_limit > max_limit)
                throw ValidationError("default_limit must be within [1, max_limit]");
            if (supported_content_types.empty())
                throw ValidationError("supported_content_types must not be empty");
            for (int l : fast_path_limits)
                if (l < 1 || l > max_limit)
                    throw ValidationError("fast_path_limits entries must be within [1, max_limit]");
        }
    };

    // =========================================================================
    // Presets
    // =========================================================================

    /// Long-lived pages, first page patched for the common client limits.
    inline MyListConfig ReadHeavy() {
        return MyListConfig{}.with_page_ttl(15min).with_fast_path_limits({20, 50});
    }

    /// Short-lived pages and a tight wait budget for write-heavy lists.
    inline MyListConfig WriteHeavy() {
        return MyListConfig{}.with_page_ttl(60s).with_lock_max_wait(500ms);
    }

    // =========================================================================
    // Backend connection settings
    // =========================================================================

    struct RedisSettings {
        std::string host = "127.0.0.1";
        int port = 6379;
        std::string unix_path;          // non-empty = connect over a Unix socket
        size_t pool_size = 4;
        std::chrono::milliseconds connect_timeout = 500ms;
        std::chrono::milliseconds command_timeout = 500ms;
    };

    struct PgSettings {
        std::string conninfo = "host=localhost dbname=mylist";
        size_t min_connections = 2;
        size_t max_connections = 16;
        std::chrono::milliseconds connect_timeout = 2s;
        std::chrono::milliseconds query_timeout = 2s;
    };

    struct AppConfig {
        MyListConfig cache;
        RedisSettings redis;
        PgSettings postgres;
    };

    namespace detail {

    // Wire shape of the JSON document: durations are integer milliseconds.
    // Keys absent from the document keep the defaults of the structs above.

    struct CacheDoc {
        int64_t page_ttl_ms;
        int64_t lock_ttl_ms;
        int64_t lock_poll_initial_ms;
        int64_t lock_poll_max_ms;
        int64_t lock_max_wait_ms;
        int default_limit;
        int max_limit;
        int64_t initial_version;
        std::vector<std::string> supported_content_types;
        std::vector<int> fast_path_limits;
    };

    struct RedisDoc {
        std::string host;
        int port;
        std::string unix_path;
        int64_t pool_size;
        int64_t connect_timeout_ms;
        int64_t command_timeout_ms;
    };

    struct PgDoc {
        std::string conninfo;
        int64_t min_connections;
        int64_t max_connections;
        int64_t connect_timeout_ms;
        int64_t query_timeout_ms;
    };

    struct AppDoc {
        CacheDoc cache;
        RedisDoc redis;
        PgDoc postgres;
    };

    inline AppDoc toDoc(const AppConfig& c) {
        AppDoc d;
        d.cache = {
            c.cache.page_ttl.count(), c.cache.lock_ttl.count(),
            c.cache.lock_poll_initial.count(), c.cache.lock_poll_max.count(),
            c.cache.lock_max_wait.count(), c.cache.default_limit, c.cache.max_limit,
            c.cache.initial_version, c.cache.supported_content_types, c.cache.fast_path_limits,
        };
        d.redis = {
            c.redis.host, c.redis.port, c.redis.unix_path,
            static_cast<int64_t>(c.redis.pool_size),
            c.redis.connect_timeout.count(), c.redis.command_timeout.count(),
        };
        d.postgres = {
            c.postgres.conninfo,
            static_cast<int64_t>(c.postgres.min_connections),
            static_cast<int64_t>(c.postgres.max_connections),
            c.postgres.connect_timeout.count(), c.postgres.query_timeout.count(),
        };
        return d;
    }

    inline AppConfig fromDoc(const AppDoc& d) {
        using std::chrono::milliseconds;
        if (d.redis.pool_size < 1) throw ValidationError("redis.pool_size must be at least 1");
        if (d.postgres.max_connections < 1) throw ValidationError("postgres.max_connections must be at least 1");
        if (d.postgres.min_connections < 0 || d.postgres.min_connections > d.postgres.max_connections)
            throw ValidationError("postgres.min_connections must be within [0, max_connections]");
        if (d.redis.port < 0 || d.redis.port > 65535) throw ValidationError("redis.port out of range");
        for (int64_t ms : {d.redis.connect_timeout_ms, d.redis.command_timeout_ms,
                           d.postgres.connect_timeout_ms, d.postgres.query_timeout_ms})
            if (ms <= 0) throw ValidationError("backend timeouts must be positive");

        AppConfig c;
        c.cache.page_ttl = milliseconds{d.cache.page_ttl_ms};
        c.cache.lock_ttl = milliseconds{d.cache.lock_ttl_ms};
        c.cache.lock_poll_initial = milliseconds{d.cache.lock_poll_initial_ms};
        c.cache.lock_poll_max = milliseconds{d.cache.lock_poll_max_ms};
        c.cache.lock_max_wait = milliseconds{d.cache.lock_max_wait_ms};
        c.cache.default_limit = d.cache.default_limit;
        c.cache.max_limit = d.cache.max_limit;
        c.cache.initial_version = d.cache.initial_version;
        c.cache.supported_content_types = d.cache.supported_content_types;
        c.cache.fast_path_limits = d.cache.fast_path_limits;

        c.redis.host = d.redis.host;
        c.redis.port = d.redis.port;
        c.redis.unix_path = d.redis.unix_path;
        c.redis.pool_size = static_cast<size_t>(d.redis.pool_size);
        c.redis.connect_timeout = milliseconds{d.redis.connect_timeout_ms};
        c.redis.command_timeout = milliseconds{d.redis.command_timeout_ms};

        c.postgres.conninfo = d.postgres.conninfo;
        c.postgres.min_connections = static_cast<size_t>(d.postgres.min_connections);
        c.postgres.max_connections = static_cast<size_t>(d.postgres.max_connections);
        c.postgres.connect_timeout = milliseconds{d.postgres.connect_timeout_ms};
        c.postgres.query_timeout = milliseconds{d.postgres.query_timeout_ms};

        c.cache.validate();
        return c;
    }

    }  // namespace detail
}  // namespace jcailloux::mylist::config

// =============================================================================
// Glaze metadata for the configuration document
// =============================================================================

template<>
struct glz::meta<jcailloux::mylist::config::detail::CacheDoc> {
    using T = jcailloux::mylist::config::detail::CacheDoc;
    static constexpr auto value = glz::object(
        "page_ttl_ms", &T::page_ttl_ms,
        "lock_ttl_ms", &T::lock_ttl_ms,
        "lock_poll_initial_ms", &T::lock_poll_initial_ms,
        "lock_poll_max_ms", &T::lock_poll_max_ms,
        "lock_max_wait_ms", &T::lock_max_wait_ms,
        "default_limit", &T::default_limit,
        "max_limit", &T::max_limit,
        "initial_version", &T::initial_version,
        "supported_content_types", &T::supported_content_types,
        "fast_path_limits", &T::fast_path_limits
    );
};

template<>
struct glz::meta<jcailloux::mylist::config::detail::RedisDoc> {
    using T = jcailloux::mylist::config::detail::RedisDoc;
    static constexpr auto value = glz::object(
        "host", &T::host,
        "port", &T::port,
        "unix_path", &T::unix_path,
        "pool_size", &T::pool_size,
        "connect_timeout_ms", &T::connect_timeout_ms,
        "command_timeout_ms", &T::command_timeout_ms
    );
};

template<>
struct glz::meta<jcailloux::mylist::config::detail::PgDoc> {
    using T = jcailloux::mylist::config::detail::PgDoc;
    static constexpr auto value = glz::object(
        "conninfo", &T::conninfo,
        "min_connections", &T::min_connections,
        "max_connections", &T::max_connections,
        "connect_timeout_ms", &T::connect_timeout_ms,
        "query_timeout_ms", &T::query_timeout_ms
    );
};

template<>
struct glz::meta<jcailloux::mylist::config::detail::AppDoc> {
    using T = jcailloux::mylist::config::detail::AppDoc;
    static constexpr auto value = glz::object(
        "cache", &T::cache,
        "redis", &T::redis,
        "postgres", &T::postgres
    );
};

namespace jcailloux::mylist::config {

    /// Parse a JSON configuration document. Unknown keys, malformed JSON and
    /// inconsistent values throw ValidationError.
    ///
    ///   {"cache": {"page_ttl_ms": 60000, "fast_path_limits": [20, 50]},
    ///    "redis": {"host": "cache", "command_timeout_ms": 300},
    ///    "postgres": {"conninfo": "host=db dbname=mylist"}}
    inline AppConfig fromJson(std::string_view json) {
        auto doc = detail::toDoc(AppConfig{});
        if (auto ec = glz::read_json(doc, json))
            throw ValidationError("invalid configuration: " + glz::format_error(ec, json));
        return detail::fromDoc(doc);
    }

    /// Serialize a configuration to the document fromJson() reads.
    inline std::string toJson(const AppConfig& config) {
        std::string out;
        if (glz::write_json(detail::toDoc(config), out))
            throw ValidationError("configuration could not be serialized");
        return out;
    }

}  // namespace jcailloux::mylist::config

#endif  // JCX_MYLIST_CONFIG_H
