#ifndef JCX_MYLIST_LOG_H
#define JCX_MYLIST_LOG_H

#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jcailloux::mylist::log {

// =============================================================================
// Log - callback-routed logging
//
// mylist never writes to stdout/stderr itself. The host installs one sink at
// startup; messages below the configured level are dropped before any
// formatting happens.
//
//   MYLIST_LOG_WARN  << "PageCache: corrupt entry " << key;
//   MYLIST_LOG_DEBUG << "MyListService: rebuilt " << sig << " v" << version;
//
//   log::setCallback([](log::Level lvl, const char* msg, size_t len) {
//       spdlog::log(toSpd(lvl), std::string_view(msg, len));
//   });
//   log::setMinLevel(log::Level::Info);
// =============================================================================

enum class Level : uint8_t { Debug, Info, Warn, Error };

using Callback = void(*)(Level level, const char* msg, size_t len);

namespace detail {

struct Sink {
    std::atomic<Callback> callback{nullptr};
    std::atomic<Level> min_level{Level::Debug};
};

inline Sink& sink() noexcept {
    static Sink s;
    return s;
}

}  // namespace detail

/// nullptr disables logging.
inline void setCallback(Callback cb) noexcept {
    detail::sink().callback.store(cb, std::memory_order_release);
}

inline Callback getCallback() noexcept {
    return detail::sink().callback.load(std::memory_order_acquire);
}

inline void setMinLevel(Level level) noexcept {
    detail::sink().min_level.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return getCallback() != nullptr &&
           level >= detail::sink().min_level.load(std::memory_order_relaxed);
}

[[nodiscard]] constexpr std::string_view levelName(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "unknown";
}

// LogStream - one message, handed to the sink when the statement ends.
class LogStream {
public:
    explicit LogStream(Level level) noexcept : level_(level) {}

    ~LogStream() {
        if (auto cb = getCallback()) cb(level_, text_.data(), text_.size());
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& operator<<(std::string_view s) {
        text_.append(s);
        return *this;
    }

    LogStream& operator<<(const char* s) {
        if (s) text_.append(s);
        return *this;
    }

    LogStream& operator<<(const std::string& s) { return *this << std::string_view(s); }

    LogStream& operator<<(char c) {
        text_.push_back(c);
        return *this;
    }

    LogStream& operator<<(bool b) { return *this << (b ? "true" : "false"); }

    template<typename T>
        requires (std::integral<T> || std::floating_point<T>) &&
                 (!std::same_as<T, char> && !std::same_as<T, bool>)
    LogStream& operator<<(T v) {
        text_.append(std::to_string(v));
        return *this;
    }

private:
    Level level_;
    std::string text_;
};

}  // namespace jcailloux::mylist::log

// Streamed operands are not evaluated when the level is filtered out.
#define MYLIST_LOG(level) \
    if (!::jcailloux::mylist::log::enabled(level)) {} \
    else ::jcailloux::mylist::log::LogStream(level)

#define MYLIST_LOG_ERROR MYLIST_LOG(::jcailloux::mylist::log::Level::Error)
#define MYLIST_LOG_WARN  MYLIST_LOG(::jcailloux::mylist::log::Level::Warn)
#define MYLIST_LOG_INFO  MYLIST_LOG(::jcailloux::mylist::log::Level::Info)
#define MYLIST_LOG_DEBUG MYLIST_LOG(::jcailloux::mylist::log::Level::Debug)

#endif  // JCX_MYLIST_LOG_H
