#ifndef JCX_MYLIST_IO_CONTEXT_H
#define JCX_MYLIST_IO_CONTEXT_H

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace jcailloux::mylist::io {

/// Socket readiness flags, combinable with | and &.
enum class IoEvent : uint8_t {
    None  = 0,
    Read  = 0b001,
    Write = 0b010,
    Error = 0b100,
};

namespace detail {
constexpr auto bits(IoEvent e) noexcept { return static_cast<std::underlying_type_t<IoEvent>>(e); }
}

[[nodiscard]] constexpr IoEvent operator|(IoEvent lhs, IoEvent rhs) noexcept {
    return IoEvent(detail::bits(lhs) | detail::bits(rhs));
}

[[nodiscard]] constexpr IoEvent operator&(IoEvent lhs, IoEvent rhs) noexcept {
    return IoEvent(detail::bits(lhs) & detail::bits(rhs));
}

constexpr IoEvent& operator|=(IoEvent& lhs, IoEvent rhs) noexcept { return lhs = lhs | rhs; }

[[nodiscard]] constexpr bool hasEvent(IoEvent set, IoEvent flag) noexcept {
    return detail::bits(set & flag) != 0;
}

/// fd readiness callbacks plus deferred work on the loop thread.
template<typename L>
concept ReadinessLoop = requires(L& loop, int fd, IoEvent mask,
                                 std::function<void(IoEvent)> onReady,
                                 std::function<void()> work,
                                 typename L::WatchHandle watch) {
    { loop.addWatch(fd, mask, std::move(onReady)) } -> std::same_as<typename L::WatchHandle>;
    { loop.updateWatch(watch, mask) } -> std::same_as<void>;
    { loop.removeWatch(watch) } -> std::same_as<void>;
    { loop.post(std::move(work)) } -> std::same_as<void>;
};

/// One-shot timers that can be cancelled before they fire.
template<typename L>
concept TimerLoop = requires(L& loop, std::chrono::milliseconds after,
                             std::function<void()> work,
                             typename L::TimerToken token) {
    { loop.postDelayed(after, std::move(work)) } -> std::same_as<typename L::TimerToken>;
    { loop.cancelTimer(token) } -> std::same_as<void>;
};

// The event loop the library runs on. Timers bound every wait (Redis and
// PostgreSQL deadlines, lock polling backoff), so both halves are required.
template<typename L>
concept IoContext = ReadinessLoop<L> && TimerLoop<L>;

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_CONTEXT_H
