#ifndef JCX_MYLIST_IO_EPOLL_IO_CONTEXT_H
#define JCX_MYLIST_IO_EPOLL_IO_CONTEXT_H

#include <jcailloux/mylist/io/IoContext.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace jcailloux::mylist::io {

// EpollIoContext - single-threaded epoll loop driving the Redis and
// PostgreSQL sockets of one MyListApp.
//
// post(), postDelayed(), cancelTimer() and stop() are safe from any thread
// and wake the loop through an eventfd. Watches belong to the loop thread.
// Timers live in a deadline-ordered map; the epoll_wait timeout is the time
// left until the earliest one.

class EpollIoContext {
public:
    using WatchHandle = int;
    using TimerToken = uint64_t;
    using Clock = std::chrono::steady_clock;

    EpollIoContext() {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0)
            throw std::runtime_error("epoll_create1: " + errnoText());

        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            auto why = errnoText();
            ::close(epoll_fd_);
            throw std::runtime_error("eventfd: " + why);
        }

        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = wake_fd_;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
            auto why = errnoText();
            ::close(wake_fd_);
            ::close(epoll_fd_);
            throw std::runtime_error("epoll_ctl(wake fd): " + why);
        }
    }

    ~EpollIoContext() {
        ::close(wake_fd_);
        ::close(epoll_fd_);
    }

    EpollIoContext(const EpollIoContext&) = delete;
    EpollIoContext& operator=(const EpollIoContext&) = delete;

    // -------------------------------------------------------------------------
    // Watches (loop thread only)
    // -------------------------------------------------------------------------

    WatchHandle addWatch(int fd, IoEvent events, std::function<void(IoEvent)> cb) {
        epoll_event ev = makeEvent(fd, events);
        int op = watches_.contains(fd) ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
        if (::epoll_ctl(epoll_fd_, op, fd, &ev) < 0)
            throw std::runtime_error("epoll_ctl(watch " + std::to_string(fd) + "): " + errnoText());
        watches_[fd] = std::make_shared<std::function<void(IoEvent)>>(std::move(cb));
        return fd;
    }

    void removeWatch(WatchHandle fd) {
        if (watches_.erase(fd) > 0)
            ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    }

    void updateWatch(WatchHandle fd, IoEvent events) {
        if (!watches_.contains(fd)) return;
        epoll_event ev = makeEvent(fd, events);
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
    }

    // -------------------------------------------------------------------------
    // Posted work and timers (any thread)
    // -------------------------------------------------------------------------

    void post(std::function<void()> cb) {
        {
            std::lock_guard lock(mutex_);
            posted_.push_back(std::move(cb));
        }
        wake();
    }

    template<typename Rep, typename Period>
    TimerToken postDelayed(std::chrono::duration<Rep, Period> delay, std::function<void()> cb) {
        auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(delay);
        TimerToken token;
        {
            std::lock_guard lock(mutex_);
            token = next_token_++;
            auto it = timers_.emplace(deadline, Timer{token, std::move(cb)});
            by_token_.emplace(token, it);
        }
        wake();
        return token;
    }

    /// Unknown or already fired tokens are ignored.
    void cancelTimer(TimerToken token) {
        std::lock_guard lock(mutex_);
        auto it = by_token_.find(token);
        if (it == by_token_.end()) return;
        timers_.erase(it->second);
        by_token_.erase(it);
    }

    // -------------------------------------------------------------------------
    // Driving the loop
    // -------------------------------------------------------------------------

    void run() {
        stopped_.store(false, std::memory_order_relaxed);
        while (!stopped_.load(std::memory_order_relaxed))
            runOnce(kIdleWait);
    }

    template<typename Pred>
    void runUntil(Pred&& pred) {
        while (!pred())
            runOnce(kIdleWait);
    }

    void stop() {
        stopped_.store(true, std::memory_order_relaxed);
        wake();
    }

    /// One iteration: posted work, due timers, then at most `maxWait` in
    /// epoll_wait (shortened to the next timer deadline).
    void runOnce(std::chrono::milliseconds maxWait = std::chrono::milliseconds{0}) {
        runPosted();
        runDueTimers();

        epoll_event events[kMaxEvents];
        int n = ::epoll_wait(epoll_fd_, events, kMaxEvents, waitBudget(maxWait));

        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                uint64_t count;
                [[maybe_unused]] auto r = ::read(wake_fd_, &count, sizeof(count));
                continue;
            }
            auto it = watches_.find(fd);
            if (it == watches_.end()) continue;
            // Shared so the callback may remove its own watch mid-call.
            auto cb = it->second;
            (*cb)(toIoEvent(events[i].events));
        }

        runPosted();
        runDueTimers();
    }

private:
    static constexpr int kMaxEvents = 64;
    static constexpr std::chrono::milliseconds kIdleWait{100};

    struct Timer {
        TimerToken token;
        std::function<void()> callback;
    };

    using TimerMap = std::multimap<Clock::time_point, Timer>;

    static std::string errnoText() {
        return std::strerror(errno);
    }

    static epoll_event makeEvent(int fd, IoEvent events) noexcept {
        epoll_event ev{};
        if (hasEvent(events, IoEvent::Read))  ev.events |= EPOLLIN;
        if (hasEvent(events, IoEvent::Write)) ev.events |= EPOLLOUT;
        if (hasEvent(events, IoEvent::Error)) ev.events |= EPOLLERR;
        ev.data.fd = fd;
        return ev;
    }

    static IoEvent toIoEvent(uint32_t raw) noexcept {
        IoEvent e = IoEvent::None;
        if (raw & EPOLLIN)  e |= IoEvent::Read;
        if (raw & EPOLLOUT) e |= IoEvent::Write;
        if (raw & (EPOLLERR | EPOLLHUP)) e |= IoEvent::Error;
        return e;
    }

    void wake() noexcept {
        uint64_t one = 1;
        [[maybe_unused]] auto r = ::write(wake_fd_, &one, sizeof(one));
    }

    void runPosted() {
        std::vector<std::function<void()>> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(posted_);
        }
        for (auto& cb : batch) cb();
    }

    void runDueTimers() {
        std::vector<std::function<void()>> due;
        {
            std::lock_guard lock(mutex_);
            auto now = Clock::now();
            auto end = timers_.upper_bound(now);
            for (auto it = timers_.begin(); it != end; ++it) {
                by_token_.erase(it->second.token);
                due.push_back(std::move(it->second.callback));
            }
            timers_.erase(timers_.begin(), end);
        }
        for (auto& cb : due) cb();
    }

    // Milliseconds epoll_wait may block, rounded up so a timer is never
    // polled before its deadline.
    int waitBudget(std::chrono::milliseconds maxWait) const {
        std::lock_guard lock(mutex_);
        if (!posted_.empty()) return 0;
        auto budget = maxWait;
        if (!timers_.empty()) {
            auto left = std::chrono::ceil<std::chrono::milliseconds>(
                timers_.begin()->first - Clock::now());
            budget = std::min(budget, std::max(left, std::chrono::milliseconds{0}));
        }
        return static_cast<int>(budget.count());
    }

    int epoll_fd_ = -1;
    int wake_fd_ = -1;

    std::unordered_map<int, std::shared_ptr<std::function<void(IoEvent)>>> watches_;

    mutable std::mutex mutex_;
    std::vector<std::function<void()>> posted_;
    TimerMap timers_;
    std::unordered_map<TimerToken, TimerMap::iterator> by_token_;
    TimerToken next_token_ = 1;
    std::atomic<bool> stopped_{false};
};

static_assert(IoContext<EpollIoContext>);

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_EPOLL_IO_CONTEXT_H
