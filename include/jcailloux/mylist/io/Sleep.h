#ifndef JCX_MYLIST_IO_SLEEP_H
#define JCX_MYLIST_IO_SLEEP_H

#include <chrono>
#include <coroutine>

#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"

namespace jcailloux::mylist::io {

// SleepAwaiter - suspend the current coroutine for a duration on the loop's
// timer queue. The loop keeps serving other coroutines in the meantime.

template<IoContext Io>
struct SleepAwaiter {
    Io& io;
    std::chrono::milliseconds delay;

    [[nodiscard]] bool await_ready() const noexcept { return delay.count() <= 0; }

    void await_suspend(std::coroutine_handle<> h) {
        io.postDelayed(delay, [h] { h.resume(); });
    }

    void await_resume() noexcept {}
};

template<IoContext Io>
Task<void> sleepFor(Io& io, std::chrono::milliseconds delay) {
    co_await SleepAwaiter<Io>{io, delay};
}

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_SLEEP_H
