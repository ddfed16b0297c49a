#ifndef JCX_MYLIST_IO_TASK_H
#define JCX_MYLIST_IO_TASK_H

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace jcailloux::mylist::io {

template<typename T = void>
class Task;

namespace detail {

// Outcome<T> - the value or exception a Task settles with.
template<typename T>
class Outcome {
public:
    void setValue(T value) { state_.template emplace<1>(std::move(value)); }
    void setException(std::exception_ptr e) noexcept { state_.template emplace<2>(std::move(e)); }

    T take() {
        if (auto* e = std::get_if<2>(&state_))
            std::rethrow_exception(*e);
        return std::move(std::get<1>(state_));
    }

private:
    std::variant<std::monostate, T, std::exception_ptr> state_;
};

template<>
class Outcome<void> {
public:
    void setValue() noexcept {}
    void setException(std::exception_ptr e) noexcept { error_ = std::move(e); }

    void take() {
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::exception_ptr error_;
};

template<typename T>
struct PromiseCore {
    Outcome<T> outcome;
    std::coroutine_handle<> awaiter = std::noop_coroutine();

    // Hands control back to whoever awaited the task.
    struct Resume {
        bool await_ready() const noexcept { return false; }

        template<typename P>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<P> self) noexcept {
            return self.promise().awaiter;
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() const noexcept { return {}; }
    Resume final_suspend() const noexcept { return {}; }
    void unhandled_exception() noexcept { outcome.setException(std::current_exception()); }
};

template<typename T>
struct Promise : PromiseCore<T> {
    Task<T> get_return_object() noexcept;
    void return_value(T value) { this->outcome.setValue(std::move(value)); }
};

template<>
struct Promise<void> : PromiseCore<void> {
    Task<void> get_return_object() noexcept;
    void return_void() noexcept { outcome.setValue(); }
};

} // namespace detail

// =============================================================================
// Task<T> - lazy, move-only coroutine result
//
// Nothing runs until the Task is co_awaited. The body then runs on the
// awaiter's thread and transfers straight back to it on completion, so long
// await chains do not grow the stack. An exception escaping the body is
// rethrown at the co_await.
//
// fromValue() / ready() build a Task that is already settled and owns no
// coroutine frame.
// =============================================================================

template<typename T>
class Task {
public:
    using promise_type = detail::Promise<T>;

    Task() noexcept = default;
    explicit Task(std::coroutine_handle<promise_type> frame) noexcept : frame_(frame) {}

    template<typename U = T>
        requires (!std::is_void_v<U>)
    static Task fromValue(std::type_identity_t<U> value) {
        Task t;
        t.settled_.setValue(std::move(value));
        return t;
    }

    static Task ready() noexcept requires std::is_void_v<T> { return Task{}; }

    Task(Task&& other) noexcept
        : frame_(std::exchange(other.frame_, {}))
        , settled_(std::move(other.settled_)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            release();
            frame_ = std::exchange(other.frame_, {});
            settled_ = std::move(other.settled_);
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task() { release(); }

    bool await_ready() const noexcept { return !frame_; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        frame_.promise().awaiter = awaiter;
        return frame_;
    }

    T await_resume() {
        if (frame_) return frame_.promise().outcome.take();
        return settled_.take();
    }

private:
    void release() noexcept {
        if (frame_) frame_.destroy();
    }

    std::coroutine_handle<promise_type> frame_;
    detail::Outcome<T> settled_;
};

namespace detail {

template<typename T>
Task<T> Promise<T>::get_return_object() noexcept {
    return Task<T>{std::coroutine_handle<Promise>::from_promise(*this)};
}

inline Task<void> Promise<void>::get_return_object() noexcept {
    return Task<void>{std::coroutine_handle<Promise>::from_promise(*this)};
}

} // namespace detail

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_TASK_H
