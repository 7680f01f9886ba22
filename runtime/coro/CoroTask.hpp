/**
 * \file CoroTask.hpp
 * \brief Minimal C++20 coroutine task type driving agent executions.
 * \details `Task<void>` owns the coroutine handle and defines explicit suspend
 * semantics: initial_suspend = suspend_never so the body starts on the calling
 * thread, final_suspend always suspends so the frame stays alive (and
 * `done()` stays queryable) until the owning Task is destroyed.
 *
 * Exception policy: unhandled_exception() is a no-op. Coroutine bodies in this
 * project catch and record their own failures before reaching final suspend.
 */
#pragma once
#include <atomic>
#include <coroutine>
#include <utility>

namespace runtime {

/**
 * \defgroup coro_module Coroutine Runtime Module
 * \brief Execution loop and task types that observe agent completions by continuation.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Coroutine task wrapper and semantics.
 */

/** \addtogroup coro_task
 *  @{ */

template<typename T = void>
struct Task;

/** \brief Owning coroutine handle for fire-and-forget executions.
 *  \details The scheduler stores these per dispatch and destroys finished ones
 *  during its next tick.
 */
template<>
struct Task<void> {
    struct promise_type {
        /// Returns a Task<void> that owns the coroutine handle
        Task<void> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        /// Start executing immediately on creation
        std::suspend_never initial_suspend() { return {}; }
        /// Set once the frame is suspended at final suspend. Safe to read from
        /// another thread, unlike coroutine_handle::done() during a resume.
        std::atomic<bool> finished{false};

        struct FinalAwaiter {
            bool await_ready() noexcept { return false; }
            void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                h.promise().finished.store(true, std::memory_order_release);
            }
            void await_resume() noexcept {}
        };

        /// Suspend at final suspend; lifetime controlled by Task owner
        FinalAwaiter final_suspend() noexcept { return {}; }
        /// Project policy: coroutine bodies handle their own errors
        void unhandled_exception() {}

        void return_void() {}
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle) {}
    /// Destroys the coroutine frame if still present
    ~Task() { if (h) h.destroy(); }
    /// Move constructible; transfers handle ownership
    Task(Task&& other) noexcept : h(std::exchange(other.h, nullptr)) {}
    /// Move assignable; destroys current handle then takes ownership
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = std::exchange(other.h, nullptr);
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h || h.promise().finished.load(std::memory_order_acquire); }
    /// Access the underlying coroutine handle (do not destroy externally)
    std::coroutine_handle<promise_type> get_handle() const { return h; }
};

/** @} */

} // namespace runtime
