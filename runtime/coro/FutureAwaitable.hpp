/**
 * \file FutureAwaitable.hpp
 * \brief Awaitable that suspends a coroutine until a `std::future` is ready.
 * \ingroup coro_module
 */
#pragma once

#include "runtime/coro/ExecutionLoop.hpp"
#include <atomic>
#include <chrono>
#include <coroutine>
#include <future>
#include <memory>
#include <stdexcept>

namespace runtime {

/** \brief Poll-based awaitable over a future.
 *  \details The coroutine is always resumed on an ExecutionLoop thread once
 *  `wait_for(0)` reports ready. `await_resume()` calls `get()`, so exceptions
 *  stored in the future (including `broken_promise`) propagate to the caller.
 *  Setting the optional `abandoned` flag resumes the coroutine without waiting
 *  for the future; `await_resume()` then throws std::runtime_error.
 */
template<typename T>
class FutureAwaitable {
public:
    FutureAwaitable(ExecutionLoop& loop, std::shared_ptr<std::future<T>> future,
                    std::shared_ptr<std::atomic<bool>> abandoned = nullptr)
        : loop_(loop), future_(std::move(future)), abandoned_(std::move(abandoned)) {
        if (!future_ || !future_->valid()) {
            throw std::invalid_argument("FutureAwaitable: future must be valid");
        }
    }

    /// Always suspends so the continuation runs on a loop thread, even for ready futures
    bool await_ready() const { return false; }

    void await_suspend(std::coroutine_handle<> h) {
        auto fut = future_;
        auto abandoned = abandoned_;
        loop_.register_pending([fut, abandoned]() {
            if (abandoned && abandoned->load(std::memory_order_acquire)) return true;
            return fut->wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }, h);
    }

    T await_resume() {
        if (abandoned_ && abandoned_->load(std::memory_order_acquire) &&
            future_->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            throw std::runtime_error("awaited future was abandoned");
        }
        return future_->get();
    }

private:
    ExecutionLoop& loop_;
    std::shared_ptr<std::future<T>> future_;
    std::shared_ptr<std::atomic<bool>> abandoned_;
};

} // namespace runtime
