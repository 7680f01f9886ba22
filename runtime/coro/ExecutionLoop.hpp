/**
 * \file ExecutionLoop.hpp
 * \brief Loop threads that resume agent executions once their result is ready.
 * \details An awaiting coroutine parks a waiter (readiness predicate plus
 * handle) on the loop. Loop threads sweep the parked waiters, resume the ready
 * ones and park the rest again. Agent futures cannot notify the loop, so the
 * sweep runs on a timer as well as on registration.
 */
#pragma once

#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace runtime {

/** \defgroup coro_loop Execution Loop
 *  \ingroup coro_module
 *  \brief Event loop for resuming coroutines whose awaited work became ready.
 */

/** \brief Polls parked waiters and resumes their coroutines on loop threads.
 *  \ingroup coro_loop
 *
 * Every dispatch made by the scheduler suspends here until the agent's
 * future is ready, so settlement always runs on a loop thread and never on
 * the assignment loop.
 */
class ExecutionLoop {
public:
	/**
	 * \param logger Optional logger for lifecycle and error messages.
	 * \param sweep_interval Longest wait between two sweeps of parked waiters.
	 */
	explicit ExecutionLoop(std::shared_ptr<Logger> logger = nullptr,
	                       std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(5));
	~ExecutionLoop();

	ExecutionLoop(const ExecutionLoop&) = delete;
	ExecutionLoop& operator=(const ExecutionLoop&) = delete;

	/** \brief Spawn `threads` loop threads (at least one). Ignored while running. */
	void start(size_t threads = 1);
	/** \brief Join the loop threads. Waiters still parked are discarded without resuming. */
	void stop();
	bool is_running() const;

	/** \brief Park `handle` until `is_ready` returns true (or throws).
	 *  \see runtime::FutureAwaitable
	 */
	void register_pending(std::function<bool()> is_ready, std::coroutine_handle<> handle);

	/** \brief Waiters currently parked. */
	size_t pending_count() const;
	/** \brief Coroutines resumed since construction. */
	size_t get_total_operations_processed() const;
	std::string format_statistics() const;

private:
	struct Waiter {
		std::function<bool()> is_ready;
		std::coroutine_handle<> handle;
	};

	void worker(size_t index);
	/** \brief One pass over the parked waiters; returns how many were resumed. */
	size_t sweep(size_t index);
	bool check_ready(Waiter& waiter);

	mutable std::mutex waiters_mutex_;
	std::condition_variable waiters_cv_;
	std::vector<Waiter> waiters_;

	std::atomic<bool> running_{false};
	std::vector<std::thread> threads_;
	std::shared_ptr<Logger> logger_;
	std::chrono::milliseconds sweep_interval_;

	std::atomic<size_t> resumed_total_{0};
	std::atomic<uint64_t> readiness_checks_{0};
	// Sized once in start(); indexed by loop thread
	std::unique_ptr<std::atomic<size_t>[]> resumed_by_thread_;
	size_t thread_slots_{0};
};

} // namespace runtime
