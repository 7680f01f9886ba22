#include "ExecutionLoop.hpp"
#include "processUtils.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace runtime {

ExecutionLoop::ExecutionLoop(std::shared_ptr<Logger> logger, std::chrono::milliseconds sweep_interval)
    : logger_(std::move(logger)),
      sweep_interval_(std::max(sweep_interval, std::chrono::milliseconds(1))) {}

ExecutionLoop::~ExecutionLoop() { stop(); }

void ExecutionLoop::start(size_t threads) {
    bool was_running = false;
    if (!running_.compare_exchange_strong(was_running, true)) {
        return;
    }
    threads = std::max<size_t>(threads, 1);
    if (threads > thread_slots_) {
        resumed_by_thread_ = std::make_unique<std::atomic<size_t>[]>(threads);
        thread_slots_ = threads;
    }
    for (size_t i = 0; i < thread_slots_; ++i) {
        resumed_by_thread_[i].store(0, std::memory_order_relaxed);
    }
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this, i] {
            ProcessUtils::set_current_thread_name("relay-loop-" + std::to_string(i));
            worker(i);
        });
    }
    if (logger_) logger_->info("Execution loop running on " + std::to_string(threads) + " thread(s)");
}

void ExecutionLoop::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    waiters_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    std::vector<Waiter> discarded;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        discarded.swap(waiters_);
    }
    if (logger_) {
        logger_->info("Execution loop stopped, " + std::to_string(discarded.size()) + " waiter(s) discarded");
    }
}

bool ExecutionLoop::is_running() const { return running_.load(); }

void ExecutionLoop::register_pending(std::function<bool()> is_ready, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        waiters_.push_back(Waiter{std::move(is_ready), handle});
    }
    waiters_cv_.notify_one();
}

void ExecutionLoop::worker(size_t index) {
    while (running_.load()) {
        try {
            sweep(index);
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("Execution loop sweep failed: ") + e.what());
        }
        std::unique_lock<std::mutex> lock(waiters_mutex_);
        waiters_cv_.wait_for(lock, sweep_interval_, [this] { return !running_.load(); });
    }
}

bool ExecutionLoop::check_ready(Waiter& waiter) {
    readiness_checks_.fetch_add(1, std::memory_order_relaxed);
    if (!waiter.is_ready) return true;
    try {
        return waiter.is_ready();
    } catch (const std::exception& e) {
        // await_resume rethrows it in the coroutine
        if (logger_) logger_->error(std::string("Readiness check threw: ") + e.what());
        return true;
    }
}

size_t ExecutionLoop::sweep(size_t index) {
    std::vector<Waiter> batch;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        batch.swap(waiters_);
    }
    if (batch.empty()) return 0;

    std::vector<Waiter> still_waiting;
    size_t resumed = 0;
    for (auto& waiter : batch) {
        if (!check_ready(waiter)) {
            still_waiting.push_back(std::move(waiter));
            continue;
        }
        if (waiter.handle && !waiter.handle.done()) {
            // Counted before resuming so observers of the coroutine see it
            resumed_total_.fetch_add(1, std::memory_order_release);
            resumed_by_thread_[index].fetch_add(1, std::memory_order_relaxed);
            waiter.handle.resume();
            ++resumed;
        }
    }

    if (!still_waiting.empty()) {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        waiters_.insert(waiters_.end(),
                        std::make_move_iterator(still_waiting.begin()),
                        std::make_move_iterator(still_waiting.end()));
    }
    return resumed;
}

size_t ExecutionLoop::pending_count() const {
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    return waiters_.size();
}

size_t ExecutionLoop::get_total_operations_processed() const {
    return resumed_total_.load(std::memory_order_acquire);
}

std::string ExecutionLoop::format_statistics() const {
    std::ostringstream out;
    out << "Execution loop: " << pending_count() << " parked, "
        << get_total_operations_processed() << " resumed, "
        << readiness_checks_.load(std::memory_order_relaxed) << " readiness checks\n";
    for (size_t i = 0; i < thread_slots_; ++i) {
        out << "  relay-loop-" << i << ": " << resumed_by_thread_[i].load(std::memory_order_relaxed) << " resumed\n";
    }
    return out.str();
}

} // namespace runtime
