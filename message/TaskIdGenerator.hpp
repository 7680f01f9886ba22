// TaskIdGenerator.hpp - Atomic counter issuing unique task ids
#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace TaskRelay {

/**
 * \ingroup message_module
 * \brief Atomic counter helper for issuing unique task ids ("<prefix>-<n>").
 */
class TaskIdGenerator {
public:
    explicit TaskIdGenerator(std::string prefix = "task") : prefix_(std::move(prefix)) {}

    TaskIdGenerator(const TaskIdGenerator&) = delete;
    TaskIdGenerator& operator=(const TaskIdGenerator&) = delete;

    uint64_t next_number() { return counter_.fetch_add(1, std::memory_order_relaxed); }

    std::string next_id() { return prefix_ + "-" + std::to_string(next_number()); }

private:
    std::string prefix_;
    std::atomic<uint64_t> counter_{1};
};

} // namespace TaskRelay
