// Timestamp.hpp - Wall-clock helpers shared by records, events and contexts
#pragma once

#include <chrono>
#include <cstdint>

namespace TaskRelay {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

inline int64_t elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace TaskRelay
