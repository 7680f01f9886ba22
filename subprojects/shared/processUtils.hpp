#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

/// CPU and resident memory of the current process.
struct ProcessUsage {
    double cpu_percent{0.0};      // Share of total machine CPU time, 0.0 - 100.0
    std::size_t memory_bytes{0};  // Resident set size
};

/**
 * \brief Samples process CPU usage between successive calls.
 *
 * CPU percentage is computed over the interval since the previous sample, so
 * the first sample of a sampler always reports 0%. One sampler per reporter.
 */
class ProcessUsageSampler {
public:
    ProcessUsage sample();

private:
    std::mutex mutex_;
    unsigned long long last_total_ticks_{0};
    unsigned long long last_process_ticks_{0};
};

namespace ProcessUtils {

/// Resident memory only; no CPU sampling state is involved.
std::size_t resident_memory_bytes();

// Set current thread name (best-effort). Names longer than the platform
// limit are truncated.
void set_current_thread_name(const std::string& name);

} // namespace ProcessUtils
