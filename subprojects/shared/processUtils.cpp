#include "processUtils.hpp"

#if defined(__linux__)
#include <fstream>
#include <pthread.h>
#include <unistd.h>
#elif defined(__APPLE__)
#include <pthread.h>
#elif defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

#if defined(__linux__)
// Sum of all jiffies on the aggregate "cpu" line of /proc/stat
unsigned long long read_total_ticks() {
    std::ifstream in("/proc/stat");
    std::string label;
    in >> label;
    unsigned long long total = 0;
    unsigned long long value = 0;
    for (int field = 0; field < 8 && (in >> value); ++field) total += value;
    return total;
}

// utime + stime, fields 14 and 15 of /proc/self/stat
unsigned long long read_process_ticks() {
    std::ifstream in("/proc/self/stat");
    std::string skip;
    for (int field = 0; field < 13; ++field) in >> skip;
    unsigned long long utime = 0;
    unsigned long long stime = 0;
    in >> utime >> stime;
    return utime + stime;
}
#endif

} // namespace

ProcessUsage ProcessUsageSampler::sample() {
    ProcessUsage usage;
    usage.memory_bytes = ProcessUtils::resident_memory_bytes();
#if defined(__linux__)
    const unsigned long long total = read_total_ticks();
    const unsigned long long process = read_process_ticks();
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_total_ticks_ != 0 && total > last_total_ticks_) {
        usage.cpu_percent = static_cast<double>(process - last_process_ticks_) /
                            static_cast<double>(total - last_total_ticks_) * 100.0;
    }
    last_total_ticks_ = total;
    last_process_ticks_ = process;
#endif
    return usage;
}

namespace ProcessUtils {

std::size_t resident_memory_bytes() {
#if defined(__linux__)
    std::ifstream in("/proc/self/statm");
    unsigned long pages_total = 0;
    unsigned long pages_resident = 0;
    in >> pages_total >> pages_resident;
    return pages_resident * static_cast<std::size_t>(sysconf(_SC_PAGESIZE));
#else
    return 0;
#endif
}

void set_current_thread_name(const std::string& name) {
#if defined(__linux__)
    // 16 bytes including the terminator; longer names are rejected outright
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#elif defined(__APPLE__)
    pthread_setname_np(name.c_str());
#elif defined(_WIN32)
    std::wstring wide(name.begin(), name.end());
    ::SetThreadDescription(::GetCurrentThread(), wide.c_str());
#else
    (void)name;
#endif
}

} // namespace ProcessUtils
