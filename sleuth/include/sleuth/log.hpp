#pragma once
// Log: component-tagged diagnostics on stderr
//
// Notable events go straight to std::cerr as "[component] message".
// log_debug() adds a millisecond timestamp and only prints in verbose mode.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace sleuth {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << std::setfill(' ') << "][" << component << "] " << std::flush;

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

} // namespace sleuth
