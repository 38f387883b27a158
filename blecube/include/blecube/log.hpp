#pragma once
// Logging: component-tagged lines on stderr
//
//   [12:04:31.207][BleCube] reserved 100000 records
//
// Debug lines only appear once verbose mode is switched on.
// Warnings are always written.

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace blecube {

namespace detail {

inline bool& verbose_mode() {
    static bool verbose = false;
    return verbose;
}

inline void log_line(const char* component, const char* fmt, va_list args) {
    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] " << std::flush;
    vfprintf(stderr, fmt, args);
    std::cerr << "\n";
}

} // namespace detail

inline void set_verbose(bool on) { detail::verbose_mode() = on; }
inline bool verbose() { return detail::verbose_mode(); }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    va_list args;
    va_start(args, fmt);
    detail::log_line(component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_line(component, fmt, args);
    va_end(args);
}

} // namespace blecube
