#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace dconf {
namespace debug {

// Callback receiving one formatted line (no trailing newline).
using DebugCallback = void (*)(const char* message);

// When null, output goes to stderr.
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[dconf][T%s] %s", oss.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace debug
} // namespace dconf

#ifdef DCONF_ENABLE_DEBUG_OUTPUT
    #define DCONF_DEBUG_LOG(fmt, ...) ::dconf::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define DCONF_DEBUG_LOG(fmt, ...) ((void)0)
#endif
