#ifndef KEYMORPH_DEBUG_LOG_HPP
#define KEYMORPH_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace keymorph {
namespace debug {

// Receives one formatted trace line (no trailing newline)
using DebugCallback = void (*)(const char* message);

// Host applications route traces into their own log here.
// When null, KEYMORPH_DEBUG_LOG falls back to printf.
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
    snprintf(full_message, sizeof(full_message), "[DEBUG][T%s] %s", oss.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace keymorph

#ifdef KEYMORPH_ENABLE_DEBUG_OUTPUT
    #define KEYMORPH_DEBUG_LOG(fmt, ...) ::keymorph::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define KEYMORPH_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // KEYMORPH_DEBUG_LOG_HPP
