#ifndef RUNSTREAM_DEBUG_LOG_HPP
#define RUNSTREAM_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>

namespace runstream {
namespace debug {

/**
 * Receives one finished log line, without a trailing newline. Installed by
 * hosts that want translator traces in their own log instead of stdout.
 */
using DebugCallback = void (*)(const char* line);

inline std::atomic<DebugCallback> g_debug_sink{nullptr};

inline void set_debug_callback(DebugCallback sink) {
    g_debug_sink.store(sink, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_sink.store(nullptr, std::memory_order_release);
}

inline std::string thread_tag() {
    std::ostringstream tag;
    tag << std::this_thread::get_id();
    return tag.str();
}

// Lines longer than the buffer are truncated
inline void debug_output(const char* fmt, ...) {
    char body[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char line[1100];
    snprintf(line, sizeof(line), "[RUNSTREAM][T%s] %s", thread_tag().c_str(), body);

    if (DebugCallback sink = g_debug_sink.load(std::memory_order_acquire)) {
        sink(line);
        return;
    }
    printf("%s\n", line);
    fflush(stdout);
}

} // namespace debug
} // namespace runstream

// Session and patch traces; compiled out unless RUNSTREAM_ENABLE_DEBUG_OUTPUT is set
#ifdef RUNSTREAM_ENABLE_DEBUG_OUTPUT
    #define RUNSTREAM_DEBUG_LOG(fmt, ...) ::runstream::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define RUNSTREAM_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // RUNSTREAM_DEBUG_LOG_HPP
