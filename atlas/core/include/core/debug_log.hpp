#ifndef ATLAS_DEBUG_LOG_HPP
#define ATLAS_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace atlas {
namespace debug {

enum class Level {
    Debug,   // Compiled out unless ATLAS_ENABLE_DEBUG_OUTPUT
    Warn     // Data problems the run survives (always on)
};

inline const char* level_tag(Level level) {
    return level == Level::Warn ? "WARN" : "DEBUG";
}

// Receives one formatted line (no trailing newline)
using LogSink = void (*)(Level level, const char* message);

// Process-wide sink; null routes Debug to stdout and Warn to stderr
inline std::atomic<LogSink> g_log_sink{nullptr};

inline void set_log_sink(LogSink sink) {
    g_log_sink.store(sink, std::memory_order_release);
}

inline void clear_log_sink() {
    g_log_sink.store(nullptr, std::memory_order_release);
}

inline void vlog(Level level, const char* fmt, va_list args) {
    char body[1024];
    vsnprintf(body, sizeof(body), fmt, args);

    std::ostringstream thread_id;
    thread_id << std::this_thread::get_id();

    char line[1120];
    snprintf(line, sizeof(line), "[ATLAS][%s][T%s] %s",
             level_tag(level), thread_id.str().c_str(), body);

    LogSink sink = g_log_sink.load(std::memory_order_acquire);
    if (sink) {
        sink(level, line);
        return;
    }
    FILE* out = level == Level::Warn ? stderr : stdout;
    fprintf(out, "%s\n", line);
    fflush(out);
}

inline void log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
}

} // namespace debug
} // namespace atlas

#ifdef ATLAS_ENABLE_DEBUG_OUTPUT
    #define ATLAS_LOG(fmt, ...) ::atlas::debug::log(::atlas::debug::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define ATLAS_LOG(fmt, ...) ((void)0)
#endif

#define ATLAS_WARN(fmt, ...) ::atlas::debug::log(::atlas::debug::Level::Warn, fmt, ##__VA_ARGS__)

#endif // ATLAS_DEBUG_LOG_HPP
