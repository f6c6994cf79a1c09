#ifndef REWRITE_SEARCH_DEBUG_LOG_HPP
#define REWRITE_SEARCH_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace rewrite_search {
namespace debug {

// Receives one formatted trace line, without trailing newline
using LogSink = void (*)(const char* line);

constexpr std::size_t MAX_LINE = 1024;
constexpr const char* LINE_PREFIX = "[rewrite_search] ";

// Where trace lines go; stdout when null
inline std::atomic<LogSink> g_log_sink{nullptr};

// Runtime switch on top of the compile-time REWRITE_SEARCH_ENABLE_DEBUG_OUTPUT
inline std::atomic<bool> g_log_enabled{true};

inline void set_log_sink(LogSink sink) {
    g_log_sink.store(sink, std::memory_order_release);
}

inline void clear_log_sink() {
    g_log_sink.store(nullptr, std::memory_order_release);
}

inline void set_log_enabled(bool enabled) {
    g_log_enabled.store(enabled, std::memory_order_release);
}

inline bool log_enabled() {
    return g_log_enabled.load(std::memory_order_acquire);
}

// printf-style formatting, then routed to the sink
inline void log_line(const char* fmt, ...) {
    if (!log_enabled()) {
        return;
    }

    char body[MAX_LINE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char line[MAX_LINE + 32];
    snprintf(line, sizeof(line), "%s%s", LINE_PREFIX, body);

    LogSink sink = g_log_sink.load(std::memory_order_acquire);
    if (sink) {
        sink(line);
    } else {
        printf("%s\n", line);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace rewrite_search

#ifdef REWRITE_SEARCH_ENABLE_DEBUG_OUTPUT
    #define REWRITE_SEARCH_DEBUG_LOG(fmt, ...) ::rewrite_search::debug::log_line(fmt, ##__VA_ARGS__)
#else
    #define REWRITE_SEARCH_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // REWRITE_SEARCH_DEBUG_LOG_HPP
