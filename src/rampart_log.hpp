// =============================================================================
// Rampart - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: RLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <atomic>
#include <functional>
#include <thread>

namespace rampart::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "trace".."fatal" (case-sensitive); unknown names map to Info
inline Level levelFromString(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one log per process run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long currentThreadTag() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

// "HH:MM:SS.mmm" in local time
inline void formatTimestamp(char* out, size_t size) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const int millis = static_cast<int>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm local;
    localtime_r(&secs, &local);
    snprintf(out, size, "%02d:%02d:%02d.%03d",
             local.tm_hour, local.tm_min, local.tm_sec, millis);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;

    char stamp[16];
    formatTimestamp(stamp, sizeof(stamp));

    char body[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char line[2200];
    snprintf(line, sizeof(line), "%s [%s] [%s] (T%lu) %s\n",
             stamp, levelStr(level), tag, currentThreadTag(), body);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fputs(line, stderr);
    if (g_log_file) {
        fputs(line, g_log_file);
        fflush(g_log_file);
    }
}

} // namespace rampart::log

#define RLOG_TRACE(tag, fmt, ...) rampart::log::write(rampart::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define RLOG_DEBUG(tag, fmt, ...) rampart::log::write(rampart::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define RLOG_INFO(tag, fmt, ...)  rampart::log::write(rampart::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define RLOG_WARN(tag, fmt, ...)  rampart::log::write(rampart::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define RLOG_ERROR(tag, fmt, ...) rampart::log::write(rampart::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define RLOG_FATAL(tag, fmt, ...) rampart::log::write(rampart::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
