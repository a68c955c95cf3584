#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<int>& min_log_level() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

// One line per message on stderr: "replaystitch WARN: ...". stdout stays
// reserved for command output.
inline void vlog(LogLevel lvl, const char* fmt, va_list args) {
    if (static_cast<int>(lvl) < min_log_level().load(std::memory_order_relaxed)) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "replaystitch %s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}
} // namespace detail

// Messages below this level are discarded. Process-wide; default Info.
inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_log_level().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return static_cast<LogLevel>(detail::min_log_level().load(std::memory_order_relaxed));
}

// Restores the previous minimum level on scope exit.
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel lvl) noexcept : saved_(log_level()) { set_log_level(lvl); }
    ~ScopedLogLevel() { set_log_level(saved_); }
    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel saved_;
};

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
