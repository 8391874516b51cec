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

inline std::atomic<LogLevel>& min_log_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* category, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (category != nullptr) {
        std::fprintf(stderr, "%s [%s]: ", level_name(lvl), category);
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

// Records below this level are discarded before formatting. Defaults to Info.
inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_log_level().store(lvl, std::memory_order_relaxed);
}

[[nodiscard]] inline LogLevel log_level() noexcept {
    return detail::min_log_level().load(std::memory_order_relaxed);
}

[[nodiscard]] inline bool log_enabled(LogLevel lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(log_level());
}

inline void log(LogLevel lvl, const char* category, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, category, fmt, args);
    va_end(args);
}

} // namespace util

#define TICKWHEEL_LOG(LVL, FMT, ...) ::util::log((LVL), "tickwheel", (FMT) __VA_OPT__(, __VA_ARGS__))

#define TICKWHEEL_LOG_TRACE(FMT, ...) TICKWHEEL_LOG(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define TICKWHEEL_LOG_DEBUG(FMT, ...) TICKWHEEL_LOG(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define TICKWHEEL_LOG_INFO(FMT, ...)  TICKWHEEL_LOG(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define TICKWHEEL_LOG_WARN(FMT, ...)  TICKWHEEL_LOG(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define TICKWHEEL_LOG_ERROR(FMT, ...) TICKWHEEL_LOG(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define TICKWHEEL_LOG_FATAL(FMT, ...) TICKWHEEL_LOG(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
