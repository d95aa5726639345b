#pragma once

#include "config/Config.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace lmv::logging {

// One category per pipeline stage, wire to screen.
enum class LogCategory { NET, FEED, BUFFER, CANDLES, BOOK, RENDER, WATCHLIST, DB, UI };

class Log {
public:
    static void set_log_level(config::LogLevel level);
    static config::LogLevel get_log_level();
    static bool enabled(config::LogLevel level);

    static const char* level_to_string(config::LogLevel level);
    static const char* category_to_string(LogCategory category);

    static void log(config::LogLevel level, LogCategory category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    static void vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args);

    static std::atomic<config::LogLevel> currentLevel;
    static std::mutex outputMutex;
};

}  // namespace lmv::logging

#define LOG_ERROR(cat, ...) ::lmv::logging::Log::log(::lmv::config::LogLevel::Error, (cat), __VA_ARGS__)
#define LOG_WARN(cat, ...)  ::lmv::logging::Log::log(::lmv::config::LogLevel::Warn,  (cat), __VA_ARGS__)
#define LOG_INFO(cat, ...)  ::lmv::logging::Log::log(::lmv::config::LogLevel::Info,  (cat), __VA_ARGS__)
#define LOG_DEBUG(cat, ...) ::lmv::logging::Log::log(::lmv::config::LogLevel::Debug, (cat), __VA_ARGS__)
#define LOG_TRACE(cat, ...) ::lmv::logging::Log::log(::lmv::config::LogLevel::Trace, (cat), __VA_ARGS__)

// Logs at warn level and returns from the enclosing function when `expr` is false.
#define LOG_GUARD(expr, cat, ...)                                                                                      \
    do {                                                                                                                \
        if (!(expr)) {                                                                                                  \
            LOG_WARN((cat), __VA_ARGS__);                                                                               \
            return;                                                                                                     \
        }                                                                                                               \
    } while (false)

#define LOG_GUARD_RET(expr, cat, ret, ...)                                                                              \
    do {                                                                                                                \
        if (!(expr)) {                                                                                                  \
            LOG_WARN((cat), __VA_ARGS__);                                                                               \
            return (ret);                                                                                               \
        }                                                                                                               \
    } while (false)
