#include "logging/Log.h"

#include <array>
#include <chrono>
#include <ctime>

namespace lmv::logging {

namespace {

constexpr std::size_t kMessageBufferSize = 1024;

constexpr std::array<const char*, 9> kCategoryNames{
    "NET", "FEED", "BUFFER", "CANDLES", "BOOK", "RENDER", "WATCHLIST", "DB", "UI",
};

// HH:MM:SS.mmm in UTC, matching the chart's time labels.
void formatWallClock(char (&out)[16]) {
    using namespace std::chrono;
    const auto sinceEpoch = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto seconds = static_cast<std::time_t>(sinceEpoch / 1000);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::snprintf(out, sizeof(out), "%02d:%02d:%02d.%03d", utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(sinceEpoch % 1000));
}

}  // namespace

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};
std::mutex Log::outputMutex;

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

bool Log::enabled(config::LogLevel level) {
    return config::logLevelSeverity(level) >= config::logLevelSeverity(get_log_level());
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    const auto index = static_cast<std::size_t>(category);
    return index < kCategoryNames.size() ? kCategoryNames[index] : "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (!enabled(level)) {
        return;
    }

    std::array<char, kMessageBufferSize> message{};
    const int written = std::vsnprintf(message.data(), message.size(), fmt, args);
    if (written < 0) {
        std::snprintf(message.data(), message.size(), "<format-error>");
    }
    else if (static_cast<std::size_t>(written) >= message.size()) {
        // Truncated: mark the cut.
        message[message.size() - 4] = '.';
        message[message.size() - 3] = '.';
        message[message.size() - 2] = '.';
    }

    char clock[16];
    formatWallClock(clock);

    std::lock_guard<std::mutex> lock(outputMutex);
    std::fprintf(stderr, "%s %-5s %-9s %s\n", clock, level_to_string(level), category_to_string(category),
                 message.data());
    std::fflush(stderr);
}

}  // namespace lmv::logging
