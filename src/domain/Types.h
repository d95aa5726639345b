#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lmv::domain {

using TimestampMs = std::int64_t;

struct Granularity {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
    constexpr bool operator==(const Granularity& other) const noexcept { return ms == other.ms; }
    constexpr bool operator!=(const Granularity& other) const noexcept { return ms != other.ms; }
};

inline constexpr TimestampMs kMinuteMs = 60'000;
inline constexpr TimestampMs kHourMs = 3'600'000;
inline constexpr TimestampMs kDayMs = 86'400'000;
inline constexpr TimestampMs kWeekMs = 604'800'000;

// Floor alignment, also correct for timestamps before the epoch.
inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    if (step <= 0) {
        return t;
    }
    TimestampMs q = t / step;
    if (t % step != 0 && t < 0) {
        --q;
    }
    return q * step;
}

enum class TradeSide { Buy, Sell };

// Normalized price observation. Built once, never mutated downstream.
struct Tick {
    TimestampMs timestamp{0};
    double price{0.0};
    std::optional<double> bid{};
    std::optional<double> ask{};
    std::optional<double> volume{};
    TradeSide side{TradeSide::Buy};
};

// Quote as it comes off the wire, before sequencing assigns side and volume.
struct QuoteSample {
    TimestampMs timestamp{0};
    double price{0.0};
    std::optional<double> bid{};
    std::optional<double> ask{};
    std::optional<double> volume{};
    std::optional<double> volume24h{};
    std::optional<TradeSide> side{};
};

struct Candle {
    TimestampMs periodStart{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    bool complete{false};
};

struct WatchlistEntry {
    std::string id;
    std::string exchangeId;
    std::string symbol;
    std::optional<std::string> displayName{};
    TimestampMs addedAt{0};

    std::string label() const { return displayName ? *displayName : exchangeId + ":" + symbol; }
};

enum class ConnectionState { Connected, Reconnecting, Failed };

enum class EntryStatus { Idle, Subscribing, Active, Reconnecting, Failed, Removed };

inline const char* to_string(TradeSide side) {
    return side == TradeSide::Buy ? "buy" : "sell";
}

inline const char* to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Reconnecting:
        return "reconnecting";
    case ConnectionState::Failed:
        return "failed";
    }
    return "unknown";
}

inline const char* to_string(EntryStatus status) {
    switch (status) {
    case EntryStatus::Idle:
        return "idle";
    case EntryStatus::Subscribing:
        return "subscribing";
    case EntryStatus::Active:
        return "active";
    case EntryStatus::Reconnecting:
        return "reconnecting";
    case EntryStatus::Failed:
        return "failed";
    case EntryStatus::Removed:
        return "removed";
    }
    return "unknown";
}

inline std::string granularity_label(const Granularity& granularity) {
    if (!granularity.valid()) {
        return "";
    }

    const auto ms = granularity.ms;
    if (ms % kWeekMs == 0) {
        return std::to_string(ms / kWeekMs) + "w";
    }
    if (ms % kDayMs == 0) {
        return std::to_string(ms / kDayMs) + "d";
    }
    if (ms % kHourMs == 0) {
        return std::to_string(ms / kHourMs) + "h";
    }
    if (ms % kMinuteMs == 0) {
        return std::to_string(ms / kMinuteMs) + "m";
    }
    if (ms % 1'000 == 0) {
        return std::to_string(ms / 1'000) + "s";
    }
    return std::to_string(ms) + "ms";
}

// Parses labels such as "1m", "15m", "4h", "1d", "1w". Returns an invalid
// granularity for anything else.
inline Granularity granularity_from_label(std::string_view label) {
    Granularity granularity{};
    std::size_t idx = 0;
    while (idx < label.size() && std::isspace(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }

    long long value = 0;
    std::size_t digits = 0;
    while (idx < label.size() && std::isdigit(static_cast<unsigned char>(label[idx])) != 0) {
        if (digits >= 9) {
            return granularity;
        }
        value = value * 10 + (label[idx] - '0');
        ++digits;
        ++idx;
    }
    if (digits == 0 || value <= 0 || idx + 1 != label.size()) {
        return granularity;
    }

    switch (std::tolower(static_cast<unsigned char>(label[idx]))) {
    case 's':
        granularity.ms = value * 1'000;
        break;
    case 'm':
        granularity.ms = value * kMinuteMs;
        break;
    case 'h':
        granularity.ms = value * kHourMs;
        break;
    case 'd':
        granularity.ms = value * kDayMs;
        break;
    case 'w':
        granularity.ms = value * kWeekMs;
        break;
    default:
        break;
    }
    return granularity;
}

}  // namespace lmv::domain
