#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "core/RollingTickBuffer.h"
#include "domain/Types.h"

namespace lmv::core {

enum class AggregationStatus { Ok, InsufficientHistory };

/**
 * Buckets one symbol's ticks into OHLCV candles at a single granularity.
 *
 * Holds the in-progress candle plus at most `maxHistory` completed candles.
 * Completed candles are never modified after they leave the in-progress slot.
 * Not synchronized; the owner serializes access.
 */
class CandleAggregator {
public:
    CandleAggregator(domain::Granularity granularity, std::size_t maxHistory);

    void ingest(const domain::Tick& tick);

    // Replaces the most recently ingested tick (same timestamp). The candle is
    // restored to its state before that timestamp and the replacement applied.
    void revise(const domain::Tick& tick);

    // Re-derives all candles from retained ticks at a new granularity. When the
    // oldest retained ticks no longer cover a whole bucket, that bucket is
    // discarded; if it is the newest bucket the result is InsufficientHistory.
    AggregationStatus rebuild(const TickWindow& ticks, domain::Granularity granularity);

    // Installs externally fetched candles. Candles before `openPeriod` become
    // completed history; the candle at `openPeriod` is the feed's unfinished
    // period and only fills an empty in-progress slot. Invalid or misaligned
    // candles are skipped. Returns the number of candles installed.
    std::size_t seedHistory(const std::vector<domain::Candle>& candles, domain::TimestampMs openPeriod);

    void reset();

    const std::deque<domain::Candle>& history() const noexcept { return history_; }
    void historyInto(std::vector<domain::Candle>& out) const;
    std::optional<domain::Candle> current() const;

    AggregationStatus status() const noexcept {
        return truncated_ ? AggregationStatus::InsufficientHistory : AggregationStatus::Ok;
    }
    domain::Granularity granularity() const noexcept { return granularity_; }
    std::size_t maxHistory() const noexcept { return maxHistory_; }

    static bool isValidCandle(const domain::Candle& candle, domain::Granularity granularity);

private:
    void ingestLocked_(const domain::Tick& tick);
    void openCandle_(domain::TimestampMs periodStart, const domain::Tick& tick);
    void closeCurrent_();
    void appendHistory_(domain::Candle candle);
    static void applyTick_(domain::Candle& candle, const domain::Tick& tick);

    domain::Granularity granularity_;
    std::size_t maxHistory_;
    std::deque<domain::Candle> history_;
    std::optional<domain::Candle> current_;

    // Period whose candle could only be partially rebuilt.
    bool truncated_{false};
    domain::TimestampMs truncatedPeriod_{0};

    std::optional<domain::TimestampMs> lastTimestamp_;
    std::optional<domain::Candle> beforeLast_;
    bool lastOpenedCandle_{false};
};

}  // namespace lmv::core
