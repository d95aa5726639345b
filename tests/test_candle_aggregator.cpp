#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/CandleAggregator.h"
#include "core/RollingTickBuffer.h"

using lmv::core::AggregationStatus;
using lmv::core::CandleAggregator;
using lmv::core::RollingTickBuffer;
using lmv::domain::Candle;
using lmv::domain::Granularity;
using lmv::domain::Tick;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

constexpr Granularity kOneMinute{60'000};
constexpr Granularity kFiveMinutes{300'000};

Tick tickAt(long long ts, double price, std::optional<double> volume = std::nullopt) {
    Tick tick;
    tick.timestamp = ts;
    tick.price = price;
    tick.volume = volume;
    return tick;
}

Candle candleAt(long long start, double o, double h, double l, double c, double v) {
    Candle candle;
    candle.periodStart = start;
    candle.open = o;
    candle.high = h;
    candle.low = l;
    candle.close = c;
    candle.volume = v;
    candle.complete = true;
    return candle;
}

bool ohlcConsistent(const Candle& c) {
    return c.low <= c.open && c.low <= c.close && c.open <= c.high && c.close <= c.high && c.volume >= 0.0;
}

void crossingScenario() {
    CandleAggregator aggregator(kOneMinute, 100);
    aggregator.ingest(tickAt(0, 100.0));
    aggregator.ingest(tickAt(30'000, 101.0));
    aggregator.ingest(tickAt(61'000, 99.0));

    const auto& history = aggregator.history();
    expect(history.size() == 1, "one completed candle after crossing");
    if (!history.empty()) {
        const auto& first = history.front();
        expect(first.periodStart == 0, "first candle covers [0,60000)");
        expect(first.open == 100.0 && first.high == 101.0 && first.low == 100.0 && first.close == 101.0,
               "first candle OHLC is 100/101/100/101");
        expect(first.complete, "first candle complete");
    }
    const auto current = aggregator.current();
    expect(current.has_value(), "in-progress candle exists");
    if (current) {
        expect(current->periodStart == 60'000, "in-progress candle covers [60000,120000)");
        expect(current->open == 99.0 && current->high == 99.0 && current->low == 99.0 && current->close == 99.0,
               "in-progress candle seeded from the crossing tick");
        expect(!current->complete, "in-progress candle not complete");
    }
}

void volumeConservation() {
    CandleAggregator aggregator(kOneMinute, 1000);
    double total = 0.0;
    double price = 100.0;
    for (int i = 0; i < 500; ++i) {
        const long long ts = static_cast<long long>(i) * 7'919;
        price += ((i * 37) % 11 - 5) * 0.25;
        const double volume = static_cast<double>((i * 13) % 7) * 0.5;
        total += volume;
        aggregator.ingest(tickAt(ts, price, volume));
    }

    double aggregated = 0.0;
    for (const auto& candle : aggregator.history()) {
        aggregated += candle.volume;
        expect(ohlcConsistent(candle), "completed candle satisfies low <= open,close <= high");
        expect(candle.complete, "history holds completed candles only");
    }
    if (auto current = aggregator.current()) {
        aggregated += current->volume;
    }
    expect(std::abs(aggregated - total) < 1e-9, "candle volume equals tick volume");

    for (std::size_t i = 1; i < aggregator.history().size(); ++i) {
        expect(aggregator.history()[i - 1].periodStart < aggregator.history()[i].periodStart,
               "history ordered by period");
    }
}

void replacementRestoresState() {
    CandleAggregator aggregator(kOneMinute, 10);
    aggregator.ingest(tickAt(0, 100.0, 1.0));
    aggregator.ingest(tickAt(10'000, 105.0, 2.0));
    aggregator.revise(tickAt(10'000, 102.0, 3.0));

    auto current = aggregator.current();
    expect(current.has_value(), "candle present after revise");
    if (current) {
        expect(current->high == 102.0, "replaced high does not linger");
        expect(current->close == 102.0, "close is the replacement price");
        expect(current->volume == 4.0, "replaced volume not double counted");
    }

    aggregator.ingest(tickAt(61'000, 99.0, 1.0));
    aggregator.revise(tickAt(61'000, 98.0, 5.0));
    current = aggregator.current();
    expect(current && current->open == 98.0 && current->volume == 5.0, "revising a candle's first tick reseeds it");
    expect(aggregator.history().size() == 1 && aggregator.history().front().close == 102.0,
           "revision never touches completed candles");
}

void rebuildWithFullHistory() {
    RollingTickBuffer buffer(100);
    CandleAggregator aggregator(kOneMinute, 100);
    for (int i = 0; i < 20; ++i) {
        const auto tick = tickAt(static_cast<long long>(i) * 30'000, 100.0 + i, 1.0);
        buffer.push(tick);
        aggregator.ingest(tick);
    }
    expect(aggregator.history().size() == 9, "nine completed minutes");

    const auto status = aggregator.rebuild(buffer.view(), kFiveMinutes);
    expect(status == AggregationStatus::Ok, "rebuild from complete buffer succeeds");
    expect(aggregator.granularity() == kFiveMinutes, "granularity switched");
    expect(aggregator.history().size() == 1, "one completed five-minute candle");
    if (!aggregator.history().empty()) {
        const auto& first = aggregator.history().front();
        expect(first.open == 100.0 && first.close == 109.0 && first.volume == 10.0, "five-minute bucket re-derived");
    }
    const auto current = aggregator.current();
    expect(current && current->periodStart == 300'000 && current->volume == 10.0, "current bucket re-derived");
}

void rebuildSignalsInsufficientHistory() {
    RollingTickBuffer buffer(3);
    const long long stamps[] = {30'000, 90'000, 150'000, 170'000};
    for (long long ts : stamps) {
        buffer.push(tickAt(ts, 100.0 + static_cast<double>(ts) / 10'000.0, 1.0));
    }

    CandleAggregator aggregator(kOneMinute, 100);
    const auto status = aggregator.rebuild(buffer.view(), kFiveMinutes);
    expect(status == AggregationStatus::InsufficientHistory, "truncated newest bucket reported");
    expect(!aggregator.current().has_value(), "no partial candle exposed");
    expect(aggregator.history().empty(), "no partial candle in history");

    aggregator.ingest(tickAt(200'000, 120.0, 1.0));
    expect(aggregator.status() == AggregationStatus::InsufficientHistory, "still insufficient within the same bucket");
    expect(!aggregator.current().has_value(), "still no partial candle");

    aggregator.ingest(tickAt(310'000, 121.0, 2.0));
    expect(aggregator.status() == AggregationStatus::Ok, "next bucket recovers");
    expect(aggregator.history().empty(), "partial bucket discarded, not appended");
    const auto current = aggregator.current();
    expect(current && current->periodStart == 300'000 && current->open == 121.0 && current->volume == 2.0,
           "fresh candle opened for the next bucket");
}

void rebuildWithAlignedOldestTick() {
    RollingTickBuffer buffer(2);
    buffer.push(tickAt(60'000, 1.0));
    buffer.push(tickAt(300'000, 2.0));
    buffer.push(tickAt(360'000, 3.0));

    CandleAggregator aggregator(kOneMinute, 100);
    const auto status = aggregator.rebuild(buffer.view(), kFiveMinutes);
    expect(status == AggregationStatus::Ok, "bucket starting exactly at the oldest tick is complete");
    const auto current = aggregator.current();
    expect(current && current->periodStart == 300'000 && current->open == 2.0 && current->close == 3.0,
           "aligned bucket rebuilt");
}

void seedingFillsTruncatedBucket() {
    RollingTickBuffer buffer(2);
    buffer.push(tickAt(30'000, 10.0));
    buffer.push(tickAt(90'000, 11.0));
    buffer.push(tickAt(150'000, 12.0));

    CandleAggregator aggregator(kOneMinute, 100);
    expect(aggregator.rebuild(buffer.view(), kFiveMinutes) == AggregationStatus::InsufficientHistory,
           "precondition: truncated");

    const std::vector<Candle> fetched = {
        candleAt(-300'000, 9.0, 9.5, 8.5, 9.2, 4.0),
        candleAt(0, 9.2, 12.5, 9.0, 12.0, 6.0),
    };
    const auto installed = aggregator.seedHistory(fetched, 0);
    expect(installed == 2, "both fetched candles installed");
    expect(aggregator.status() == AggregationStatus::Ok, "seeding clears insufficient history");
    expect(aggregator.history().size() == 1 && aggregator.history().front().periodStart == -300'000,
           "older candle prepended to history");
    auto current = aggregator.current();
    expect(current && current->periodStart == 0 && !current->complete && current->high == 12.5,
           "fetched candle replaces the truncated bucket");

    aggregator.ingest(tickAt(200'000, 13.0, 1.0));
    current = aggregator.current();
    expect(current && current->high == 13.0 && current->close == 13.0 && current->volume == 7.0,
           "live ticks continue the seeded candle");
}

void seedingRejectsInvalidCandles() {
    CandleAggregator aggregator(kOneMinute, 3);
    const std::vector<Candle> fetched = {
        candleAt(0, 1.0, 2.0, 0.5, 1.5, 1.0),
        candleAt(60'001, 1.0, 2.0, 0.5, 1.5, 1.0),
        candleAt(120'000, 1.0, 0.9, 0.5, 1.5, 1.0),
        candleAt(180'000, 1.0, 2.0, 0.5, 1.5, -1.0),
        candleAt(240'000, 1.0, 2.0, 0.5, 1.5, 1.0),
        candleAt(240'000, 1.0, 2.0, 0.5, 1.5, 1.0),
        candleAt(300'000, 1.0, 2.0, 0.5, 1.5, 1.0),
        candleAt(360'000, 1.0, 2.0, 0.5, 1.5, 1.0),
    };
    const auto installed = aggregator.seedHistory(fetched, 420'000);
    expect(installed == 4, "only valid, ordered, aligned candles installed");
    expect(aggregator.history().size() == 3, "history bounded by max length");
    expect(aggregator.history().front().periodStart == 240'000, "oldest seeded candles evicted first");
}

void seededOpenPeriodStaysInProgress() {
    CandleAggregator aggregator(kOneMinute, 100);
    const std::vector<Candle> fetched = {
        candleAt(0, 10.0, 11.0, 9.0, 10.5, 3.0),
        candleAt(60'000, 10.5, 12.5, 10.0, 12.0, 5.0),
        candleAt(120'000, 12.0, 12.0, 12.0, 12.0, 1.0),
    };
    expect(aggregator.seedHistory(fetched, 60'000) == 2, "closed and open periods installed, future skipped");
    expect(aggregator.history().size() == 1 && aggregator.history().back().periodStart == 0,
           "only the closed period enters history");
    auto current = aggregator.current();
    expect(current && current->periodStart == 60'000 && !current->complete && current->close == 12.0,
           "open period seeds the in-progress candle");

    aggregator.ingest(tickAt(90'000, 13.0, 1.0));
    expect(aggregator.history().size() == 1 && aggregator.history().back().periodStart == 0,
           "completed history untouched by the live tick");
    current = aggregator.current();
    expect(current && current->periodStart == 60'000 && !current->complete && current->volume == 6.0 &&
               current->close == 13.0 && current->high == 13.0,
           "live tick continues the open period");

    aggregator.ingest(tickAt(125'000, 14.0, 1.0));
    expect(aggregator.history().size() == 2 && aggregator.history().back().periodStart == 60'000 &&
               aggregator.history().back().complete && aggregator.history().back().volume == 6.0,
           "open period completes when the next one starts");

    CandleAggregator live(kOneMinute, 100);
    live.ingest(tickAt(60'500, 20.0, 1.0));
    expect(live.seedHistory(fetched, 60'000) == 1, "live candle wins over the fetched open period");
    current = live.current();
    expect(current && current->close == 20.0 && current->volume == 1.0, "live candle kept as is");
    expect(live.history().size() == 1 && live.history().front().periodStart == 0, "older candle prepended");
}

void historyBounded() {
    CandleAggregator aggregator(kOneMinute, 2);
    for (int i = 0; i < 5; ++i) {
        aggregator.ingest(tickAt(static_cast<long long>(i) * 60'000, 1.0 + i));
    }
    expect(aggregator.history().size() == 2, "history evicts beyond max length");
    expect(aggregator.history().front().periodStart == 120'000, "oldest completed candle evicted");
}

}  // namespace

int main() {
    crossingScenario();
    volumeConservation();
    replacementRestoresState();
    rebuildWithFullHistory();
    rebuildSignalsInsufficientHistory();
    rebuildWithAlignedOldestTick();
    seedingFillsTruncatedBucket();
    seedingRejectsInvalidCandles();
    seededOpenPeriodStaysInProgress();
    historyBounded();

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_candle_aggregator passed\n";
    return 0;
}
