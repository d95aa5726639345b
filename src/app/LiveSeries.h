#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "core/CandleAggregator.h"
#include "core/RollingTickBuffer.h"
#include "core/SeriesSnapshot.h"
#include "core/TickSequencer.h"
#include "domain/Types.h"

namespace lmv::app {

/**
 * Buffer and aggregator pair owned by one watchlist entry.
 *
 * All mutation goes through a per-entry mutex, so one symbol's timeline is
 * applied in delivery order while other entries proceed in parallel. Feed and
 * backfill callbacks carry the epoch they were issued under; once the entry is
 * invalidated, or a newer history request supersedes theirs, they are
 * discarded without touching any state.
 */
class LiveSeries {
public:
    LiveSeries(domain::WatchlistEntry entry,
               std::size_t tickCapacity,
               domain::Granularity granularity,
               std::size_t maxHistory);

    LiveSeries(const LiveSeries&) = delete;
    LiveSeries& operator=(const LiveSeries&) = delete;

    const domain::WatchlistEntry& entry() const noexcept { return entry_; }
    std::uint64_t epoch() const noexcept { return epoch_.load(std::memory_order_acquire); }
    bool valid() const noexcept { return !invalidated_.load(std::memory_order_acquire); }

    // Applies a sequenced tick delivered under `epoch`. Returns false when the
    // update is stale or was rejected by the buffer.
    bool apply(std::uint64_t epoch, const core::TickUpdate& update);

    // Returns false when the signal is stale.
    bool setConnection(std::uint64_t epoch, domain::ConnectionState state);
    void setStatus(domain::EntryStatus status);

    // Bumps the epoch and drops buffered state. Later callbacks are ignored.
    void invalidate();

    // Rebuilds the candles from the buffer. Pending history requests are
    // superseded.
    core::AggregationStatus setGranularity(domain::Granularity granularity);

    // Starts a backfill request; the returned token must be handed back to
    // seedHistory.
    std::uint64_t beginHistoryRequest();
    // `openPeriod` is the start of the period still in progress when the
    // request was made. Returns nullopt when the request was superseded or the
    // entry removed.
    std::optional<std::size_t> seedHistory(std::uint64_t historyEpoch,
                                           const std::vector<domain::Candle>& candles,
                                           domain::TimestampMs openPeriod);

    domain::Granularity granularity() const;
    std::optional<double> lastPrice() const;
    domain::ConnectionState connection() const;
    domain::EntryStatus status() const;

    core::SeriesSnapshot snapshot() const;
    // Reuses the vectors held by `out`.
    void snapshotInto(core::SeriesSnapshot& out) const;

private:
    bool staleLocked_(std::uint64_t epoch) const;

    const domain::WatchlistEntry entry_;
    const std::uint64_t createdEpoch_;

    mutable std::mutex mutex_;
    core::RollingTickBuffer buffer_;
    core::CandleAggregator aggregator_;
    domain::ConnectionState connection_{domain::ConnectionState::Reconnecting};
    domain::EntryStatus status_{domain::EntryStatus::Idle};
    std::uint64_t historyEpoch_{0};

    std::atomic<std::uint64_t> epoch_;
    std::atomic<bool> invalidated_{false};
};

}  // namespace lmv::app
