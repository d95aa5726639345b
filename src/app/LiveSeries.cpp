#include "app/LiveSeries.h"

#include <utility>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace lmv::app {

namespace {

std::atomic<std::uint64_t> gEpochCounter{0};

std::uint64_t nextEpoch() {
    return gEpochCounter.fetch_add(1, std::memory_order_relaxed) + 1;
}

void countStale() {
    metrics::Registry::instance().incrementCounter("stale_responses_discarded");
}

}  // namespace

LiveSeries::LiveSeries(domain::WatchlistEntry entry,
                       std::size_t tickCapacity,
                       domain::Granularity granularity,
                       std::size_t maxHistory)
    : entry_(std::move(entry)),
      createdEpoch_(nextEpoch()),
      buffer_(tickCapacity),
      aggregator_(granularity, maxHistory),
      epoch_(createdEpoch_) {}

bool LiveSeries::staleLocked_(std::uint64_t epoch) const {
    return invalidated_.load(std::memory_order_acquire) || epoch != epoch_.load(std::memory_order_acquire);
}

bool LiveSeries::apply(std::uint64_t epoch, const core::TickUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (staleLocked_(epoch)) {
        countStale();
        LOG_DEBUG(logging::LogCategory::WATCHLIST,
                  "Discarding stale tick for %s ts=%lld",
                  entry_.id.c_str(),
                  static_cast<long long>(update.tick.timestamp));
        return false;
    }

    if (update.replacesLast) {
        if (!buffer_.replaceLast(update.tick)) {
            LOG_WARN(logging::LogCategory::BUFFER,
                     "Replacement for %s ts=%lld does not match newest tick",
                     entry_.id.c_str(),
                     static_cast<long long>(update.tick.timestamp));
            return false;
        }
        aggregator_.revise(update.tick);
    }
    else {
        if (!buffer_.push(update.tick)) {
            LOG_DEBUG(logging::LogCategory::BUFFER,
                      "Buffer for %s rejected ts=%lld",
                      entry_.id.c_str(),
                      static_cast<long long>(update.tick.timestamp));
            return false;
        }
        aggregator_.ingest(update.tick);
    }

    if (status_ == domain::EntryStatus::Subscribing || status_ == domain::EntryStatus::Idle) {
        status_ = domain::EntryStatus::Active;
        connection_ = domain::ConnectionState::Connected;
    }
    return true;
}

bool LiveSeries::setConnection(std::uint64_t epoch, domain::ConnectionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (staleLocked_(epoch)) {
        countStale();
        return false;
    }
    connection_ = state;
    switch (state) {
    case domain::ConnectionState::Connected:
        status_ = domain::EntryStatus::Active;
        break;
    case domain::ConnectionState::Reconnecting:
        status_ = domain::EntryStatus::Reconnecting;
        break;
    case domain::ConnectionState::Failed:
        status_ = domain::EntryStatus::Failed;
        break;
    }
    return true;
}

void LiveSeries::setStatus(domain::EntryStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (invalidated_.load(std::memory_order_acquire)) {
        return;
    }
    status_ = status;
}

void LiveSeries::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    invalidated_.store(true, std::memory_order_release);
    epoch_.store(nextEpoch(), std::memory_order_release);
    ++historyEpoch_;
    buffer_.clear();
    aggregator_.reset();
    status_ = domain::EntryStatus::Removed;
}

core::AggregationStatus LiveSeries::setGranularity(domain::Granularity granularity) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++historyEpoch_;
    const auto status = aggregator_.rebuild(buffer_.view(), granularity);
    LOG_INFO(logging::LogCategory::CANDLES,
             "%s re-derived at %s from %zu ticks%s",
             entry_.id.c_str(),
             domain::granularity_label(granularity).c_str(),
             buffer_.size(),
             status == core::AggregationStatus::InsufficientHistory ? " (insufficient history)" : "");
    return status;
}

std::uint64_t LiveSeries::beginHistoryRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++historyEpoch_;
}

std::optional<std::size_t> LiveSeries::seedHistory(std::uint64_t historyEpoch,
                                                   const std::vector<domain::Candle>& candles,
                                                   domain::TimestampMs openPeriod) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (invalidated_.load(std::memory_order_acquire) || historyEpoch != historyEpoch_) {
        countStale();
        LOG_DEBUG(logging::LogCategory::WATCHLIST, "Discarding superseded backfill for %s", entry_.id.c_str());
        return std::nullopt;
    }
    return aggregator_.seedHistory(candles, openPeriod);
}

domain::Granularity LiveSeries::granularity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_.granularity();
}

std::optional<double> LiveSeries::lastPrice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* newest = buffer_.newest()) {
        return newest->price;
    }
    return std::nullopt;
}

domain::ConnectionState LiveSeries::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

domain::EntryStatus LiveSeries::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

core::SeriesSnapshot LiveSeries::snapshot() const {
    core::SeriesSnapshot out;
    snapshotInto(out);
    return out;
}

void LiveSeries::snapshotInto(core::SeriesSnapshot& out) const {
    out.entryId = entry_.id;
    out.title = entry_.label();

    std::lock_guard<std::mutex> lock(mutex_);
    out.granularity = aggregator_.granularity();
    out.connection = connection_;
    out.status = status_;
    out.aggregation = aggregator_.status();
    buffer_.snapshotInto(out.ticks);
    aggregator_.historyInto(out.history);
    out.current = aggregator_.current();
}

}  // namespace lmv::app
