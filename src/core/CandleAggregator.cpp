#include "core/CandleAggregator.h"

#include <algorithm>
#include <cmath>

#include "logging/Log.h"

namespace lmv::core {

namespace {

domain::Candle seedCandle(domain::TimestampMs periodStart, const domain::Tick& tick) {
    domain::Candle candle;
    candle.periodStart = periodStart;
    candle.open = tick.price;
    candle.high = tick.price;
    candle.low = tick.price;
    candle.close = tick.price;
    candle.volume = tick.volume.value_or(0.0);
    candle.complete = false;
    return candle;
}

}  // namespace

CandleAggregator::CandleAggregator(domain::Granularity granularity, std::size_t maxHistory)
    : granularity_(granularity.valid() ? granularity : domain::Granularity{domain::kMinuteMs}),
      maxHistory_(std::max<std::size_t>(maxHistory, 1)) {}

void CandleAggregator::ingest(const domain::Tick& tick) {
    ingestLocked_(tick);
}

void CandleAggregator::revise(const domain::Tick& tick) {
    if (!lastTimestamp_ || tick.timestamp != *lastTimestamp_) {
        ingestLocked_(tick);
        return;
    }

    const auto period = domain::align_down_ms(tick.timestamp, granularity_.ms);
    if (truncated_ && period <= truncatedPeriod_) {
        return;
    }

    if (lastOpenedCandle_) {
        current_ = seedCandle(period, tick);
    }
    else if (beforeLast_) {
        current_ = *beforeLast_;
        applyTick_(*current_, tick);
    }
    else if (current_) {
        applyTick_(*current_, tick);
    }
    else {
        current_ = seedCandle(period, tick);
        lastOpenedCandle_ = true;
    }
}

AggregationStatus CandleAggregator::rebuild(const TickWindow& ticks, domain::Granularity granularity) {
    if (granularity.valid()) {
        granularity_ = granularity;
    }
    reset();
    if (ticks.empty()) {
        return AggregationStatus::Ok;
    }

    std::optional<domain::TimestampMs> partialPeriod;
    if (ticks.evicted()) {
        const auto& oldest = ticks.front();
        const auto oldestPeriod = domain::align_down_ms(oldest.timestamp, granularity_.ms);
        if (oldest.timestamp != oldestPeriod) {
            partialPeriod = oldestPeriod;
        }
    }

    ticks.forEach([&](const domain::Tick& tick) {
        if (partialPeriod && domain::align_down_ms(tick.timestamp, granularity_.ms) == *partialPeriod) {
            return;
        }
        ingestLocked_(tick);
    });

    const auto& newest = ticks.back();
    if (partialPeriod && domain::align_down_ms(newest.timestamp, granularity_.ms) == *partialPeriod) {
        truncated_ = true;
        truncatedPeriod_ = *partialPeriod;
        lastTimestamp_ = newest.timestamp;
        LOG_INFO(logging::LogCategory::CANDLES,
                 "Retained ticks do not cover the %s bucket at %lld; waiting for history",
                 domain::granularity_label(granularity_).c_str(),
                 static_cast<long long>(truncatedPeriod_));
    }
    return status();
}

std::size_t CandleAggregator::seedHistory(const std::vector<domain::Candle>& candles, domain::TimestampMs openPeriod) {
    std::optional<domain::TimestampMs> currentPeriod;
    if (current_) {
        currentPeriod = current_->periodStart;
    }
    else if (truncated_) {
        currentPeriod = truncatedPeriod_;
    }

    domain::TimestampMs liveStart = openPeriod;
    if (!history_.empty()) {
        liveStart = std::min(liveStart, history_.front().periodStart);
    }
    else if (currentPeriod) {
        liveStart = std::min(liveStart, *currentPeriod);
    }

    std::size_t installed = 0;
    std::size_t rejected = 0;
    std::optional<domain::Candle> inProgress;
    std::vector<domain::Candle> prefix;
    prefix.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!isValidCandle(candle, granularity_)) {
            ++rejected;
            continue;
        }
        if (!prefix.empty() && candle.periodStart <= prefix.back().periodStart) {
            ++rejected;
            continue;
        }
        if (currentPeriod && candle.periodStart == *currentPeriod) {
            if (truncated_) {
                current_ = candle;
                current_->complete = false;
                truncated_ = false;
                beforeLast_.reset();
                lastOpenedCandle_ = false;
                ++installed;
            }
            continue;
        }
        if (currentPeriod && candle.periodStart > *currentPeriod) {
            continue;
        }
        // The feed's still-open period seeds the in-progress slot, never history.
        if (candle.periodStart == openPeriod) {
            inProgress = candle;
            continue;
        }
        if (candle.periodStart >= liveStart) {
            continue;
        }
        prefix.push_back(candle);
        prefix.back().complete = true;
    }

    installed += prefix.size();
    history_.insert(history_.begin(), prefix.begin(), prefix.end());
    while (history_.size() > maxHistory_) {
        history_.pop_front();
    }

    if (inProgress && !current_ && !truncated_ &&
        (history_.empty() || history_.back().periodStart < inProgress->periodStart)) {
        current_ = *inProgress;
        current_->complete = false;
        beforeLast_.reset();
        lastOpenedCandle_ = false;
        ++installed;
    }

    if (rejected > 0) {
        LOG_WARN(logging::LogCategory::CANDLES, "Skipped %zu invalid historical candles", rejected);
    }
    return installed;
}

void CandleAggregator::reset() {
    history_.clear();
    current_.reset();
    truncated_ = false;
    truncatedPeriod_ = 0;
    lastTimestamp_.reset();
    beforeLast_.reset();
    lastOpenedCandle_ = false;
}

void CandleAggregator::historyInto(std::vector<domain::Candle>& out) const {
    out.assign(history_.begin(), history_.end());
}

std::optional<domain::Candle> CandleAggregator::current() const {
    if (truncated_) {
        return std::nullopt;
    }
    return current_;
}

bool CandleAggregator::isValidCandle(const domain::Candle& candle, domain::Granularity granularity) {
    if (!granularity.valid() || domain::align_down_ms(candle.periodStart, granularity.ms) != candle.periodStart) {
        return false;
    }
    const double values[] = {candle.open, candle.high, candle.low, candle.close, candle.volume};
    for (double v : values) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    if (candle.volume < 0.0) {
        return false;
    }
    return candle.low <= std::min(candle.open, candle.close) && candle.high >= std::max(candle.open, candle.close);
}

void CandleAggregator::ingestLocked_(const domain::Tick& tick) {
    const auto period = domain::align_down_ms(tick.timestamp, granularity_.ms);
    const bool newTimestamp = !lastTimestamp_ || *lastTimestamp_ != tick.timestamp;

    if (truncated_) {
        if (period <= truncatedPeriod_) {
            lastTimestamp_ = tick.timestamp;
            beforeLast_.reset();
            lastOpenedCandle_ = false;
            return;
        }
        LOG_DEBUG(logging::LogCategory::CANDLES, "Discarding partial candle at %lld",
                  static_cast<long long>(truncatedPeriod_));
        truncated_ = false;
    }

    if (current_ && period < current_->periodStart) {
        LOG_DEBUG(logging::LogCategory::CANDLES, "Ignoring tick before current period ts=%lld",
                  static_cast<long long>(tick.timestamp));
        return;
    }
    if (!current_ && !history_.empty() && period <= history_.back().periodStart) {
        return;
    }

    if (newTimestamp) {
        beforeLast_ = current_;
        lastOpenedCandle_ = false;
        lastTimestamp_ = tick.timestamp;
    }

    if (current_ && current_->periodStart == period) {
        applyTick_(*current_, tick);
        return;
    }

    if (current_) {
        closeCurrent_();
    }
    openCandle_(period, tick);
    if (newTimestamp && lastOpenedCandle_) {
        beforeLast_.reset();
    }
}

void CandleAggregator::openCandle_(domain::TimestampMs periodStart, const domain::Tick& tick) {
    current_ = seedCandle(periodStart, tick);
    lastOpenedCandle_ = true;
}

void CandleAggregator::closeCurrent_() {
    domain::Candle closed = *current_;
    closed.complete = true;
    current_.reset();
    LOG_TRACE(logging::LogCategory::CANDLES,
              "Closed candle %lld o=%.8g h=%.8g l=%.8g c=%.8g v=%.8g",
              static_cast<long long>(closed.periodStart), closed.open, closed.high, closed.low, closed.close,
              closed.volume);
    appendHistory_(closed);
}

void CandleAggregator::appendHistory_(domain::Candle candle) {
    history_.push_back(candle);
    while (history_.size() > maxHistory_) {
        history_.pop_front();
    }
}

void CandleAggregator::applyTick_(domain::Candle& candle, const domain::Tick& tick) {
    candle.high = std::max(candle.high, tick.price);
    candle.low = std::min(candle.low, tick.price);
    candle.close = tick.price;
    candle.volume += tick.volume.value_or(0.0);
}

}  // namespace lmv::core
