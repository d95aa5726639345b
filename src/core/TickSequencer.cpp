#include "core/TickSequencer.h"

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace lmv::core {

namespace {

domain::TradeSide inferSide(const std::optional<double>& previous, double price) {
    if (!previous) {
        return domain::TradeSide::Buy;
    }
    return price >= *previous ? domain::TradeSide::Buy : domain::TradeSide::Sell;
}

std::optional<double> volumeDelta(const std::optional<double>& prior, const std::optional<double>& current) {
    if (!prior || !current) {
        return std::nullopt;
    }
    const double delta = *current - *prior;
    // Rolling 24h windows shrink when old trades fall out.
    if (delta < 0.0) {
        return std::nullopt;
    }
    return delta;
}

}  // namespace

TickDisposition TickSequencer::classify(std::optional<domain::TimestampMs> last,
                                        domain::TimestampMs incoming) noexcept {
    if (!last || incoming > *last) {
        return TickDisposition::Append;
    }
    if (incoming == *last) {
        return TickDisposition::ReplaceLast;
    }
    return TickDisposition::Drop;
}

std::optional<TickUpdate> TickSequencer::accept(const domain::QuoteSample& sample) {
    const auto disposition = classify(lastTimestamp_, sample.timestamp);
    if (disposition == TickDisposition::Drop) {
        ++dropped_;
        metrics::Registry::instance().incrementCounter("ticks_dropped_out_of_order");
        LOG_DEBUG(logging::LogCategory::FEED,
                  "Dropping out-of-order tick ts=%lld last=%lld",
                  static_cast<long long>(sample.timestamp),
                  static_cast<long long>(*lastTimestamp_));
        return std::nullopt;
    }

    if (disposition == TickDisposition::Append) {
        pricePrior_ = lastPrice_;
        volume24hPrior_ = lastVolume24h_;
        lastTimestamp_ = sample.timestamp;
    }

    TickUpdate update;
    update.replacesLast = disposition == TickDisposition::ReplaceLast;
    update.tick.timestamp = sample.timestamp;
    update.tick.price = sample.price;
    update.tick.bid = sample.bid;
    update.tick.ask = sample.ask;
    update.tick.side = sample.side ? *sample.side : inferSide(pricePrior_, sample.price);
    if (sample.volume) {
        update.tick.volume = sample.volume;
    }
    else {
        update.tick.volume = volumeDelta(volume24hPrior_, sample.volume24h);
    }

    lastPrice_ = sample.price;
    if (sample.volume24h) {
        lastVolume24h_ = sample.volume24h;
    }

    if (update.replacesLast) {
        metrics::Registry::instance().incrementCounter("ticks_replaced");
    }
    metrics::Registry::instance().incrementCounter("ticks_accepted");
    return update;
}

void TickSequencer::reset() {
    lastTimestamp_.reset();
    pricePrior_.reset();
    volume24hPrior_.reset();
    lastPrice_.reset();
    lastVolume24h_.reset();
    dropped_ = 0;
}

}  // namespace lmv::core
