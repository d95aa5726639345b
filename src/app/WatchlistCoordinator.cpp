#include "app/WatchlistCoordinator.h"

#include <algorithm>
#include <mutex>
#include <utility>

#include "common/Metrics.hpp"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace lmv::app {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::WATCHLIST;
constexpr std::size_t kBackfillThreads = 2;

domain::TimestampMs wallClockMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

render::DataState dataStateOf(const core::SeriesSnapshot& snapshot) {
    if (snapshot.ticks.empty() && snapshot.history.empty()) {
        return render::DataState::Empty;
    }
    if (snapshot.aggregation == core::AggregationStatus::InsufficientHistory) {
        return render::DataState::InsufficientHistory;
    }
    return render::DataState::Live;
}

const char* viewName(render::ChartView view) {
    switch (view) {
    case render::ChartView::Line:
        return "line";
    case render::ChartView::Candles:
        return "candles";
    case render::ChartView::Book:
        return "book";
    }
    return "unknown";
}

}  // namespace

CoordinatorOptions CoordinatorOptions::fromConfig(const config::Config& cfg) {
    CoordinatorOptions options;
    options.tickCapacity = std::max<std::size_t>(1, cfg.tickCapacity);
    options.candleHistory = std::max<std::size_t>(1, cfg.candleHistory);
    options.granularity = domain::granularity_from_label(cfg.granularity);
    if (!options.granularity.valid()) {
        LOG_WARN(kLogCategory, "Unknown granularity '%s', using 1m", cfg.granularity.c_str());
        options.granularity = domain::Granularity{domain::kMinuteMs};
    }
    options.backfillLimit = cfg.backfillLimit;
    options.bookDepth = std::max<std::size_t>(1, cfg.bookDepth);
    options.bookStepRatio = cfg.bookStepRatio;
    options.focusedInterval = std::chrono::milliseconds(cfg.pollIntervalMs);
    options.backgroundInterval = std::chrono::milliseconds(cfg.backgroundPollIntervalMs);
    options.renderInterval = std::chrono::milliseconds(cfg.renderIntervalMs);
    return options;
}

WatchlistCoordinator::WatchlistCoordinator(std::shared_ptr<adapters::feed::ITickSource> source,
                                           std::shared_ptr<core::RefreshScheduler> scheduler,
                                           CoordinatorOptions options,
                                           std::shared_ptr<adapters::history::ICandleHistorySource> history)
    : source_(std::move(source)),
      scheduler_(std::move(scheduler)),
      history_(std::move(history)),
      options_(std::move(options)),
      book_(options_.bookStepRatio) {
    if (history_) {
        backfill_ = std::make_unique<core::RefreshScheduler>(kBackfillThreads);
    }
}

WatchlistCoordinator::~WatchlistCoordinator() {
    stop();
}

bool WatchlistCoordinator::add(const domain::WatchlistEntry& entry) {
    LOG_GUARD_RET(!entry.id.empty() && !entry.exchangeId.empty() && !entry.symbol.empty(),
                  kLogCategory,
                  false,
                  "Rejecting watchlist entry without id, venue or symbol");
    LOG_GUARD_RET(source_ != nullptr, kLogCategory, false, "No tick source configured");

    auto series =
        std::make_shared<LiveSeries>(entry, options_.tickCapacity, options_.granularity, options_.candleHistory);
    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex_);
        if (entries_.count(entry.id) != 0) {
            LOG_WARN(kLogCategory, "Watchlist entry %s already present", entry.id.c_str());
            return false;
        }
        entries_.emplace(entry.id, Slot{series, {}});
        order_.push_back(entry.id);
        if (!focused_) {
            focused_ = entry.id;
        }
    }
    metrics::Registry::instance().addGauge("entries_active", 1.0);

    series->setStatus(domain::EntryStatus::Subscribing);
    const auto epoch = series->epoch();
    std::weak_ptr<LiveSeries> weak = series;

    auto onTick = [weak, epoch](const core::TickUpdate& update) {
        if (auto live = weak.lock()) {
            live->apply(epoch, update);
            return;
        }
        metrics::Registry::instance().incrementCounter("stale_responses_discarded");
    };
    auto onState = [weak, epoch](domain::ConnectionState state) {
        auto live = weak.lock();
        if (!live) {
            return;
        }
        if (live->setConnection(epoch, state)) {
            LOG_INFO(kLogCategory, "%s is %s", live->entry().id.c_str(), domain::to_string(state));
        }
    };

    adapters::feed::Subscription subscription;
    try {
        subscription = source_->subscribe(entry.exchangeId, entry.symbol, std::move(onTick), std::move(onState));
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Subscribing %s failed: %s", entry.id.c_str(), ex.what());
        remove(entry.id);
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex_);
        auto it = entries_.find(entry.id);
        if (it == entries_.end() || it->second.series != series) {
            lock.unlock();
            LOG_DEBUG(kLogCategory, "%s removed while subscribing", entry.id.c_str());
            subscription.cancel();
            return false;
        }
        it->second.subscription = std::move(subscription);
        it->second.subscription.setRefreshInterval(focused_ == entry.id ? options_.focusedInterval
                                                                         : options_.backgroundInterval);
    }

    LOG_INFO(kLogCategory,
             "Added %s (%s:%s) via %s feed",
             entry.id.c_str(),
             entry.exchangeId.c_str(),
             entry.symbol.c_str(),
             source_->mode());
    requestBackfill_(series);
    return true;
}

bool WatchlistCoordinator::remove(const std::string& id) {
    Slot slot;
    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        slot = std::move(it->second);
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        if (focused_ == id) {
            focused_.reset();
            if (!order_.empty()) {
                focused_ = order_.front();
            }
            applyIntervalsLocked_();
        }
    }

    slot.series->invalidate();
    slot.subscription.cancel();
    metrics::Registry::instance().addGauge("entries_active", -1.0);
    LOG_INFO(kLogCategory, "Removed %s", id.c_str());
    return true;
}

std::optional<core::AggregationStatus> WatchlistCoordinator::setActiveGranularity(const std::string& id,
                                                                                  domain::Granularity granularity) {
    LOG_GUARD_RET(granularity.valid(), kLogCategory, std::nullopt, "Ignoring invalid granularity for %s", id.c_str());
    auto series = find_(id);
    if (!series) {
        return std::nullopt;
    }
    const auto status = series->setGranularity(granularity);
    requestBackfill_(series);
    return status;
}

bool WatchlistCoordinator::setFocus(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(entriesMutex_);
    if (entries_.count(id) == 0) {
        return false;
    }
    if (focused_ != id) {
        focused_ = id;
        applyIntervalsLocked_();
        LOG_DEBUG(kLogCategory, "Focus moved to %s", id.c_str());
    }
    return true;
}

std::optional<std::string> WatchlistCoordinator::focusNext() {
    std::unique_lock<std::shared_mutex> lock(entriesMutex_);
    if (order_.empty()) {
        return std::nullopt;
    }
    std::size_t next = 0;
    if (focused_) {
        const auto it = std::find(order_.begin(), order_.end(), *focused_);
        if (it != order_.end()) {
            next = (static_cast<std::size_t>(it - order_.begin()) + 1) % order_.size();
        }
    }
    focused_ = order_[next];
    applyIntervalsLocked_();
    return focused_;
}

std::optional<std::string> WatchlistCoordinator::focused() const {
    std::shared_lock<std::shared_mutex> lock(entriesMutex_);
    return focused_;
}

void WatchlistCoordinator::applyIntervalsLocked_() {
    for (auto& [id, slot] : entries_) {
        slot.subscription.setRefreshInterval(focused_ == id ? options_.focusedInterval : options_.backgroundInterval);
    }
}

std::shared_ptr<LiveSeries> WatchlistCoordinator::find_(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(entriesMutex_);
    const auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.series;
}

void WatchlistCoordinator::requestBackfill_(const std::shared_ptr<LiveSeries>& series) {
    if (!backfill_ || options_.backfillLimit == 0 || !backfill_->running()) {
        return;
    }

    adapters::history::CandleRequest request;
    request.venue = series->entry().exchangeId;
    request.symbol = series->entry().symbol;
    request.granularity = series->granularity();
    request.endTime = wallClockMs();
    request.startTime = request.endTime - static_cast<domain::TimestampMs>(options_.backfillLimit) *
                                              request.granularity.ms;
    request.limit = options_.backfillLimit;

    const auto openPeriod = domain::align_down_ms(request.endTime, request.granularity.ms);
    const auto token = series->beginHistoryRequest();
    std::weak_ptr<LiveSeries> weak = series;
    auto history = history_;
    backfill_->post([weak, token, request, openPeriod, history]() {
        std::vector<domain::Candle> candles;
        try {
            candles = history->fetchCandles(request);
        }
        catch (const domain::TransportError& ex) {
            metrics::Registry::instance().incrementCounter("backfill_failures");
            LOG_WARN(kLogCategory, "Backfill for %s failed: %s", request.symbol.c_str(), ex.what());
            return;
        }
        catch (const domain::MalformedTickError& ex) {
            metrics::Registry::instance().incrementCounter("backfill_failures");
            LOG_WARN(kLogCategory, "Backfill for %s unusable: %s", request.symbol.c_str(), ex.what());
            return;
        }

        auto live = weak.lock();
        if (!live) {
            metrics::Registry::instance().incrementCounter("stale_responses_discarded");
            return;
        }
        if (const auto installed = live->seedHistory(token, candles, openPeriod)) {
            LOG_INFO(kLogCategory,
                     "Backfilled %zu of %zu candles for %s at %s",
                     *installed,
                     candles.size(),
                     live->entry().id.c_str(),
                     domain::granularity_label(request.granularity).c_str());
        }
    });
}

std::vector<EntryOverview> WatchlistCoordinator::overview() const {
    std::vector<std::shared_ptr<LiveSeries>> ordered;
    std::optional<std::string> focusedId;
    {
        std::shared_lock<std::shared_mutex> lock(entriesMutex_);
        ordered.reserve(order_.size());
        for (const auto& id : order_) {
            const auto it = entries_.find(id);
            if (it != entries_.end()) {
                ordered.push_back(it->second.series);
            }
        }
        focusedId = focused_;
    }

    std::vector<EntryOverview> rows;
    rows.reserve(ordered.size());
    core::SeriesSnapshot snapshot;
    for (const auto& series : ordered) {
        series->snapshotInto(snapshot);
        EntryOverview row;
        row.id = snapshot.entryId;
        row.label = snapshot.title;
        row.granularity = domain::granularity_label(snapshot.granularity);
        row.connection = snapshot.connection;
        row.status = snapshot.status;
        row.dataState = dataStateOf(snapshot);
        row.focused = focusedId == snapshot.entryId;
        if (!snapshot.ticks.empty()) {
            row.lastPrice = snapshot.ticks.back().price;
            const double first = snapshot.ticks.front().price;
            if (first != 0.0) {
                row.changePercent = (snapshot.ticks.back().price - first) / first * 100.0;
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::optional<core::SeriesSnapshot> WatchlistCoordinator::snapshot(const std::string& id) const {
    auto series = find_(id);
    if (!series) {
        return std::nullopt;
    }
    return series->snapshot();
}

std::optional<domain::EntryStatus> WatchlistCoordinator::status(const std::string& id) const {
    auto series = find_(id);
    if (!series) {
        return std::nullopt;
    }
    return series->status();
}

std::optional<core::AggregatedQuote> WatchlistCoordinator::aggregatedQuote(const std::string& symbol) const {
    std::vector<std::shared_ptr<LiveSeries>> matching;
    {
        std::shared_lock<std::shared_mutex> lock(entriesMutex_);
        for (const auto& [id, slot] : entries_) {
            if (slot.series->entry().symbol == symbol) {
                matching.push_back(slot.series);
            }
        }
    }

    std::vector<core::VenueQuote> quotes;
    core::SeriesSnapshot snapshot;
    for (const auto& series : matching) {
        series->snapshotInto(snapshot);
        if (snapshot.ticks.empty()) {
            continue;
        }
        const auto& newest = snapshot.ticks.back();
        core::VenueQuote quote;
        quote.venue = series->entry().exchangeId;
        quote.timestamp = newest.timestamp;
        quote.last = newest.price;
        quote.bid = newest.bid;
        quote.ask = newest.ask;
        quote.high = newest.price;
        quote.low = newest.price;
        for (const auto& tick : snapshot.ticks) {
            quote.high = std::max(quote.high, tick.price);
            quote.low = std::min(quote.low, tick.price);
            quote.volume += tick.volume.value_or(0.0);
        }
        const double first = snapshot.ticks.front().price;
        if (first != 0.0) {
            quote.changePercent = (newest.price - first) / first * 100.0;
        }
        quotes.push_back(std::move(quote));
    }
    return core::aggregateQuotes(symbol, quotes);
}

std::size_t WatchlistCoordinator::size() const {
    std::shared_lock<std::shared_mutex> lock(entriesMutex_);
    return entries_.size();
}

std::optional<render::RenderFrame> WatchlistCoordinator::buildFrame(render::ChartView view,
                                                                    unsigned width,
                                                                    unsigned height) const {
    std::shared_ptr<LiveSeries> series;
    {
        std::shared_lock<std::shared_mutex> lock(entriesMutex_);
        if (!focused_) {
            return std::nullopt;
        }
        const auto it = entries_.find(*focused_);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        series = it->second.series;
    }
    return frameFor_(*series, view, width, height);
}

std::optional<render::RenderFrame> WatchlistCoordinator::buildFrame(const std::string& id,
                                                                    render::ChartView view,
                                                                    unsigned width,
                                                                    unsigned height) const {
    auto series = find_(id);
    if (!series) {
        return std::nullopt;
    }
    return frameFor_(*series, view, width, height);
}

render::RenderFrame WatchlistCoordinator::frameFor_(const LiveSeries& series,
                                                    render::ChartView view,
                                                    unsigned width,
                                                    unsigned height) const {
    const auto snapshot = series.snapshot();
    core::OrderBook book;
    if (view == render::ChartView::Book && !snapshot.ticks.empty()) {
        book = book_.generate(snapshot.ticks.back().price, options_.bookDepth);
    }

    auto frame = model_.buildFrame(snapshot, view, width, height, book);

    bool rejected = false;
    switch (view) {
    case render::ChartView::Line:
        rejected = !frame.series.empty() && frame.seriesPath.empty();
        break;
    case render::ChartView::Candles:
        rejected = frame.dataState == render::DataState::Live && (!snapshot.history.empty() || snapshot.current) &&
                   frame.candles.empty();
        break;
    case render::ChartView::Book:
        rejected = !book.empty() && frame.ladder.empty();
        break;
    }
    if (rejected) {
        metrics::Registry::instance().incrementCounter("render_input_rejected");
        LOG_DEBUG(logging::LogCategory::RENDER,
                  "Empty %s projection for %s at %ux%u",
                  viewName(view),
                  snapshot.entryId.c_str(),
                  width,
                  height);
    }
    return frame;
}

std::size_t WatchlistCoordinator::loadFrom(const adapters::storage::IWatchlistStore& store) {
    std::size_t added = 0;
    for (const auto& entry : store.list()) {
        if (add(entry)) {
            ++added;
        }
    }
    LOG_INFO(kLogCategory, "Loaded %zu watchlist entries", added);
    return added;
}

void WatchlistCoordinator::startRenderLoop(std::function<void()> onTick) {
    LOG_GUARD(scheduler_ != nullptr, logging::LogCategory::RENDER, "No scheduler for the render loop");
    renderTask_.cancel();
    renderTask_ = scheduler_->scheduleEvery(options_.renderInterval, std::move(onTick));
}

void WatchlistCoordinator::stop() {
    renderTask_.cancel();

    std::vector<Slot> slots;
    {
        std::unique_lock<std::shared_mutex> lock(entriesMutex_);
        slots.reserve(entries_.size());
        for (auto& [id, slot] : entries_) {
            slots.push_back(std::move(slot));
        }
        entries_.clear();
        order_.clear();
        focused_.reset();
    }

    for (auto& slot : slots) {
        slot.series->invalidate();
        slot.subscription.cancel();
    }
    if (!slots.empty()) {
        metrics::Registry::instance().addGauge("entries_active", -static_cast<double>(slots.size()));
        LOG_INFO(kLogCategory, "Stopped %zu watchlist entries", slots.size());
    }
}

}  // namespace lmv::app
