#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "adapters/feed/ITickSource.h"
#include "adapters/history/ICandleHistorySource.hpp"
#include "adapters/storage/IWatchlistStore.hpp"
#include "app/LiveSeries.h"
#include "config/Config.h"
#include "core/QuoteAggregator.h"
#include "core/RefreshScheduler.h"
#include "core/SeriesSnapshot.h"
#include "core/SyntheticOrderBook.h"
#include "domain/Types.h"
#include "render/ChartRenderModel.h"
#include "render/RenderFrame.h"

namespace lmv::app {

struct CoordinatorOptions {
    std::size_t tickCapacity = 60;
    std::size_t candleHistory = 200;
    domain::Granularity granularity{domain::kMinuteMs};
    std::size_t backfillLimit = 200;
    std::size_t bookDepth = 10;
    double bookStepRatio = 0.001;
    std::chrono::milliseconds focusedInterval{2000};
    std::chrono::milliseconds backgroundInterval{5000};
    std::chrono::milliseconds renderInterval{1000};

    static CoordinatorOptions fromConfig(const config::Config& cfg);
};

// One row of the watchlist side panel.
struct EntryOverview {
    std::string id;
    std::string label;
    std::string granularity;
    std::optional<double> lastPrice;
    std::optional<double> changePercent;
    domain::ConnectionState connection{domain::ConnectionState::Reconnecting};
    domain::EntryStatus status{domain::EntryStatus::Idle};
    render::DataState dataState{render::DataState::Empty};
    bool focused{false};
};

/**
 * Owns every watchlist entry's live subscription and series state.
 *
 * Entry lifecycle: idle -> subscribing -> active <-> reconnecting/failed ->
 * removed. The entry map is guarded by a shared mutex held only for lookups
 * and structural changes; tick delivery locks the single entry it targets, so
 * unrelated symbols never wait on each other. Feed and backfill callbacks
 * hold a weak reference plus an epoch and become no-ops once their entry is
 * removed or re-added.
 */
class WatchlistCoordinator {
public:
    WatchlistCoordinator(std::shared_ptr<adapters::feed::ITickSource> source,
                         std::shared_ptr<core::RefreshScheduler> scheduler,
                         CoordinatorOptions options = {},
                         std::shared_ptr<adapters::history::ICandleHistorySource> history = nullptr);
    ~WatchlistCoordinator();

    WatchlistCoordinator(const WatchlistCoordinator&) = delete;
    WatchlistCoordinator& operator=(const WatchlistCoordinator&) = delete;

    // Returns false for a duplicate id or an entry without venue or symbol.
    bool add(const domain::WatchlistEntry& entry);
    bool remove(const std::string& id);

    // Re-points the entry's candles without touching its tick buffer.
    std::optional<core::AggregationStatus> setActiveGranularity(const std::string& id,
                                                                domain::Granularity granularity);

    bool setFocus(const std::string& id);
    // Cycles focus in insertion order.
    std::optional<std::string> focusNext();
    std::optional<std::string> focused() const;

    std::vector<EntryOverview> overview() const;
    std::optional<core::SeriesSnapshot> snapshot(const std::string& id) const;
    std::optional<domain::EntryStatus> status(const std::string& id) const;
    std::optional<core::AggregatedQuote> aggregatedQuote(const std::string& symbol) const;
    std::size_t size() const;

    // Frame for the focused entry; nullopt when the watchlist is empty.
    std::optional<render::RenderFrame> buildFrame(render::ChartView view, unsigned width, unsigned height) const;
    std::optional<render::RenderFrame> buildFrame(const std::string& id,
                                                  render::ChartView view,
                                                  unsigned width,
                                                  unsigned height) const;

    // Adds every stored entry. Returns the number added.
    std::size_t loadFrom(const adapters::storage::IWatchlistStore& store);

    // Runs `onTick` on the render cadence until stop().
    void startRenderLoop(std::function<void()> onTick);
    // Cancels the render loop and every subscription. Idempotent.
    void stop();

    const CoordinatorOptions& options() const noexcept { return options_; }

private:
    struct Slot {
        std::shared_ptr<LiveSeries> series;
        adapters::feed::Subscription subscription;
    };

    std::shared_ptr<LiveSeries> find_(const std::string& id) const;
    void requestBackfill_(const std::shared_ptr<LiveSeries>& series);
    void applyIntervalsLocked_();
    render::RenderFrame frameFor_(const LiveSeries& series,
                                  render::ChartView view,
                                  unsigned width,
                                  unsigned height) const;

    std::shared_ptr<adapters::feed::ITickSource> source_;
    std::shared_ptr<core::RefreshScheduler> scheduler_;
    std::shared_ptr<adapters::history::ICandleHistorySource> history_;
    CoordinatorOptions options_;
    render::ChartRenderModel model_;
    core::SyntheticOrderBook book_;

    mutable std::shared_mutex entriesMutex_;
    std::unordered_map<std::string, Slot> entries_;
    std::vector<std::string> order_;
    std::optional<std::string> focused_;

    core::TaskHandle renderTask_;
    // History fetches block; they never share threads with the render tick.
    std::unique_ptr<core::RefreshScheduler> backfill_;
};

}  // namespace lmv::app
