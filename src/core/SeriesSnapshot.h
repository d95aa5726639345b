#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/CandleAggregator.h"
#include "domain/Types.h"

namespace lmv::core {

// Copy of one watchlist entry's state, detached from the live buffers.
struct SeriesSnapshot {
    std::string entryId;
    std::string title;
    domain::Granularity granularity{};
    domain::ConnectionState connection{domain::ConnectionState::Reconnecting};
    domain::EntryStatus status{domain::EntryStatus::Idle};
    AggregationStatus aggregation{AggregationStatus::Ok};
    std::vector<domain::Tick> ticks;
    std::vector<domain::Candle> history;
    std::optional<domain::Candle> current;

    // Completed candles followed by the in-progress one.
    std::vector<domain::Candle> visibleCandles() const {
        std::vector<domain::Candle> out;
        out.reserve(history.size() + 1);
        out.insert(out.end(), history.begin(), history.end());
        if (current) {
            out.push_back(*current);
        }
        return out;
    }
};

}  // namespace lmv::core
