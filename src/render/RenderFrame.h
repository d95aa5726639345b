#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::render {

enum class ChartView { Line, Candles, Book };

enum class DataState { Empty, Live, InsufficientHistory };

struct SeriesPoint {
    domain::TimestampMs x{0};
    double y{0.0};
    domain::TradeSide tag{domain::TradeSide::Buy};

    bool operator==(const SeriesPoint& o) const { return x == o.x && y == o.y && tag == o.tag; }
};

struct ScreenPoint {
    float x{0.0f};
    float y{0.0f};
    domain::TradeSide tag{domain::TradeSide::Buy};

    bool operator==(const ScreenPoint& o) const { return x == o.x && y == o.y && tag == o.tag; }
};

struct CandleGeometry {
    domain::TimestampMs periodStart{0};
    float x{0.0f};
    float halfWidth{0.0f};
    float bodyTop{0.0f};
    float bodyBottom{0.0f};
    float wickTop{0.0f};
    float wickBottom{0.0f};
    bool bullish{false};
    bool complete{false};

    bool operator==(const CandleGeometry& o) const {
        return periodStart == o.periodStart && x == o.x && halfWidth == o.halfWidth && bodyTop == o.bodyTop &&
               bodyBottom == o.bodyBottom && wickTop == o.wickTop && wickBottom == o.wickBottom &&
               bullish == o.bullish && complete == o.complete;
    }
};

// Candle geometry plus the framing used to produce it.
struct CandleLayout {
    std::vector<CandleGeometry> candles;
    double priceMin{0.0};
    double priceMax{0.0};
    float pxPerCandle{0.0f};
    float pxPerPrice{0.0f};

    bool empty() const noexcept { return candles.empty(); }
};

enum class LadderSide { Ask, Bid };

struct LadderRow {
    LadderSide side{LadderSide::Bid};
    double price{0.0};
    double volume{0.0};
    double cumulative{0.0};
    double notional{0.0};
    float depthRatio{0.0f};

    bool operator==(const LadderRow& o) const {
        return side == o.side && price == o.price && volume == o.volume && cumulative == o.cumulative &&
               notional == o.notional && depthRatio == o.depthRatio;
    }
};

struct PriceMark {
    float y{0.0f};
    double price{0.0};
    std::string text;
};

struct RenderFrame {
    std::string entryId;
    std::string title;
    std::string granularity;
    domain::ConnectionState connection{domain::ConnectionState::Reconnecting};
    domain::EntryStatus status{domain::EntryStatus::Idle};
    DataState dataState{DataState::Empty};
    std::string stateMessage;
    ChartView view{ChartView::Line};
    unsigned width{0};
    unsigned height{0};
    std::optional<double> lastPrice;

    std::vector<SeriesPoint> series;
    std::vector<ScreenPoint> seriesPath;
    CandleLayout candles;
    std::vector<LadderRow> ladder;
    std::vector<PriceMark> priceAxis;
};

}  // namespace lmv::render
