#pragma once

#include <vector>

#include "core/RollingTickBuffer.h"
#include "core/SeriesSnapshot.h"
#include "core/SyntheticOrderBook.h"
#include "domain/Types.h"
#include "render/RenderFrame.h"

namespace lmv::render {

/**
 * Turns buffer, candle and book state into draw instructions.
 *
 * Every method is a pure function of its arguments: no I/O, no caches, no
 * state carried between calls. Inconsistent input (empty canvas, non-finite
 * prices, inverted candles) yields an empty result instead of an error so the
 * render loop keeps going.
 */
class ChartRenderModel {
public:
    explicit ChartRenderModel(float candleWidthRatio = 0.75f, float minBodyHeight = 1.0f);

    std::vector<SeriesPoint> toSeries(const std::vector<domain::Tick>& ticks) const;
    std::vector<SeriesPoint> toSeries(const core::TickWindow& ticks) const;

    // Maps series points onto a canvas, newest on the right edge.
    std::vector<ScreenPoint> projectSeries(const std::vector<SeriesPoint>& points, float width, float height) const;

    // Lays out the most recent candles that fit the width. The vertical range
    // is exactly [min low, max high] over the laid out candles.
    CandleLayout toCandleGeometry(const std::vector<domain::Candle>& candles, float chartWidth, float chartHeight) const;

    // Asks from highest to lowest price, then bids from highest to lowest.
    std::vector<LadderRow> toLadderRows(const core::OrderBook& book) const;

    std::vector<PriceMark> toPriceAxis(double priceMin, double priceMax, float chartHeight) const;

    RenderFrame buildFrame(const core::SeriesSnapshot& snapshot,
                           ChartView view,
                           unsigned width,
                           unsigned height,
                           const core::OrderBook& book) const;

private:
    float candleWidthRatio_;
    float minBodyHeight_;
};

}  // namespace lmv::render
