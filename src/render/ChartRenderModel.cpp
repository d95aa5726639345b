#include "render/ChartRenderModel.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "render/PriceAxis.h"

namespace lmv::render {

namespace {

constexpr float kMinPxPerCandle = 3.0f;
constexpr float kPriceLabelMinSpacingPx = 14.0f;

bool finiteCanvas(float width, float height) {
    return std::isfinite(width) && std::isfinite(height) && width > 0.0f && height > 0.0f;
}

float priceToY(double price, double minPrice, float pxPerPrice, float canvasHeight) {
    const double offset = (price - minPrice) * static_cast<double>(pxPerPrice);
    return static_cast<float>(static_cast<double>(canvasHeight) - offset);
}

// Widens a zero-height range so that a flat series still has a scale.
void ensureRange(double& minPrice, double& maxPrice) {
    if (maxPrice > minPrice) {
        return;
    }
    const double reference = (maxPrice + minPrice) * 0.5;
    const double padding = std::max(std::abs(reference) * 0.001, 1e-6);
    minPrice = reference - padding;
    maxPrice = reference + padding;
}

bool consistentCandle(const domain::Candle& c) {
    if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) || !std::isfinite(c.close)) {
        return false;
    }
    return c.low <= std::min(c.open, c.close) && c.high >= std::max(c.open, c.close);
}

const char* connectionMessage(domain::ConnectionState state) {
    switch (state) {
    case domain::ConnectionState::Connected:
        return "";
    case domain::ConnectionState::Reconnecting:
        return "reconnecting";
    case domain::ConnectionState::Failed:
        return "connection failed, retrying";
    }
    return "";
}

}  // namespace

ChartRenderModel::ChartRenderModel(float candleWidthRatio, float minBodyHeight)
    : candleWidthRatio_(std::clamp(candleWidthRatio, 0.1f, 1.0f)),
      minBodyHeight_(std::max(minBodyHeight, 0.5f)) {}

std::vector<SeriesPoint> ChartRenderModel::toSeries(const std::vector<domain::Tick>& ticks) const {
    std::vector<SeriesPoint> points;
    points.reserve(ticks.size());
    for (const auto& tick : ticks) {
        if (!std::isfinite(tick.price)) {
            continue;
        }
        points.push_back(SeriesPoint{tick.timestamp, tick.price, tick.side});
    }
    return points;
}

std::vector<SeriesPoint> ChartRenderModel::toSeries(const core::TickWindow& ticks) const {
    std::vector<SeriesPoint> points;
    points.reserve(ticks.size());
    ticks.forEach([&points](const domain::Tick& tick) {
        if (std::isfinite(tick.price)) {
            points.push_back(SeriesPoint{tick.timestamp, tick.price, tick.side});
        }
    });
    return points;
}

std::vector<ScreenPoint> ChartRenderModel::projectSeries(const std::vector<SeriesPoint>& points,
                                                         float width,
                                                         float height) const {
    std::vector<ScreenPoint> out;
    if (points.empty() || !finiteCanvas(width, height)) {
        return out;
    }

    double minPrice = std::numeric_limits<double>::max();
    double maxPrice = std::numeric_limits<double>::lowest();
    for (const auto& p : points) {
        minPrice = std::min(minPrice, p.y);
        maxPrice = std::max(maxPrice, p.y);
    }
    ensureRange(minPrice, maxPrice);
    const float pxPerPrice = static_cast<float>(static_cast<double>(height) / (maxPrice - minPrice));

    const auto firstX = points.front().x;
    const auto spanX = points.back().x - firstX;
    out.reserve(points.size());
    for (const auto& p : points) {
        float x = width;
        if (spanX > 0) {
            x = static_cast<float>(static_cast<double>(p.x - firstX) / static_cast<double>(spanX) * width);
        }
        out.push_back(ScreenPoint{x, priceToY(p.y, minPrice, pxPerPrice, height), p.tag});
    }
    return out;
}

CandleLayout ChartRenderModel::toCandleGeometry(const std::vector<domain::Candle>& candles,
                                                float chartWidth,
                                                float chartHeight) const {
    CandleLayout layout;
    if (candles.empty() || !finiteCanvas(chartWidth, chartHeight)) {
        return layout;
    }

    const auto maxVisible = std::max<std::size_t>(1, static_cast<std::size_t>(std::floor(chartWidth / kMinPxPerCandle)));
    const std::size_t count = std::min(candles.size(), maxVisible);
    const std::size_t start = candles.size() - count;

    double minPrice = std::numeric_limits<double>::max();
    double maxPrice = std::numeric_limits<double>::lowest();
    for (std::size_t i = start; i < candles.size(); ++i) {
        const auto& candle = candles[i];
        if (!consistentCandle(candle)) {
            return layout;
        }
        minPrice = std::min(minPrice, candle.low);
        maxPrice = std::max(maxPrice, candle.high);
    }
    ensureRange(minPrice, maxPrice);

    layout.priceMin = minPrice;
    layout.priceMax = maxPrice;
    layout.pxPerCandle = chartWidth / static_cast<float>(count);
    layout.pxPerPrice = static_cast<float>(static_cast<double>(chartHeight) / (maxPrice - minPrice));
    if (!std::isfinite(layout.pxPerPrice) || layout.pxPerPrice <= 0.0f) {
        return CandleLayout{};
    }

    const float halfWidth = layout.pxPerCandle * candleWidthRatio_ * 0.5f;
    layout.candles.reserve(count);
    for (std::size_t local = 0; local < count; ++local) {
        const auto& candle = candles[start + local];
        CandleGeometry g;
        g.periodStart = candle.periodStart;
        g.x = layout.pxPerCandle * (0.5f + static_cast<float>(local));
        g.halfWidth = halfWidth;
        const float openY = priceToY(candle.open, minPrice, layout.pxPerPrice, chartHeight);
        const float closeY = priceToY(candle.close, minPrice, layout.pxPerPrice, chartHeight);
        g.bodyTop = std::min(openY, closeY);
        g.bodyBottom = g.bodyTop + std::max(std::abs(openY - closeY), minBodyHeight_);
        g.wickTop = priceToY(candle.high, minPrice, layout.pxPerPrice, chartHeight);
        g.wickBottom = priceToY(candle.low, minPrice, layout.pxPerPrice, chartHeight);
        g.bullish = candle.close >= candle.open;
        g.complete = candle.complete;
        layout.candles.push_back(g);
    }
    return layout;
}

std::vector<LadderRow> ChartRenderModel::toLadderRows(const core::OrderBook& book) const {
    std::vector<LadderRow> rows;
    rows.reserve(book.asks.size() + book.bids.size());

    // Cumulative volume runs outward from the spread on both sides.
    std::vector<core::BookLevel> asks = book.asks;
    std::sort(asks.begin(), asks.end(), [](const auto& a, const auto& b) { return a.price < b.price; });
    std::vector<core::BookLevel> bids = book.bids;
    std::sort(bids.begin(), bids.end(), [](const auto& a, const auto& b) { return a.price > b.price; });

    std::vector<LadderRow> askRows;
    askRows.reserve(asks.size());
    double cumulative = 0.0;
    for (const auto& level : asks) {
        if (!std::isfinite(level.price) || !std::isfinite(level.volume) || level.volume < 0.0) {
            return {};
        }
        cumulative += level.volume;
        askRows.push_back(LadderRow{LadderSide::Ask, level.price, level.volume, cumulative, level.price * level.volume, 0.0f});
    }
    const double askTotal = cumulative;

    cumulative = 0.0;
    for (auto it = askRows.rbegin(); it != askRows.rend(); ++it) {
        rows.push_back(*it);
    }
    for (const auto& level : bids) {
        if (!std::isfinite(level.price) || !std::isfinite(level.volume) || level.volume < 0.0) {
            return {};
        }
        cumulative += level.volume;
        rows.push_back(LadderRow{LadderSide::Bid, level.price, level.volume, cumulative, level.price * level.volume, 0.0f});
    }

    const double maxCumulative = std::max(askTotal, cumulative);
    if (maxCumulative > 0.0) {
        for (auto& row : rows) {
            row.depthRatio = static_cast<float>(row.cumulative / maxCumulative);
        }
    }
    return rows;
}

std::vector<PriceMark> ChartRenderModel::toPriceAxis(double priceMin, double priceMax, float chartHeight) const {
    std::vector<PriceMark> marks;
    if (!std::isfinite(chartHeight) || chartHeight <= 0.0f) {
        return marks;
    }
    const PriceScale scale = buildPriceScale(priceMin, priceMax);
    if (scale.ticks.empty()) {
        return marks;
    }
    const float pxPerPrice = static_cast<float>(static_cast<double>(chartHeight) / (priceMax - priceMin));
    float lastY = std::numeric_limits<float>::quiet_NaN();
    for (double tick : scale.ticks) {
        const float y = priceToY(tick, priceMin, pxPerPrice, chartHeight);
        if (y < 0.0f || y > chartHeight) {
            continue;
        }
        if (!std::isnan(lastY) && std::abs(lastY - y) < kPriceLabelMinSpacingPx) {
            continue;
        }
        lastY = y;
        marks.push_back(PriceMark{y, tick, formatPrice(tick, scale.decimals)});
    }
    return marks;
}

RenderFrame ChartRenderModel::buildFrame(const core::SeriesSnapshot& snapshot,
                                         ChartView view,
                                         unsigned width,
                                         unsigned height,
                                         const core::OrderBook& book) const {
    RenderFrame frame;
    frame.entryId = snapshot.entryId;
    frame.title = snapshot.title;
    frame.granularity = domain::granularity_label(snapshot.granularity);
    frame.connection = snapshot.connection;
    frame.status = snapshot.status;
    frame.view = view;
    frame.width = width;
    frame.height = height;
    if (!snapshot.ticks.empty()) {
        frame.lastPrice = snapshot.ticks.back().price;
    }

    const auto w = static_cast<float>(width);
    const auto h = static_cast<float>(height);
    frame.dataState = snapshot.ticks.empty() && snapshot.history.empty() ? DataState::Empty : DataState::Live;

    switch (view) {
    case ChartView::Line: {
        frame.series = toSeries(snapshot.ticks);
        frame.seriesPath = projectSeries(frame.series, w, h);
        if (!frame.series.empty()) {
            double lo = std::numeric_limits<double>::max();
            double hi = std::numeric_limits<double>::lowest();
            for (const auto& p : frame.series) {
                lo = std::min(lo, p.y);
                hi = std::max(hi, p.y);
            }
            ensureRange(lo, hi);
            frame.priceAxis = toPriceAxis(lo, hi, h);
        }
        break;
    }
    case ChartView::Candles: {
        if (snapshot.aggregation == core::AggregationStatus::InsufficientHistory) {
            frame.dataState = DataState::InsufficientHistory;
            break;
        }
        frame.candles = toCandleGeometry(snapshot.visibleCandles(), w, h);
        if (!frame.candles.empty()) {
            frame.priceAxis = toPriceAxis(frame.candles.priceMin, frame.candles.priceMax, h);
        }
        break;
    }
    case ChartView::Book:
        frame.ladder = toLadderRows(book);
        break;
    }

    std::string message;
    if (frame.dataState == DataState::Empty) {
        message = "waiting for data";
    }
    else if (frame.dataState == DataState::InsufficientHistory) {
        message = "not enough data";
    }
    const std::string connection =
        snapshot.status == domain::EntryStatus::Subscribing ? "connecting" : connectionMessage(snapshot.connection);
    if (!connection.empty()) {
        message = message.empty() ? connection : message + " (" + connection + ")";
    }
    frame.stateMessage = message;
    return frame;
}

}  // namespace lmv::render
