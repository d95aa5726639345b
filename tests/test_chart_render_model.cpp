#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "core/RollingTickBuffer.h"
#include "core/SeriesSnapshot.h"
#include "core/SyntheticOrderBook.h"
#include "render/ChartRenderModel.h"
#include "render/PriceAxis.h"

using namespace lmv;
using render::ChartRenderModel;
using render::ChartView;
using render::DataState;
using render::LadderSide;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

domain::Candle candle(long long start, double o, double h, double l, double c, bool complete = true) {
    domain::Candle out;
    out.periodStart = start;
    out.open = o;
    out.high = h;
    out.low = l;
    out.close = c;
    out.volume = 1.0;
    out.complete = complete;
    return out;
}

domain::Tick tickAt(long long ts, double price, domain::TradeSide side) {
    domain::Tick tick;
    tick.timestamp = ts;
    tick.price = price;
    tick.side = side;
    return tick;
}

void seriesProjection(const ChartRenderModel& model) {
    core::RollingTickBuffer buffer(3);
    buffer.push(tickAt(1'000, 10.0, domain::TradeSide::Buy));
    buffer.push(tickAt(2'000, 9.0, domain::TradeSide::Sell));
    buffer.push(tickAt(3'000, std::numeric_limits<double>::quiet_NaN(), domain::TradeSide::Buy));
    buffer.push(tickAt(4'000, 11.0, domain::TradeSide::Buy));

    const auto fromView = model.toSeries(buffer.view());
    const auto fromVector = model.toSeries(buffer.snapshot());
    expect(fromView == fromVector, "view and vector projections agree");
    expect(fromView.size() == 2, "non-finite prices skipped");
    if (fromView.size() == 2) {
        expect(fromView[0].x == 2'000 && fromView[0].y == 9.0 && fromView[0].tag == domain::TradeSide::Sell,
               "points carry timestamp, price and side");
    }
    expect(model.toSeries(buffer.view()) == fromView, "toSeries is idempotent");

    const auto path = model.projectSeries(fromView, 100.f, 50.f);
    expect(path.size() == 2, "one screen point per series point");
    if (path.size() == 2) {
        expect(path[0].x == 0.f && path[1].x == 100.f, "series spans the canvas width");
        expect(path[0].y == 50.f && path[1].y == 0.f, "min price at bottom, max at top");
    }
    expect(model.projectSeries(fromView, 0.f, 50.f).empty(), "empty canvas yields no path");
}

void candleGeometry(const ChartRenderModel& model) {
    const std::vector<domain::Candle> candles = {
        candle(0, 100.0, 110.0, 90.0, 105.0),
        candle(60'000, 105.0, 120.0, 100.0, 102.0, false),
    };
    const auto layout = model.toCandleGeometry(candles, 300.f, 300.f);
    expect(layout.candles.size() == 2, "both candles laid out");
    expect(layout.priceMin == 90.0 && layout.priceMax == 120.0, "framing is [min low, max high]");
    if (layout.candles.size() == 2) {
        const auto& a = layout.candles[0];
        expect(a.x == 75.f, "first candle centred in its slot");
        expect(a.bodyTop == 150.f && a.bodyBottom == 200.f, "body spans open and close");
        expect(a.wickTop == 100.f && a.wickBottom == 300.f, "wick spans high and low");
        expect(a.bullish && a.complete, "rising complete candle");
        const auto& b = layout.candles[1];
        expect(b.wickTop == 0.f, "highest high touches the top edge");
        expect(!b.bullish && !b.complete, "falling in-progress candle");
    }
    const auto again = model.toCandleGeometry(candles, 300.f, 300.f);
    expect(again.candles == layout.candles, "toCandleGeometry is idempotent");

    const std::vector<domain::Candle> windowed = {
        candle(0, 1.0, 1000.0, 1.0, 2.0),
        candle(60'000, 100.0, 110.0, 90.0, 105.0),
        candle(120'000, 105.0, 120.0, 100.0, 102.0),
    };
    const auto narrow = model.toCandleGeometry(windowed, 6.f, 100.f);
    expect(narrow.candles.size() == 2, "only candles that fit are laid out");
    expect(narrow.priceMin == 90.0 && narrow.priceMax == 120.0, "framing ignores candles outside the window");

    expect(model.toCandleGeometry({}, 300.f, 300.f).empty(), "no candles yields empty layout");
    expect(model.toCandleGeometry(candles, 0.f, 300.f).empty(), "zero width yields empty layout");
    expect(model.toCandleGeometry({candle(0, 5.0, 4.0, 3.0, 4.5)}, 300.f, 300.f).empty(),
           "inconsistent candle yields empty layout");

    const auto flat = model.toCandleGeometry({candle(0, 5.0, 5.0, 5.0, 5.0)}, 300.f, 300.f);
    expect(flat.candles.size() == 1 && flat.priceMax > flat.priceMin, "flat candle still gets a scale");
    if (!flat.candles.empty()) {
        expect(flat.candles[0].bodyBottom - flat.candles[0].bodyTop >= 1.f, "doji keeps a visible body");
    }
}

void ladderRows(const ChartRenderModel& model) {
    const core::SyntheticOrderBook generator;
    const auto book = generator.generate(100.0, 3);
    const auto rows = model.toLadderRows(book);
    expect(rows.size() == 6, "one row per level");
    if (rows.size() == 6) {
        expect(rows[0].side == LadderSide::Ask && rows[0].price == book.asks[2].price, "highest ask first");
        expect(rows[2].price == book.asks[0].price, "best ask just above the spread");
        expect(rows[3].side == LadderSide::Bid && rows[3].price == book.bids[0].price, "best bid just below spread");
        expect(rows[5].price == book.bids[2].price, "lowest bid last");
        expect(rows[2].cumulative == book.asks[0].volume, "ask cumulative starts at the spread");
        expect(rows[3].cumulative == book.bids[0].volume, "bid cumulative starts at the spread");
        expect(rows[0].depthRatio == 1.0f && rows[5].depthRatio == 1.0f, "outermost rows span the full bar");
        expect(rows[2].depthRatio > 0.0f && rows[2].depthRatio < 1.0f, "inner rows are partial bars");
        expect(rows[0].notional == rows[0].price * rows[0].volume, "notional is price times volume");
    }
    expect(model.toLadderRows(book) == rows, "toLadderRows is idempotent");

    core::OrderBook broken = book;
    broken.bids[1].volume = -1.0;
    expect(model.toLadderRows(broken).empty(), "negative volume yields no rows");
    expect(model.toLadderRows(core::OrderBook{}).empty(), "empty book yields no rows");
}

void frames(const ChartRenderModel& model) {
    core::SeriesSnapshot snapshot;
    snapshot.entryId = "binance:btcusdt";
    snapshot.title = "binance:BTCUSDT";
    snapshot.granularity = domain::Granularity{domain::kMinuteMs};
    snapshot.status = domain::EntryStatus::Active;
    snapshot.connection = domain::ConnectionState::Connected;

    auto frame = model.buildFrame(snapshot, ChartView::Line, 400, 200, {});
    expect(frame.dataState == DataState::Empty, "no data is the empty state");
    expect(frame.stateMessage == "waiting for data", "empty state message");

    snapshot.status = domain::EntryStatus::Subscribing;
    snapshot.connection = domain::ConnectionState::Reconnecting;
    frame = model.buildFrame(snapshot, ChartView::Line, 400, 200, {});
    expect(frame.stateMessage == "waiting for data (connecting)", "subscribing shows connecting");

    snapshot.status = domain::EntryStatus::Active;
    snapshot.connection = domain::ConnectionState::Connected;
    snapshot.ticks = {tickAt(1'000, 10.0, domain::TradeSide::Buy), tickAt(2'000, 12.0, domain::TradeSide::Buy)};
    snapshot.history = {candle(0, 10.0, 12.0, 9.0, 11.0)};
    snapshot.current = candle(60'000, 11.0, 12.0, 11.0, 12.0, false);

    frame = model.buildFrame(snapshot, ChartView::Candles, 400, 200, {});
    expect(frame.dataState == DataState::Live, "data present is live");
    expect(frame.candles.candles.size() == 2, "history plus current candle drawn");
    expect(!frame.priceAxis.empty(), "price axis produced");
    expect(frame.lastPrice && *frame.lastPrice == 12.0, "last price from newest tick");
    expect(frame.stateMessage.empty(), "live connected frame has no message");
    expect(frame.granularity == "1m", "granularity label");

    const auto repeat = model.buildFrame(snapshot, ChartView::Candles, 400, 200, {});
    expect(repeat.candles.candles == frame.candles.candles && repeat.series == frame.series,
           "identical input yields identical frame");

    snapshot.aggregation = core::AggregationStatus::InsufficientHistory;
    snapshot.connection = domain::ConnectionState::Failed;
    frame = model.buildFrame(snapshot, ChartView::Candles, 400, 200, {});
    expect(frame.dataState == DataState::InsufficientHistory, "insufficient history surfaced");
    expect(frame.candles.empty(), "no partial candles rendered");
    expect(frame.stateMessage == "not enough data (connection failed, retrying)", "insufficient history message");

    snapshot.aggregation = core::AggregationStatus::Ok;
    snapshot.connection = domain::ConnectionState::Connected;
    const core::SyntheticOrderBook generator;
    frame = model.buildFrame(snapshot, ChartView::Book, 400, 200, generator.generate(12.0, 5));
    expect(frame.ladder.size() == 10, "book view carries ladder rows");
    expect(frame.candles.empty() && frame.series.empty(), "book view skips other projections");
}

void priceAxis(const ChartRenderModel& model) {
    const auto scale = render::buildPriceScale(0.0, 10.0);
    expect(scale.step > 0.0 && scale.ticks.size() >= 4 && scale.ticks.size() <= 12, "nice scale tick count");
    expect(render::buildPriceScale(5.0, 5.0).ticks.empty(), "empty range yields no ticks");

    expect(scale.step == 2.0 && scale.ticks.size() == 6, "0..10 splits into steps of 2");
    expect(scale.ticks.front() == 0.0 && scale.ticks.back() == 10.0, "gridlines cover both ends");
    const auto wider = render::buildPriceScale(90.0, 120.0);
    expect(wider.step == 5.0 && wider.ticks.size() == 7, "90..120 splits into steps of 5");
    expect(render::computePriceDecimals(0.001) == 5, "decimals follow the step");
    expect(render::formatPrice(2.5, 3) == "2.50", "trailing zeros trimmed to two decimals");
    expect(render::formatTimeLabel(3'661'000) == "01:01:01", "time label in UTC");

    const auto marks = model.toPriceAxis(90.0, 120.0, 300.f);
    expect(!marks.empty(), "axis marks produced");
    for (const auto& mark : marks) {
        expect(mark.y >= 0.f && mark.y <= 300.f, "marks inside the canvas");
        expect(!mark.text.empty(), "marks labelled");
    }
    expect(model.toPriceAxis(90.0, 120.0, 0.f).empty(), "zero height yields no marks");
}

}  // namespace

int main() {
    const ChartRenderModel model;
    seriesProjection(model);
    candleGeometry(model);
    ladderRows(model);
    frames(model);
    priceAxis(model);

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_chart_render_model passed\n";
    return 0;
}
