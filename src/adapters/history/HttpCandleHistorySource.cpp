#include "adapters/history/HttpCandleHistorySource.hpp"

#include <algorithm>
#include <cstdint>

#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

#include "adapters/feed/TickNormalizer.hpp"
#include "logging/Log.h"

namespace lmv::adapters::history {

HttpCandleHistorySource::HttpCandleHistorySource(infra::http::Endpoint endpoint, int timeoutSec)
    : endpoint_(std::move(endpoint)), timeoutSec_(timeoutSec) {}

std::string HttpCandleHistorySource::buildBody(const CandleRequest& request) {
    boost::json::object body;
    body["venue"] = request.venue;
    body["symbol"] = request.symbol;
    body["granularity"] = domain::granularity_label(request.granularity);
    body["startTime"] = request.startTime;
    body["endTime"] = request.endTime;
    body["limit"] = static_cast<std::uint64_t>(request.limit);
    return boost::json::serialize(body);
}

void HttpCandleHistorySource::markCompleted(std::vector<domain::Candle>& candles,
                                            domain::Granularity granularity,
                                            domain::TimestampMs endTime) {
    for (auto& candle : candles) {
        candle.complete = candle.periodStart + granularity.ms <= endTime;
    }
}

std::vector<domain::Candle> HttpCandleHistorySource::fetchCandles(const CandleRequest& request) {
    const auto response = infra::http::post_json(endpoint_, "/market-data", buildBody(request), timeoutSec_);
    auto candles = feed::TickNormalizer::candlesFromText(response);

    std::sort(candles.begin(), candles.end(),
              [](const domain::Candle& a, const domain::Candle& b) { return a.periodStart < b.periodStart; });
    if (request.limit > 0 && candles.size() > request.limit) {
        candles.erase(candles.begin(), candles.end() - static_cast<std::ptrdiff_t>(request.limit));
    }
    markCompleted(candles, request.granularity, request.endTime);
    LOG_DEBUG(logging::LogCategory::NET, "Fetched %zu %s candles for %s:%s", candles.size(),
              domain::granularity_label(request.granularity).c_str(), request.venue.c_str(), request.symbol.c_str());
    return candles;
}

}  // namespace lmv::adapters::history
