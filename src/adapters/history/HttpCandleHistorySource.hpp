#pragma once

#include "adapters/history/ICandleHistorySource.hpp"
#include "infra/http/HttpClient.hpp"

namespace lmv::adapters::history {

// POST /market-data {venue, symbol, granularity, startTime, endTime, limit}
class HttpCandleHistorySource : public ICandleHistorySource {
public:
    explicit HttpCandleHistorySource(infra::http::Endpoint endpoint, int timeoutSec = 15);

    std::vector<domain::Candle> fetchCandles(const CandleRequest& request) override;

    static std::string buildBody(const CandleRequest& request);
    // A candle is complete once its period ended at or before `endTime`.
    static void markCompleted(std::vector<domain::Candle>& candles,
                              domain::Granularity granularity,
                              domain::TimestampMs endTime);

private:
    infra::http::Endpoint endpoint_;
    int timeoutSec_;
};

}  // namespace lmv::adapters::history
