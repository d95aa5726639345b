#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::adapters::history {

struct CandleRequest {
    std::string venue;
    std::string symbol;
    domain::Granularity granularity{};
    domain::TimestampMs startTime{0};
    domain::TimestampMs endTime{0};
    std::size_t limit{0};
};

// Candles ordered by period start. The last one may be the period still open
// at `endTime`, returned with `complete` false. Throws domain::TransportError
// on fetch failure and domain::MalformedTickError on an unusable payload.
class ICandleHistorySource {
public:
    virtual ~ICandleHistorySource() = default;
    virtual std::vector<domain::Candle> fetchCandles(const CandleRequest& request) = 0;
};

}  // namespace lmv::adapters::history
