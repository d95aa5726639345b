#include "core/QuoteAggregator.h"

#include <algorithm>
#include <limits>

namespace lmv::core {

std::optional<AggregatedQuote> aggregateQuotes(const std::string& symbol, const std::vector<VenueQuote>& quotes) {
    if (quotes.empty()) {
        return std::nullopt;
    }

    AggregatedQuote out;
    out.symbol = symbol;
    out.venues = quotes.size();
    out.low = std::numeric_limits<double>::max();

    double weightedLast = 0.0;
    double plainLast = 0.0;
    double changeSum = 0.0;
    for (const auto& quote : quotes) {
        if (quote.bid && (!out.bestBid || *quote.bid > *out.bestBid)) {
            out.bestBid = quote.bid;
        }
        if (quote.ask && *quote.ask > 0.0 && (!out.bestAsk || *quote.ask < *out.bestAsk)) {
            out.bestAsk = quote.ask;
        }
        out.high = std::max(out.high, quote.high);
        if (quote.low > 0.0) {
            out.low = std::min(out.low, quote.low);
        }
        out.volume += std::max(quote.volume, 0.0);
        weightedLast += quote.last * std::max(quote.volume, 0.0);
        plainLast += quote.last;
        changeSum += quote.changePercent;
        out.timestamp = std::max(out.timestamp, quote.timestamp);
    }

    const auto count = static_cast<double>(quotes.size());
    out.last = out.volume > 0.0 ? weightedLast / out.volume : plainLast / count;
    out.changePercent = changeSum / count;
    if (out.low == std::numeric_limits<double>::max()) {
        out.low = 0.0;
    }
    return out;
}

}  // namespace lmv::core
