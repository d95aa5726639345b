#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::core {

struct VenueQuote {
    std::string venue;
    domain::TimestampMs timestamp{0};
    double last{0.0};
    std::optional<double> bid{};
    std::optional<double> ask{};
    double high{0.0};
    double low{0.0};
    double volume{0.0};
    double changePercent{0.0};
};

struct AggregatedQuote {
    std::string symbol;
    std::size_t venues{0};
    domain::TimestampMs timestamp{0};
    double last{0.0};
    std::optional<double> bestBid{};
    std::optional<double> bestAsk{};
    double high{0.0};
    double low{0.0};
    double volume{0.0};
    double changePercent{0.0};
};

// Combines one symbol's quotes from several venues: highest bid, lowest
// positive ask, volume weighted last price (plain mean without volume).
std::optional<AggregatedQuote> aggregateQuotes(const std::string& symbol, const std::vector<VenueQuote>& quotes);

}  // namespace lmv::core
