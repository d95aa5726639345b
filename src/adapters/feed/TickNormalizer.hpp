#pragma once

#include <string_view>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace lmv::adapters::feed {

// Maps market-data payloads onto QuoteSample / Candle. Throws
// domain::MalformedTickError when a required field is missing or invalid.
class TickNormalizer {
public:
    // {timestamp, price, bid?, ask?, volume?, volume24h?, side?}
    static domain::QuoteSample fromQuoteJson(const boost::json::value& json);
    static domain::QuoteSample fromQuoteText(std::string_view body);

    // A quote object, an array of quotes, or an envelope {"type", "data"}.
    // Malformed entries inside a batch are skipped and counted.
    static std::vector<domain::QuoteSample> fromPushMessage(std::string_view payload);

    // Array of {periodStart|timestamp, open, high, low, close, volume} objects
    // or [time, open, high, low, close, volume] rows, optionally wrapped in
    // {"candles": [...]}. Candles come back with `complete` unset; only the
    // caller knows which period was still open.
    static std::vector<domain::Candle> candlesFromText(std::string_view body);

    // Epoch millis as a number, a numeric string or ISO-8601. Values outside
    // the int64 range are malformed.
    static domain::TimestampMs parseTimestamp(const boost::json::value& value);
};

}  // namespace lmv::adapters::feed
