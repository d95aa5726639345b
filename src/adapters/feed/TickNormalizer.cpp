#include "adapters/feed/TickNormalizer.hpp"

#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/json/parse.hpp>

#include "common/Metrics.hpp"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace lmv::adapters::feed {

namespace {

domain::MalformedTickError make_error(const std::string& message) {
    return domain::MalformedTickError("TickNormalizer: " + message);
}

boost::json::value parse_json(std::string_view text) {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw make_error("invalid JSON: " + ec.message());
    }
    return json;
}

std::optional<double> json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        char* end = nullptr;
        const double parsed = std::strtod(str.c_str(), &end);
        if (str.empty() || end != str.c_str() + str.size()) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::optional<double> optional_number(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    auto parsed = json_to_double(*value);
    if (!parsed || !std::isfinite(*parsed) || *parsed < 0.0) {
        LOG_DEBUG(logging::LogCategory::FEED, "Ignoring invalid optional field '%s'", key);
        return std::nullopt;
    }
    return parsed;
}

double required_number(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (!value || value->is_null()) {
        throw make_error(std::string("missing field '") + key + "'");
    }
    auto parsed = json_to_double(*value);
    if (!parsed || !std::isfinite(*parsed)) {
        throw make_error(std::string("field '") + key + "' is not a number");
    }
    return *parsed;
}

const boost::json::value* first_of(const boost::json::object& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const auto* value = obj.if_contains(key); value && !value->is_null()) {
            return value;
        }
    }
    return nullptr;
}

// YYYY-MM-DDTHH:MM:SS[.fff]Z
std::optional<domain::TimestampMs> parse_iso8601(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return std::nullopt;
    }
    long long millis = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits < 3) {
            millis *= 10;
            ++digits;
        }
    }
    if (pos != text.size() && !(pos + 1 == text.size() && (text[pos] == 'Z' || text[pos] == 'z'))) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
#if defined(_WIN32)
    const std::time_t seconds = _mkgmtime(&tm);
#else
    const std::time_t seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<domain::TimestampMs>(seconds) * 1000 + millis;
}

std::optional<domain::TradeSide> parse_side(const boost::json::object& obj) {
    const auto* value = obj.if_contains("side");
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    const std::string side{value->as_string().c_str()};
    if (side == "buy" || side == "BUY" || side == "b") {
        return domain::TradeSide::Buy;
    }
    if (side == "sell" || side == "SELL" || side == "s") {
        return domain::TradeSide::Sell;
    }
    return std::nullopt;
}

domain::Candle candle_from_json(const boost::json::value& value) {
    domain::Candle candle;
    if (value.is_array()) {
        const auto& row = value.as_array();
        if (row.size() < 5) {
            throw make_error("candle row too short");
        }
        candle.periodStart = TickNormalizer::parseTimestamp(row.at(0));
        auto field = [&](std::size_t i) {
            auto parsed = json_to_double(row.at(i));
            if (!parsed) {
                throw make_error("candle row field is not a number");
            }
            return *parsed;
        };
        candle.open = field(1);
        candle.high = field(2);
        candle.low = field(3);
        candle.close = field(4);
        candle.volume = row.size() > 5 ? field(5) : 0.0;
    }
    else if (value.is_object()) {
        const auto& obj = value.as_object();
        const auto* time = first_of(obj, {"periodStart", "timestamp", "time", "openTime"});
        if (!time) {
            throw make_error("candle without period start");
        }
        candle.periodStart = TickNormalizer::parseTimestamp(*time);
        candle.open = required_number(obj, "open");
        candle.high = required_number(obj, "high");
        candle.low = required_number(obj, "low");
        candle.close = required_number(obj, "close");
        candle.volume = optional_number(obj, "volume").value_or(0.0);
    }
    else {
        throw make_error("candle is neither object nor array");
    }
    candle.complete = false;
    return candle;
}

}  // namespace

domain::TimestampMs TickNormalizer::parseTimestamp(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        const auto u = value.as_uint64();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<domain::TimestampMs>::max())) {
            throw make_error("timestamp out of range");
        }
        return static_cast<domain::TimestampMs>(u);
    }
    if (value.is_double()) {
        const double d = value.as_double();
        if (!std::isfinite(d)) {
            throw make_error("timestamp is not finite");
        }
        // [-2^63, 2^63): every double in it rounds to a representable value.
        constexpr double kLimit = 9223372036854775808.0;
        if (d < -kLimit || d >= kLimit) {
            throw make_error("timestamp out of range");
        }
        return static_cast<domain::TimestampMs>(std::llround(d));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        if (auto iso = parse_iso8601(str)) {
            return *iso;
        }
        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(str.c_str(), &end, 10);
        if (!str.empty() && errno == 0 && end == str.c_str() + str.size()) {
            return parsed;
        }
        throw make_error("unparseable timestamp '" + str + "'");
    }
    throw make_error("unsupported timestamp type");
}

domain::QuoteSample TickNormalizer::fromQuoteJson(const boost::json::value& json) {
    if (!json.is_object()) {
        throw make_error("quote is not an object");
    }
    const auto& obj = json.as_object();

    domain::QuoteSample sample;
    const auto* time = first_of(obj, {"timestamp", "ts", "time"});
    if (!time) {
        throw make_error("missing field 'timestamp'");
    }
    sample.timestamp = parseTimestamp(*time);

    const auto* priceField = first_of(obj, {"price", "last"});
    if (!priceField) {
        throw make_error("missing field 'price'");
    }
    auto price = json_to_double(*priceField);
    if (!price || !std::isfinite(*price) || *price <= 0.0) {
        throw make_error("field 'price' is not a positive number");
    }
    sample.price = *price;

    sample.bid = optional_number(obj, "bid");
    sample.ask = optional_number(obj, "ask");
    sample.volume = optional_number(obj, "volume");
    sample.volume24h = optional_number(obj, "volume24h");
    sample.side = parse_side(obj);
    return sample;
}

domain::QuoteSample TickNormalizer::fromQuoteText(std::string_view body) {
    return fromQuoteJson(parse_json(body));
}

std::vector<domain::QuoteSample> TickNormalizer::fromPushMessage(std::string_view payload) {
    auto json = parse_json(payload);

    const boost::json::value* body = &json;
    if (json.is_object()) {
        const auto& obj = json.as_object();
        if (const auto* type = obj.if_contains("type"); type && type->is_string()) {
            const std::string kind{type->as_string().c_str()};
            if (kind != "ticker" && kind != "quote" && kind != "trade") {
                return {};
            }
        }
        if (const auto* data = obj.if_contains("data"); data && !data->is_null()) {
            body = data;
        }
    }

    std::vector<domain::QuoteSample> samples;
    if (!body->is_array()) {
        samples.push_back(fromQuoteJson(*body));
        return samples;
    }

    const auto& items = body->as_array();
    samples.reserve(items.size());
    for (const auto& item : items) {
        try {
            samples.push_back(fromQuoteJson(item));
        }
        catch (const domain::MalformedTickError& ex) {
            metrics::Registry::instance().incrementCounter("ticks_malformed");
            LOG_WARN(logging::LogCategory::FEED, "Dropping malformed tick in batch: %s", ex.what());
        }
    }
    return samples;
}

std::vector<domain::Candle> TickNormalizer::candlesFromText(std::string_view body) {
    auto json = parse_json(body);
    const boost::json::value* rows = &json;
    if (json.is_object()) {
        const auto& obj = json.as_object();
        rows = first_of(obj, {"candles", "data"});
        if (!rows) {
            throw make_error("candle response without 'candles'");
        }
    }
    if (!rows->is_array()) {
        throw make_error("candle response is not an array");
    }

    std::vector<domain::Candle> candles;
    candles.reserve(rows->as_array().size());
    for (const auto& row : rows->as_array()) {
        candles.push_back(candle_from_json(row));
    }
    return candles;
}

}  // namespace lmv::adapters::feed
