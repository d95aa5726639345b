#include "adapters/feed/HttpQuoteFetcher.hpp"

#include "adapters/feed/TickNormalizer.hpp"

namespace lmv::adapters::feed {

HttpQuoteFetcher::HttpQuoteFetcher(infra::http::Endpoint endpoint, int timeoutSec)
    : endpoint_(std::move(endpoint)), timeoutSec_(timeoutSec) {}

std::string HttpQuoteFetcher::buildTarget(const std::string& venue, const std::string& symbol) {
    return "/market-data?venue=" + infra::http::url_encode(venue) + "&symbol=" + infra::http::url_encode(symbol) +
           "&forceRefresh=true";
}

domain::QuoteSample HttpQuoteFetcher::fetch(const std::string& venue, const std::string& symbol) {
    const std::string body = infra::http::get_json(endpoint_, buildTarget(venue, symbol), timeoutSec_);
    return TickNormalizer::fromQuoteText(body);
}

}  // namespace lmv::adapters::feed
