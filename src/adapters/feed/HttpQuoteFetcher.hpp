#pragma once

#include <string>

#include "adapters/feed/IQuoteFetcher.hpp"
#include "infra/http/HttpClient.hpp"

namespace lmv::adapters::feed {

// GET /market-data?venue=&symbol=&forceRefresh=true
class HttpQuoteFetcher : public IQuoteFetcher {
public:
    explicit HttpQuoteFetcher(infra::http::Endpoint endpoint, int timeoutSec = 10);

    domain::QuoteSample fetch(const std::string& venue, const std::string& symbol) override;

    static std::string buildTarget(const std::string& venue, const std::string& symbol);

private:
    infra::http::Endpoint endpoint_;
    int timeoutSec_;
};

}  // namespace lmv::adapters::feed
