#pragma once

#include <string>

#include "domain/Types.h"

namespace lmv::adapters::feed {

// One request/response round trip for the latest quote.
// Throws domain::TransportError or domain::MalformedTickError.
class IQuoteFetcher {
public:
    virtual ~IQuoteFetcher() = default;
    virtual domain::QuoteSample fetch(const std::string& venue, const std::string& symbol) = 0;
};

}  // namespace lmv::adapters::feed
