#pragma once

#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::app {

// Parses "venue:symbol[,venue:symbol...]". Entry ids are "venue:symbol" in
// lower case; malformed items and duplicates are skipped.
std::vector<domain::WatchlistEntry> parseWatchlistSeed(const std::string& csv, domain::TimestampMs addedAt);

// Timeframes bound to the digit keys 1..9; invalid for any other digit.
domain::Granularity granularityForDigit(int digit);

}  // namespace lmv::app
