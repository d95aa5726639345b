#include "app/WatchlistSeed.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_set>

#include "logging/Log.h"

namespace lmv::app {

namespace {

std::string trimCopy(const std::string& s) {
    auto begin = s.begin();
    auto end = s.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin)) != 0) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1))) != 0) {
        --end;
    }
    return std::string(begin, end);
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}  // namespace

std::vector<domain::WatchlistEntry> parseWatchlistSeed(const std::string& csv, domain::TimestampMs addedAt) {
    std::vector<domain::WatchlistEntry> entries;
    std::unordered_set<std::string> seen;
    std::stringstream stream(csv);
    std::string item;
    domain::TimestampMs order = 0;
    while (std::getline(stream, item, ',')) {
        item = trimCopy(item);
        if (item.empty()) {
            continue;
        }
        const auto colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == item.size()) {
            LOG_WARN(logging::LogCategory::WATCHLIST, "Ignoring watchlist item '%s' (expected venue:symbol)", item.c_str());
            continue;
        }

        domain::WatchlistEntry entry;
        entry.exchangeId = lowerCopy(trimCopy(item.substr(0, colon)));
        entry.symbol = upperCopy(trimCopy(item.substr(colon + 1)));
        if (entry.exchangeId.empty() || entry.symbol.empty()) {
            continue;
        }
        entry.id = entry.exchangeId + ":" + lowerCopy(entry.symbol);
        if (!seen.insert(entry.id).second) {
            continue;
        }
        // Keeps the configured order when entries are later sorted by addedAt.
        entry.addedAt = addedAt + order++;
        entries.push_back(std::move(entry));
    }
    return entries;
}

domain::Granularity granularityForDigit(int digit) {
    static const std::array<const char*, 9> kLabels{"1m", "3m", "5m", "15m", "30m", "1h", "4h", "1d", "1w"};
    if (digit < 1 || digit > 9) {
        return domain::Granularity{};
    }
    return domain::granularity_from_label(kLabels[static_cast<std::size_t>(digit - 1)]);
}

}  // namespace lmv::app
