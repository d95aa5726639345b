#include "core/SyntheticOrderBook.h"

#include <algorithm>
#include <cmath>

#include "logging/Log.h"

namespace lmv::core {

namespace {
constexpr std::size_t kMaxDepth = 500;
}

SyntheticOrderBook::SyntheticOrderBook(double stepRatio, double peakVolume, double floorVolume)
    : stepRatio_(stepRatio > 0.0 && stepRatio < 1.0 ? stepRatio : 0.001),
      peakVolume_(std::max(peakVolume, 0.0)),
      floorVolume_(std::max(floorVolume, 0.0)) {}

OrderBook SyntheticOrderBook::generate(double currentPrice, std::size_t depth) const {
    OrderBook book;
    if (!std::isfinite(currentPrice) || currentPrice <= 0.0 || depth == 0) {
        return book;
    }
    if (depth > kMaxDepth) {
        LOG_DEBUG(logging::LogCategory::BOOK, "Clamping book depth %zu to %zu", depth, kMaxDepth);
        depth = kMaxDepth;
    }
    // Deeper levels would go non-positive on the bid side.
    const auto maxBidLevels = static_cast<std::size_t>(std::ceil(1.0 / stepRatio_)) - 1;

    book.midPrice = currentPrice;
    book.bids.reserve(depth);
    book.asks.reserve(depth);
    for (std::size_t level = 1; level <= depth; ++level) {
        const double offset = stepRatio_ * static_cast<double>(level);
        const double volume = levelVolume_(level, depth);
        book.asks.push_back(BookLevel{currentPrice * (1.0 + offset), volume});
        if (level <= maxBidLevels) {
            book.bids.push_back(BookLevel{currentPrice * (1.0 - offset), volume});
        }
    }
    return book;
}

double SyntheticOrderBook::levelVolume_(std::size_t level, std::size_t depth) const {
    const double sigma = std::max(1.0, static_cast<double>(depth) / 2.0);
    const double distance = static_cast<double>(level - 1);
    return floorVolume_ + peakVolume_ * std::exp(-(distance * distance) / (2.0 * sigma * sigma));
}

}  // namespace lmv::core
