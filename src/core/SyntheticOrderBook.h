#pragma once

#include <cstddef>
#include <vector>

namespace lmv::core {

struct BookLevel {
    double price{0.0};
    double volume{0.0};
};

// Bids sorted best (highest) first, asks sorted best (lowest) first.
struct OrderBook {
    double midPrice{0.0};
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;

    bool empty() const noexcept { return bids.empty() && asks.empty(); }
};

/**
 * Presentation-only depth ladder.
 *
 * The venues feeding this viewer publish no order book, so the ladder is
 * simulated from the last price alone: `depth` levels on each side spaced by
 * a fixed relative step, with volume falling off as a Gaussian of the level
 * index. The output carries no information about real liquidity and must
 * never be used for anything but drawing. Output is a pure function of
 * (currentPrice, depth) and the constructor parameters.
 */
class SyntheticOrderBook {
public:
    explicit SyntheticOrderBook(double stepRatio = 0.001, double peakVolume = 2.0, double floorVolume = 0.1);

    OrderBook generate(double currentPrice, std::size_t depth) const;

    double stepRatio() const noexcept { return stepRatio_; }

private:
    double levelVolume_(std::size_t level, std::size_t depth) const;

    double stepRatio_;
    double peakVolume_;
    double floorVolume_;
};

}  // namespace lmv::core
