#pragma once

#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::render {

// Gridline prices for the vertical axis, lowest first.
struct PriceScale {
    std::vector<double> ticks;
    double step{0.0};
    int decimals{2};
};

PriceScale buildPriceScale(double minPrice, double maxPrice, int targetTicks = 8);
int computePriceDecimals(double step);
std::string formatPrice(double value, int decimals);
// HH:MM:SS in UTC; "--:--" for unset timestamps.
std::string formatTimeLabel(domain::TimestampMs timestampMs);

}  // namespace lmv::render
