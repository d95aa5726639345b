#include "render/PriceAxis.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace lmv::render {

namespace {

constexpr long long kMinTicks = 4;
constexpr long long kMaxTicks = 12;
constexpr double kMultipliers[] = {1.0, 2.0, 5.0};

struct StepFit {
    double step{0.0};
    long long first{0};
    long long last{-1};

    long long count() const { return last - first + 1; }
};

// Gridlines are integer multiples of the step inside [min, max].
StepFit fitStep(double minPrice, double maxPrice, double step) {
    const double tolerance = 1e-9;
    StepFit fit;
    fit.step = step;
    fit.first = static_cast<long long>(std::ceil(minPrice / step - tolerance));
    fit.last = static_cast<long long>(std::floor(maxPrice / step + tolerance));
    return fit;
}

}  // namespace

PriceScale buildPriceScale(double minPrice, double maxPrice, int targetTicks) {
    PriceScale scale;
    if (!std::isfinite(minPrice) || !std::isfinite(maxPrice) || !(maxPrice > minPrice)) {
        return scale;
    }
    const long long target = std::max(targetTicks, 1);
    const double rough = (maxPrice - minPrice) / static_cast<double>(target);
    if (!(rough > 0.0)) {
        return scale;
    }

    // Walk the 1-2-5 ladder from one decade below the rough step to two above
    // and keep the step whose gridline count lands nearest the target,
    // preferring counts inside [kMinTicks, kMaxTicks].
    const int baseExponent = static_cast<int>(std::floor(std::log10(rough)));
    StepFit best;
    bool bestInRange = false;
    long long bestDistance = std::numeric_limits<long long>::max();
    for (int exponent = baseExponent - 1; exponent <= baseExponent + 2; ++exponent) {
        const double decade = std::pow(10.0, exponent);
        for (double multiplier : kMultipliers) {
            const StepFit fit = fitStep(minPrice, maxPrice, multiplier * decade);
            const long long count = fit.count();
            if (count <= 0) {
                continue;
            }
            const bool inRange = count >= kMinTicks && count <= kMaxTicks;
            const long long distance = std::llabs(count - target);
            if ((inRange && !bestInRange) || (inRange == bestInRange && distance < bestDistance)) {
                best = fit;
                bestInRange = inRange;
                bestDistance = distance;
            }
        }
    }
    if (best.count() <= 0) {
        return scale;
    }

    scale.step = best.step;
    scale.decimals = computePriceDecimals(best.step);
    scale.ticks.reserve(static_cast<std::size_t>(best.count()));
    for (long long k = best.first; k <= best.last; ++k) {
        scale.ticks.push_back(static_cast<double>(k) * best.step);
    }
    return scale;
}

int computePriceDecimals(double step) {
    if (!(step > 0.0)) {
        return 2;
    }
    const int decimals = static_cast<int>(std::ceil(-std::log10(step))) + 2;
    return std::clamp(decimals, 2, 8);
}

std::string formatPrice(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::clamp(decimals, 0, 8)) << value;
    std::string text = oss.str();

    const auto dot = text.find('.');
    if (dot == std::string::npos) {
        return text;
    }
    // At least two decimals survive trimming.
    const std::size_t keep = dot + 3;
    while (text.size() > keep && text.back() == '0') {
        text.pop_back();
    }
    text.append(keep > text.size() ? keep - text.size() : 0, '0');
    return text;
}

std::string formatTimeLabel(domain::TimestampMs timestampMs) {
    if (timestampMs <= 0) {
        return "--:--";
    }
    const auto seconds = static_cast<std::time_t>(timestampMs / 1000);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%H:%M:%S");
    return oss.str();
}

}  // namespace lmv::render
