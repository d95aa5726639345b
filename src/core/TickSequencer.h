#pragma once

#include <cstdint>
#include <optional>

#include "domain/Types.h"

namespace lmv::core {

enum class TickDisposition { Append, ReplaceLast, Drop };

struct TickUpdate {
    domain::Tick tick;
    // Same timestamp as the previously delivered tick; it supersedes it.
    bool replacesLast{false};
};

/**
 * Orders one symbol's stream on the exchange clock.
 *
 * A quote newer than the last accepted one is appended. A quote carrying the
 * same timestamp replaces the previous tick (last write on the clock wins,
 * regardless of arrival order among equal timestamps). Older quotes are
 * dropped. Side is inferred by the tick rule when the feed omits it, and a
 * cumulative 24h volume is turned into a per-tick delta.
 */
class TickSequencer {
public:
    static TickDisposition classify(std::optional<domain::TimestampMs> last, domain::TimestampMs incoming) noexcept;

    std::optional<TickUpdate> accept(const domain::QuoteSample& sample);
    void reset();

    std::optional<domain::TimestampMs> lastTimestamp() const noexcept { return lastTimestamp_; }
    std::uint64_t droppedCount() const noexcept { return dropped_; }

private:
    std::optional<domain::TimestampMs> lastTimestamp_;
    // State from before the ticks at lastTimestamp_, used to rebuild a replacement.
    std::optional<double> pricePrior_;
    std::optional<double> volume24hPrior_;
    std::optional<double> lastPrice_;
    std::optional<double> lastVolume24h_;
    std::uint64_t dropped_{0};
};

}  // namespace lmv::core
