#include <iostream>
#include <string>

#include "core/TickSequencer.h"

using lmv::core::TickDisposition;
using lmv::core::TickSequencer;
using lmv::domain::QuoteSample;
using lmv::domain::TradeSide;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

QuoteSample quote(long long ts, double price) {
    QuoteSample sample;
    sample.timestamp = ts;
    sample.price = price;
    return sample;
}

}  // namespace

int main() {
    expect(TickSequencer::classify(std::nullopt, 5) == TickDisposition::Append, "first tick appends");
    expect(TickSequencer::classify(5, 6) == TickDisposition::Append, "newer tick appends");
    expect(TickSequencer::classify(5, 5) == TickDisposition::ReplaceLast, "same timestamp replaces");
    expect(TickSequencer::classify(5, 4) == TickDisposition::Drop, "older tick drops");

    {
        TickSequencer sequencer;
        auto first = sequencer.accept(quote(1000, 100.0));
        expect(first && !first->replacesLast && first->tick.side == TradeSide::Buy, "first tick is a buy append");

        auto down = sequencer.accept(quote(2000, 99.0));
        expect(down && down->tick.side == TradeSide::Sell, "down tick inferred as sell");

        // Last write on the clock wins: the replacement is judged against the
        // price before the replaced tick, not against the replaced tick.
        auto replaced = sequencer.accept(quote(2000, 101.0));
        expect(replaced && replaced->replacesLast, "same timestamp flagged as replacement");
        expect(replaced && replaced->tick.price == 101.0, "replacement carries the later price");
        expect(replaced && replaced->tick.side == TradeSide::Buy, "replacement side uses the prior price");

        auto stale = sequencer.accept(quote(1500, 50.0));
        expect(!stale, "out-of-order tick dropped");
        expect(sequencer.droppedCount() == 1, "drop counted");
        expect(sequencer.lastTimestamp() && *sequencer.lastTimestamp() == 2000, "last timestamp unchanged by drop");
    }

    {
        TickSequencer sequencer;
        auto sample = quote(1000, 10.0);
        sample.volume24h = 500.0;
        auto first = sequencer.accept(sample);
        expect(first && !first->tick.volume, "first cumulative volume has no delta");

        sample = quote(2000, 10.5);
        sample.volume24h = 503.5;
        auto second = sequencer.accept(sample);
        expect(second && second->tick.volume && *second->tick.volume == 3.5, "cumulative volume becomes a delta");

        sample = quote(2000, 10.6);
        sample.volume24h = 504.0;
        auto replacement = sequencer.accept(sample);
        expect(replacement && replacement->tick.volume && *replacement->tick.volume == 4.0,
               "replacement delta measured from before the replaced tick");

        sample = quote(3000, 10.4);
        sample.volume24h = 400.0;
        auto reset = sequencer.accept(sample);
        expect(reset && !reset->tick.volume, "shrinking 24h volume yields no volume");
    }

    {
        TickSequencer sequencer;
        auto sample = quote(1000, 10.0);
        sample.volume = 2.0;
        sample.side = TradeSide::Sell;
        auto update = sequencer.accept(sample);
        expect(update && update->tick.volume && *update->tick.volume == 2.0, "explicit volume kept");
        expect(update && update->tick.side == TradeSide::Sell, "explicit side kept");

        sequencer.reset();
        expect(!sequencer.lastTimestamp() && sequencer.droppedCount() == 0, "reset clears state");
        expect(sequencer.accept(quote(10, 1.0)).has_value(), "accepts older timestamps after reset");
    }

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_tick_sequencer passed\n";
    return 0;
}
