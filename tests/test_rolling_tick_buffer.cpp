#include <iostream>
#include <string>
#include <vector>

#include "core/RollingTickBuffer.h"

using lmv::core::RollingTickBuffer;
using lmv::domain::Tick;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

Tick tickAt(long long ts, double price) {
    Tick tick;
    tick.timestamp = ts;
    tick.price = price;
    return tick;
}

}  // namespace

int main() {
    {
        RollingTickBuffer buffer(3);
        for (int i = 1; i <= 5; ++i) {
            expect(buffer.push(tickAt(i, static_cast<double>(i))), "push in order accepted");
        }
        const auto snapshot = buffer.snapshot();
        expect(snapshot.size() == 3, "capacity 3 keeps three ticks");
        if (snapshot.size() == 3) {
            expect(snapshot[0].price == 3.0 && snapshot[1].price == 4.0 && snapshot[2].price == 5.0,
                   "snapshot is [3,4,5]");
        }
        expect(buffer.hasEvicted(), "eviction recorded");
        expect(buffer.view().evicted(), "view reports eviction");
        expect(buffer.newest() != nullptr && buffer.newest()->price == 5.0, "newest is the last push");
    }

    {
        RollingTickBuffer buffer(4);
        const long long stamps[] = {10, 20, 20, 15, 30, 40, 50, 5, 60};
        for (long long ts : stamps) {
            buffer.push(tickAt(ts, 1.0));
            const auto snap = buffer.snapshot();
            expect(snap.size() <= buffer.capacity(), "length never exceeds capacity");
            for (std::size_t i = 1; i < snap.size(); ++i) {
                expect(snap[i - 1].timestamp <= snap[i].timestamp, "snapshot timestamp ordered");
            }
        }
        expect(!buffer.push(tickAt(1, 1.0)), "older tick rejected");
    }

    {
        RollingTickBuffer buffer(2);
        expect(!buffer.replaceLast(tickAt(1, 1.0)), "replace on empty buffer fails");
        buffer.push(tickAt(100, 1.0));
        expect(!buffer.replaceLast(tickAt(101, 2.0)), "replace with another timestamp fails");
        expect(buffer.replaceLast(tickAt(100, 2.0)), "replace with same timestamp succeeds");
        expect(buffer.size() == 1 && buffer.newest()->price == 2.0, "replacement overwrote newest tick");
    }

    {
        RollingTickBuffer buffer(2);
        buffer.push(tickAt(1, 1.0));
        buffer.push(tickAt(2, 2.0));
        buffer.push(tickAt(3, 3.0));
        const auto view = buffer.view();
        expect(view.size() == 2 && view.front().timestamp == 2 && view.back().timestamp == 3,
               "view walks the ring oldest to newest");

        std::vector<Tick> reused(10);
        buffer.snapshotInto(reused);
        expect(reused.size() == 2, "snapshotInto replaces previous contents");

        buffer.clear();
        expect(buffer.empty() && !buffer.hasEvicted() && buffer.newest() == nullptr, "clear resets the buffer");
    }

    {
        RollingTickBuffer buffer(0);
        expect(buffer.capacity() == 1, "zero capacity is raised to one");
    }

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_rolling_tick_buffer passed\n";
    return 0;
}
