#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "adapters/feed/PollingTickSource.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.h"

using namespace std::chrono_literals;
using namespace lmv;
using adapters::feed::PollingTickSource;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// Plays back a fixed script of fetch outcomes, then repeats the last quote.
class ScriptedFetcher : public adapters::feed::IQuoteFetcher {
public:
    enum class Kind { Quote, TransportFailure, Malformed };
    struct Step {
        Kind kind;
        domain::TimestampMs timestamp;
        double price;
    };

    explicit ScriptedFetcher(std::vector<Step> script) : script_(std::move(script)) {}

    domain::QuoteSample fetch(const std::string& venue, const std::string& symbol) override {
        ++calls;
        lastVenue = venue;
        lastSymbol = symbol;
        std::lock_guard<std::mutex> lock(mutex_);
        const Step step = next_ < script_.size() ? script_[next_++] : lastQuote_;
        switch (step.kind) {
        case Kind::TransportFailure:
            throw domain::TransportError("connection refused");
        case Kind::Malformed:
            throw domain::MalformedTickError("missing price");
        case Kind::Quote:
            break;
        }
        lastQuote_ = step;
        domain::QuoteSample sample;
        sample.timestamp = step.timestamp;
        sample.price = step.price;
        return sample;
    }

    std::atomic<int> calls{0};
    std::string lastVenue;
    std::string lastSymbol;

private:
    std::mutex mutex_;
    std::vector<Step> script_;
    std::size_t next_{0};
    Step lastQuote_{Kind::Quote, 0, 0.0};
};

// Blocks every fetch for a gated symbol until released; other symbols answer at once.
class GatedFetcher : public adapters::feed::IQuoteFetcher {
public:
    domain::QuoteSample fetch(const std::string& venue, const std::string& symbol) override {
        (void)venue;
        if (symbol.rfind("HANG", 0) == 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            ++blocked_;
            cv_.wait(lock, [this]() { return released_; });
            --blocked_;
            throw domain::TransportError("timed out");
        }
        const int n = ++healthyCalls;
        domain::QuoteSample sample;
        sample.timestamp = 1'000 + n;
        sample.price = 100.0 + n;
        return sample;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    int blockedCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocked_;
    }

    std::atomic<int> healthyCalls{0};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_{false};
    int blocked_{0};
};

struct Recorder {
    std::mutex mutex;
    std::vector<core::TickUpdate> ticks;
    std::vector<domain::ConnectionState> states;

    std::size_t tickCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return ticks.size();
    }
    std::size_t stateCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return states.size();
    }
};

void hungFetchesStallOnlyTheirOwnSymbol() {
    auto fetcher = std::make_shared<GatedFetcher>();
    adapters::feed::PollingOptions options;
    options.interval = 5ms;
    {
        PollingTickSource source(fetcher, options);
        std::vector<adapters::feed::Subscription> hung;
        for (int i = 0; i < 4; ++i) {
            hung.push_back(source.subscribe("binance", "HANG" + std::to_string(i), nullptr, nullptr));
        }
        expect(waitFor([&]() { return fetcher->blockedCount() == 4; }), "every hung symbol is mid-fetch");

        std::atomic<int> healthyTicks{0};
        auto healthy = source.subscribe(
            "binance", "ETHUSDT", [&healthyTicks](const core::TickUpdate&) { ++healthyTicks; }, nullptr);
        expect(waitFor([&]() { return healthyTicks.load() >= 5; }), "healthy symbol keeps polling past hung fetches");

        const auto start = std::chrono::steady_clock::now();
        hung[0].cancel();
        const auto elapsed = std::chrono::steady_clock::now() - start;
        expect(elapsed < 100ms, "cancel does not wait for the hung fetch");
        expect(!hung[0].active(), "hung subscription cancelled");
        expect(source.liveWorkers() == 5, "cancelled worker still finishing its fetch");

        healthy.cancel();
        fetcher->release();
        for (auto& subscription : hung) {
            subscription.cancel();
        }
        expect(waitFor([&]() { return source.liveWorkers() == 0; }), "workers exit once fetches return");
    }
    expect(fetcher->blockedCount() == 0, "no fetch outlives the source");
}

}  // namespace

int main() {
    using Kind = ScriptedFetcher::Kind;
    auto fetcher = std::make_shared<ScriptedFetcher>(std::vector<ScriptedFetcher::Step>{
        {Kind::Quote, 1'000, 100.0},
        {Kind::Quote, 1'000, 100.0},
        {Kind::Quote, 2'000, 101.0},
        {Kind::Malformed, 0, 0.0},
        {Kind::Quote, 2'000, 102.0},
        {Kind::TransportFailure, 0, 0.0},
        {Kind::TransportFailure, 0, 0.0},
        {Kind::TransportFailure, 0, 0.0},
        {Kind::Quote, 3'000, 103.0},
    });

    adapters::feed::PollingOptions options;
    options.interval = 5ms;
    options.backoff.base = 5ms;
    options.backoff.cap = 20ms;
    options.backoff.failAfter = 2;
    PollingTickSource source(fetcher, options);
    expect(std::string(source.mode()) == "poll", "poll mode");

    const auto malformedBefore = metrics::Registry::instance().snapshot().counter("ticks_malformed");
    const auto transportBefore = metrics::Registry::instance().snapshot().counter("transport_failures");

    Recorder recorder;
    auto subscription = source.subscribe(
        "binance",
        "BTCUSDT",
        [&recorder](const core::TickUpdate& update) {
            std::lock_guard<std::mutex> lock(recorder.mutex);
            recorder.ticks.push_back(update);
        },
        [&recorder](domain::ConnectionState state) {
            std::lock_guard<std::mutex> lock(recorder.mutex);
            recorder.states.push_back(state);
        });
    expect(subscription.active(), "subscription active");

    expect(waitFor([&]() { return recorder.tickCount() >= 4 && recorder.stateCount() >= 4; }), "script played out");
    expect(fetcher->lastVenue == "binance" && fetcher->lastSymbol == "BTCUSDT", "fetch targets the entry");

    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        expect(recorder.ticks.size() == 4, "identical quote emitted nothing");
        if (recorder.ticks.size() == 4) {
            expect(!recorder.ticks[0].replacesLast && recorder.ticks[0].tick.price == 100.0, "first quote appended");
            expect(!recorder.ticks[1].replacesLast && recorder.ticks[1].tick.timestamp == 2'000, "new timestamp");
            expect(recorder.ticks[2].replacesLast && recorder.ticks[2].tick.price == 102.0, "changed quote replaces");
            expect(recorder.ticks[3].tick.timestamp == 3'000, "recovered feed resumes");
            expect(recorder.ticks[1].tick.side == domain::TradeSide::Buy, "uptick inferred as buy");
        }
        const std::vector<domain::ConnectionState> expected{domain::ConnectionState::Connected,
                                                            domain::ConnectionState::Reconnecting,
                                                            domain::ConnectionState::Failed,
                                                            domain::ConnectionState::Connected};
        expect(recorder.states == expected, "connection transitions");
    }
    const auto snapshot = metrics::Registry::instance().snapshot();
    expect(snapshot.counter("ticks_malformed") == malformedBefore + 1, "malformed quote counted");
    expect(snapshot.counter("transport_failures") == transportBefore + 3, "transport failures counted");

    subscription.setRefreshInterval(10ms);
    subscription.cancel();
    expect(!subscription.active(), "cancelled subscription inactive");
    std::this_thread::sleep_for(30ms);
    const int settled = fetcher->calls.load();
    std::this_thread::sleep_for(60ms);
    expect(fetcher->calls.load() == settled, "no fetches after cancel");

    bool rejected = false;
    try {
        source.subscribe("", "BTCUSDT", nullptr, nullptr);
    }
    catch (const std::runtime_error&) {
        rejected = true;
    }
    expect(rejected, "subscription without venue rejected");

    hungFetchesStallOnlyTheirOwnSymbol();

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_polling_source passed\n";
    return 0;
}
